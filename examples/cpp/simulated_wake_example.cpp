#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "client/cpp/wake_client.h"
#include "fieldwake/v1.hpp"

/*
  Plays one device wake against a running fieldwake server:

    alive -> metadata -> fragments 0,1,3 -> (missing 2) -> fragment 2

  The device must be mapped and approved in the lineage registry for the
  server to ask for a capture; otherwise the wake ends in sleep_only.
*/

namespace {

constexpr const char* kDevice = "AA:BB:CC:DD:EE:01";

std::string Base64(const std::string& in) {
  static constexpr char kTable[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string           out;
  uint32_t              buffer = 0;
  int                   bits   = 0;
  for (unsigned char c : in) {
    buffer = (buffer << 8) | c;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kTable[(buffer >> bits) & 0x3F]);
    }
  }
  if (bits > 0) out.push_back(kTable[(buffer << (6 - bits)) & 0x3F]);
  while (out.size() % 4 != 0) out.push_back('=');
  return out;
}

bool Send(const fieldwake::client::WakeClient& client, const std::string& topic, const std::string& json) {
  auto response = client.Deliver(topic, json);
  if (!response.ok()) {
    std::cerr << "Deliver failed: " << response.status().ToString() << '\n';
    return false;
  }
  std::cout << topic << " -> " << fieldwake::v1::DeliveryDisposition_Name(response->disposition()) << " (" << response->detail() << ")\n";
  return true;
}

} // namespace

int main(int argc, char** argv) {
  const std::string target = argc > 1 ? argv[1] : "localhost:50061";

  fieldwake::client::WakeClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  const std::string status_topic = std::string("ESP32CAM/") + kDevice + "/status";
  const std::string data_topic   = std::string("ESP32CAM/") + kDevice + "/data";

  if (!Send(client, status_topic,
            std::string(R"({"device_id":")") + kDevice + R"(","status":"alive","pendingImg":1,"battery_voltage":3.9,"wifi_rssi":-61})")) {
    return 1;
  }

  // The capture directive names the artifact; a real bridge reads it from StreamCommands.
  auto wakes = client.ListWakeEvents(kDevice, 1);
  if (!wakes.ok() || wakes->wake_events_size() == 0) {
    std::cerr << "no wake event recorded\n";
    return 1;
  }
  const auto& wake = wakes->wake_events(0);
  if (wake.artifact_name().empty()) {
    std::cout << "device is not admitted; wake state " << fieldwake::v1::ProtocolState_Name(wake.state()) << '\n';
    return 0;
  }
  const std::string artifact = wake.artifact_name();

  const std::vector<std::string> chunks = {"\xFF\xD8\xFF\xE0", "JFIF", "-body-", "\xFF\xD9"};
  const std::vector<int>         order  = {0, 1, 3};

  if (!Send(client, data_topic,
            R"({"device_id":")" + std::string(kDevice) + R"(","image_name":")" + artifact + R"(","total_chunks_count":4,"image_size":16,"max_chunk_size":6})")) {
    return 1;
  }

  auto fragment = [&](int index) {
    return Send(client, data_topic,
                R"({"device_id":")" + std::string(kDevice) + R"(","image_name":")" + artifact + R"(","chunk_id":)" + std::to_string(index) +
                    R"(,"payload":")" + Base64(chunks[static_cast<size_t>(index)]) + R"("})");
  };

  for (int index : order) {
    if (!fragment(index)) return 1;
  }

  auto transfer = client.GetTransfer(kDevice, artifact);
  if (transfer.ok()) {
    std::cout << "after first pass: " << transfer->received_fragments() << "/" << transfer->total_fragments()
              << " missing_requests=" << transfer->missing_requests() << '\n';
  }

  // resend the gap the server asked for
  if (!fragment(2)) return 1;

  transfer = client.GetTransfer(kDevice, artifact);
  if (!transfer.ok()) {
    std::cerr << "GetTransfer failed: " << transfer.status().ToString() << '\n';
    return 1;
  }
  std::cout << "status=" << fieldwake::v1::TransferStatus_Name(transfer->status()) << " location=" << transfer->storage_location() << '\n';
  return 0;
}
