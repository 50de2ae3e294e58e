#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "client/cpp/wake_client.h"
#include "fieldwake/v1.hpp"

using namespace fieldwake::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fieldwakectl <addr> deliver <topic> <json-file|->\n"
            << "  fieldwakectl <addr> stats\n"
            << "  fieldwakectl <addr> wake <wake_event_id>\n"
            << "  fieldwakectl <addr> wakes [device_id] [limit]\n"
            << "  fieldwakectl <addr> device <device_id>\n"
            << "  fieldwakectl <addr> transfer <device_id> <artifact_name>\n"
            << "  fieldwakectl <addr> sweep\n"
            << "  fieldwakectl <addr> watch [bridge_id]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return out;
}

static bool ReadInput(const std::string& path, std::string* out) {
  if (path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

template <typename T>
static int Print(const arrow::Result<T>& result) {
  if (!result.ok()) {
    std::cerr << result.status().ToString() << "\n";
    return 2;
  }
  std::cout << ToJson(*result) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  fieldwake::client::WakeClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------

  if (cmd == "deliver") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    std::string payload;
    if (!ReadInput(argv[4], &payload)) {
      std::cerr << "cannot read " << argv[4] << "\n";
      return 1;
    }
    return Print(client.Deliver(argv[3], payload));
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    return Print(client.Stats());
  }

  if (cmd == "wake") {
    if (argc < 4) return 1;
    return Print(client.GetWakeEvent(argv[3]));
  }

  if (cmd == "wakes") {
    const std::string device_id = argc >= 4 ? argv[3] : "";
    const uint32_t    limit     = argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 20;
    return Print(client.ListWakeEvents(device_id, limit));
  }

  if (cmd == "device") {
    if (argc < 4) return 1;
    return Print(client.GetDevice(argv[3]));
  }

  if (cmd == "transfer") {
    if (argc < 5) return 1;
    return Print(client.GetTransfer(argv[3], argv[4]));
  }

  if (cmd == "sweep") {
    return Print(client.SweepNow());
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    const std::string   bridge_id = argc >= 4 ? argv[3] : "fieldwakectl";
    grpc::ClientContext ctx;
    auto                reader = client.StreamCommands(bridge_id, &ctx);

    DeviceCommand command;
    while (reader->Read(&command)) {
      std::cout << command.topic() << " " << CommandKind_Name(command.kind()) << " " << command.payload_json() << std::endl;
    }

    auto status = reader->Finish();
    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }
    return 0;
  }

  Usage();
  return 1;
}
