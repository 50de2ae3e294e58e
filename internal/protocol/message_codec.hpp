#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/protocol/inbound_message.hpp"

namespace fieldwake::protocol {

/*
  Device JSON <-> typed messages.

  Inbound classification (data topic):
    chunk_id present                   -> fragment
    image_name + total chunk count     -> metadata
    environment readings only          -> telemetry
  Anything else throws util::MalformedMessage.

  Field aliases the firmware has shipped with over time are accepted
  (pendingImg, total_chunk_count, max_chunks_size, device_mac, nested
  sensor_data, payload as base64 or as a byte array).
*/

InboundMessage DecodeInbound(std::string_view topic, std::string_view payload);

std::string_view MessageKind(const InboundMessage& message);

const std::string& DeviceIdOf(const InboundMessage& message);

// Outbound directive bodies, in the firmware's field names.
std::string RenderCaptureDirective(const std::string& device_id, const std::string& artifact_name);
std::string RenderMissingDirective(const std::string& device_id, const std::string& artifact_name,
                                   const std::vector<uint32_t>& missing);
std::string RenderSleepDirective(const std::string& device_id, const std::string& next_wake_display);

// (V - 3.0) / 1.2 * 100, clamped to [0, 100]
double BatteryHealthPercent(double voltage);

} // namespace fieldwake::protocol
