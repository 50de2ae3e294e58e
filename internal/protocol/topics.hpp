#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace fieldwake::protocol {

/*
  Topic layout shared with the device firmware:

    ESP32CAM/<mac>/status   device -> server   alive hello
    ESP32CAM/<mac>/data     device -> server   metadata, fragments, telemetry
    ESP32CAM/<mac>/cmd      server -> device   capture / missing / sleep
*/

inline constexpr std::string_view kTopicRoot = "ESP32CAM";

enum class TopicKind {
  kStatus,
  kData,
  kCommand,
};

struct Topic {
  std::string device_segment; // as it appeared, not normalised
  TopicKind   kind = TopicKind::kData;
};

// Strips ':' '-' and whitespace, upper-cases. "aa:bb:cc:dd:ee:ff" -> "AABBCCDDEEFF".
std::string NormalizeDeviceId(std::string_view raw);

std::optional<Topic> ParseTopic(std::string_view topic);

std::string CommandTopic(std::string_view device_id);

std::string_view ToString(TopicKind kind);

} // namespace fieldwake::protocol
