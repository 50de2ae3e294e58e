#include "internal/protocol/topics.hpp"

#include <cctype>

namespace fieldwake::protocol {

std::string NormalizeDeviceId(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    if (c == ':' || c == '-' || std::isspace(static_cast<unsigned char>(c))) continue;
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return out;
}

std::optional<Topic> ParseTopic(std::string_view topic) {
  const auto first = topic.find('/');
  if (first == std::string_view::npos || topic.substr(0, first) != kTopicRoot) return std::nullopt;

  const auto second = topic.find('/', first + 1);
  if (second == std::string_view::npos || second == first + 1) return std::nullopt;

  const auto suffix = topic.substr(second + 1);
  Topic      parsed;
  parsed.device_segment = std::string(topic.substr(first + 1, second - first - 1));

  if (suffix == "status") {
    parsed.kind = TopicKind::kStatus;
  } else if (suffix == "data") {
    parsed.kind = TopicKind::kData;
  } else if (suffix == "cmd") {
    parsed.kind = TopicKind::kCommand;
  } else {
    return std::nullopt;
  }
  return parsed;
}

std::string CommandTopic(std::string_view device_id) {
  return std::string(kTopicRoot) + "/" + std::string(device_id) + "/cmd";
}

std::string_view ToString(TopicKind kind) {
  switch (kind) {
    case TopicKind::kStatus:
      return "status";
    case TopicKind::kData:
      return "data";
    case TopicKind::kCommand:
      return "cmd";
  }
  return "unknown";
}

} // namespace fieldwake::protocol
