#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fieldwake::storage::common {

inline constexpr std::string_view kUnassignedSegment = "unassigned";

inline void ValidateKeySegment(const std::string& segment) {
  if (segment.empty()) {
    throw std::invalid_argument("artifact key segment must not be empty");
  }
  for (char c : segment) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("artifact key segment contains invalid character: " + segment);
    }
  }
  if (segment == "." || segment == "..") {
    throw std::invalid_argument("artifact key segment must not be a relative path component");
  }
}

// Every '/'-separated segment of the key must be a plain name.
inline void ValidateArtifactKey(const std::string& key) {
  std::string_view rest = key;
  if (rest.empty()) {
    throw std::invalid_argument("artifact key must not be empty");
  }
  while (true) {
    auto slash = rest.find('/');
    ValidateKeySegment(std::string(rest.substr(0, slash)));
    if (slash == std::string_view::npos) break;
    rest.remove_prefix(slash + 1);
  }
}

/*
  <company>/<site>/<device>/<artifact>; missing ownership levels become
  "unassigned".
*/
inline std::string ArtifactKey(const std::string& company_id,
                               const std::string& site_id,
                               const std::string& device_id,
                               const std::string& artifact_name) {
  auto level = [](const std::string& value) { return value.empty() ? std::string(kUnassignedSegment) : value; };
  std::string key = level(company_id) + "/" + level(site_id) + "/" + device_id + "/" + artifact_name;
  ValidateArtifactKey(key);
  return key;
}

inline std::filesystem::path ArtifactPath(const std::filesystem::path& root, const std::string& key) {
  ValidateArtifactKey(key);
  return root / std::filesystem::path(key);
}

} // namespace fieldwake::storage::common
