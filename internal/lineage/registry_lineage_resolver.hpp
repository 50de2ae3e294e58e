#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/lineage/lineage_resolver.hpp"

namespace fieldwake::lineage {

// RegistryLineageResolver
//
// Reads device -> site assignments from a YAML registry:
//
//   sites:
//     - id: north-field
//       name: North Field
//       program_id: spring-trial
//       company_id: acme
//       timezone: America/Denver
//       wake_schedule: "0 8,16 * * *"
//   devices:
//     - device_id: "AA:BB:CC:DD:EE:FF"
//       site_id: north-field
//       approved: true
//       wake_schedule: "0 */6 * * *"
//
// The file is re-read when its modification time changes. A registry that
// fails to parse after a change keeps the previous snapshot in service.
class RegistryLineageResolver final : public LineageResolver {
 public:
  // Throws std::runtime_error when the initial load fails.
  explicit RegistryLineageResolver(std::filesystem::path path);

  std::optional<DeviceLineage> Resolve(const std::string& device_id) override;

  // Forces a re-read. Throws on parse errors and keeps the old snapshot.
  void Reload();

  std::size_t DeviceCount() const;

 private:
  using Snapshot = std::unordered_map<std::string, DeviceLineage>;

  static Snapshot Load(const std::filesystem::path& path);
  void            ReloadIfChanged();

  std::filesystem::path           path_;
  mutable std::shared_mutex       mutex_;
  Snapshot                        devices_;
  std::filesystem::file_time_type loaded_mtime_{};
};

} // namespace fieldwake::lineage
