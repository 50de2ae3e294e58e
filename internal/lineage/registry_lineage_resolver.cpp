#include "internal/lineage/registry_lineage_resolver.hpp"

#include <yaml-cpp/yaml.h>

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/protocol/topics.hpp"

namespace fieldwake::lineage {

namespace {

struct SiteEntry {
  std::string name;
  std::string program_id;
  std::string company_id;
  std::string timezone;
  std::string wake_schedule;
};

std::string Text(const YAML::Node& node, const char* key) {
  const auto child = node[key];
  if (!child || child.IsNull()) return {};
  return child.as<std::string>();
}

} // namespace

RegistryLineageResolver::RegistryLineageResolver(std::filesystem::path path) : path_(std::move(path)) {
  Reload();
}

RegistryLineageResolver::Snapshot RegistryLineageResolver::Load(const std::filesystem::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("lineage registry " + path.string() + ": " + e.what());
  }

  std::unordered_map<std::string, SiteEntry> sites;
  if (const auto node = root["sites"]) {
    if (!node.IsSequence()) throw std::runtime_error("lineage registry: 'sites' must be a list");
    for (const auto& item : node) {
      const auto id = Text(item, "id");
      if (id.empty()) throw std::runtime_error("lineage registry: site without id");
      sites[id] = SiteEntry{Text(item, "name"), Text(item, "program_id"), Text(item, "company_id"), Text(item, "timezone"),
                            Text(item, "wake_schedule")};
    }
  }

  Snapshot devices;
  if (const auto node = root["devices"]) {
    if (!node.IsSequence()) throw std::runtime_error("lineage registry: 'devices' must be a list");
    for (const auto& item : node) {
      DeviceLineage lineage;
      lineage.device_id = protocol::NormalizeDeviceId(Text(item, "device_id"));
      if (lineage.device_id.empty()) throw std::runtime_error("lineage registry: device without device_id");

      lineage.device_schedule = Text(item, "wake_schedule");
      lineage.approved        = item["approved"] ? item["approved"].as<bool>() : false;

      const auto site_id = Text(item, "site_id");
      if (!site_id.empty()) {
        const auto it = sites.find(site_id);
        if (it == sites.end()) throw std::runtime_error("lineage registry: device " + lineage.device_id + " references unknown site " + site_id);
        lineage.mapped        = true;
        lineage.site_id       = site_id;
        lineage.site_name     = it->second.name;
        lineage.program_id    = it->second.program_id;
        lineage.company_id    = it->second.company_id;
        lineage.timezone      = it->second.timezone;
        lineage.site_schedule = it->second.wake_schedule;
      }

      devices[lineage.device_id] = std::move(lineage);
    }
  }
  return devices;
}

void RegistryLineageResolver::Reload() {
  const auto mtime    = std::filesystem::last_write_time(path_);
  auto       snapshot = Load(path_);

  std::unique_lock lock(mutex_);
  devices_      = std::move(snapshot);
  loaded_mtime_ = mtime;
}

void RegistryLineageResolver::ReloadIfChanged() {
  std::error_code ec;
  const auto      mtime = std::filesystem::last_write_time(path_, ec);
  if (ec) {
    FIELDWAKE_LOG_WARN("lineage registry unreadable; serving previous snapshot",
                       {observability::StringField("path", path_.string()), observability::StringField("error", ec.message())});
    return;
  }

  {
    std::shared_lock lock(mutex_);
    if (mtime == loaded_mtime_) return;
  }

  try {
    Reload();
    FIELDWAKE_LOG_INFO("lineage registry reloaded", {observability::StringField("path", path_.string()),
                                                     observability::IntField("devices", static_cast<int64_t>(DeviceCount()))});
  } catch (const std::exception& e) {
    FIELDWAKE_LOG_WARN("lineage registry reload failed; serving previous snapshot",
                       {observability::StringField("path", path_.string()), observability::StringField("error", e.what())});
    // do not retry the same broken file on every lookup
    std::unique_lock lock(mutex_);
    loaded_mtime_ = mtime;
  }
}

std::optional<DeviceLineage> RegistryLineageResolver::Resolve(const std::string& device_id) {
  ReloadIfChanged();

  std::shared_lock lock(mutex_);
  const auto       it = devices_.find(protocol::NormalizeDeviceId(device_id));
  if (it == devices_.end()) return std::nullopt;
  return it->second;
}

std::size_t RegistryLineageResolver::DeviceCount() const {
  std::shared_lock lock(mutex_);
  return devices_.size();
}

} // namespace fieldwake::lineage
