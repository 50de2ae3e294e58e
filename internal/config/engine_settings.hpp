#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace fieldwake::config {

/*
  Engine tunables with defaults applied. Built once from RuntimeConfig and
  copied into the components that need them.
*/
struct EngineSettings {
  std::chrono::seconds fragment_ttl{1800};
  std::chrono::seconds sweep_interval{60};
  std::uint32_t        max_missing_requests{3};
  // idle time after the last fragment before the sweeper asks for the gaps
  std::chrono::seconds recovery_delay{15};
  std::chrono::seconds retention{std::chrono::hours(24 * 30)};

  std::string default_schedule{"0 8 * * *"};
  std::string default_timezone{"America/New_York"};

  std::chrono::milliseconds external_call_timeout{10000};
  std::size_t               max_queued_commands{1024};

  std::chrono::seconds lineage_cache_ttl{300};
};

EngineSettings SettingsFromConfig(const fieldwake::runtime::config::RuntimeConfig& config);

} // namespace fieldwake::config
