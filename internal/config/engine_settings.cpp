#include "engine_settings.hpp"

namespace fieldwake::config {

EngineSettings SettingsFromConfig(const fieldwake::runtime::config::RuntimeConfig& config) {
  EngineSettings settings;

  const auto& chunks = config.chunks();
  if (chunks.ttl_seconds() > 0) settings.fragment_ttl = std::chrono::seconds(chunks.ttl_seconds());
  if (chunks.sweep_interval_seconds() > 0) settings.sweep_interval = std::chrono::seconds(chunks.sweep_interval_seconds());
  if (chunks.max_missing_requests() > 0) settings.max_missing_requests = chunks.max_missing_requests();
  if (chunks.recovery_delay_seconds() > 0) settings.recovery_delay = std::chrono::seconds(chunks.recovery_delay_seconds());
  if (chunks.retention_seconds() > 0) settings.retention = std::chrono::seconds(chunks.retention_seconds());

  const auto& schedule = config.schedule();
  if (!schedule.default_expression().empty()) settings.default_schedule = schedule.default_expression();
  if (!schedule.default_timezone().empty()) settings.default_timezone = schedule.default_timezone();

  if (config.notify().external_call_timeout_ms() > 0) {
    settings.external_call_timeout = std::chrono::milliseconds(config.notify().external_call_timeout_ms());
  }
  if (config.commands().max_queued() > 0) settings.max_queued_commands = config.commands().max_queued();
  if (config.lineage().cache_ttl_seconds() > 0) settings.lineage_cache_ttl = std::chrono::seconds(config.lineage().cache_ttl_seconds());

  return settings;
}

} // namespace fieldwake::config
