#pragma once

#include <absl/time/time.h>

#include <optional>
#include <string>

#include "internal/config/engine_settings.hpp"
#include "internal/lineage/lineage_resolver.hpp"
#include "internal/schedule/wake_schedule.hpp"
#include "internal/util/time.hpp"

namespace fieldwake::core {

inline schedule::ScheduleDefaults DefaultsFrom(const config::EngineSettings& settings) {
  schedule::ScheduleDefaults defaults;
  defaults.expression = settings.default_schedule;
  defaults.timezone   = settings.default_timezone;
  return defaults;
}

/*
  Lineage used for scheduling. An unknown device schedules on the stored
  device expression (if any) and the defaults; a registry expression for
  the device wins over the stored one.
*/
inline lineage::DeviceLineage SchedulingLineage(const std::optional<lineage::DeviceLineage>& resolved, const std::string& device_id,
                                                const std::string& stored_schedule) {
  lineage::DeviceLineage out = resolved.value_or(lineage::DeviceLineage{});
  out.device_id              = device_id;
  if (out.device_schedule.empty()) out.device_schedule = stored_schedule;
  return out;
}

inline schedule::WakePlan PlanNextWake(const lineage::DeviceLineage& lineage, util::TimePoint reference, const config::EngineSettings& settings) {
  return schedule::ComputeNextWake(lineage, absl::FromChrono(reference), DefaultsFrom(settings));
}

} // namespace fieldwake::core
