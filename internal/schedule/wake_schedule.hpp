#pragma once

#include <absl/time/time.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/lineage/lineage_resolver.hpp"

namespace fieldwake::schedule {

// Wake schedules are cron-shaped ("m h * * *") but only the hour field is
// honoured; sub-hour granularity is not supported. A bare hour field
// ("8,16", "*/6", "14", "*") is accepted as well.
//
//   list      8,16,20   -> next listed local hour after the reference hour
//   interval  */N       -> reference + N hours, no snapping (drift-free)
//   wildcard  *         -> interval of one hour
struct WakeSchedule {
  enum class Kind {
    kHours,
    kInterval,
  };

  Kind             kind = Kind::kHours;
  std::vector<int> hours;              // kHours: sorted, unique, 0..23
  int              interval_hours = 0; // kInterval: 1..24
  std::string      expression;
};

enum class ScheduleSource {
  kDevice,
  kSite,
  kDefault,
};

std::string_view ToString(ScheduleSource source);

struct ResolvedSchedule {
  WakeSchedule   schedule;
  ScheduleSource source = ScheduleSource::kDefault;
};

struct ScheduleDefaults {
  std::string expression = "0 8 * * *";
  std::string timezone   = "America/New_York";
};

struct WakePlan {
  absl::Time     instant;
  std::string    display;
  ScheduleSource source = ScheduleSource::kDefault;
  std::string    expression;
  std::string    timezone;
};

std::optional<WakeSchedule> ParseSchedule(std::string_view expression);

// device -> site -> default; invalid or empty expressions are skipped.
ResolvedSchedule ResolveSchedule(std::string_view device_expr, std::string_view site_expr, std::string_view default_expr);

absl::Time NextWake(const WakeSchedule& schedule, absl::Time reference, const absl::TimeZone& tz);

// "5:30PM", "8:00AM"
std::string FormatDisplay(absl::Time instant, const absl::TimeZone& tz);

// Named zone, else the fallback name, else UTC. `resolved_name` receives
// the name actually used.
absl::TimeZone ResolveTimeZone(std::string_view name, std::string_view fallback, std::string* resolved_name = nullptr);

std::size_t DailyWakeCount(const WakeSchedule& schedule);

// `reference` is the hello instant of the device's most recent wake.
WakePlan ComputeNextWake(const lineage::DeviceLineage& lineage, absl::Time reference, const ScheduleDefaults& defaults);

} // namespace fieldwake::schedule
