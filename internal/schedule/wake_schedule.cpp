#include "internal/schedule/wake_schedule.hpp"

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <absl/time/civil_time.h>

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"

namespace fieldwake::schedule {

namespace {

constexpr std::string_view kFallbackExpression = "0 8 * * *";

std::optional<int> ParseNumber(std::string_view text, int min, int max) {
  int value = 0;
  if (text.empty() || !absl::SimpleAtoi(text, &value)) return std::nullopt;
  if (value < min || value > max) return std::nullopt;
  return value;
}

std::optional<WakeSchedule> ParseHourField(std::string_view field) {
  WakeSchedule schedule;

  if (field == "*") {
    schedule.kind           = WakeSchedule::Kind::kInterval;
    schedule.interval_hours = 1;
    return schedule;
  }

  if (absl::ConsumePrefix(&field, "*/")) {
    const auto step = ParseNumber(field, 1, 24);
    if (!step) return std::nullopt;
    schedule.kind           = WakeSchedule::Kind::kInterval;
    schedule.interval_hours = *step;
    return schedule;
  }

  for (const auto part : absl::StrSplit(field, ',')) {
    const auto hour = ParseNumber(absl::StripAsciiWhitespace(part), 0, 23);
    if (!hour) return std::nullopt;
    schedule.hours.push_back(*hour);
  }
  std::sort(schedule.hours.begin(), schedule.hours.end());
  schedule.hours.erase(std::unique(schedule.hours.begin(), schedule.hours.end()), schedule.hours.end());
  if (schedule.hours.empty()) return std::nullopt;

  schedule.kind = WakeSchedule::Kind::kHours;
  return schedule;
}

} // namespace

std::string_view ToString(ScheduleSource source) {
  switch (source) {
    case ScheduleSource::kDevice:
      return "device";
    case ScheduleSource::kSite:
      return "site";
    case ScheduleSource::kDefault:
      return "default";
  }
  return "unknown";
}

std::optional<WakeSchedule> ParseSchedule(std::string_view expression) {
  const auto trimmed = absl::StripAsciiWhitespace(expression);
  if (trimmed.empty()) return std::nullopt;

  std::vector<std::string_view> fields = absl::StrSplit(trimmed, absl::ByAnyChar(" \t"), absl::SkipEmpty());

  std::optional<WakeSchedule> parsed;
  if (fields.size() == 1) {
    parsed = ParseHourField(fields[0]);
  } else if (fields.size() == 5) {
    // minute must be a plain minute; day/month/weekday must be wildcards
    if (!ParseNumber(fields[0], 0, 59)) return std::nullopt;
    for (std::size_t i = 2; i < 5; ++i) {
      if (fields[i] != "*") return std::nullopt;
    }
    parsed = ParseHourField(fields[1]);
  }

  if (parsed) parsed->expression = std::string(trimmed);
  return parsed;
}

ResolvedSchedule ResolveSchedule(std::string_view device_expr, std::string_view site_expr, std::string_view default_expr) {
  const std::pair<std::string_view, ScheduleSource> candidates[] = {
      {device_expr, ScheduleSource::kDevice},
      {site_expr, ScheduleSource::kSite},
      {default_expr, ScheduleSource::kDefault},
  };

  for (const auto& [expr, source] : candidates) {
    if (absl::StripAsciiWhitespace(expr).empty()) continue;
    if (auto parsed = ParseSchedule(expr)) {
      return ResolvedSchedule{std::move(*parsed), source};
    }
    FIELDWAKE_LOG_WARN("ignoring invalid wake schedule",
                       {observability::StringField("expression", expr), observability::StringField("source", ToString(source))});
  }

  return ResolvedSchedule{*ParseSchedule(kFallbackExpression), ScheduleSource::kDefault};
}

absl::Time NextWake(const WakeSchedule& schedule, absl::Time reference, const absl::TimeZone& tz) {
  if (schedule.kind == WakeSchedule::Kind::kInterval) {
    return reference + absl::Hours(schedule.interval_hours);
  }

  const auto local = absl::ToCivilHour(reference, tz);
  const int  hour  = local.hour();

  // the current hour's slot counts as already served
  const auto next = std::upper_bound(schedule.hours.begin(), schedule.hours.end(), hour);
  if (next != schedule.hours.end()) {
    return absl::FromCivil(absl::CivilHour(local.year(), local.month(), local.day(), *next), tz);
  }

  const auto tomorrow = absl::CivilDay(local) + 1;
  return absl::FromCivil(absl::CivilHour(tomorrow.year(), tomorrow.month(), tomorrow.day(), schedule.hours.front()), tz);
}

std::string FormatDisplay(absl::Time instant, const absl::TimeZone& tz) {
  const auto local  = absl::ToCivilMinute(instant, tz);
  const int  hour12 = local.hour() % 12 == 0 ? 12 : local.hour() % 12;
  const int  minute = local.minute();
  return std::to_string(hour12) + (minute < 10 ? ":0" : ":") + std::to_string(minute) + (local.hour() < 12 ? "AM" : "PM");
}

absl::TimeZone ResolveTimeZone(std::string_view name, std::string_view fallback, std::string* resolved_name) {
  absl::TimeZone tz;
  for (const auto candidate : {name, fallback}) {
    if (candidate.empty()) continue;
    if (absl::LoadTimeZone(std::string(candidate), &tz)) {
      if (resolved_name) *resolved_name = std::string(candidate);
      return tz;
    }
    FIELDWAKE_LOG_WARN("unknown time zone", {observability::StringField("timezone", candidate)});
  }
  if (resolved_name) *resolved_name = "UTC";
  return absl::UTCTimeZone();
}

std::size_t DailyWakeCount(const WakeSchedule& schedule) {
  if (schedule.kind == WakeSchedule::Kind::kInterval) {
    return static_cast<std::size_t>((24 + schedule.interval_hours - 1) / schedule.interval_hours);
  }
  return schedule.hours.size();
}

WakePlan ComputeNextWake(const lineage::DeviceLineage& lineage, absl::Time reference, const ScheduleDefaults& defaults) {
  WakePlan plan;
  const auto tz       = ResolveTimeZone(lineage.timezone, defaults.timezone, &plan.timezone);
  const auto resolved = ResolveSchedule(lineage.device_schedule, lineage.site_schedule, defaults.expression);

  plan.instant    = NextWake(resolved.schedule, reference, tz);
  plan.display    = FormatDisplay(plan.instant, tz);
  plan.source     = resolved.source;
  plan.expression = resolved.schedule.expression;
  return plan;
}

} // namespace fieldwake::schedule
