#include "internal/schedule/wake_schedule.hpp"

#include <absl/time/civil_time.h>

#include <cassert>
#include <iostream>
#include <string>

namespace {

namespace schedule = fieldwake::schedule;

absl::Time Utc(int y, int m, int d, int hh, int mm = 0) {
  return absl::FromCivil(absl::CivilMinute(y, m, d, hh, mm), absl::UTCTimeZone());
}

void TestParsing() {
  const auto list = schedule::ParseSchedule("0 16,8,8 * * *");
  assert(list.has_value());
  assert(list->kind == schedule::WakeSchedule::Kind::kHours);
  assert((list->hours == std::vector<int>{8, 16}));

  const auto interval = schedule::ParseSchedule("*/6");
  assert(interval->kind == schedule::WakeSchedule::Kind::kInterval);
  assert(interval->interval_hours == 6);

  assert(schedule::ParseSchedule("*")->interval_hours == 1);
  assert((schedule::ParseSchedule("14")->hours == std::vector<int>{14}));

  assert(!schedule::ParseSchedule("").has_value());
  assert(!schedule::ParseSchedule("0 25 * * *").has_value());
  assert(!schedule::ParseSchedule("0 8 * * 1").has_value());
  assert(!schedule::ParseSchedule("*/0").has_value());
  assert(!schedule::ParseSchedule("30 8").has_value());
  assert(!schedule::ParseSchedule("eight").has_value());
}

void TestNextListedHourIsStrictlyAfterCurrentHour() {
  const auto hours = *schedule::ParseSchedule("0 8,16 * * *");
  const auto utc   = absl::UTCTimeZone();

  assert(schedule::NextWake(hours, Utc(2024, 5, 1, 7, 30), utc) == Utc(2024, 5, 1, 8));
  assert(schedule::NextWake(hours, Utc(2024, 5, 1, 8, 15), utc) == Utc(2024, 5, 1, 16));
  assert(schedule::NextWake(hours, Utc(2024, 5, 1, 17, 0), utc) == Utc(2024, 5, 2, 8));
  assert(schedule::NextWake(hours, Utc(2024, 12, 31, 23, 59), utc) == Utc(2025, 1, 1, 8));
}

void TestIntervalDoesNotSnap() {
  const auto every6 = *schedule::ParseSchedule("0 */6 * * *");
  const auto next   = schedule::NextWake(every6, Utc(2024, 5, 1, 10, 17), absl::UTCTimeZone());
  assert(next == Utc(2024, 5, 1, 16, 17));
  assert(schedule::FormatDisplay(next, absl::UTCTimeZone()) == "4:17PM");
}

void TestLocalTimeZone() {
  absl::TimeZone denver;
  assert(absl::LoadTimeZone("America/Denver", &denver));

  // 20:00 UTC is 14:00 MDT
  const auto next = schedule::NextWake(*schedule::ParseSchedule("8,16"), Utc(2024, 5, 1, 20), denver);
  assert(next == Utc(2024, 5, 1, 22));
  assert(schedule::FormatDisplay(next, denver) == "4:00PM");
}

void TestDisplayFormatting() {
  const auto utc = absl::UTCTimeZone();
  assert(schedule::FormatDisplay(Utc(2024, 5, 1, 0, 0), utc) == "12:00AM");
  assert(schedule::FormatDisplay(Utc(2024, 5, 1, 12, 5), utc) == "12:05PM");
  assert(schedule::FormatDisplay(Utc(2024, 5, 1, 8, 0), utc) == "8:00AM");
}

void TestResolutionPrecedence() {
  auto resolved = schedule::ResolveSchedule("0 */4 * * *", "0 9 * * *", "0 8 * * *");
  assert(resolved.source == schedule::ScheduleSource::kDevice);

  resolved = schedule::ResolveSchedule("bogus", "0 9 * * *", "0 8 * * *");
  assert(resolved.source == schedule::ScheduleSource::kSite);
  assert((resolved.schedule.hours == std::vector<int>{9}));

  resolved = schedule::ResolveSchedule("", "", "0 10 * * *");
  assert(resolved.source == schedule::ScheduleSource::kDefault);
  assert((resolved.schedule.hours == std::vector<int>{10}));

  resolved = schedule::ResolveSchedule("bad", "worse", "worst");
  assert(resolved.source == schedule::ScheduleSource::kDefault);
  assert((resolved.schedule.hours == std::vector<int>{8}));
}

void TestTimeZoneFallback() {
  std::string name;
  (void)schedule::ResolveTimeZone("Mars/Olympus", "America/New_York", &name);
  assert(name == "America/New_York");

  (void)schedule::ResolveTimeZone("", "Nowhere/Else", &name);
  assert(name == "UTC");
}

void TestDailyWakeCount() {
  assert(schedule::DailyWakeCount(*schedule::ParseSchedule("*/6")) == 4);
  assert(schedule::DailyWakeCount(*schedule::ParseSchedule("*/5")) == 5);
  assert(schedule::DailyWakeCount(*schedule::ParseSchedule("8,12,16")) == 3);
}

void TestComputeNextWakeUsesLineage() {
  fieldwake::lineage::DeviceLineage lineage;
  lineage.device_id       = "AABBCCDDEEFF";
  lineage.timezone        = "UTC";
  lineage.site_schedule   = "0 8,16 * * *";
  lineage.device_schedule = "0 */2 * * *";

  schedule::ScheduleDefaults defaults;
  auto                       plan = schedule::ComputeNextWake(lineage, Utc(2024, 5, 1, 9, 30), defaults);
  assert(plan.source == schedule::ScheduleSource::kDevice);
  assert(plan.instant == Utc(2024, 5, 1, 11, 30));
  assert(plan.display == "11:30AM");
  assert(plan.timezone == "UTC");

  lineage.device_schedule.clear();
  plan = schedule::ComputeNextWake(lineage, Utc(2024, 5, 1, 9, 30), defaults);
  assert(plan.source == schedule::ScheduleSource::kSite);
  assert(plan.display == "4:00PM");
}

} // namespace

int main() {
  TestParsing();
  TestNextListedHourIsStrictlyAfterCurrentHour();
  TestIntervalDoesNotSnap();
  TestLocalTimeZone();
  TestDisplayFormatting();
  TestResolutionPrecedence();
  TestTimeZoneFallback();
  TestDailyWakeCount();
  TestComputeNextWakeUsesLineage();

  std::cout << "fieldwake_unit_wake_schedule: pass\n";
  return 0;
}
