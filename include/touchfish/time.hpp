#pragma once
#include <compare>
#include <ctime>
#include <string>
#include <string_view>

namespace touchfish {

// Wall-clock time of day with minute resolution.
struct TimeOfDay {
  int hour = 0;
  int minute = 0;

  [[nodiscard]] auto minutes() const -> int { return hour * 60 + minute; }
  auto operator<=>(const TimeOfDay &) const = default;
};

// Daily window [start, end]. Valid only when start < end.
struct TimeWindow {
  TimeOfDay start;
  TimeOfDay end;

  bool operator==(const TimeWindow &) const = default;
};

// Parse "H:MM" or "HH:MM" (24-hour). Throws Error(errc::malformed_time_string).
auto parse_time_of_day(std::string_view text) -> TimeOfDay;

// Always two-digit "HH:MM"
auto format_time_of_day(TimeOfDay tod) -> std::string;

// Throws Error(errc::invalid_window) unless start < end.
void validate_window(const TimeWindow &window);

// Parse both ends and validate the result.
auto make_window(std::string_view start, std::string_view end) -> TimeWindow;

// 00:00 - 02:00
auto default_window() -> TimeWindow;

namespace timeutil {

struct LocalDate {
  int year = 0;
  int month = 0; // 1..12
  int day = 0;   // 1..31

  auto operator<=>(const LocalDate &) const = default;
};

// Calendar date of `t` in the local timezone.
auto local_date(std::time_t t) -> LocalDate;

// Local timestamp for `date` at `tod` (seconds = 0).
auto at_local_time(const LocalDate &date, TimeOfDay tod) -> std::time_t;

// Calendar date `days` days after `date` (negative goes back).
auto add_days(const LocalDate &date, int days) -> LocalDate;

// Local wall-clock hour and minute of `t`.
auto local_time_of_day(std::time_t t) -> TimeOfDay;

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HH:MM from minutes (e.g., +180 -> "+03:00", -420 -> "-07:00")
auto tz_offset_string(int minutes) -> std::string;

// "2024-01-02T09:15:00+08:00" for `when` seen at a fixed offset east of UTC
auto format_rfc3339(std::time_t when, int utc_offset_minutes) -> std::string;

// Same, with the local offset in effect at `when`
auto format_rfc3339(std::time_t when) -> std::string;

// Current time; throws Error(errc::clock_read_failure) if the clock is unavailable.
auto now() -> std::time_t;

} // namespace timeutil

} // namespace touchfish
