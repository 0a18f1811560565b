#include "touchfish/time.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/error.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdio>

#if defined(_WIN32)
#include <time.h>
#include <windows.h>
static std::time_t timegm_portable(std::tm *t) { return _mkgmtime(t); }
static bool localtime_portable(std::time_t t, std::tm *out) { return localtime_s(out, &t) == 0; }
static bool gmtime_portable(std::time_t t, std::tm *out) { return gmtime_s(out, &t) == 0; }
#else
// POSIX/macOS have timegm
static std::time_t timegm_portable(std::tm *t) { return timegm(t); }
static bool localtime_portable(std::time_t t, std::tm *out) { return localtime_r(&t, out) != nullptr; }
static bool gmtime_portable(std::time_t t, std::tm *out) { return gmtime_r(&t, out) != nullptr; }
#endif

namespace {

bool all_digits(std::string_view sv) {
  for (char c : sv) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return !sv.empty();
}

int to_int(std::string_view digits) {
  int v = 0;
  std::from_chars(digits.data(), digits.data() + digits.size(), v);
  return v;
}

[[noreturn]] void throw_malformed(std::string_view text) {
  throw touchfish::Error(touchfish::errc::malformed_time_string,
                         "invalid time '" + std::string(text) +
                             "': expected HH:MM in 24-hour format (e.g. 09:00)");
}

std::tm local_tm(std::time_t t) {
  std::tm out{};
  if (!localtime_portable(t, &out)) {
    throw touchfish::Error(touchfish::errc::clock_read_failure,
                           "cannot convert " + std::to_string(static_cast<long long>(t)) +
                               " to local time");
  }
  return out;
}

std::time_t checked_mktime(std::tm &tm) {
  const std::time_t t = std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    throw touchfish::Error(touchfish::errc::clock_read_failure,
                           "local time is not representable");
  }
  return t;
}

} // namespace

namespace touchfish {

TimeOfDay parse_time_of_day(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos)
    throw_malformed(text);

  const std::string_view hh = text.substr(0, colon);
  const std::string_view mm = text.substr(colon + 1);
  if (hh.size() > 2 || mm.size() != 2 || !all_digits(hh) || !all_digits(mm))
    throw_malformed(text);

  TimeOfDay tod{.hour = to_int(hh), .minute = to_int(mm)};
  if (tod.hour >= consts::kHoursPerDay || tod.minute >= consts::kMinutesPerHour)
    throw_malformed(text);
  return tod;
}

std::string format_time_of_day(TimeOfDay tod) {
  std::array<char, 8> buf{};
  std::snprintf(buf.data(), buf.size(), "%02d:%02d", tod.hour, tod.minute);
  return std::string(buf.data());
}

void validate_window(const TimeWindow &window) {
  if (!(window.start < window.end)) {
    throw Error(errc::invalid_window, "start time " + format_time_of_day(window.start) +
                                          " must be earlier than end time " +
                                          format_time_of_day(window.end));
  }
}

TimeWindow make_window(std::string_view start, std::string_view end) {
  TimeWindow w{.start = parse_time_of_day(start), .end = parse_time_of_day(end)};
  validate_window(w);
  return w;
}

TimeWindow default_window() {
  return make_window(consts::kDefaultStart, consts::kDefaultEnd);
}

namespace timeutil {

LocalDate local_date(std::time_t t) {
  const std::tm tm = local_tm(t);
  return LocalDate{.year = tm.tm_year + 1900, .month = tm.tm_mon + 1, .day = tm.tm_mday};
}

std::time_t at_local_time(const LocalDate &date, TimeOfDay tod) {
  std::tm tm{};
  tm.tm_year = date.year - 1900;
  tm.tm_mon = date.month - 1;
  tm.tm_mday = date.day;
  tm.tm_hour = tod.hour;
  tm.tm_min = tod.minute;
  tm.tm_sec = 0;
  tm.tm_isdst = -1; // let the C library decide
  return checked_mktime(tm);
}

LocalDate add_days(const LocalDate &date, int days) {
  // Noon keeps the normalisation clear of any DST transition.
  std::tm tm{};
  tm.tm_year = date.year - 1900;
  tm.tm_mon = date.month - 1;
  tm.tm_mday = date.day + days;
  tm.tm_hour = 12;
  tm.tm_isdst = -1;
  checked_mktime(tm);
  return LocalDate{.year = tm.tm_year + 1900, .month = tm.tm_mon + 1, .day = tm.tm_mday};
}

TimeOfDay local_time_of_day(std::time_t t) {
  const std::tm tm = local_tm(t);
  return TimeOfDay{.hour = tm.tm_hour, .minute = tm.tm_min};
}

int local_utc_offset_minutes(std::time_t t) {
  std::tm lt{}, gt{};
  if (!localtime_portable(t, &lt) || !gmtime_portable(t, &gt))
    throw Error(errc::clock_read_failure, "cannot determine the local UTC offset");
  // Convert both back to epoch and subtract: local - UTC
  const std::time_t local_epoch = timegm_portable(&lt);
  const std::time_t utc_epoch = timegm_portable(&gt);
  const long diff = local_epoch - utc_epoch; // seconds
  return static_cast<int>(diff / 60);        // minutes
}

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, hh, mm);
  return std::string(buf);
}

std::string format_rfc3339(std::time_t when, int utc_offset_minutes) {
  // Wall clock at the given offset, independent of the process TZ
  std::tm tm{};
  if (!gmtime_portable(when + static_cast<std::time_t>(utc_offset_minutes) * 60, &tm))
    throw Error(errc::clock_read_failure, "cannot format timestamp");
  std::array<char, 32> buf{};
  if (std::strftime(buf.data(), buf.size(), "%Y-%m-%dT%H:%M:%S", &tm) == 0)
    throw Error(errc::clock_read_failure, "cannot format timestamp");
  return std::string(buf.data()) + tz_offset_string(utc_offset_minutes);
}

std::string format_rfc3339(std::time_t when) {
  return format_rfc3339(when, local_utc_offset_minutes(when));
}

std::time_t now() {
  const std::time_t t = std::time(nullptr);
  if (t == static_cast<std::time_t>(-1))
    throw Error(errc::clock_read_failure, "cannot read the system clock");
  return t;
}

} // namespace timeutil

} // namespace touchfish
