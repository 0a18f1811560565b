#include "touchfish/generator.hpp"

#include "touchfish/error.hpp"

#include <exception>
#include <stdexcept>

namespace touchfish {

std::string GeneratedTimestamp::rfc3339() const {
  return timeutil::format_rfc3339(when, utc_offset_minutes);
}

TimestampGenerator::TimestampGenerator() {
  try {
    std::random_device rd;
    const std::uint64_t hi = rd();
    const std::uint64_t lo = rd();
    rng_.seed((hi << 32) ^ lo);
  } catch (const std::exception &e) {
    throw Error(errc::random_source_failure,
                std::string("cannot seed from the platform entropy source: ") + e.what());
  }
}

timeutil::LocalDate TimestampGenerator::anchor_date(std::optional<std::time_t> reference,
                                                    std::time_t now) {
  timeutil::LocalDate base = timeutil::local_date(now);
  if (reference) {
    // A future-dated HEAD (from an earlier run) moves the whole window forward.
    if (const auto ref_date = timeutil::local_date(*reference); ref_date > base)
      base = ref_date;
  }
  return base;
}

std::int64_t TimestampGenerator::window_span(const TimeWindow &window) {
  validate_window(window);
  return static_cast<std::int64_t>(window.end.minutes() - window.start.minutes()) * 60;
}

bool TimestampGenerator::fits_on(const TimeWindow &window, const timeutil::LocalDate &date) {
  const std::time_t start = timeutil::at_local_time(date, window.start);
  const std::time_t end = timeutil::at_local_time(date, window.end);
  // mktime moves a start inside a DST gap; a transition inside the window changes its length
  return timeutil::local_time_of_day(start) == window.start &&
         static_cast<std::int64_t>(end - start) == window_span(window);
}

timeutil::LocalDate TimestampGenerator::placement_date(const TimeWindow &window,
                                                       timeutil::LocalDate date) {
  for (int i = 0; i < kMaxSkippedDays; ++i, date = timeutil::add_days(date, 1)) {
    if (fits_on(window, date))
      return date;
  }
  throw Error(errc::invalid_window, "window " + format_time_of_day(window.start) + "-" +
                                        format_time_of_day(window.end) +
                                        " does not map to local time on any nearby day");
}

GeneratedTimestamp TimestampGenerator::place(const TimeWindow &window,
                                             std::optional<std::time_t> reference,
                                             std::time_t now, std::int64_t offset_seconds) {
  const std::int64_t span = window_span(window);
  if (offset_seconds < 0 || offset_seconds > span)
    throw std::invalid_argument("offset outside window span");

  const auto ordered = [&](std::time_t t) { return reference ? t > *reference : t >= now; };
  const auto at = [&](const timeutil::LocalDate &d) {
    return timeutil::at_local_time(d, window.start) + static_cast<std::time_t>(offset_seconds);
  };

  timeutil::LocalDate date = placement_date(window, anchor_date(reference, now));
  std::time_t candidate = at(date);
  if (!ordered(candidate)) {
    date = placement_date(window, timeutil::add_days(date, 1));
    candidate = at(date);
  }

  // Single shift; holds for any span under a day since the anchor is at or after the
  // reference date.
  if (!ordered(candidate)) {
    throw Error(errc::invalid_window,
                "cannot place a timestamp after " +
                    timeutil::format_rfc3339(reference ? *reference : now) + " within " +
                    format_time_of_day(window.start) + "-" + format_time_of_day(window.end));
  }
  return GeneratedTimestamp{.when = candidate,
                            .utc_offset_minutes = timeutil::local_utc_offset_minutes(candidate)};
}

GeneratedTimestamp TimestampGenerator::generate(const TimeWindow &window,
                                                std::optional<std::time_t> reference,
                                                std::time_t now) {
  std::uniform_int_distribution<std::int64_t> dist(0, window_span(window));
  return place(window, reference, now, dist(rng_));
}

} // namespace touchfish
