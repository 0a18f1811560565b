#pragma once
#include "touchfish/time.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <random>
#include <string>

namespace touchfish {

struct GeneratedTimestamp {
  std::time_t when;        // seconds since the epoch
  int utc_offset_minutes;  // local offset in effect at `when`

  // "2024-01-02T09:15:00+08:00", the form handed to GIT_*_DATE
  [[nodiscard]] auto rfc3339() const -> std::string;
};

/**
 * Picks a commit timestamp inside the configured daily window.
 *
 * The result is strictly later than `reference` (the current HEAD commit time) when one
 * is given; otherwise it is not earlier than `now`. The window is anchored on the local
 * date of `now`, or on the reference's date when that is later. A candidate that would
 * break ordering is moved to the same offset into the window on the following date.
 * Dates on which a DST transition cuts into the window are passed over.
 *
 * Neither the configuration nor the repository is touched: every input is a parameter.
 */
class TimestampGenerator {
public:
  // Seeds from std::random_device. Throws Error(errc::random_source_failure).
  TimestampGenerator();
  explicit TimestampGenerator(std::uint64_t seed) : rng_(seed) {}

  [[nodiscard]] auto generate(const TimeWindow &window, std::optional<std::time_t> reference,
                              std::time_t now) -> GeneratedTimestamp;

  // Deterministic core of generate(): `offset_seconds` is the draw from [0, span].
  [[nodiscard]] static auto place(const TimeWindow &window,
                                  std::optional<std::time_t> reference, std::time_t now,
                                  std::int64_t offset_seconds) -> GeneratedTimestamp;

  // Local date the window is instantiated on.
  [[nodiscard]] static auto anchor_date(std::optional<std::time_t> reference, std::time_t now)
      -> timeutil::LocalDate;

  // Seconds from window start to window end; offsets are drawn from [0, span].
  [[nodiscard]] static auto window_span(const TimeWindow &window) -> std::int64_t;

  // True when every instant of the window on `date` exists exactly once in local time.
  [[nodiscard]] static auto fits_on(const TimeWindow &window, const timeutil::LocalDate &date)
      -> bool;

  // First date from `date` onward that the window fits on.
  // Throws Error(errc::invalid_window) if none does within a week.
  [[nodiscard]] static auto placement_date(const TimeWindow &window, timeutil::LocalDate date)
      -> timeutil::LocalDate;

private:
  static constexpr int kMaxSkippedDays = 7;

  std::mt19937_64 rng_;
};

} // namespace touchfish
