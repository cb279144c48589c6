#pragma once

/** \file clock.hpp
 *  \brief Time source and calendar helpers for time-dependent warehouse rules.
 *
 * Rules capture a wall_clock when built and read it on every evaluation, so a rule built at
 * startup keeps tracking the current time. Tests pin time with wall_clock::fixed.
 */

#include <chrono>
#include <functional>
#include <string>

namespace criteria::wms {

using time_point = std::chrono::sys_seconds;

class wall_clock {
public:
  /** \brief System clock (UTC). */
  wall_clock();

  /** \brief Clock frozen at `at`. */
  static auto fixed(time_point at) -> wall_clock;

  [[nodiscard]] auto now() const -> time_point;

private:
  explicit wall_clock(std::function<time_point()> source);

  std::function<time_point()> source_;
};

/** \brief Whole days from `from` to `to`, truncated toward zero (negative when to < from). */
[[nodiscard]] auto whole_days(time_point from, time_point to) -> long long;

/** \brief Fractional hours from `from` to `to`. */
[[nodiscard]] auto hours_between(time_point from, time_point to) -> double;

/** \brief Same UTC calendar day. */
[[nodiscard]] auto same_day(time_point a, time_point b) -> bool;

/** \brief "YYYY-MM-DD" in UTC. */
[[nodiscard]] auto format_date(time_point t) -> std::string;

} // namespace criteria::wms
