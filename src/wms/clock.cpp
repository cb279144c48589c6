#include "criteria/wms/clock.hpp"

#include <cstdio>
#include <utility>

namespace criteria::wms {

wall_clock::wall_clock()
    : source_([] { return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now()); }) {}

wall_clock::wall_clock(std::function<time_point()> source) : source_(std::move(source)) {}

auto wall_clock::fixed(time_point at) -> wall_clock {
  return wall_clock([at] { return at; });
}

auto wall_clock::now() const -> time_point { return source_(); }

auto whole_days(time_point from, time_point to) -> long long {
  return std::chrono::duration_cast<std::chrono::days>(to - from).count();
}

auto hours_between(time_point from, time_point to) -> double {
  return std::chrono::duration<double, std::chrono::hours::period>(to - from).count();
}

auto same_day(time_point a, time_point b) -> bool {
  return std::chrono::floor<std::chrono::days>(a) == std::chrono::floor<std::chrono::days>(b);
}

auto format_date(time_point t) -> std::string {
  const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(t)};
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
  return buf;
}

} // namespace criteria::wms
