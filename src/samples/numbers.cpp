#include "criteria/samples/numbers.hpp"

#include "criteria/core/trace.hpp"

namespace criteria::samples {

auto is_positive::is_satisfied_by(const int& candidate) const -> bool { return candidate > 0; }
auto is_positive::describe() const -> std::string { return "is_positive"; }

auto is_even::is_satisfied_by(const int& candidate) const -> bool { return candidate % 2 == 0; }
auto is_even::describe() const -> std::string { return "is_even"; }

auto in_range::create(int min_value, int max_value) -> std::expected<predicate<int>, core::error> {
  if (max_value < min_value) {
    return std::unexpected(core::trace_rejection(core::error{
        core::error_code::invalid_argument,
        "max (" + std::to_string(max_value) + ") is below min (" + std::to_string(min_value) + ")",
        "samples.in_range"}));
  }
  return predicate<int>::wrap(specification_ptr<int>(new in_range(min_value, max_value)));
}

auto in_range::is_satisfied_by(const int& candidate) const -> bool {
  return candidate >= min_ && candidate <= max_;
}

auto in_range::describe() const -> std::string {
  return "in_range[" + std::to_string(min_) + ", " + std::to_string(max_) + "]";
}

} // namespace criteria::samples
