#include "criteria/samples/users.hpp"

namespace criteria::samples {

namespace {
constexpr int kAdultAge = 18;
}

auto is_adult::is_satisfied_by(const user& candidate) const -> bool {
  return candidate.age >= kAdultAge;
}
auto is_adult::describe() const -> std::string { return "is_adult"; }

auto is_active_user::is_satisfied_by(const user& candidate) const -> bool {
  return candidate.is_active;
}
auto is_active_user::describe() const -> std::string { return "is_active_user"; }

} // namespace criteria::samples
