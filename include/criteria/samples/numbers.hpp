#pragma once

/** \file numbers.hpp
 *  \brief Integer leaf specifications used by the examples and tests.
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/specification.hpp"

namespace criteria::samples {

/** \brief x > 0 */
class is_positive final : public specification<int> {
public:
  auto is_satisfied_by(const int& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

/** \brief x % 2 == 0 (negative even numbers included). */
class is_even final : public specification<int> {
public:
  auto is_satisfied_by(const int& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

/** \brief min ≤ x ≤ max, both bounds inclusive. */
class in_range final : public specification<int> {
public:
  /** \brief invalid_argument when max_value < min_value. */
  static auto create(int min_value, int max_value) -> std::expected<predicate<int>, core::error>;

  auto is_satisfied_by(const int& candidate) const -> bool override;
  auto describe() const -> std::string override;

  [[nodiscard]] auto min_value() const noexcept -> int { return min_; }
  [[nodiscard]] auto max_value() const noexcept -> int { return max_; }

private:
  in_range(int min_value, int max_value) : min_(min_value), max_(max_value) {}

  int min_;
  int max_;
};

} // namespace criteria::samples
