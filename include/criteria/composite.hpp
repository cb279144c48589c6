#pragma once

/** \file composite.hpp
 *  \brief Composite specifications: a closed set of boolean combinators over shared operands.
 *
 * A composite holds one (negation) or two operands and dispatches on its combinator tag.
 * Operands are evaluated left first with short-circuiting; nothing is cached between calls.
 * Composites never catch or translate anything raised by their operands.
 *
 * Construction rejects null operands, so a composite with an absent operand never exists.
 * Composites are acyclic by construction: they can only reference already-built operands.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "criteria/error.hpp"
#include "criteria/specification.hpp"

namespace criteria {

template <typename T> class predicate;

/** \brief Boolean combinator tags. */
enum class combinator : std::uint8_t {
  conjunction, /**< left && right */
  disjunction, /**< left || right */
  negation,    /**< !left */
  and_not,     /**< left && !right */
  or_not,      /**< left || !right */
};

[[nodiscard]] constexpr auto to_string(combinator op) noexcept -> std::string_view {
  switch (op) {
    case combinator::conjunction: return "AND";
    case combinator::disjunction: return "OR";
    case combinator::negation: return "NOT";
    case combinator::and_not: return "AND NOT";
    case combinator::or_not: return "OR NOT";
  }
  return "?";
}

template <typename T>
class composite_specification final : public specification<T> {
public:
  /**
   * \brief Build a binary composite.
   * \return the composite, or invalid_argument if an operand is null or op is negation
   */
  static auto binary(combinator op, specification_ptr<T> left, specification_ptr<T> right)
      -> std::expected<specification_ptr<T>, core::error> {
    if (op == combinator::negation) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "negation takes a single operand", "core.composite"});
    }
    if (!left) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "left operand is null", "core.composite"});
    }
    if (!right) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "right operand is null", "core.composite"});
    }
    return make(op, std::move(left), std::move(right));
  }

  /** \brief Build a negation; invalid_argument if inner is null. */
  static auto negate(specification_ptr<T> inner) -> std::expected<specification_ptr<T>, core::error> {
    if (!inner) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "operand is null", "core.composite"});
    }
    return make(combinator::negation, std::move(inner), nullptr);
  }

  auto is_satisfied_by(const T& candidate) const -> bool override {
    switch (op_) {
      case combinator::conjunction:
        return left_->is_satisfied_by(candidate) && right_->is_satisfied_by(candidate);
      case combinator::disjunction:
        return left_->is_satisfied_by(candidate) || right_->is_satisfied_by(candidate);
      case combinator::negation:
        return !left_->is_satisfied_by(candidate);
      case combinator::and_not:
        return left_->is_satisfied_by(candidate) && !right_->is_satisfied_by(candidate);
      case combinator::or_not:
        return left_->is_satisfied_by(candidate) || !right_->is_satisfied_by(candidate);
    }
    return false;
  }

  auto describe() const -> std::string override {
    if (op_ == combinator::negation) {
      return "NOT " + left_->describe();
    }
    std::string out = "(";
    out += left_->describe();
    out += ' ';
    out += to_string(op_);
    out += ' ';
    out += right_->describe();
    out += ')';
    return out;
  }

  [[nodiscard]] auto op() const noexcept -> combinator { return op_; }
  [[nodiscard]] auto left() const noexcept -> const specification_ptr<T>& { return left_; }
  /** \brief Right operand; null for negation. */
  [[nodiscard]] auto right() const noexcept -> const specification_ptr<T>& { return right_; }

private:
  friend class predicate<T>;

  composite_specification(combinator op, specification_ptr<T> left, specification_ptr<T> right)
      : op_(op), left_(std::move(left)), right_(std::move(right)) {}

  // Callers guarantee non-null operands.
  static auto make(combinator op, specification_ptr<T> left, specification_ptr<T> right)
      -> specification_ptr<T> {
    return specification_ptr<T>(new composite_specification(op, std::move(left), std::move(right)));
  }

  combinator op_;
  specification_ptr<T> left_;
  specification_ptr<T> right_;
};

} // namespace criteria
