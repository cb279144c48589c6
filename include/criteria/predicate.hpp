#pragma once

/** \file predicate.hpp
 *  \brief Value handle over a non-null specification with fluent combinators.
 *
 * A predicate<T> always refers to a live specification: the only ways to obtain one are
 * checked factories (wrap, from_function, leaf create() functions) and make_predicate.
 * Combinators taking a predicate therefore cannot fail; overloads taking a raw
 * specification_ptr validate it and report a null operand through std::expected.
 *
 * Combinators never evaluate anything and never modify the receiver; they return a new
 * handle that shares the operands.
 *
 * Example:
 * ```cpp
 * auto strong = min_length8.and_(has_special).and_(has_digit);
 * bool ok = strong.test("ValidP@ssw0rd");
 * ```
 */

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "criteria/composite.hpp"
#include "criteria/core/trace.hpp"
#include "criteria/error.hpp"
#include "criteria/specification.hpp"

namespace criteria {

/** \brief Leaf specification backed by a callable. Built through predicate::from_function. */
template <typename T>
class function_specification final : public specification<T> {
public:
  using function_type = std::function<bool(const T&)>;

  auto is_satisfied_by(const T& candidate) const -> bool override { return fn_(candidate); }
  auto describe() const -> std::string override { return name_.empty() ? "function" : name_; }

private:
  friend class predicate<T>;

  function_specification(function_type fn, std::string name)
      : fn_(std::move(fn)), name_(std::move(name)) {}

  function_type fn_;
  std::string name_;
};

template <typename T>
class predicate {
public:
  using candidate_type = T;

  /** \brief Adopt an existing specification; invalid_argument if spec is null. */
  static auto wrap(specification_ptr<T> spec) -> std::expected<predicate, core::error> {
    if (!spec) {
      return std::unexpected(core::trace_rejection(
          core::error{core::error_code::invalid_argument, "specification is null", "core.predicate"}));
    }
    return predicate(std::move(spec));
  }

  /** \brief Leaf predicate from a callable; invalid_argument if fn is empty. */
  static auto from_function(std::function<bool(const T&)> fn, std::string name = {})
      -> std::expected<predicate, core::error> {
    if (!fn) {
      return std::unexpected(core::trace_rejection(
          core::error{core::error_code::invalid_argument, "function is empty", "core.predicate"}));
    }
    return predicate(specification_ptr<T>(
        new function_specification<T>(std::move(fn), std::move(name))));
  }

  /**
   * \brief Leaf predicate from a closure type, which can never be empty.
   *
   * Function pointers and std::function go through from_function instead.
   */
  template <typename F>
    requires(std::is_class_v<std::decay_t<F>> &&
             !std::is_same_v<std::decay_t<F>, std::function<bool(const T&)>> &&
             std::is_invocable_r_v<bool, const std::decay_t<F>&, const T&>)
  [[nodiscard]] static auto of(F&& fn, std::string name = {}) -> predicate {
    return predicate(specification_ptr<T>(new function_specification<T>(
        typename function_specification<T>::function_type(std::forward<F>(fn)), std::move(name))));
  }

  /** \brief Construct an unparameterised leaf Spec in place. */
  template <typename Spec, typename... Args>
  [[nodiscard]] static auto make(Args&&... args) -> predicate {
    static_assert(std::is_base_of_v<specification<T>, Spec>,
                  "Spec must derive from specification<T>");
    return predicate(std::make_shared<const Spec>(std::forward<Args>(args)...));
  }

  [[nodiscard]] auto test(const T& candidate) const -> bool {
    return spec_->is_satisfied_by(candidate);
  }

  [[nodiscard]] auto operator()(const T& candidate) const -> bool { return test(candidate); }

  [[nodiscard]] auto and_(const predicate& other) const -> predicate {
    return compose(combinator::conjunction, other.spec_);
  }
  [[nodiscard]] auto or_(const predicate& other) const -> predicate {
    return compose(combinator::disjunction, other.spec_);
  }
  [[nodiscard]] auto and_not(const predicate& other) const -> predicate {
    return compose(combinator::and_not, other.spec_);
  }
  [[nodiscard]] auto or_not(const predicate& other) const -> predicate {
    return compose(combinator::or_not, other.spec_);
  }
  [[nodiscard]] auto not_() const -> predicate {
    return predicate(composite_specification<T>::make(combinator::negation, spec_, nullptr));
  }

  // Raw-operand overloads: a null operand is a construction error.
  [[nodiscard]] auto and_(specification_ptr<T> other) const -> std::expected<predicate, core::error> {
    return checked(combinator::conjunction, std::move(other));
  }
  [[nodiscard]] auto or_(specification_ptr<T> other) const -> std::expected<predicate, core::error> {
    return checked(combinator::disjunction, std::move(other));
  }
  [[nodiscard]] auto and_not(specification_ptr<T> other) const -> std::expected<predicate, core::error> {
    return checked(combinator::and_not, std::move(other));
  }
  [[nodiscard]] auto or_not(specification_ptr<T> other) const -> std::expected<predicate, core::error> {
    return checked(combinator::or_not, std::move(other));
  }

  [[nodiscard]] auto describe() const -> std::string { return spec_->describe(); }

  /** \brief Underlying specification; never null. */
  [[nodiscard]] auto spec() const noexcept -> const specification_ptr<T>& { return spec_; }

private:
  explicit predicate(specification_ptr<T> spec) noexcept : spec_(std::move(spec)) {}

  auto compose(combinator op, const specification_ptr<T>& right) const -> predicate {
    return predicate(composite_specification<T>::make(op, spec_, right));
  }

  auto checked(combinator op, specification_ptr<T> right) const
      -> std::expected<predicate, core::error> {
    auto composed = composite_specification<T>::binary(op, spec_, std::move(right));
    if (!composed) return std::unexpected(core::trace_rejection(std::move(composed.error())));
    return predicate(std::move(*composed));
  }

  specification_ptr<T> spec_;
};

/** \brief make_predicate<is_positive>() == predicate<int>::make<is_positive>(). */
template <typename Spec, typename... Args>
[[nodiscard]] auto make_predicate(Args&&... args) -> predicate<typename Spec::candidate_type> {
  return predicate<typename Spec::candidate_type>::template make<Spec>(std::forward<Args>(args)...);
}

template <typename T>
[[nodiscard]] auto operator&&(const predicate<T>& lhs, const predicate<T>& rhs) -> predicate<T> {
  return lhs.and_(rhs);
}

template <typename T>
[[nodiscard]] auto operator||(const predicate<T>& lhs, const predicate<T>& rhs) -> predicate<T> {
  return lhs.or_(rhs);
}

template <typename T>
[[nodiscard]] auto operator!(const predicate<T>& p) -> predicate<T> {
  return p.not_();
}

} // namespace criteria
