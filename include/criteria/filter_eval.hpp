#pragma once

/** \file filter_eval.hpp
 *  \brief In-memory evaluation of filter_expr against tag/numeric attribute maps, and the
 *         expression-backed specification built on it.
 *
 * Semantics: and([]) == true, or([]) == false, not([]) == true; not over several children
 * holds when none of them does. A missing attribute never satisfies a term or range.
 */

#include <expected>
#include <functional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "criteria/error.hpp"
#include "criteria/filter_expr.hpp"
#include "criteria/filtering.hpp"
#include "criteria/predicate.hpp"
#include "criteria/specification.hpp"

namespace criteria::filter_eval {

using tags_t = std::unordered_map<std::string, std::string>;
using nums_t = std::unordered_map<std::string, double>;

/** \brief Attribute projection of one candidate. */
struct attribute_set {
  tags_t tags;
  nums_t nums;
};

// Evaluate whether a document with given tags/numerics matches the expression.
auto matches(const filter_expr& expr, const tags_t& tags, const nums_t& nums) -> bool;
auto matches(const filter_expr& expr, const attribute_set& attrs) -> bool;

/**
 * \brief Structural check run before an expression is used as a predicate.
 * \return invalid_argument for an empty field name; out_of_range for a range with max < min
 */
auto validate(const filter_expr& expr) -> std::expected<void, core::error>;

/** \brief Diagnostic rendering, e.g. (category == "Beauty" AND unit_cost in [20, 50]). */
auto to_string(const filter_expr& expr) -> std::string;

} // namespace criteria::filter_eval

namespace criteria {

/**
 * \brief Specification backed by a filter_expr over a projection of the candidate.
 *
 * The projection maps a candidate to its attribute_set on every evaluation; it must be pure.
 */
template <typename T>
class expression_specification final : public specification<T> {
public:
  using projection_type = std::function<filter_eval::attribute_set(const T&)>;

  /** \brief Validate expr and projection, then build the predicate. */
  static auto create(filter_expr expr, projection_type projection)
      -> std::expected<predicate<T>, core::error> {
    if (!projection) {
      return std::unexpected(core::trace_rejection(core::error{
          core::error_code::invalid_argument, "projection is empty", "filter.expression"}));
    }
    if (auto ok = filter_eval::validate(expr); !ok) {
      return std::unexpected(core::trace_rejection(std::move(ok.error())));
    }
    return predicate<T>::wrap(specification_ptr<T>(
        new expression_specification(std::move(expr), std::move(projection))));
  }

  auto is_satisfied_by(const T& candidate) const -> bool override {
    return filter_eval::matches(expr_, projection_(candidate));
  }

  auto describe() const -> std::string override { return filter_eval::to_string(expr_); }

  [[nodiscard]] auto expression() const noexcept -> const filter_expr& { return expr_; }

private:
  expression_specification(filter_expr expr, projection_type projection)
      : expr_(std::move(expr)), projection_(std::move(projection)) {}

  filter_expr expr_;
  projection_type projection_;
};

} // namespace criteria

namespace criteria::filter_eval {

/**
 * \brief Copies of the elements of `source` whose projection satisfies `expr`, in source order.
 *
 * A null expr selects every element. An expression that fails validate() is returned as the
 * error and nothing is evaluated.
 */
template <candidate_range Range, typename Projection>
[[nodiscard]] auto apply_filter(const filter_expr* expr, const Range& source, Projection projection)
    -> std::expected<std::vector<std::ranges::range_value_t<const Range>>, core::error> {
  using value_type = std::ranges::range_value_t<const Range>;
  if (!expr) return std::vector<value_type>(std::ranges::begin(source), std::ranges::end(source));
  auto rule = expression_specification<value_type>::create(*expr, std::move(projection));
  if (!rule) return std::unexpected(std::move(rule.error()));
  return to_vector(source, *rule);
}

} // namespace criteria::filter_eval
