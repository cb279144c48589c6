#pragma once

/** \file filter_expr.hpp
 *  \brief Attribute expression AST: predicates over string tags and numeric attributes.
 *
 * Use cases: declarative rules evaluated in memory against an attribute projection of a
 * candidate (see expression_specification in filter_eval.hpp).
 * Ownership: this AST is value-semantic and self-contained.
 */

#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace criteria {

/** \brief A simple term equality predicate field == value. */
struct term {
  std::string field; /**< attribute name */
  std::string value; /**< expected tag value */
};

/** \brief A numeric range predicate min_value ≤ field ≤ max_value. */
struct range {
  std::string field; /**< attribute name */
  double min_value{}; /**< inclusive */
  double max_value{}; /**< inclusive */
};

/** \brief Recursive filter expression. */
struct filter_expr {
  struct and_t { std::vector<filter_expr> children; };
  struct or_t  { std::vector<filter_expr> children; };
  struct not_t { std::vector<filter_expr> children; };

  std::variant<term, range, and_t, or_t, not_t> node; /**< root node */
};

inline auto all_of(std::initializer_list<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::and_t{std::vector<filter_expr>(children)}};
}

inline auto any_of(std::initializer_list<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::or_t{std::vector<filter_expr>(children)}};
}

// not over several children: none of them holds
inline auto none_of(std::initializer_list<filter_expr> children) -> filter_expr {
  return filter_expr{filter_expr::not_t{std::vector<filter_expr>(children)}};
}

} // namespace criteria
