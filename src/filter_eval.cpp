#include "criteria/filter_eval.hpp"

#include <sstream>

namespace criteria::filter_eval {

static auto matches_node(const filter_expr& e, const tags_t& tags, const nums_t& nums) -> bool {
  if (std::holds_alternative<term>(e.node)) {
    const auto& t = std::get<term>(e.node);
    auto it = tags.find(t.field);
    return it != tags.end() && it->second == t.value;
  } else if (std::holds_alternative<range>(e.node)) {
    const auto& r = std::get<range>(e.node);
    auto it = nums.find(r.field);
    if (it == nums.end()) return false;
    return (it->second >= r.min_value) && (it->second <= r.max_value);
  } else if (std::holds_alternative<filter_expr::and_t>(e.node)) {
    const auto& a = std::get<filter_expr::and_t>(e.node);
    for (const auto& c : a.children) if (!matches_node(c, tags, nums)) return false;
    return true; // and([]) == true
  } else if (std::holds_alternative<filter_expr::or_t>(e.node)) {
    const auto& o = std::get<filter_expr::or_t>(e.node);
    for (const auto& c : o.children) if (matches_node(c, tags, nums)) return true;
    return false; // or([]) == false
  } else if (std::holds_alternative<filter_expr::not_t>(e.node)) {
    const auto& n = std::get<filter_expr::not_t>(e.node);
    for (const auto& c : n.children) if (matches_node(c, tags, nums)) return false;
    return true; // not([]) == true
  }
  return false;
}

auto matches(const filter_expr& expr, const tags_t& tags, const nums_t& nums) -> bool {
  return matches_node(expr, tags, nums);
}

auto matches(const filter_expr& expr, const attribute_set& attrs) -> bool {
  return matches_node(expr, attrs.tags, attrs.nums);
}

static auto validate_children(const std::vector<filter_expr>& children)
    -> std::expected<void, core::error> {
  for (const auto& c : children) {
    if (auto ok = validate(c); !ok) return ok;
  }
  return {};
}

auto validate(const filter_expr& expr) -> std::expected<void, core::error> {
  if (const auto* t = std::get_if<term>(&expr.node)) {
    if (t->field.empty()) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "term field is empty", "filter.expression"});
    }
    return {};
  }
  if (const auto* r = std::get_if<range>(&expr.node)) {
    if (r->field.empty()) {
      return std::unexpected(core::error{core::error_code::invalid_argument,
                                         "range field is empty", "filter.expression"});
    }
    if (r->max_value < r->min_value) {
      return std::unexpected(core::error{core::error_code::out_of_range,
                                         "range max is below min for field '" + r->field + "'",
                                         "filter.expression"});
    }
    return {};
  }
  if (const auto* a = std::get_if<filter_expr::and_t>(&expr.node)) return validate_children(a->children);
  if (const auto* o = std::get_if<filter_expr::or_t>(&expr.node)) return validate_children(o->children);
  if (const auto* n = std::get_if<filter_expr::not_t>(&expr.node)) return validate_children(n->children);
  return {};
}

static void render(std::ostringstream& os, const filter_expr& e);

static void render_group(std::ostringstream& os, const std::vector<filter_expr>& children,
                         const char* sep, const char* empty) {
  if (children.empty()) {
    os << empty;
    return;
  }
  if (children.size() == 1) {
    render(os, children.front());
    return;
  }
  os << '(';
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (i) os << sep;
    render(os, children[i]);
  }
  os << ')';
}

static void render(std::ostringstream& os, const filter_expr& e) {
  if (const auto* t = std::get_if<term>(&e.node)) {
    os << t->field << " == \"" << t->value << '"';
  } else if (const auto* r = std::get_if<range>(&e.node)) {
    os << r->field << " in [" << r->min_value << ", " << r->max_value << ']';
  } else if (const auto* a = std::get_if<filter_expr::and_t>(&e.node)) {
    render_group(os, a->children, " AND ", "TRUE");
  } else if (const auto* o = std::get_if<filter_expr::or_t>(&e.node)) {
    render_group(os, o->children, " OR ", "FALSE");
  } else if (const auto* n = std::get_if<filter_expr::not_t>(&e.node)) {
    if (n->children.empty()) {
      os << "TRUE";
      return;
    }
    os << "NOT ";
    render_group(os, n->children, " OR ", "FALSE");
  }
}

auto to_string(const filter_expr& expr) -> std::string {
  std::ostringstream os;
  render(os, expr);
  return os.str();
}

} // namespace criteria::filter_eval
