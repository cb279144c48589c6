#include "criteria/wms/product_rules.hpp"

#include <string>
#include <utility>

#include "rule_support.hpp"

namespace criteria::wms::product_rules {

namespace {

constexpr const char* kComponent = "wms.product_rules";

auto flag(bool v) -> std::string { return v ? "true" : "false"; }

} // namespace

auto belongs_to_client(std::string client_id) -> std::expected<predicate<product>, core::error> {
  if (auto ok = detail::require_non_blank(client_id, "client id", kComponent); !ok) {
    return std::unexpected(std::move(ok.error()));
  }
  auto name = detail::tagged("product.belongs_to_client", client_id);
  return predicate<product>::of(
      [id = std::move(client_id)](const product& p) { return p.client_id == id; }, std::move(name));
}

auto is_hazmat() -> predicate<product> {
  return predicate<product>::of([](const product& p) { return p.is_hazmat; }, "product.is_hazmat");
}

auto is_fragile() -> predicate<product> {
  return predicate<product>::of([](const product& p) { return p.is_fragile; }, "product.is_fragile");
}

auto requires_refrigeration() -> predicate<product> {
  return predicate<product>::of([](const product& p) { return p.requires_refrigeration; },
                                "product.requires_refrigeration");
}

auto is_perishable() -> predicate<product> {
  return predicate<product>::of([](const product& p) { return p.expiration_date.has_value(); },
                                "product.is_perishable");
}

auto is_expired(wall_clock clock) -> predicate<product> {
  return predicate<product>::of(
      [clock](const product& p) {
        return p.expiration_date.has_value() && *p.expiration_date < clock.now();
      },
      "product.is_expired");
}

auto is_expiring(int days, wall_clock clock) -> std::expected<predicate<product>, core::error> {
  if (days < 0) return detail::reject("days until expiration must be non-negative", kComponent);
  return predicate<product>::of(
      [days, clock](const product& p) {
        if (!p.expiration_date) return false;
        const auto remaining = whole_days(clock.now(), *p.expiration_date);
        return remaining >= 0 && remaining <= days;
      },
      detail::tagged("product.is_expiring", std::to_string(days)));
}

auto is_category(product_category category) -> predicate<product> {
  return predicate<product>::of([category](const product& p) { return p.category == category; },
                                detail::tagged("product.is_category", to_string(category)));
}

auto exceeds_weight(double threshold) -> std::expected<predicate<product>, core::error> {
  if (!(threshold >= 0.0)) return detail::reject("weight threshold must be non-negative", kComponent);
  return predicate<product>::of([threshold](const product& p) { return p.weight > threshold; },
                                detail::tagged("product.exceeds_weight", threshold));
}

auto is_high_value(double threshold) -> std::expected<predicate<product>, core::error> {
  if (!(threshold >= 0.0)) return detail::reject("value threshold must be non-negative", kComponent);
  return predicate<product>::of([threshold](const product& p) { return p.unit_cost > threshold; },
                                detail::tagged("product.is_high_value", threshold));
}

auto requires_special_handling() -> predicate<product> {
  return predicate<product>::of(
      [](const product& p) { return p.is_hazmat || p.is_fragile || p.requires_refrigeration; },
      "product.requires_special_handling");
}

auto is_oversized(double threshold) -> std::expected<predicate<product>, core::error> {
  if (!(threshold >= 0.0)) return detail::reject("volume threshold must be non-negative", kComponent);
  return predicate<product>::of([threshold](const product& p) { return p.size.volume() > threshold; },
                                detail::tagged("product.is_oversized", threshold));
}

auto attributes(const product& p) -> filter_eval::attribute_set {
  filter_eval::attribute_set attrs;
  attrs.tags.emplace("sku", p.sku);
  attrs.tags.emplace("client_id", p.client_id);
  attrs.tags.emplace("name", p.name);
  attrs.tags.emplace("category", std::string(to_string(p.category)));
  attrs.tags.emplace("hazmat", flag(p.is_hazmat));
  attrs.tags.emplace("fragile", flag(p.is_fragile));
  attrs.tags.emplace("refrigerated", flag(p.requires_refrigeration));
  attrs.nums.emplace("weight", p.weight);
  attrs.nums.emplace("unit_cost", p.unit_cost);
  attrs.nums.emplace("volume", p.size.volume());
  return attrs;
}

} // namespace criteria::wms::product_rules
