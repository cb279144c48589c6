#pragma once

/** \file product_rules.hpp
 *  \brief Business rules over client products, plus the attribute projection used by
 *         expression queries.
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/filter_eval.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms::product_rules {

[[nodiscard]] auto belongs_to_client(std::string client_id)
    -> std::expected<predicate<product>, core::error>;

[[nodiscard]] auto is_hazmat() -> predicate<product>;
[[nodiscard]] auto is_fragile() -> predicate<product>;
[[nodiscard]] auto requires_refrigeration() -> predicate<product>;

/** \brief Has an expiration date. */
[[nodiscard]] auto is_perishable() -> predicate<product>;

[[nodiscard]] auto is_expired(wall_clock clock = {}) -> predicate<product>;

/** \brief 0 ≤ whole days until expiration ≤ days. days ≥ 0. */
[[nodiscard]] auto is_expiring(int days = 30, wall_clock clock = {})
    -> std::expected<predicate<product>, core::error>;

[[nodiscard]] auto is_category(product_category category) -> predicate<product>;

/** \brief weight > threshold. threshold ≥ 0. */
[[nodiscard]] auto exceeds_weight(double threshold)
    -> std::expected<predicate<product>, core::error>;

/** \brief unit_cost > threshold. threshold ≥ 0. */
[[nodiscard]] auto is_high_value(double threshold = 1000.0)
    -> std::expected<predicate<product>, core::error>;

/** \brief Hazmat, fragile or refrigerated. */
[[nodiscard]] auto requires_special_handling() -> predicate<product>;

/** \brief volume > threshold (cubic inches). threshold ≥ 0. */
[[nodiscard]] auto is_oversized(double threshold = 10000.0)
    -> std::expected<predicate<product>, core::error>;

/**
 * \brief Attribute projection for filter_expr queries.
 *
 * Tags: sku, client_id, name, category, hazmat, fragile, refrigerated ("true"/"false").
 * Numbers: weight, unit_cost, volume.
 */
[[nodiscard]] auto attributes(const product& p) -> filter_eval::attribute_set;

} // namespace criteria::wms::product_rules
