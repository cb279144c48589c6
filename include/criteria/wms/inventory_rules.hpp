#pragma once

/** \file inventory_rules.hpp
 *  \brief Business rules over inventory records.
 *
 * Rules taking an identifier or threshold validate it once, at construction, and report
 * invalid_argument through std::expected.
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms::inventory_rules {

[[nodiscard]] auto belongs_to_client(std::string client_id)
    -> std::expected<predicate<inventory>, core::error>;

[[nodiscard]] auto is_at_location(std::string location_id)
    -> std::expected<predicate<inventory>, core::error>;

/** \brief quantity ≤ reorder point while Available. */
[[nodiscard]] auto is_below_reorder_point() -> predicate<inventory>;

[[nodiscard]] auto is_out_of_stock() -> predicate<inventory>;

/**
 * \brief quantity / max_quantity ≥ threshold; never true when max_quantity is 0.
 *
 * threshold must lie in [0, 1].
 */
[[nodiscard]] auto is_near_capacity(double threshold = 0.9)
    -> std::expected<predicate<inventory>, core::error>;

[[nodiscard]] auto has_status(inventory_status status) -> predicate<inventory>;

/** \brief Quarantined with a release date still in the future. */
[[nodiscard]] auto is_in_quarantine(wall_clock clock = {}) -> predicate<inventory>;

/** \brief Quarantined with a release date at or before now. */
[[nodiscard]] auto can_release_from_quarantine(wall_clock clock = {}) -> predicate<inventory>;

/** \brief More than `days` whole days since the last count. days ≥ 0. */
[[nodiscard]] auto needs_cycle_count(int days = 30, wall_clock clock = {})
    -> std::expected<predicate<inventory>, core::error>;

/** \brief Available with stock on hand. */
[[nodiscard]] auto is_available() -> predicate<inventory>;

/** \brief Damaged, Expired, or Available with zero quantity. */
[[nodiscard]] auto requires_immediate_attention() -> predicate<inventory>;

} // namespace criteria::wms::inventory_rules
