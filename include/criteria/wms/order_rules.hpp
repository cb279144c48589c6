#pragma once

/** \file order_rules.hpp
 *  \brief Business rules over customer orders.
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms::order_rules {

[[nodiscard]] auto belongs_to_client(std::string client_id)
    -> std::expected<predicate<order>, core::error>;

[[nodiscard]] auto has_priority(order_priority priority) -> predicate<order>;

/** \brief Rush or SameDay priority. */
[[nodiscard]] auto is_urgent() -> predicate<order>;

[[nodiscard]] auto has_status(order_status status) -> predicate<order>;

/** \brief Required date passed and not yet Shipped, Delivered or Cancelled. */
[[nodiscard]] auto is_overdue(wall_clock clock = {}) -> predicate<order>;

/** \brief 0 < hours until required date ≤ hours. hours ≥ 0. */
[[nodiscard]] auto is_due_soon(int hours = 24, wall_clock clock = {})
    -> std::expected<predicate<order>, core::error>;

/** \brief Destination differs (ignoring ASCII case) from the domestic country. */
[[nodiscard]] auto is_international(std::string domestic_country = "USA")
    -> std::expected<predicate<order>, core::error>;

[[nodiscard]] auto has_shipping_method(shipping_method method) -> predicate<order>;

/** \brief Packed. */
[[nodiscard]] auto is_ready_to_ship() -> predicate<order>;

/** \brief Every line picked in full. */
[[nodiscard]] auto is_completely_picked() -> predicate<order>;

/** \brief Some line picked partially (0 < picked < ordered). */
[[nodiscard]] auto has_partial_picks() -> predicate<order>;

/** \brief More than `line_threshold` lines. line_threshold > 0. */
[[nodiscard]] auto is_large_order(int line_threshold = 10)
    -> std::expected<predicate<order>, core::error>;

/** \brief Urgent priority, air shipping, or due in under 8 hours (overdue included). */
[[nodiscard]] auto requires_expedited_processing(wall_clock clock = {}) -> predicate<order>;

/** \brief Placed on the current UTC calendar day. */
[[nodiscard]] auto is_placed_today(wall_clock clock = {}) -> predicate<order>;

} // namespace criteria::wms::order_rules
