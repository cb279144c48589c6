#pragma once

/** \file shipment_rules.hpp
 *  \brief Business rules over outbound shipments.
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms::shipment_rules {

[[nodiscard]] auto belongs_to_client(std::string client_id)
    -> std::expected<predicate<shipment>, core::error>;

[[nodiscard]] auto has_status(shipment_status status) -> predicate<shipment>;

/** \brief Carrier name equal ignoring ASCII case. */
[[nodiscard]] auto is_carrier(std::string carrier)
    -> std::expected<predicate<shipment>, core::error>;

/** \brief Delayed or Exception. */
[[nodiscard]] auto is_delayed() -> predicate<shipment>;

/** \brief InTransit or OutForDelivery. */
[[nodiscard]] auto is_in_transit() -> predicate<shipment>;

/** \brief Delivered and a delivery date is recorded. */
[[nodiscard]] auto is_delivered() -> predicate<shipment>;

/** \brief start ≤ ship date ≤ end. invalid_argument when end < start. */
[[nodiscard]] auto is_shipped_in_date_range(time_point start, time_point end)
    -> std::expected<predicate<shipment>, core::error>;

/** \brief Delivered more than `expected_days` whole days after shipping. expected_days > 0. */
[[nodiscard]] auto has_long_delivery_time(int expected_days = 7)
    -> std::expected<predicate<shipment>, core::error>;

/** \brief weight > threshold. threshold > 0. */
[[nodiscard]] auto is_heavy_shipment(double threshold = 150.0)
    -> std::expected<predicate<shipment>, core::error>;

[[nodiscard]] auto is_returned() -> predicate<shipment>;

[[nodiscard]] auto is_shipped_today(wall_clock clock = {}) -> predicate<shipment>;

/** \brief Delayed, Exception or Returned. */
[[nodiscard]] auto has_delivery_issues() -> predicate<shipment>;

} // namespace criteria::wms::shipment_rules
