#pragma once

/** \file models.hpp
 *  \brief Warehouse management (3PL) records used as example candidates.
 *
 * Records are plain aggregates. The make_* factories validate a draft and return the record
 * or invalid_argument; a record that failed validation is never produced.
 *
 * Example usage:
 * ```cpp
 * auto c = wms::make_client({
 *     .id = "TR001", .name = "Tire Rack", .contact_email = "logistics@tirerack.com",
 *     .tier = wms::client_tier::enterprise, .contract_start = start});
 * ```
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "criteria/error.hpp"
#include "criteria/wms/clock.hpp"

namespace criteria::wms {

enum class client_tier : std::uint8_t { standard, premium, enterprise };

enum class inventory_status : std::uint8_t {
  available, reserved, quarantine, damaged, expired, in_transit
};

enum class location_type : std::uint8_t {
  receiving, storage, picking, packing, shipping, quarantine, returns
};

enum class order_priority : std::uint8_t { low, normal, high, rush, same_day };

enum class shipping_method : std::uint8_t { ground, two_day_air, overnight, international, freight };

enum class order_status : std::uint8_t {
  pending, in_progress, picked, packed, shipped, delivered, cancelled, on_hold
};

enum class product_category : std::uint8_t {
  automotive, beauty, electronics, food, apparel, industrial, general
};

enum class shipment_status : std::uint8_t {
  created, picked_up, in_transit, out_for_delivery, delivered, delayed, exception, returned
};

[[nodiscard]] auto to_string(client_tier v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(inventory_status v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(location_type v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(order_priority v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(shipping_method v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(order_status v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(product_category v) noexcept -> std::string_view;
[[nodiscard]] auto to_string(shipment_status v) noexcept -> std::string_view;

/** \brief Online retailer using the warehouse's logistics services. */
struct client {
  std::string id;
  std::string name;
  std::string contact_email;
  client_tier tier{client_tier::standard};
  time_point contract_start{};
  std::optional<time_point> contract_end; /**< open-ended when absent */
  bool is_active{true};
};

/** \brief Product dimensions in inches. */
struct dimensions {
  double length{};
  double width{};
  double height{};

  [[nodiscard]] auto volume() const noexcept -> double { return length * width * height; }
};

struct product {
  std::string sku;
  std::string client_id;
  std::string name;
  std::string description;
  product_category category{product_category::general};
  double weight{};          /**< pounds */
  dimensions size{};
  bool is_fragile{false};
  bool is_hazmat{false};
  bool requires_refrigeration{false};
  double unit_cost{0.0};
  std::optional<time_point> expiration_date;
};

/** \brief Storage location zone-aisle-bay-level. */
struct location {
  std::string id;
  std::string zone;
  std::string aisle;
  std::string bay;
  std::string level;
  location_type type{location_type::storage};
  bool is_temperature_controlled{false};
  double max_weight{5000.0};
  bool is_hazmat_approved{false};
};

/** \brief Stock of one SKU at one location. */
struct inventory {
  std::string id;
  std::string sku;
  std::string client_id;
  std::string location_id;
  int quantity{};
  int reorder_point{};
  int max_quantity{};
  time_point last_count_date{};
  inventory_status status{inventory_status::available};
  std::optional<time_point> quarantine_until;
};

struct order_line {
  std::string sku;
  int quantity_ordered{};
  int quantity_picked{0};
};

struct order {
  std::string id;
  std::string client_id;
  time_point order_date{};
  time_point required_date{};
  order_priority priority{order_priority::normal};
  shipping_method method{shipping_method::ground};
  std::string destination_country;
  order_status status{order_status::pending};
  std::vector<order_line> lines;
};

struct shipment {
  std::string id;
  std::string order_id;
  std::string client_id;
  time_point ship_date{};
  std::string carrier;
  std::string tracking_number;
  double weight{};
  shipment_status status{shipment_status::created};
  std::optional<time_point> delivery_date;
};

/** \brief Non-blank id, name and e-mail; end date, if any, strictly after start. */
[[nodiscard]] auto make_client(client draft) -> std::expected<client, core::error>;

/** \brief All sides strictly positive. */
[[nodiscard]] auto make_dimensions(double length, double width, double height)
    -> std::expected<dimensions, core::error>;

/** \brief Non-blank sku, client and name; weight > 0; unit cost ≥ 0; valid dimensions. */
[[nodiscard]] auto make_product(product draft) -> std::expected<product, core::error>;

/** \brief Non-blank id, zone, aisle, bay and level; max weight > 0. */
[[nodiscard]] auto make_location(location draft) -> std::expected<location, core::error>;

/** \brief Non-blank ids; quantity ≥ 0; reorder point ≥ 0; max quantity ≥ reorder point. */
[[nodiscard]] auto make_inventory(inventory draft) -> std::expected<inventory, core::error>;

/** \brief Non-blank sku; ordered > 0; 0 ≤ picked ≤ ordered. */
[[nodiscard]] auto make_order_line(std::string sku, int quantity_ordered, int quantity_picked = 0)
    -> std::expected<order_line, core::error>;

/** \brief Non-blank ids and country; at least one valid line; required ≥ order date. */
[[nodiscard]] auto make_order(order draft) -> std::expected<order, core::error>;

/** \brief Non-blank ids, carrier and tracking; weight > 0; delivery, if any, ≥ ship date. */
[[nodiscard]] auto make_shipment(shipment draft) -> std::expected<shipment, core::error>;

} // namespace criteria::wms
