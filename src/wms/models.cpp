#include "criteria/wms/models.hpp"

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

#include "rule_support.hpp"

namespace criteria::wms {

namespace {

using detail::reject;

// First blank field among (name, value) pairs, or nullptr.
auto first_blank(std::initializer_list<std::pair<const char*, std::string_view>> fields)
    -> const char* {
  for (const auto& [name, value] : fields) {
    if (core::is_blank(value)) return name;
  }
  return nullptr;
}

auto validate_line(const order_line& line) -> std::expected<void, core::error> {
  if (core::is_blank(line.sku)) return reject("sku must not be blank", "wms.order_line");
  if (line.quantity_ordered <= 0) {
    return reject("quantity ordered must be greater than zero", "wms.order_line");
  }
  if (line.quantity_picked < 0) return reject("quantity picked cannot be negative", "wms.order_line");
  if (line.quantity_picked > line.quantity_ordered) {
    return reject("quantity picked cannot exceed quantity ordered", "wms.order_line");
  }
  return {};
}

} // namespace

auto to_string(client_tier v) noexcept -> std::string_view {
  switch (v) {
    case client_tier::standard: return "Standard";
    case client_tier::premium: return "Premium";
    case client_tier::enterprise: return "Enterprise";
  }
  return "Unknown";
}

auto to_string(inventory_status v) noexcept -> std::string_view {
  switch (v) {
    case inventory_status::available: return "Available";
    case inventory_status::reserved: return "Reserved";
    case inventory_status::quarantine: return "Quarantine";
    case inventory_status::damaged: return "Damaged";
    case inventory_status::expired: return "Expired";
    case inventory_status::in_transit: return "InTransit";
  }
  return "Unknown";
}

auto to_string(location_type v) noexcept -> std::string_view {
  switch (v) {
    case location_type::receiving: return "Receiving";
    case location_type::storage: return "Storage";
    case location_type::picking: return "Picking";
    case location_type::packing: return "Packing";
    case location_type::shipping: return "Shipping";
    case location_type::quarantine: return "Quarantine";
    case location_type::returns: return "Returns";
  }
  return "Unknown";
}

auto to_string(order_priority v) noexcept -> std::string_view {
  switch (v) {
    case order_priority::low: return "Low";
    case order_priority::normal: return "Normal";
    case order_priority::high: return "High";
    case order_priority::rush: return "Rush";
    case order_priority::same_day: return "SameDay";
  }
  return "Unknown";
}

auto to_string(shipping_method v) noexcept -> std::string_view {
  switch (v) {
    case shipping_method::ground: return "Ground";
    case shipping_method::two_day_air: return "TwoDayAir";
    case shipping_method::overnight: return "Overnight";
    case shipping_method::international: return "International";
    case shipping_method::freight: return "Freight";
  }
  return "Unknown";
}

auto to_string(order_status v) noexcept -> std::string_view {
  switch (v) {
    case order_status::pending: return "Pending";
    case order_status::in_progress: return "InProgress";
    case order_status::picked: return "Picked";
    case order_status::packed: return "Packed";
    case order_status::shipped: return "Shipped";
    case order_status::delivered: return "Delivered";
    case order_status::cancelled: return "Cancelled";
    case order_status::on_hold: return "OnHold";
  }
  return "Unknown";
}

auto to_string(product_category v) noexcept -> std::string_view {
  switch (v) {
    case product_category::automotive: return "Automotive";
    case product_category::beauty: return "Beauty";
    case product_category::electronics: return "Electronics";
    case product_category::food: return "Food";
    case product_category::apparel: return "Apparel";
    case product_category::industrial: return "Industrial";
    case product_category::general: return "General";
  }
  return "Unknown";
}

auto to_string(shipment_status v) noexcept -> std::string_view {
  switch (v) {
    case shipment_status::created: return "Created";
    case shipment_status::picked_up: return "PickedUp";
    case shipment_status::in_transit: return "InTransit";
    case shipment_status::out_for_delivery: return "OutForDelivery";
    case shipment_status::delivered: return "Delivered";
    case shipment_status::delayed: return "Delayed";
    case shipment_status::exception: return "Exception";
    case shipment_status::returned: return "Returned";
  }
  return "Unknown";
}

auto make_client(client draft) -> std::expected<client, core::error> {
  if (const char* blank = first_blank({{"id", draft.id},
                                       {"name", draft.name},
                                       {"contact email", draft.contact_email}})) {
    return reject(std::string(blank) + " must not be blank", "wms.client");
  }
  if (draft.contract_end && *draft.contract_end <= draft.contract_start) {
    return reject("contract end date must be after start date", "wms.client");
  }
  return draft;
}

auto make_dimensions(double length, double width, double height)
    -> std::expected<dimensions, core::error> {
  if (!(length > 0.0) || !(width > 0.0) || !(height > 0.0)) {
    return reject("all dimensions must be greater than zero", "wms.dimensions");
  }
  return dimensions{length, width, height};
}

auto make_product(product draft) -> std::expected<product, core::error> {
  if (const char* blank = first_blank({{"sku", draft.sku},
                                       {"client id", draft.client_id},
                                       {"name", draft.name}})) {
    return reject(std::string(blank) + " must not be blank", "wms.product");
  }
  if (!(draft.weight > 0.0)) return reject("weight must be greater than zero", "wms.product");
  if (draft.unit_cost < 0.0) return reject("unit cost cannot be negative", "wms.product");
  if (auto dims = make_dimensions(draft.size.length, draft.size.width, draft.size.height); !dims) {
    return std::unexpected(std::move(dims.error()));
  }
  return draft;
}

auto make_location(location draft) -> std::expected<location, core::error> {
  if (const char* blank = first_blank({{"id", draft.id},
                                       {"zone", draft.zone},
                                       {"aisle", draft.aisle},
                                       {"bay", draft.bay},
                                       {"level", draft.level}})) {
    return reject(std::string(blank) + " must not be blank", "wms.location");
  }
  if (!(draft.max_weight > 0.0)) {
    return reject("max weight must be greater than zero", "wms.location");
  }
  return draft;
}

auto make_inventory(inventory draft) -> std::expected<inventory, core::error> {
  if (const char* blank = first_blank({{"id", draft.id},
                                       {"sku", draft.sku},
                                       {"client id", draft.client_id},
                                       {"location id", draft.location_id}})) {
    return reject(std::string(blank) + " must not be blank", "wms.inventory");
  }
  if (draft.quantity < 0) return reject("quantity cannot be negative", "wms.inventory");
  if (draft.reorder_point < 0) return reject("reorder point cannot be negative", "wms.inventory");
  if (draft.max_quantity < draft.reorder_point) {
    return reject("max quantity must be greater than or equal to reorder point", "wms.inventory");
  }
  return draft;
}

auto make_order_line(std::string sku, int quantity_ordered, int quantity_picked)
    -> std::expected<order_line, core::error> {
  order_line line{std::move(sku), quantity_ordered, quantity_picked};
  if (auto ok = validate_line(line); !ok) return std::unexpected(std::move(ok.error()));
  return line;
}

auto make_order(order draft) -> std::expected<order, core::error> {
  if (const char* blank = first_blank({{"id", draft.id},
                                       {"client id", draft.client_id},
                                       {"destination country", draft.destination_country}})) {
    return reject(std::string(blank) + " must not be blank", "wms.order");
  }
  if (draft.lines.empty()) return reject("order must have at least one line item", "wms.order");
  for (const auto& line : draft.lines) {
    if (auto ok = validate_line(line); !ok) return std::unexpected(std::move(ok.error()));
  }
  if (draft.required_date < draft.order_date) {
    return reject("required date must be on or after order date", "wms.order");
  }
  return draft;
}

auto make_shipment(shipment draft) -> std::expected<shipment, core::error> {
  if (const char* blank = first_blank({{"id", draft.id},
                                       {"order id", draft.order_id},
                                       {"client id", draft.client_id},
                                       {"carrier", draft.carrier},
                                       {"tracking number", draft.tracking_number}})) {
    return reject(std::string(blank) + " must not be blank", "wms.shipment");
  }
  if (!(draft.weight > 0.0)) return reject("weight must be greater than zero", "wms.shipment");
  if (draft.delivery_date && *draft.delivery_date < draft.ship_date) {
    return reject("delivery date cannot be before ship date", "wms.shipment");
  }
  return draft;
}

} // namespace criteria::wms
