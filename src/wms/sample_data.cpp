#include "criteria/wms/sample_data.hpp"

#include <chrono>
#include <initializer_list>
#include <utility>

namespace criteria::wms {

namespace {

using std::chrono::days;
using std::chrono::hours;

template <typename T>
auto collect(std::initializer_list<std::expected<T, core::error>> made)
    -> std::expected<std::vector<T>, core::error> {
  std::vector<T> out;
  out.reserve(made.size());
  for (const auto& m : made) {
    if (!m) return std::unexpected(m.error());
    out.push_back(*m);
  }
  return out;
}

auto clients_at(time_point now) -> std::expected<std::vector<client>, core::error> {
  return collect<client>({
      make_client({.id = "TR001", .name = "Tire Rack", .contact_email = "logistics@tirerack.com",
                   .tier = client_tier::enterprise, .contract_start = add_months(now, -24),
                   .contract_end = add_months(now, 12)}),
      make_client({.id = "FB001", .name = "Fenty Beauty", .contact_email = "warehouse@fentybeauty.com",
                   .tier = client_tier::premium, .contract_start = add_months(now, -12),
                   .contract_end = add_months(now, 6)}),
      make_client({.id = "NE001", .name = "Newegg", .contact_email = "fulfillment@newegg.com",
                   .tier = client_tier::enterprise, .contract_start = add_months(now, -36),
                   .contract_end = add_months(now, 24)}),
      make_client({.id = "SM001", .name = "Small Retailer", .contact_email = "orders@small.com",
                   .tier = client_tier::standard, .contract_start = add_months(now, -6),
                   .contract_end = add_months(now, 6)}),
  });
}

auto products_at(time_point now) -> std::expected<std::vector<product>, core::error> {
  return collect<product>({
      make_product({.sku = "TIRE-001", .client_id = "TR001", .name = "All-Season Tire 225/65R17",
                    .description = "Premium all-season tire", .category = product_category::automotive,
                    .weight = 25.0, .size = {28, 9, 28}, .unit_cost = 120.0}),
      make_product({.sku = "FB-LIP-001", .client_id = "FB001", .name = "Fenty Icon Lipstick",
                    .description = "Velvet liquid lipstick", .category = product_category::beauty,
                    .weight = 0.15, .size = {4, 1, 1}, .is_fragile = true, .unit_cost = 25.0,
                    .expiration_date = add_months(now, 18)}),
      make_product({.sku = "NE-GPU-001", .client_id = "NE001", .name = "RTX 4090 Graphics Card",
                    .description = "High-end GPU", .category = product_category::electronics,
                    .weight = 5.0, .size = {12, 5, 2}, .is_fragile = true, .unit_cost = 1599.0}),
      make_product({.sku = "CHEM-001", .client_id = "TR001", .name = "Tire Sealant Spray",
                    .description = "Emergency tire repair", .category = product_category::automotive,
                    .weight = 1.5, .size = {10, 3, 3}, .is_hazmat = true, .unit_cost = 15.0}),
      make_product({.sku = "FB-FOUND-001", .client_id = "FB001", .name = "Pro Filt'r Foundation",
                    .description = "Soft matte foundation", .category = product_category::beauty,
                    .weight = 0.3, .size = {5, 2, 2}, .is_fragile = true, .unit_cost = 40.0,
                    .expiration_date = now + days{10}}),
  });
}

auto stock_at(time_point now) -> std::expected<std::vector<inventory>, core::error> {
  auto record = [now](const char* id, const char* sku, const char* client_id, const char* loc,
                      int qty, int reorder, int max_qty, int days_since_count) {
    return make_inventory({.id = id, .sku = sku, .client_id = client_id, .location_id = loc,
                           .quantity = qty, .reorder_point = reorder, .max_quantity = max_qty,
                           .last_count_date = now - days{days_since_count},
                           .status = inventory_status::available});
  };
  return collect<inventory>({
      record("INV-001", "TIRE-001", "TR001", "LOC-A1", 45, 100, 500, 45),
      record("INV-002", "FB-LIP-001", "FB001", "LOC-B2", 250, 200, 1000, 15),
      record("INV-003", "NE-GPU-001", "NE001", "LOC-C3", 8, 10, 50, 20),
      record("INV-004", "CHEM-001", "TR001", "LOC-D4", 0, 50, 200, 60),
      record("INV-005", "FB-FOUND-001", "FB001", "LOC-B1", 150, 100, 800, 10),
  });
}

auto locations() -> std::expected<std::vector<location>, core::error> {
  auto storage = [](const char* id, const char* zone, const char* aisle, const char* bay,
                    const char* level, bool temperature_controlled, double max_weight,
                    bool hazmat_approved) {
    return make_location({.id = id, .zone = zone, .aisle = aisle, .bay = bay, .level = level,
                          .type = location_type::storage,
                          .is_temperature_controlled = temperature_controlled,
                          .max_weight = max_weight, .is_hazmat_approved = hazmat_approved});
  };
  return collect<location>({
      storage("LOC-A1", "A", "01", "01", "1", false, 5000, false),
      storage("LOC-B1", "B", "02", "01", "1", true, 2000, false),
      storage("LOC-B2", "B", "02", "02", "2", true, 2000, false),
      storage("LOC-C3", "C", "03", "03", "1", false, 1000, false),
      storage("LOC-D4", "D", "04", "01", "1", false, 3000, true),
  });
}

auto orders_at(time_point now) -> std::expected<std::vector<order>, core::error> {
  return collect<order>({
      make_order({.id = "ORD-001", .client_id = "TR001", .order_date = now - days{1},
                  .required_date = now + hours{6}, .priority = order_priority::rush,
                  .method = shipping_method::overnight, .destination_country = "USA",
                  .status = order_status::pending, .lines = {{"TIRE-001", 4}}}),
      make_order({.id = "ORD-002", .client_id = "FB001", .order_date = now - days{2},
                  .required_date = now + days{3}, .priority = order_priority::normal,
                  .method = shipping_method::ground, .destination_country = "USA",
                  .status = order_status::pending,
                  .lines = {{"FB-LIP-001", 50}, {"FB-FOUND-001", 30}}}),
      make_order({.id = "ORD-003", .client_id = "NE001", .order_date = now,
                  .required_date = now + days{1}, .priority = order_priority::high,
                  .method = shipping_method::two_day_air, .destination_country = "Canada",
                  .status = order_status::pending, .lines = {{"NE-GPU-001", 2}}}),
  });
}

auto shipments_at(time_point now) -> std::expected<std::vector<shipment>, core::error> {
  return collect<shipment>({
      make_shipment({.id = "SHIP-001", .order_id = "ORD-100", .client_id = "TR001",
                     .ship_date = now - days{5}, .carrier = "FedEx",
                     .tracking_number = "1Z999AA10123456784", .weight = 100.0,
                     .status = shipment_status::in_transit}),
      make_shipment({.id = "SHIP-002", .order_id = "ORD-101", .client_id = "FB001",
                     .ship_date = now - days{3}, .carrier = "UPS",
                     .tracking_number = "1Z999AA10123456785", .weight = 5.0,
                     .status = shipment_status::delayed}),
      make_shipment({.id = "SHIP-003", .order_id = "ORD-102", .client_id = "NE001",
                     .ship_date = now - days{10}, .carrier = "USPS",
                     .tracking_number = "9400100000000000000000", .weight = 10.0,
                     .status = shipment_status::delivered, .delivery_date = now - days{2}}),
  });
}

} // namespace

auto add_months(time_point t, int months) -> time_point {
  const auto day = std::chrono::floor<days>(t);
  const auto time_of_day = t - day;
  std::chrono::year_month_day ymd{day};
  ymd += std::chrono::months{months};
  if (!ymd.ok()) ymd = std::chrono::year_month_day_last{ymd.year(), std::chrono::month_day_last{ymd.month()}};
  return std::chrono::sys_days{ymd} + time_of_day;
}

auto load_sample_warehouse(time_point now) -> std::expected<warehouse_snapshot, core::error> {
  warehouse_snapshot snapshot;

  auto c = clients_at(now);
  if (!c) return std::unexpected(std::move(c.error()));
  snapshot.clients = std::move(*c);

  auto p = products_at(now);
  if (!p) return std::unexpected(std::move(p.error()));
  snapshot.products = std::move(*p);

  auto s = stock_at(now);
  if (!s) return std::unexpected(std::move(s.error()));
  snapshot.stock = std::move(*s);

  auto l = locations();
  if (!l) return std::unexpected(std::move(l.error()));
  snapshot.locations = std::move(*l);

  auto o = orders_at(now);
  if (!o) return std::unexpected(std::move(o.error()));
  snapshot.orders = std::move(*o);

  auto sh = shipments_at(now);
  if (!sh) return std::unexpected(std::move(sh.error()));
  snapshot.shipments = std::move(*sh);

  return snapshot;
}

} // namespace criteria::wms
