#include "scenarios.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "criteria/filter_eval.hpp"
#include "criteria/filter_expr.hpp"
#include "criteria/filtering.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/client_rules.hpp"
#include "criteria/wms/inventory_rules.hpp"
#include "criteria/wms/order_rules.hpp"
#include "criteria/wms/product_rules.hpp"
#include "criteria/wms/sample_data.hpp"
#include "criteria/wms/shipment_rules.hpp"

namespace criteria::demo {

namespace {

using wms::warehouse_snapshot;

void banner(std::ostream& out, std::string_view title) { out << "=== " << title << " ===\n\n"; }

auto fixed(double v, int digits) -> std::string {
  std::ostringstream os;
  os << std::fixed << std::setprecision(digits) << v;
  return os.str();
}

auto client_with_id(const std::string& id) -> predicate<wms::client> {
  return predicate<wms::client>::of([id](const wms::client& c) { return c.id == id; }, "client.id");
}

auto product_with_sku(const std::string& sku) -> predicate<wms::product> {
  return predicate<wms::product>::of([sku](const wms::product& p) { return p.sku == sku; },
                                     "product.sku");
}

auto stock_with_sku(const std::string& sku) -> predicate<wms::inventory> {
  return predicate<wms::inventory>::of([sku](const wms::inventory& i) { return i.sku == sku; },
                                       "inventory.sku");
}

auto tier_rank(const std::optional<wms::client>& c) -> int {
  if (!c) return 1;
  switch (c->tier) {
    case wms::client_tier::enterprise: return 3;
    case wms::client_tier::premium: return 2;
    case wms::client_tier::standard: return 1;
  }
  return 1;
}

} // namespace

auto low_stock_premium_clients(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Low Stock Alert for Premium Clients");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  namespace cr = wms::client_rules;
  namespace ir = wms::inventory_rules;

  const auto premium_active = cr::is_premium_or_enterprise() && cr::is_active();
  const auto low_stock = ir::is_below_reorder_point() || ir::is_out_of_stock();

  out << "Premium clients with low stock items:\n";
  for (const auto& client : where(data->clients, premium_active)) {
    auto owned = ir::belongs_to_client(client.id);
    if (!owned) return std::unexpected(std::move(owned.error()));
    const auto alerts = to_vector(data->stock, low_stock.and_(*owned));
    if (alerts.empty()) continue;

    out << "\n  Client: " << client.name << " (Tier: " << wms::to_string(client.tier) << ")\n";
    for (const auto& inv : alerts) {
      out << "    - SKU: " << inv.sku << ", Qty: " << inv.quantity
          << ", Reorder Point: " << inv.reorder_point << '\n';
    }
  }
  out << '\n';
  return {};
}

auto expedited_orders(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Expedited Order Processing");
  const auto now = opts.clock.now();
  auto data = wms::load_sample_warehouse(now);
  if (!data) return std::unexpected(std::move(data.error()));

  namespace orr = wms::order_rules;
  const auto urgent_pending = orr::requires_expedited_processing(opts.clock)
                                  .and_(orr::has_status(wms::order_status::pending));

  auto urgent = to_vector(data->orders, urgent_pending);
  std::stable_sort(urgent.begin(), urgent.end(), [](const wms::order& a, const wms::order& b) {
    return a.required_date < b.required_date;
  });

  out << "Urgent pending orders requiring immediate processing (" << urgent.size() << "):\n\n";
  for (const auto& o : urgent) {
    out << "  Order: " << o.id << '\n'
        << "    Priority: " << wms::to_string(o.priority)
        << ", Shipping: " << wms::to_string(o.method) << '\n'
        << "    Due: " << wms::format_date(o.required_date) << " ("
        << fixed(wms::hours_between(now, o.required_date), 1) << " hours)\n"
        << "    Lines: " << o.lines.size() << " items\n\n";
  }
  return {};
}

auto special_handling_locations(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Special Handling Location Assignment");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  const auto special = to_vector(data->products, wms::product_rules::requires_special_handling());
  out << "Products requiring special handling (" << special.size() << "):\n\n";

  for (const auto& p : special) {
    out << "  SKU: " << p.sku << " - " << p.name << '\n' << "    Attributes:";
    if (p.is_hazmat) out << " Hazmat";
    if (p.is_fragile) out << " Fragile";
    if (p.requires_refrigeration) out << " Refrigerated";
    out << '\n';

    const auto suitable_for = predicate<wms::location>::of(
        [&p](const wms::location& loc) {
          return (!p.is_hazmat || loc.is_hazmat_approved) &&
                 (!p.requires_refrigeration || loc.is_temperature_controlled) &&
                 p.weight <= loc.max_weight;
        },
        "location.suitable_for[" + p.sku + "]");

    const auto suitable = to_vector(data->locations, suitable_for);
    out << "    Suitable locations: " << suitable.size() << '\n';
    for (std::size_t i = 0; i < suitable.size() && i < 3; ++i) {
      const auto& loc = suitable[i];
      out << "      - " << loc.id << " (" << loc.zone << '-' << loc.aisle << '-' << loc.bay << '-'
          << loc.level << ")\n";
    }
    out << '\n';
  }
  return {};
}

auto expiring_inventory(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Expiring Inventory Management");
  const auto now = opts.clock.now();
  auto data = wms::load_sample_warehouse(now);
  if (!data) return std::unexpected(std::move(data.error()));

  namespace pr = wms::product_rules;
  auto expiring_window = pr::is_expiring(opts.expiring_days, opts.clock);
  if (!expiring_window) return std::unexpected(std::move(expiring_window.error()));
  auto expiring_urgent = pr::is_expiring(opts.urgent_days, opts.clock);
  if (!expiring_urgent) return std::unexpected(std::move(expiring_urgent.error()));
  const auto expired = pr::is_expired(opts.clock);
  const auto on_hand = wms::inventory_rules::is_available();

  out << "Expiring Inventory Report:\n\n";

  const auto expired_products = to_vector(data->products, expired);
  out << "CRITICAL - Expired (" << expired_products.size() << "):\n";
  for (const auto& p : expired_products) {
    auto inv = first_or_default(data->stock, stock_with_sku(p.sku));
    if (inv && inv->quantity > 0) {
      out << "  x " << p.sku << " - Qty: " << inv->quantity
          << ", Expired: " << wms::format_date(*p.expiration_date) << '\n';
    }
  }

  auto report = [&](const std::string& heading, const predicate<wms::product>& rule,
                    const char* marker) {
    const auto selected = to_vector(data->products, rule);
    out << '\n' << heading << " (" << selected.size() << "):\n";
    for (const auto& p : selected) {
      auto inv = first_or_default(data->stock, stock_with_sku(p.sku).and_(on_hand));
      if (!inv) continue;
      out << "  " << marker << ' ' << p.sku << " - Qty: " << inv->quantity
          << ", Days left: " << wms::whole_days(now, *p.expiration_date) << '\n';
    }
  };

  report("HIGH - Expiring within " + std::to_string(opts.urgent_days) + " days",
         expiring_urgent->and_not(expired), "!");
  report("MEDIUM - Expiring within " + std::to_string(opts.expiring_days) + " days",
         expiring_window->and_not(*expiring_urgent), "*");
  out << '\n';
  return {};
}

auto order_batching(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Order Batching Logic");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  namespace orr = wms::order_rules;
  const auto batchable_rule = orr::has_status(wms::order_status::pending)
                                  .and_(orr::has_shipping_method(wms::shipping_method::ground))
                                  .and_(!orr::is_urgent());
  const auto batchable = to_vector(data->orders, batchable_rule);

  out << "Orders eligible for batching (" << batchable.size() << "):\n\n";

  // Group by client in first-seen order.
  std::vector<std::pair<std::string, std::vector<const wms::order*>>> batches;
  for (const auto& o : batchable) {
    auto it = std::find_if(batches.begin(), batches.end(),
                           [&o](const auto& b) { return b.first == o.client_id; });
    if (it == batches.end()) {
      batches.emplace_back(o.client_id, std::vector<const wms::order*>{});
      it = std::prev(batches.end());
    }
    it->second.push_back(&o);
  }

  for (const auto& [client_id, orders] : batches) {
    std::size_t total_lines = 0;
    std::string ids;
    for (const auto* o : orders) {
      total_lines += o->lines.size();
      if (!ids.empty()) ids += ", ";
      ids += o->id;
    }
    out << "  Client: " << client_id << '\n'
        << "    Orders in batch: " << orders.size() << '\n'
        << "    Total line items: " << total_lines << '\n'
        << "    Order IDs: " << ids << "\n\n";
  }
  return {};
}

auto sla_compliance(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "SLA Compliance Monitoring");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  auto problems = to_vector(data->shipments, wms::shipment_rules::has_delivery_issues());
  std::stable_sort(problems.begin(), problems.end(), [](const wms::shipment& a, const wms::shipment& b) {
    return a.status < b.status;
  });
  const auto premium = wms::client_rules::is_premium_or_enterprise();

  out << "Shipments with delivery issues (" << problems.size() << "):\n\n";
  for (const auto& s : problems) {
    const auto client = first_or_default(data->clients, client_with_id(s.client_id));
    const bool high = client && premium.test(*client);
    out << "  Shipment: " << s.id << " [Priority: " << (high ? "HIGH" : "NORMAL") << "]\n"
        << "    Client: " << (client ? client->name : s.client_id);
    if (client) out << " (" << wms::to_string(client->tier) << ")";
    out << '\n'
        << "    Status: " << wms::to_string(s.status) << '\n'
        << "    Carrier: " << s.carrier << '\n'
        << "    Tracking: " << s.tracking_number << '\n'
        << "    Ship Date: " << wms::format_date(s.ship_date) << "\n\n";
  }
  return {};
}

auto cycle_count_priorities(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Cycle Count Prioritization");
  const auto now = opts.clock.now();
  auto data = wms::load_sample_warehouse(now);
  if (!data) return std::unexpected(std::move(data.error()));

  namespace ir = wms::inventory_rules;
  auto needs_count = ir::needs_cycle_count(opts.cycle_count_days, opts.clock);
  if (!needs_count) return std::unexpected(std::move(needs_count.error()));

  const auto due = to_vector(data->stock, needs_count->and_(ir::is_available()));
  out << "Inventory items requiring cycle count (" << due.size() << "):\n\n";

  struct candidate {
    const wms::inventory* inv;
    std::optional<wms::product> product;
    std::optional<wms::client> client;
    long long days_since_count;
  };
  std::vector<candidate> ranked;
  ranked.reserve(due.size());
  for (const auto& inv : due) {
    ranked.push_back({&inv, first_or_default(data->products, product_with_sku(inv.sku)),
                      first_or_default(data->clients, client_with_id(inv.client_id)),
                      wms::whole_days(inv.last_count_date, now)});
  }
  std::stable_sort(ranked.begin(), ranked.end(), [](const candidate& a, const candidate& b) {
    if (tier_rank(a.client) != tier_rank(b.client)) return tier_rank(a.client) > tier_rank(b.client);
    const double cost_a = a.product ? a.product->unit_cost : 0.0;
    const double cost_b = b.product ? b.product->unit_cost : 0.0;
    if (cost_a != cost_b) return cost_a > cost_b;
    return a.days_since_count > b.days_since_count;
  });
  if (ranked.size() > 10) ranked.resize(10);

  out << "Top 10 priority cycle counts:\n\n";
  int rank = 1;
  for (const auto& c : ranked) {
    out << "  " << rank++ << ". SKU: " << c.inv->sku << '\n'
        << "     Client: " << (c.client ? c.client->name : c.inv->client_id);
    if (c.client) out << " (" << wms::to_string(c.client->tier) << ")";
    out << '\n'
        << "     Value: $" << fixed(c.product ? c.product->unit_cost : 0.0, 2)
        << ", Qty: " << c.inv->quantity << '\n'
        << "     Days since count: " << c.days_since_count << '\n'
        << "     Location: " << c.inv->location_id << "\n\n";
  }
  return {};
}

auto international_compliance(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "International Shipment Compliance");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  auto international = wms::order_rules::is_international(opts.domestic_country);
  if (!international) return std::unexpected(std::move(international.error()));

  const auto orders = to_vector(data->orders, *international);
  out << "International orders (" << orders.size() << "):\n\n";

  for (const auto& o : orders) {
    out << "  Order: " << o.id << '\n'
        << "    Destination: " << o.destination_country << '\n'
        << "    Status: " << wms::to_string(o.status) << '\n';

    std::vector<wms::product> contents;
    for (const auto& line : o.lines) {
      if (auto p = first_or_default(data->products, product_with_sku(line.sku))) {
        contents.push_back(std::move(*p));
      }
    }
    const bool hazmat = any(contents, wms::product_rules::is_hazmat());
    const bool perishable = any(contents, wms::product_rules::is_perishable());

    if (hazmat || perishable) {
      out << "    COMPLIANCE ISSUES:\n";
      if (hazmat) out << "      - Contains HAZMAT items (special documentation required)\n";
      if (perishable) out << "      - Contains perishable items (expedited shipping required)\n";
    } else {
      out << "    No compliance issues\n";
    }
    out << '\n';
  }
  return {};
}

auto attribute_query(std::ostream& out, const demo_options& opts) -> scenario_result {
  banner(out, "Attribute Expression Query");
  auto data = wms::load_sample_warehouse(opts.clock.now());
  if (!data) return std::unexpected(std::move(data.error()));

  auto mid_priced_beauty = expression_specification<wms::product>::create(
      all_of({filter_expr{term{"category", "Beauty"}}, filter_expr{range{"unit_cost", 20, 50}}}),
      &wms::product_rules::attributes);
  if (!mid_priced_beauty) return std::unexpected(std::move(mid_priced_beauty.error()));

  auto heavy_or_hazmat = expression_specification<wms::product>::create(
      any_of({filter_expr{term{"hazmat", "true"}}, filter_expr{range{"weight", 20, 1000}}}),
      &wms::product_rules::attributes);
  if (!heavy_or_hazmat) return std::unexpected(std::move(heavy_or_hazmat.error()));

  auto print = [&](const predicate<wms::product>& rule) {
    out << "Query: " << rule.describe() << '\n';
    for (const auto& p : where(data->products, rule)) {
      out << "  - " << p.sku << " (" << wms::to_string(p.category) << ", $" << fixed(p.unit_cost, 2)
          << ")\n";
    }
    out << '\n';
  };

  print(*mid_priced_beauty);
  print(*heavy_or_hazmat);
  print(mid_priced_beauty->and_(wms::product_rules::is_perishable()));

  const filter_expr fragile{term{"fragile", "true"}};
  auto fragile_products =
      filter_eval::apply_filter(&fragile, data->products, &wms::product_rules::attributes);
  if (!fragile_products) return std::unexpected(std::move(fragile_products.error()));
  out << "Query: " << filter_eval::to_string(fragile) << '\n';
  for (const auto& p : *fragile_products) {
    out << "  - " << p.sku << " (" << wms::to_string(p.category) << ", $" << fixed(p.unit_cost, 2)
        << ")\n";
  }
  out << '\n';
  return {};
}

} // namespace criteria::demo
