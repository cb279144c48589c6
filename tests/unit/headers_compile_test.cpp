#include <criteria/composite.hpp>
#include <criteria/core/platform_utils.hpp>
#include <criteria/core/text.hpp>
#include <criteria/core/trace.hpp>
#include <criteria/error.hpp>
#include <criteria/filter_eval.hpp>
#include <criteria/filter_expr.hpp>
#include <criteria/filtering.hpp>
#include <criteria/predicate.hpp>
#include <criteria/samples/numbers.hpp>
#include <criteria/samples/strings.hpp>
#include <criteria/samples/users.hpp>
#include <criteria/specification.hpp>
#include <criteria/wms/client_rules.hpp>
#include <criteria/wms/clock.hpp>
#include <criteria/wms/inventory_rules.hpp>
#include <criteria/wms/models.hpp>
#include <criteria/wms/order_rules.hpp>
#include <criteria/wms/product_rules.hpp>
#include <criteria/wms/sample_data.hpp>
#include <criteria/wms/shipment_rules.hpp>
#include <catch2/catch_all.hpp>
#include <type_traits>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  criteria::wms::location loc{};
  REQUIRE(loc.max_weight == 5000.0);
  REQUIRE(criteria::to_string(criteria::combinator::and_not) == "AND NOT");
  STATIC_REQUIRE(std::is_abstract_v<criteria::specification<int>>);
}
