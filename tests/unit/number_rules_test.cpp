#include <catch2/catch_all.hpp>

#include <limits>
#include <numeric>
#include <vector>

#include "criteria/filtering.hpp"
#include "criteria/samples/numbers.hpp"

using namespace criteria;

TEST_CASE("is_positive boundaries", "[samples][numbers]") {
  const auto positive = make_predicate<samples::is_positive>();
  REQUIRE_FALSE(positive.test(std::numeric_limits<int>::min()));
  REQUIRE_FALSE(positive.test(-1));
  REQUIRE_FALSE(positive.test(0));
  REQUIRE(positive.test(1));
  REQUIRE(positive.test(std::numeric_limits<int>::max()));
}

TEST_CASE("is_even includes negatives and zero", "[samples][numbers]") {
  const auto even = make_predicate<samples::is_even>();
  REQUIRE(even.test(0));
  REQUIRE(even.test(-4));
  REQUIRE_FALSE(even.test(-3));
  REQUIRE_FALSE(even.test(7));
}

TEST_CASE("in_range bounds are inclusive", "[samples][numbers]") {
  auto r = samples::in_range::create(1, 100);
  REQUIRE(r);
  REQUIRE_FALSE(r->test(0));
  REQUIRE(r->test(1));
  REQUIRE(r->test(100));
  REQUIRE_FALSE(r->test(101));
  REQUIRE(r->describe() == "in_range[1, 100]");

  auto point = samples::in_range::create(5, 5);
  REQUIRE(point);
  REQUIRE_FALSE(point->test(4));
  REQUIRE(point->test(5));
  REQUIRE_FALSE(point->test(6));
}

TEST_CASE("in_range rejects an inverted range", "[samples][numbers][errors]") {
  auto r = samples::in_range::create(10, 1);
  REQUIRE_FALSE(r);
  REQUIRE(r.error().code == core::error_code::invalid_argument);
  REQUIRE(r.error().component == "samples.in_range");
  REQUIRE(r.error().message == "max (1) is below min (10)");
}

TEST_CASE("NOT of is_even keeps the odd numbers", "[samples][numbers]") {
  std::vector<int> numbers(10);
  std::iota(numbers.begin(), numbers.end(), 1);
  const auto odd = make_predicate<samples::is_even>().not_();
  REQUIRE(to_vector(numbers, odd) == std::vector<int>{1, 3, 5, 7, 9});
}
