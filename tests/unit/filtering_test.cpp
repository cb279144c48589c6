#include <catch2/catch_all.hpp>

#include <array>
#include <list>
#include <string>
#include <vector>

#include "criteria/filtering.hpp"
#include "criteria/samples/numbers.hpp"
#include "criteria/samples/users.hpp"

using namespace criteria;

namespace {

auto greater_than(int n) -> predicate<int> {
  return predicate<int>::of([n](const int& x) { return x > n; }, "gt" + std::to_string(n));
}

} // namespace

TEST_CASE("where preserves source order and is lazy", "[filtering]") {
  const std::vector<int> numbers{-5, 0, 15, 25, 50, 75, 101};
  auto in_range = samples::in_range::create(1, 100);
  REQUIRE(in_range);
  const auto rule = make_predicate<samples::is_positive>().and_(*in_range);

  auto view = where(numbers, rule);
  std::vector<int> got(view.begin(), view.end());
  REQUIRE(got == std::vector<int>{15, 25, 50, 75});

  std::vector<int> relaxed;
  for (int x : where(numbers, make_predicate<samples::is_positive>().or_(*in_range))) {
    relaxed.push_back(x);
  }
  REQUIRE(relaxed == std::vector<int>{15, 25, 50, 75, 101});
}

TEST_CASE("where is restartable and re-evaluates on each pass", "[filtering]") {
  std::vector<int> numbers{1, 2, 3, 4};
  int evaluations = 0;
  const auto even = predicate<int>::of([&evaluations](const int& x) {
    ++evaluations;
    return x % 2 == 0;
  });

  auto view = where(numbers, even);
  REQUIRE(evaluations == 0);
  REQUIRE(std::vector<int>(view.begin(), view.end()) == std::vector<int>{2, 4});
  const int first_pass = evaluations;
  REQUIRE(first_pass >= 4);
  REQUIRE(std::vector<int>(view.begin(), view.end()) == std::vector<int>{2, 4});
  REQUIRE(evaluations == 2 * first_pass);

  // The view borrows the source: later changes are seen by the next pass.
  numbers.push_back(6);
  REQUIRE(std::vector<int>(view.begin(), view.end()) == std::vector<int>{2, 4, 6});
}

TEST_CASE("where models a forward range", "[filtering]") {
  const std::list<int> numbers{3, 8, 1, 12};
  auto view = where(numbers, greater_than(2));
  STATIC_REQUIRE(std::ranges::forward_range<decltype(view)>);
  REQUIRE(std::ranges::distance(view) == 3);
  REQUIRE(*view.begin() == 3);
  REQUIRE_FALSE(view.empty());
  REQUIRE(view.filter().describe() == "gt2");
}

TEST_CASE("aggregate helpers", "[filtering]") {
  const std::vector<int> numbers{1, 2, 3, 4, 5, 6};
  const std::vector<int> empty;
  const auto even = make_predicate<samples::is_even>();

  REQUIRE(to_vector(numbers, even) == std::vector<int>{2, 4, 6});
  REQUIRE(count(numbers, even) == 3);
  REQUIRE(any(numbers, even));
  REQUIRE_FALSE(all(numbers, even));
  REQUIRE(all(numbers, greater_than(0)));

  REQUIRE_FALSE(any(empty, even));
  REQUIRE(all(empty, even));
  REQUIRE(count(empty, even) == 0);
  REQUIRE(to_vector(empty, even).empty());

  const std::array<int, 3> fixed{7, 9, 11};
  REQUIRE(count(fixed, even) == 0);
}

TEST_CASE("first and first_or_default", "[filtering]") {
  const std::vector<int> numbers{1, 3, 4, 6};
  const auto even = make_predicate<samples::is_even>();

  auto f = first(numbers, even);
  REQUIRE(f);
  REQUIRE(*f == 4);
  REQUIRE(first_or_default(numbers, even) == std::optional<int>{4});

  auto missing = first(numbers, greater_than(10));
  REQUIRE_FALSE(missing);
  REQUIRE(missing.error().code == core::error_code::not_found);
  REQUIRE(missing.error().message == "no element satisfies gt10");
  REQUIRE_FALSE(first_or_default(numbers, greater_than(10)).has_value());
}

TEST_CASE("single and single_or_default", "[filtering]") {
  const std::vector<int> numbers{1, 3, 4, 6};

  auto one = single(numbers, greater_than(5));
  REQUIRE(one);
  REQUIRE(*one == 6);

  auto none = single(numbers, greater_than(10));
  REQUIRE_FALSE(none);
  REQUIRE(none.error().code == core::error_code::not_found);

  auto many = single(numbers, greater_than(2));
  REQUIRE_FALSE(many);
  REQUIRE(many.error().code == core::error_code::precondition_failed);
  REQUIRE(many.error().component == "filtering.single");

  auto none_default = single_or_default(numbers, greater_than(10));
  REQUIRE(none_default);
  REQUIRE_FALSE(none_default->has_value());

  auto many_default = single_or_default(numbers, greater_than(0));
  REQUIRE_FALSE(many_default);
  REQUIRE(many_default.error().code == core::error_code::precondition_failed);
}

TEST_CASE("filtering returns copies of records", "[filtering]") {
  std::vector<samples::user> users{
      {"user1", "john@example.com", 25, true},
      {"user2", "jane@example.com", 17, true},
      {"user3", "bob@example.com", 30, false},
      {"user4", "alice@example.com", 22, true},
  };
  const auto active_adult =
      make_predicate<samples::is_adult>() && make_predicate<samples::is_active_user>();

  auto selected = to_vector(users, active_adult);
  REQUIRE(selected.size() == 2);
  REQUIRE(selected[0].username == "user1");
  REQUIRE(selected[1].username == "user4");

  selected[0].age = 99;
  REQUIRE(users[0].age == 25);
}
