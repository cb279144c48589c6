#include <catch2/catch_all.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "criteria/composite.hpp"
#include "criteria/predicate.hpp"
#include "criteria/samples/numbers.hpp"

using namespace criteria;

namespace {

// Constant leaf that counts its evaluations.
class counting_spec final : public specification<int> {
public:
  counting_spec(bool result, std::shared_ptr<std::atomic<int>> calls)
      : result_(result), calls_(std::move(calls)) {}

  auto is_satisfied_by(const int&) const -> bool override {
    calls_->fetch_add(1, std::memory_order_relaxed);
    return result_;
  }
  auto describe() const -> std::string override { return result_ ? "T" : "F"; }

private:
  bool result_;
  std::shared_ptr<std::atomic<int>> calls_;
};

struct counted {
  std::shared_ptr<std::atomic<int>> calls = std::make_shared<std::atomic<int>>(0);
  predicate<int> pred;

  explicit counted(bool result)
      : pred(predicate<int>::make<counting_spec>(result, calls)) {}
  auto count() const -> int { return calls->load(); }
};

auto constant(bool v) -> predicate<int> {
  return predicate<int>::of([v](const int&) { return v; }, v ? "T" : "F");
}

} // namespace

TEST_CASE("combinator truth tables", "[core][composite]") {
  for (bool a : {false, true}) {
    for (bool b : {false, true}) {
      const auto A = constant(a);
      const auto B = constant(b);
      INFO("a=" << a << " b=" << b);
      REQUIRE(A.and_(B).test(0) == (a && b));
      REQUIRE(A.or_(B).test(0) == (a || b));
      REQUIRE(A.and_not(B).test(0) == (a && !b));
      REQUIRE(A.or_not(B).test(0) == (a || !b));
      REQUIRE(A.not_().test(0) == !a);
      REQUIRE((A && B).test(0) == (a && b));
      REQUIRE((A || B).test(0) == (a || b));
      REQUIRE((!A).test(0) == !a);
    }
  }
}

TEST_CASE("double negation and De Morgan hold", "[core][composite]") {
  const auto positive = make_predicate<samples::is_positive>();
  const auto even = make_predicate<samples::is_even>();
  for (int x = -6; x <= 6; ++x) {
    REQUIRE(positive.not_().not_().test(x) == positive.test(x));
    REQUIRE(positive.and_(even).not_().test(x) == positive.not_().or_(even.not_()).test(x));
    REQUIRE(positive.or_(even).not_().test(x) == positive.not_().and_(even.not_()).test(x));
    REQUIRE(positive.and_not(even).test(x) == positive.and_(even.not_()).test(x));
    REQUIRE(positive.or_not(even).test(x) == positive.or_(even.not_()).test(x));
  }
}

TEST_CASE("combinators do not modify their operands", "[core][composite]") {
  const auto positive = make_predicate<samples::is_positive>();
  const auto even = make_predicate<samples::is_even>();
  const auto before = positive.spec();

  auto both = positive.and_(even);
  auto either = positive.or_(even);
  auto neither = positive.not_();
  (void)both; (void)either; (void)neither;

  REQUIRE(positive.spec() == before);
  REQUIRE(positive.describe() == "is_positive");
  REQUIRE(positive.test(3));
  REQUIRE_FALSE(positive.test(-3));
}

TEST_CASE("operands are shared, not copied", "[core][composite]") {
  const auto positive = make_predicate<samples::is_positive>();
  const auto even = make_predicate<samples::is_even>();
  auto both = positive.and_(even);

  auto composite = std::dynamic_pointer_cast<const composite_specification<int>>(both.spec());
  REQUIRE(composite);
  REQUIRE(composite->op() == combinator::conjunction);
  REQUIRE(composite->left() == positive.spec());
  REQUIRE(composite->right() == even.spec());

  auto neg = std::dynamic_pointer_cast<const composite_specification<int>>(positive.not_().spec());
  REQUIRE(neg);
  REQUIRE(neg->op() == combinator::negation);
  REQUIRE(neg->right() == nullptr);
}

TEST_CASE("conjunction short-circuits on a false left operand", "[core][composite]") {
  counted left(false);
  counted right(true);
  REQUIRE_FALSE(left.pred.and_(right.pred).test(1));
  REQUIRE(left.count() == 1);
  REQUIRE(right.count() == 0);

  REQUIRE_FALSE(left.pred.and_not(right.pred).test(1));
  REQUIRE(right.count() == 0);
}

TEST_CASE("disjunction short-circuits on a true left operand", "[core][composite]") {
  counted left(true);
  counted right(false);
  REQUIRE(left.pred.or_(right.pred).test(1));
  REQUIRE(left.pred.or_not(right.pred).test(1));
  REQUIRE(left.count() == 2);
  REQUIRE(right.count() == 0);
}

TEST_CASE("right operand is evaluated when the left does not decide", "[core][composite]") {
  counted left(true);
  counted right(false);
  REQUIRE_FALSE(left.pred.and_(right.pred).test(1));
  REQUIRE(right.count() == 1);
}

TEST_CASE("results are not cached between evaluations", "[core][composite]") {
  counted leaf(true);
  const auto negated = leaf.pred.not_();
  REQUIRE_FALSE(negated.test(1));
  REQUIRE_FALSE(negated.test(1));
  REQUIRE_FALSE(negated.test(1));
  REQUIRE(leaf.count() == 3);
}

TEST_CASE("null operands are rejected at construction", "[core][errors]") {
  const auto positive = make_predicate<samples::is_positive>();
  const specification_ptr<int> null_spec;

  SECTION("wrap") {
    auto r = predicate<int>::wrap(null_spec);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == core::error_code::invalid_argument);
    REQUIRE(r.error().component == "core.predicate");
  }
  SECTION("raw operand overloads") {
    auto a = positive.and_(null_spec);
    auto o = positive.or_(null_spec);
    auto an = positive.and_not(null_spec);
    auto on = positive.or_not(null_spec);
    for (const auto* r : {&a, &o, &an, &on}) {
      REQUIRE_FALSE(*r);
      REQUIRE(r->error().code == core::error_code::invalid_argument);
      REQUIRE(r->error().message == "right operand is null");
    }
  }
  SECTION("composite factories") {
    auto left_null = composite_specification<int>::binary(combinator::conjunction, null_spec,
                                                          positive.spec());
    REQUIRE_FALSE(left_null);
    REQUIRE(left_null.error().message == "left operand is null");

    auto neg = composite_specification<int>::negate(null_spec);
    REQUIRE_FALSE(neg);
    REQUIRE(neg.error().code == core::error_code::invalid_argument);

    auto misuse = composite_specification<int>::binary(combinator::negation, positive.spec(),
                                                       positive.spec());
    REQUIRE_FALSE(misuse);
    REQUIRE(misuse.error().message == "negation takes a single operand");
  }
  SECTION("empty function") {
    auto r = predicate<int>::from_function({});
    REQUIRE_FALSE(r);
    REQUIRE(r.error().code == core::error_code::invalid_argument);
  }
}

TEST_CASE("raw operand overloads accept a live specification", "[core]") {
  const auto positive = make_predicate<samples::is_positive>();
  const specification_ptr<int> even = std::make_shared<const samples::is_even>();

  auto both = positive.and_(even);
  REQUIRE(both);
  REQUIRE(both->test(4));
  REQUIRE_FALSE(both->test(3));
  REQUIRE_FALSE(both->test(-4));

  auto built = composite_specification<int>::binary(combinator::or_not, positive.spec(), even);
  REQUIRE(built);
  REQUIRE((*built)->is_satisfied_by(-3));   // not even
  REQUIRE_FALSE((*built)->is_satisfied_by(-4));
}

TEST_CASE("describe renders the composition tree", "[core]") {
  const auto positive = make_predicate<samples::is_positive>();
  const auto even = make_predicate<samples::is_even>();
  REQUIRE(positive.and_(even).describe() == "(is_positive AND is_even)");
  REQUIRE(positive.or_not(even).describe() == "(is_positive OR NOT is_even)");
  REQUIRE(positive.and_not(even).not_().describe() == "NOT (is_positive AND NOT is_even)");

  auto fn = predicate<int>::from_function([](const int& x) { return x > 10; });
  REQUIRE(fn);
  REQUIRE(fn->describe() == "function");
}

TEST_CASE("a shared composite evaluates consistently across threads", "[core][concurrency]") {
  const auto positive = make_predicate<samples::is_positive>();
  const auto even = make_predicate<samples::is_even>();
  const auto rule = positive.and_(even).or_(positive.not_().and_not(even));

  std::vector<int> expected_hits(8, 0);
  for (int x = -1000; x < 1000; ++x) {
    if (rule.test(x)) ++expected_hits[0];
  }
  std::fill(expected_hits.begin() + 1, expected_hits.end(), expected_hits[0]);

  std::vector<int> hits(8, 0);
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&rule, &hits, t] {
      for (int x = -1000; x < 1000; ++x) {
        if (rule.test(x)) ++hits[static_cast<std::size_t>(t)];
      }
    });
  }
  for (auto& th : threads) th.join();
  REQUIRE(hits == expected_hits);
}
