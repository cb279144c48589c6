#include <catch2/catch_all.hpp>

#include <string>
#include <utility>
#include <vector>

#include "criteria/samples/strings.hpp"

using namespace criteria;

namespace {

struct sample {
  std::string input;
  bool expected;
};

void check(const predicate<std::string>& rule, const std::vector<sample>& cases) {
  for (const auto& c : cases) {
    INFO(rule.describe() << " on '" << c.input << "'");
    REQUIRE(rule.test(c.input) == c.expected);
  }
}

} // namespace

TEST_CASE("has_at_symbol", "[samples][strings]") {
  check(make_predicate<samples::has_at_symbol>(),
        {{"", false}, {"nodomain", false}, {"user@domain.com", true}});
}

TEST_CASE("has_domain edge cases", "[samples][strings]") {
  check(make_predicate<samples::has_domain>(), {
      {"", false},
      {" ", false},
      {"noatsymbol", false},
      {"user@", false},
      {"@domain.com", false},
      {"user@@domain.com", false},
      {"user@domain", false},
      {"user@domain.", false},
      {"user@.domain.com", false},
      {"user@sub.domain.com", true},
      {"USER@DOMAIN.COM", true},
  });
}

TEST_CASE("not_spam_domain is case-insensitive", "[samples][strings]") {
  check(make_predicate<samples::not_spam_domain>(), {
      {"", true},
      {"noatsymbol", true},
      {"user@nospam.com", true},
      {"user@spam.com", false},
      {"user@SPAM.com", false},
      {"user@trash.com", false},
      {"user@junk.com", false},
  });
}

TEST_CASE("min_length boundaries", "[samples][strings]") {
  auto min8 = samples::min_length::create(8);
  REQUIRE(min8);
  check(*min8, {{"", false}, {"short", false}, {"1234567", false}, {"12345678", true},
                {"123456789", true}});

  auto zero = samples::min_length::create(0);
  REQUIRE(zero);
  REQUIRE_FALSE(zero->test(""));
  REQUIRE(zero->test("a"));
}

TEST_CASE("min_length rejects a negative length", "[samples][strings][errors]") {
  auto r = samples::min_length::create(-1);
  REQUIRE_FALSE(r);
  REQUIRE(r.error().code == core::error_code::invalid_argument);
  REQUIRE(r.error().component == "samples.min_length");
}

TEST_CASE("has_digit and has_special_character", "[samples][strings]") {
  check(make_predicate<samples::has_digit>(),
        {{"", false}, {"NoDigitsHere", false}, {"Contains1Digit", true}, {"12345", true}});
  check(make_predicate<samples::has_special_character>(),
        {{"", false}, {"AlphaNum123", false}, {"Has@Symbol", true}, {"Space here", true},
         {"Tab\tHere", true}});
}

TEST_CASE("strong password composition", "[samples][strings]") {
  auto min8 = samples::min_length::create(8);
  REQUIRE(min8);
  const auto strong = min8->and_(make_predicate<samples::has_special_character>())
                          .and_(make_predicate<samples::has_digit>());
  check(strong, {{"short", false},
                 {"longbutnosymbols", false},
                 {"Long@WithSymbol", false},
                 {"NoNum@Symbol", false},
                 {"ValidP@ssw0rd", true}});
  REQUIRE(strong.describe() == "((min_length[8] AND has_special_character) AND has_digit)");
}

TEST_CASE("min_length and has_digit compose", "[samples][strings]") {
  auto min8 = samples::min_length::create(8);
  REQUIRE(min8);
  const auto long_with_digit = min8->and_(make_predicate<samples::has_digit>());
  REQUIRE_FALSE(long_with_digit.test("short1"));
  REQUIRE(long_with_digit.test("longenough1"));
  REQUIRE_FALSE(long_with_digit.test("longenough"));
  REQUIRE(long_with_digit.describe() == "(min_length[8] AND has_digit)");
}

TEST_CASE("valid non-spam e-mail composition", "[samples][strings]") {
  const auto valid = make_predicate<samples::has_at_symbol>()
                         .and_(make_predicate<samples::has_domain>())
                         .and_(make_predicate<samples::not_spam_domain>());
  check(valid, {{"valid@example.com", true},
                {"invalid-email", false},
                {"test@spam.com", false},
                {"admin@company.com", true},
                {"", false}});
}
