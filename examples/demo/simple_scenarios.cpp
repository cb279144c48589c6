#include "scenarios.hpp"

#include <iomanip>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "criteria/filtering.hpp"
#include "criteria/predicate.hpp"
#include "criteria/samples/numbers.hpp"
#include "criteria/samples/strings.hpp"
#include "criteria/samples/users.hpp"

namespace criteria::demo {

namespace {

template <typename Range>
void print_joined(std::ostream& out, const Range& values) {
  bool first = true;
  out << "  ";
  for (const auto& v : values) {
    if (!first) out << ", ";
    out << v;
    first = false;
  }
  out << '\n';
}

void banner(std::ostream& out, std::string_view title) { out << "=== " << title << " ===\n\n"; }

} // namespace

auto user_validation(std::ostream& out, const demo_options&) -> scenario_result {
  banner(out, "Simple User Validation");

  const std::vector<samples::user> users{
      {"user1", "john@example.com", 25, true},
      {"user2", "jane@example.com", 17, true},
      {"user3", "bob@example.com", 30, false},
      {"user4", "alice@example.com", 22, true},
  };

  const auto active_adult =
      make_predicate<samples::is_adult>() && make_predicate<samples::is_active_user>();

  out << "Active adult users (" << active_adult.describe() << "):\n";
  for (const auto& u : where(users, active_adult)) {
    out << "  - " << u.username << " (" << u.email << "), Age: " << u.age << '\n';
  }
  out << "\nTotal: " << count(users, active_adult) << "\n\n";
  return {};
}

auto email_validation(std::ostream& out, const demo_options&) -> scenario_result {
  banner(out, "Email Validation");

  const std::vector<std::string> emails{
      "valid@example.com", "invalid-email", "test@spam.com", "admin@company.com", ""};

  const auto valid_non_spam = make_predicate<samples::has_at_symbol>()
                                  .and_(make_predicate<samples::has_domain>())
                                  .and_(make_predicate<samples::not_spam_domain>());

  out << "Rule: " << valid_non_spam.describe() << '\n';
  for (const auto& email : emails) {
    out << (valid_non_spam.test(email) ? "  [valid]   " : "  [invalid] ")
        << (email.empty() ? std::string("(empty)") : email) << '\n';
  }
  out << '\n';
  return {};
}

auto number_ranges(std::ostream& out, const demo_options&) -> scenario_result {
  banner(out, "Number Range Validation");

  const std::vector<int> numbers{-5, 0, 15, 25, 50, 75, 101};

  auto in_range = samples::in_range::create(1, 100);
  if (!in_range) return std::unexpected(std::move(in_range.error()));
  const auto positive = make_predicate<samples::is_positive>();

  out << "Numbers that are positive and in range [1, 100]:\n";
  print_joined(out, where(numbers, positive.and_(*in_range)));

  out << "\nNumbers that are positive OR in range [1, 100]:\n";
  print_joined(out, where(numbers, positive.or_(*in_range)));
  out << '\n';
  return {};
}

auto password_strength(std::ostream& out, const demo_options&) -> scenario_result {
  banner(out, "String Content Validation");

  const std::vector<std::string> passwords{
      "short", "longbutnosymbols", "Long@WithSymbol", "NoNum@Symbol", "ValidP@ssw0rd"};

  auto min_length = samples::min_length::create(8);
  if (!min_length) return std::unexpected(std::move(min_length.error()));
  const auto strong = min_length->and_(make_predicate<samples::has_special_character>())
                          .and_(make_predicate<samples::has_digit>());

  out << "Password strength validation:\n";
  for (const auto& pw : passwords) {
    out << "  " << std::left << std::setw(20) << pw << std::right << " -> "
        << (strong.test(pw) ? "Strong" : "Weak") << '\n';
  }
  out << '\n';
  return {};
}

auto not_operator(std::ostream& out, const demo_options&) -> scenario_result {
  banner(out, "NOT Operator");

  std::vector<int> numbers(20);
  std::iota(numbers.begin(), numbers.end(), 1);

  const auto even = make_predicate<samples::is_even>();
  const auto odd = !even;

  out << "Even numbers:\n";
  print_joined(out, where(numbers, even));
  out << "\nOdd numbers (" << odd.describe() << "):\n";
  print_joined(out, where(numbers, odd));
  out << '\n';
  return {};
}

} // namespace criteria::demo
