#include "criteria/samples/strings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

#include "criteria/core/text.hpp"
#include "criteria/core/trace.hpp"

namespace criteria::samples {

namespace {

constexpr std::array<std::string_view, 3> kSpamDomains{"spam.com", "junk.com", "trash.com"};

} // namespace

auto has_at_symbol::is_satisfied_by(const std::string& candidate) const -> bool {
  return candidate.find('@') != std::string::npos;
}
auto has_at_symbol::describe() const -> std::string { return "has_at_symbol"; }

auto has_domain::is_satisfied_by(const std::string& candidate) const -> bool {
  const auto at = candidate.find('@');
  if (at == std::string::npos || at == 0) return false;
  if (candidate.find('@', at + 1) != std::string::npos) return false;
  const std::string_view domain = std::string_view(candidate).substr(at + 1);
  if (domain.empty() || domain.find('.') == std::string_view::npos) return false;
  return domain.front() != '.' && domain.back() != '.';
}
auto has_domain::describe() const -> std::string { return "has_domain"; }

auto not_spam_domain::is_satisfied_by(const std::string& candidate) const -> bool {
  const auto at = candidate.find('@');
  if (at == std::string::npos) return true;
  // domain runs up to the next '@', if any
  const auto next = candidate.find('@', at + 1);
  const std::string_view domain = std::string_view(candidate).substr(
      at + 1, next == std::string::npos ? std::string_view::npos : next - at - 1);
  return std::none_of(kSpamDomains.begin(), kSpamDomains.end(),
                      [&](std::string_view spam) { return core::iequals(domain, spam); });
}
auto not_spam_domain::describe() const -> std::string { return "not_spam_domain"; }

auto min_length::create(int length) -> std::expected<predicate<std::string>, core::error> {
  if (length < 0) {
    return std::unexpected(core::trace_rejection(core::error{
        core::error_code::invalid_argument,
        "minimum length must be non-negative, got " + std::to_string(length),
        "samples.min_length"}));
  }
  return predicate<std::string>::wrap(
      specification_ptr<std::string>(new min_length(static_cast<std::size_t>(length))));
}

auto min_length::is_satisfied_by(const std::string& candidate) const -> bool {
  return !candidate.empty() && candidate.size() >= length_;
}
auto min_length::describe() const -> std::string {
  return "min_length[" + std::to_string(length_) + "]";
}

auto has_special_character::is_satisfied_by(const std::string& candidate) const -> bool {
  return std::any_of(candidate.begin(), candidate.end(),
                     [](char c) { return !std::isalnum(static_cast<unsigned char>(c)); });
}
auto has_special_character::describe() const -> std::string { return "has_special_character"; }

auto has_digit::is_satisfied_by(const std::string& candidate) const -> bool {
  return std::any_of(candidate.begin(), candidate.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}
auto has_digit::describe() const -> std::string { return "has_digit"; }

} // namespace criteria::samples
