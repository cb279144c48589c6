#pragma once

/** \file strings.hpp
 *  \brief String leaf specifications: e-mail shape and password strength rules.
 *
 * Every rule treats an empty string as "not satisfied", except not_spam_domain, which only
 * rejects addresses whose domain is a known spam domain.
 * Character classes follow the "C" locale (ASCII).
 */

#include <expected>
#include <string>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/specification.hpp"

namespace criteria::samples {

/** \brief Non-empty and contains '@'. */
class has_at_symbol final : public specification<std::string> {
public:
  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

/**
 * \brief local@domain with exactly one '@', a non-empty local part, and a domain that
 *        contains '.' but neither starts nor ends with it.
 */
class has_domain final : public specification<std::string> {
public:
  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

/** \brief Domain is not spam.com, junk.com or trash.com (case-insensitive). */
class not_spam_domain final : public specification<std::string> {
public:
  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

class min_length final : public specification<std::string> {
public:
  /** \brief invalid_argument for a negative length. */
  static auto create(int length) -> std::expected<predicate<std::string>, core::error>;

  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;

private:
  explicit min_length(std::size_t length) : length_(length) {}

  std::size_t length_;
};

/** \brief Contains a character that is neither a letter nor a digit (spaces count). */
class has_special_character final : public specification<std::string> {
public:
  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

class has_digit final : public specification<std::string> {
public:
  auto is_satisfied_by(const std::string& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

} // namespace criteria::samples
