#pragma once

/** \file users.hpp
 *  \brief Minimal user record and its account rules.
 */

#include <string>

#include "criteria/specification.hpp"

namespace criteria::samples {

struct user {
  std::string username;
  std::string email;
  int age{};
  bool is_active{};
};

/** \brief age ≥ 18 */
class is_adult final : public specification<user> {
public:
  auto is_satisfied_by(const user& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

class is_active_user final : public specification<user> {
public:
  auto is_satisfied_by(const user& candidate) const -> bool override;
  auto describe() const -> std::string override;
};

} // namespace criteria::samples
