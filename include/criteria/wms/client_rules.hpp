#pragma once

/** \file client_rules.hpp
 *  \brief Business rules over warehouse clients.
 *
 * Time-dependent rules read the captured wall_clock on every evaluation.
 */

#include <expected>

#include "criteria/error.hpp"
#include "criteria/predicate.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms::client_rules {

[[nodiscard]] auto is_active() -> predicate<client>;

[[nodiscard]] auto is_tier(client_tier tier) -> predicate<client>;

/** \brief Contract end date present and strictly before now. */
[[nodiscard]] auto has_expired_contract(wall_clock clock = {}) -> predicate<client>;

/**
 * \brief Contract ends within `days` whole days (0 ≤ remaining ≤ days).
 *
 * Open-ended contracts never match. invalid_argument when days < 0.
 */
[[nodiscard]] auto contract_expiring(int days = 30, wall_clock clock = {})
    -> std::expected<predicate<client>, core::error>;

[[nodiscard]] auto is_premium_or_enterprise() -> predicate<client>;

/** \brief Fixed-term contract lasting at least 365 days. */
[[nodiscard]] auto has_long_term_contract() -> predicate<client>;

} // namespace criteria::wms::client_rules
