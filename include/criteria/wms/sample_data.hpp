#pragma once

/** \file sample_data.hpp
 *  \brief Small fixed 3PL data set used by the demo and tests.
 *
 * Dates are laid out relative to the supplied `now` so the time-based rules produce the same
 * classification whenever the data set is built.
 */

#include <expected>
#include <vector>

#include "criteria/error.hpp"
#include "criteria/wms/clock.hpp"
#include "criteria/wms/models.hpp"

namespace criteria::wms {

struct warehouse_snapshot {
  std::vector<client> clients;
  std::vector<product> products;
  std::vector<inventory> stock;
  std::vector<location> locations;
  std::vector<order> orders;
  std::vector<shipment> shipments;
};

/**
 * \brief Four clients, five products, five inventory records, five locations, three orders
 *        and three shipments.
 * \return the first record that fails validation, as invalid_argument
 */
[[nodiscard]] auto load_sample_warehouse(time_point now)
    -> std::expected<warehouse_snapshot, core::error>;

/** \brief Calendar month arithmetic; the day is clamped to the end of a shorter month. */
[[nodiscard]] auto add_months(time_point t, int months) -> time_point;

} // namespace criteria::wms
