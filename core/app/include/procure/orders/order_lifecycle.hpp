#pragma once

#include "procure/domain/order.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/domain/step_changes.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

#include <vector>

namespace procure {

// -----------------------------------------------------------------------------
// OrderLifecycle: the per-step order state machine
// -----------------------------------------------------------------------------
//
// @brief  Advances every live order by at most one transition per step.
//
// @details
// For each order, in list order:
//   - Delivered, Cancelled, PartiallyDelivered: skipped, no draw.
//   - expected delivery absent or unparsable: skipped, no draw.
//   - days = daysBetween(now, expected delivery), floored.
//
//   Pending,   days <= dispatch_window_days:
//       chance(ship_probability)       -> InTransit
//       else chance(delay_probability) -> Delayed, expected delivery pushed
//                                         U{min_delay_days..max_delay_days}
//       else                           -> stays Pending
//   InTransit, days <= 0               -> Delivered (no draw), stamped with
//                                         actual_delivery_date = now
//   Delayed:
//       chance(resume_probability)     -> InTransit
//
// Every transition yields one OrderChange with an empty `action`.
// This is a biased random walk over a small state graph, not a schedule.
//
// Thread model: NOT thread-safe; called only from MarketEngine::advance_step().
// -----------------------------------------------------------------------------
class OrderLifecycle {
 public:
  OrderLifecycle(const domain::SimulationConfig& config, IRandomSource& rng);

  std::vector<domain::OrderChange> advance(std::vector<domain::Order>& orders,
                                           TimestampMs now);

  static bool isAbsorbing(domain::OrderStatus status) {
    return status == domain::OrderStatus::Delivered ||
           status == domain::OrderStatus::Cancelled;
  }

 private:
  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
