#include "procure/orders/order_lifecycle.hpp"

#include "procure/orders/delivery_date.hpp"

namespace procure {

namespace {

domain::OrderChange transition(const domain::Order& order,
                               domain::OrderStatus from,
                               domain::OrderStatus to) {
  domain::OrderChange change;
  change.id = order.id;
  change.old_status = from;
  change.new_status = to;
  return change;
}

}  // namespace

OrderLifecycle::OrderLifecycle(const domain::SimulationConfig& config,
                               IRandomSource& rng)
    : config_(config), rng_(rng) {}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
std::vector<domain::OrderChange> OrderLifecycle::advance(
    std::vector<domain::Order>& orders, TimestampMs now) {
  using S = domain::OrderStatus;
  std::vector<domain::OrderChange> changes;

  for (auto& order : orders) {
    if (isAbsorbing(order.status) || order.status == S::PartiallyDelivered) {
      continue;
    }
    if (!order.expected_delivery || !order.expected_delivery->value) {
      continue;
    }

    const std::int64_t days_until_delivery =
        daysBetween(now, *order.expected_delivery->value);

    if (order.status == S::Pending &&
        days_until_delivery <= config_.dispatch_window_days) {
      if (rng_.chance(config_.ship_probability)) {
        order.status = S::InTransit;
        changes.push_back(transition(order, S::Pending, S::InTransit));
      } else if (rng_.chance(config_.delay_probability)) {
        const std::int64_t delay_days =
            rng_.uniform_int(config_.min_delay_days, config_.max_delay_days);
        pushDeliveryDate(*order.expected_delivery, delay_days);
        order.status = S::Delayed;

        auto change = transition(order, S::Pending, S::Delayed);
        change.delay_days = delay_days;
        changes.push_back(std::move(change));
      }
    } else if (order.status == S::InTransit && days_until_delivery <= 0) {
      order.status = S::Delivered;
      order.actual_delivery_date = now;
      changes.push_back(transition(order, S::InTransit, S::Delivered));
    } else if (order.status == S::Delayed) {
      if (rng_.chance(config_.resume_probability)) {
        order.status = S::InTransit;
        changes.push_back(transition(order, S::Delayed, S::InTransit));
      }
    }
  }

  return changes;
}

}  // namespace procure
