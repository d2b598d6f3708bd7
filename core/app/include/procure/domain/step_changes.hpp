#pragma once

#include "procure/domain/contract_status.hpp"
#include "procure/domain/order_status.hpp"
#include "procure/domain/supplier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procure {
namespace domain {

// Recorded once per step by MarketProcess. Prices are post-rounding,
// post-clamp for new_price; change_pct is the raw sampled fraction.
struct MarketChange {
  double old_price{0.0};
  double new_price{0.0};
  double change_pct{0.0};
};

// Capacity values are whole kilograms carried as double so one record type
// covers all four attributes.
struct SupplierChange {
  std::string id;
  std::string name;
  SupplierAttribute update_type{SupplierAttribute::Quality};
  double old_value{0.0};
  double new_value{0.0};
};

// -----------------------------------------------------------------------------
// OrderChange
// -----------------------------------------------------------------------------
// One entry per order mutation. `action` is empty for lifecycle
// transitions produced by advance_step() and names the accessor otherwise
// ("created", "update", "update_status", "update_delivery").
// -----------------------------------------------------------------------------
struct OrderChange {
  std::string id;
  std::string action;
  std::optional<OrderStatus> old_status;
  std::optional<OrderStatus> new_status;
  std::optional<std::int64_t> delay_days;
  std::optional<std::string> supplier;
  std::optional<std::int64_t> volume;
  std::optional<std::string> old_delivery;
  std::optional<std::string> new_delivery;
};

struct ContractChange {
  std::string contract_id;
  std::string action;  // "add", "created", "update", "update_status"
  std::optional<ContractStatus> old_status;
  std::optional<ContractStatus> new_status;
  std::optional<std::string> supplier;
};

// A fallback synthesis that could not produce its entity. Recorded in the
// change-log so the failure is observable, not just printed.
struct SynthesisFailure {
  std::string component;  // "contract_fallback" or "order_placement"
  std::string reason;
};

// -----------------------------------------------------------------------------
// StepChanges: the per-step change-log
// -----------------------------------------------------------------------------
//
// @brief  Structured diff of everything that changed since the start of the
//         current step.
//
// @details
// MarketEngine resets it to empty at the beginning of every advance_step();
// mutating accessors called between steps append to it as well. It is a
// per-step delta, not a log: nothing older than the current step survives.
// get_changes() returns a copy, so calling it twice without an intervening
// step yields identical values.
// -----------------------------------------------------------------------------
struct StepChanges {
  std::vector<SupplierChange> suppliers;
  std::vector<ContractChange> contracts;
  std::vector<OrderChange> orders;
  std::optional<MarketChange> market_conditions;
  std::vector<SynthesisFailure> failures;

  bool empty() const {
    return suppliers.empty() && contracts.empty() && orders.empty() &&
           !market_conditions.has_value() && failures.empty();
  }
};

}  // namespace domain
}  // namespace procure
