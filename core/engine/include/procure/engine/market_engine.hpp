#pragma once

#include "procure/contracts/contract_fallback_policy.hpp"
#include "procure/domain/contract.hpp"
#include "procure/domain/market_conditions.hpp"
#include "procure/domain/order.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/domain/step_changes.hpp"
#include "procure/domain/supplier.hpp"
#include "procure/domain/tracking_view.hpp"
#include "procure/generator/entity_generator.hpp"
#include "procure/market/market_process.hpp"
#include "procure/orders/order_lifecycle.hpp"
#include "procure/orders/order_placement_policy.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/suppliers/supplier_drift.hpp"
#include "procure/time/i_time_provider.hpp"
#include "procure/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procure {

// -----------------------------------------------------------------------------
// SimulationState
// -----------------------------------------------------------------------------
// Every mutable collection of one simulation, owned by exactly one
// MarketEngine. Nothing outside the engine holds a reference into it.
// -----------------------------------------------------------------------------
struct SimulationState {
  std::vector<domain::Supplier> suppliers;
  std::vector<domain::Contract> contracts;
  std::vector<domain::Order> orders;
  domain::MarketConditions market_conditions;
  domain::StepChanges changes;
  std::int64_t simulation_step{0};
};

// -----------------------------------------------------------------------------
// MarketEngine: the simulation engine
// -----------------------------------------------------------------------------
//
// @brief  Owns the SimulationState and the simulated clock, advances both
//         one day per advance_step(), and exposes copy-on-read accessors.
//
// @details
// advance_step() runs a fixed pipeline:
//
//   1. simulation_step += 1; simulated date += 1 day; change-log reset
//   2. MarketProcess::advance()           -> changes.market_conditions
//   3. OrderLifecycle::advance()          -> changes.orders
//   4. SupplierDrift::maybeDrift()        -> changes.suppliers
//   5. ContractFallbackPolicy             -> changes.contracts or failures
//
// Synthesis is all-or-nothing: a fallback entity is fully built before it
// is inserted, and a failed synthesis (a Result failure or an exception
// thrown while building) is logged and recorded under changes.failures.
// advance_step() never throws for those.
//
// Accessors:
//   - get_* return deep, independent copies. Callers may mutate them freely.
//   - add_* append without uniqueness checks (a duplicate id is logged);
//     update_* act on the first entity with the id and return false when
//     there is none. Every successful mutation appends a change entry.
//   - *_json variants decode through the JSON codec (which runs the
//     delivery-date normalization shim for orders) and reject a payload
//     with a missing id or a malformed shape.
//
// Thread model:
//   Single writer, no internal locking. Callers serialize every call through
//   one external lock (SimulationService owns that mutex). The simulated
//   clock is atomic so simulation_date() is torn-free, but all other reads
//   need the lock too.
//
// Ownership:
//   MarketEngine
//    ├── config_        (SimulationConfig, value, immutable)
//    ├── rng_           (IRandomSource&, non-owning, must outlive engine)
//    ├── wall_clock_    (const ITimeProvider&, non-owning; start instant)
//    ├── sim_clock_     (SimulationTimeProvider, value member)
//    ├── state_         (SimulationState, value member)
//    └── generator_, market_, lifecycle_, drift_, contract_fallback_,
//        order_placement_ (value members holding refs to config_ and rng_)
//
// config_ is declared first so the components' references bind to an
// initialized member.
// -----------------------------------------------------------------------------
class MarketEngine {
 public:
  MarketEngine(domain::SimulationConfig config, IRandomSource& rng,
               const ITimeProvider& wall_clock);

  MarketEngine(const MarketEngine&) = delete;
  MarketEngine& operator=(const MarketEngine&) = delete;
  MarketEngine(MarketEngine&&) = delete;
  MarketEngine& operator=(MarketEngine&&) = delete;

  // -------------------------------------------------------------------------
  // initialize(count)
  // -------------------------------------------------------------------------
  // @brief  Replaces all state with a freshly generated population.
  //
  // @details
  // Sets the simulated clock to the wall clock's now, resets the step
  // counter and change-log, and generates `count` suppliers plus the
  // initial market snapshot. Contracts and orders start empty.
  //
  // @return A copy of the generated data.
  // -------------------------------------------------------------------------
  InitialData initialize(std::size_t count);
  InitialData initialize();  // config().supplier_count suppliers

  void advance_step();

  TimestampMs simulation_date() const { return sim_clock_.now_ms(); }
  std::int64_t simulation_step() const { return state_.simulation_step; }
  const domain::SimulationConfig& config() const { return config_; }

  // --- Copy-on-read accessors ------------------------------------------------
  std::vector<domain::Supplier> get_suppliers() const;
  std::vector<domain::Contract> get_contracts() const;
  std::vector<domain::Order> get_orders() const;
  domain::MarketConditions get_market_conditions() const;
  domain::StepChanges get_changes() const;

  std::optional<domain::Supplier> find_supplier(const std::string& id) const;
  std::optional<domain::Contract> find_contract(const std::string& id) const;
  std::optional<domain::Order> find_order(const std::string& id) const;

  std::size_t supplier_count() const { return state_.suppliers.size(); }
  std::size_t contract_count() const { return state_.contracts.size(); }
  std::size_t order_count() const { return state_.orders.size(); }

  // Replaces the market snapshot wholesale (scenario seeding, tests).
  void set_market_conditions(domain::MarketConditions conditions);

  // --- Mutating accessors ------------------------------------------------------
  void add_contract(domain::Contract contract);
  void add_order(domain::Order order);
  bool update_contract(domain::Contract contract);
  bool update_order(domain::Order order);

  bool add_contract_json(const nlohmann::json& payload);
  bool add_order_json(const nlohmann::json& payload);
  bool update_contract_json(const nlohmann::json& payload);
  bool update_order_json(const nlohmann::json& payload);

  bool update_contract_status(const std::string& contract_id,
                              domain::ContractStatus status);

  // Delivered also stamps actual_delivery_date with the simulated date.
  bool update_order_status(const std::string& order_id,
                           domain::OrderStatus status);

  // Keeps the field name the order was ingested with; an unparsable date
  // is stored as text and makes the lifecycle skip the order.
  bool update_order_expected_delivery(const std::string& order_id,
                                      const std::string& expected_delivery);

  // -------------------------------------------------------------------------
  // place_fallback_order()
  // -------------------------------------------------------------------------
  // Between-step heuristic (not part of advance_step()): when
  // OrderPlacementPolicy::shouldPlace() agrees, inserts one order against a
  // random active contract and records a "created" change. A failed build
  // is recorded under changes.failures.
  //
  // @return true when an order was inserted.
  // -------------------------------------------------------------------------
  bool place_fallback_order();

  // Fresh narrative per call; std::nullopt for an unknown id.
  std::optional<domain::TrackingView> get_order_tracking(
      const std::string& order_id);

  std::string get_country_for_region(const std::string& region);
  std::string get_country_for_supplier(const std::string& supplier_id);

  // Full state: suppliers, contracts, orders, market_conditions,
  // simulation_date, simulation_step.
  nlohmann::json snapshot() const;

 private:
  domain::Contract* findContractMutable(const std::string& id);
  domain::Order* findOrderMutable(const std::string& id);

  void runContractFallback(TimestampMs now);
  void recordFailure(const std::string& component, const std::string& reason);

  domain::SimulationConfig config_;
  IRandomSource& rng_;
  const ITimeProvider& wall_clock_;
  SimulationTimeProvider sim_clock_;
  SimulationState state_;

  EntityGenerator generator_;
  MarketProcess market_;
  OrderLifecycle lifecycle_;
  SupplierDrift drift_;
  ContractFallbackPolicy contract_fallback_;
  OrderPlacementPolicy order_placement_;
};

}  // namespace procure
