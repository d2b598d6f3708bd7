#pragma once

#include "procure/domain/contract.hpp"
#include "procure/domain/market_conditions.hpp"
#include "procure/domain/result.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/domain/supplier.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

#include <vector>

namespace procure {

// -----------------------------------------------------------------------------
// ContractFallbackPolicy: keeps at least one active contract available
// -----------------------------------------------------------------------------
//
// @brief  When no contract is active, synthesizes one directly in the
//         Active state so order placement is never starved.
//
// @details
// Two-phase so the engine can observe both the decision and the outcome:
//
//   shouldSynthesize(contracts)
//       false without a draw when any contract is Active; otherwise
//       chance(fallback_contract_probability).
//
//   synthesize(suppliers, market, now) -> Result<Contract>
//       Draw order: supplier index, duration U{min..max_contract_days},
//       volume min U{5000..10000}, volume max U{15000..30000}, payment
//       terms, delivery terms, sustainability requirement.
//       price = roundCents(average_price * (0.9 + 0.3 * quality / 10))
//       id    = "contract_<supplier id>_<YYYYMMDDHHMMSS of now>"
//       Fails (no entity, no partial state) when there are no suppliers.
//
// Starting from zero active contracts the number of steps until one exists
// is geometric with p = fallback_contract_probability.
// -----------------------------------------------------------------------------
class ContractFallbackPolicy {
 public:
  ContractFallbackPolicy(const domain::SimulationConfig& config,
                         IRandomSource& rng);

  bool shouldSynthesize(const std::vector<domain::Contract>& contracts);

  domain::Result<domain::Contract> synthesize(
      const std::vector<domain::Supplier>& suppliers,
      const domain::MarketConditions& market, TimestampMs now);

  static bool hasActive(const std::vector<domain::Contract>& contracts);

 private:
  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
