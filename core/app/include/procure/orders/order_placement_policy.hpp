#pragma once

#include "procure/domain/contract.hpp"
#include "procure/domain/order.hpp"
#include "procure/domain/result.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace procure {

// Resolves a supplier id to the country used for the origin port.
using CountryLookup = std::function<std::string(const std::string&)>;

// -----------------------------------------------------------------------------
// makeOrder(rng, config, contract, volume_lbs, now, id, country_for)
// -----------------------------------------------------------------------------
//
// @brief  Builds one complete Pending order against `contract`.
//
// @details
// Shared by the desk's create_order tool and the fallback placement policy
// so both produce identical shapes. Draw order: delivery lead
// U{min..max_delivery_lead_days}, carrier, tracking number U{100000..999999},
// then whatever `country_for` consumes.
//
//   order_date             now
//   expected_delivery_date now + lead days, plain date
//   total_value            roundCents(volume_lbs * price_per_pound)
//   shipping_details       carrier, "TRK<n>", "Port of <country>",
//                          catalogue::kDestinationPort
// -----------------------------------------------------------------------------
domain::Order makeOrder(IRandomSource& rng,
                        const domain::SimulationConfig& config,
                        const domain::Contract& contract,
                        std::int64_t volume_lbs, TimestampMs now,
                        std::string id, const CountryLookup& country_for);

// "order_<contract id>_<YYYYMMDDHHMMSS>_<sequence>"
std::string makeOrderId(const std::string& contract_id, TimestampMs now,
                        std::size_t sequence);

// -----------------------------------------------------------------------------
// OrderPlacementPolicy: between-step fallback order placement
// -----------------------------------------------------------------------------
// Responsibility: Keeps orders flowing when no external agent places any.
//
// @details
// shouldPlace(): false without a draw when no contract is Active; true
// without a draw when there are no orders yet; otherwise
// chance(fallback_order_probability).
//
// place(): picks an Active contract uniformly, draws a volume from its
// volume_range (5000..20000 when it has none), and delegates to makeOrder().
// Fails when no contract is Active or the range is inverted. The id uses
// `sequence`, which MarketEngine passes as order count + 1 so ids never
// repeat.
// -----------------------------------------------------------------------------
class OrderPlacementPolicy {
 public:
  OrderPlacementPolicy(const domain::SimulationConfig& config,
                       IRandomSource& rng);

  bool shouldPlace(const std::vector<domain::Contract>& contracts,
                   std::size_t order_count);

  domain::Result<domain::Order> place(
      const std::vector<domain::Contract>& contracts, TimestampMs now,
      std::size_t sequence, const CountryLookup& country_for);

 private:
  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
