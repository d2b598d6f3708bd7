#pragma once

#include "procure/domain/contract.hpp"
#include "procure/domain/market_conditions.hpp"
#include "procure/domain/order.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/domain/supplier.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

#include <cstddef>
#include <vector>

namespace procure {

// The population a fresh simulation starts from. contracts and orders are
// always empty; they exist so callers get the full state shape back.
struct InitialData {
  std::vector<domain::Supplier> suppliers;
  std::vector<domain::Contract> contracts;
  std::vector<domain::Order> orders;
  domain::MarketConditions market_conditions;
};

// -----------------------------------------------------------------------------
// EntityGenerator: initial population and market snapshot
// -----------------------------------------------------------------------------
//
// @brief  Builds suppliers and the initial MarketConditions from the fixed
//         catalogue using bounded random draws.
//
// @details
// Suppliers (per supplier, in draw order):
//   region      uniform over catalogue::regions()
//   bean_types  1-2 distinct entries of the region's palette
//   certs       0-3 distinct entries of catalogue::certifications()
//   quality     U(region.quality_min, region.quality_max), tenths
//   capacity    U{10..100} * 1000 kg
//   reliability U(6.0, 9.5), tenths
//   years       U{3..50}
//   sustain.    U(5.0, 10.0), tenths
//
// Market conditions:
//   base price U(initial_price_min, initial_price_max), cents. 30 days of
//   history back-filled by a multiplicative walk (each step a return in
//   +/- history_daily_return), oldest point 30 days before `now`. Regional
//   and bean prices are one-shot perturbations of the base. Factors, trend
//   and forecast are drawn independently.
//
// Pure with respect to engine state: it only reads the catalogue and
// consumes draws from the injected source.
//
// Ownership:
//   Holds non-owning references to the config and random source; both must
//   outlive the generator (MarketEngine owns all three).
// -----------------------------------------------------------------------------
class EntityGenerator {
 public:
  EntityGenerator(const domain::SimulationConfig& config, IRandomSource& rng);

  InitialData generateInitialData(TimestampMs now, std::size_t count);

  std::vector<domain::Supplier> generateSuppliers(std::size_t count);

  domain::MarketConditions generateMarketConditions(TimestampMs now);

 private:
  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
