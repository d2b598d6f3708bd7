#pragma once

#include "procure/domain/price_history.hpp"
#include "procure/time/calendar.hpp"

#include <map>
#include <string>
#include <vector>

namespace procure {
namespace domain {

enum class PriceTrend {
  Rising,
  Falling,
  Stable,
};

// -----------------------------------------------------------------------------
// MarketFactor
// -----------------------------------------------------------------------------
// A named qualitative driver ("Weather Conditions", "Political Stability",
// "Global Demand"). status/impact/details are drawn from fixed vocabularies
// keyed by the factor name (see catalogue/catalogue.hpp).
// -----------------------------------------------------------------------------
struct MarketFactor {
  std::string name;
  std::string status;
  std::string impact;
  std::string details;
};

struct Forecast {
  std::string short_term;
  std::string long_term;
};

// -----------------------------------------------------------------------------
// MarketConditions: the singleton market snapshot
// -----------------------------------------------------------------------------
//
// @brief  Everything the market process evolves once per simulated day.
//
// @details
// Exactly one instance lives inside MarketEngine's SimulationState. It is
// created by EntityGenerator, mutated by MarketProcess::advance() on every
// step, and handed out only as a copy.
//
// Invariants (after every mutation):
//   - 3.0 <= average_price <= 10.0 (configurable band)
//   - price_history.size() <= price_history.capacity()
//   - market_factors keeps its three named entries in a fixed order
//
// regional_prices and bean_prices use std::map so iteration, and therefore
// the order of random draws applied to them, is deterministic.
// -----------------------------------------------------------------------------
struct MarketConditions {
  TimestampMs date{0};
  double average_price{0.0};
  PriceTrend price_trend{PriceTrend::Stable};
  PriceHistory price_history;
  std::map<std::string, double> regional_prices;
  std::map<std::string, double> bean_prices;
  std::vector<MarketFactor> market_factors;
  Forecast forecast;
};

}  // namespace domain
}  // namespace procure
