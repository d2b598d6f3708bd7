#pragma once

#include "procure/domain/market_conditions.hpp"
#include "procure/domain/simulation_config.hpp"
#include "procure/domain/step_changes.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

#include <cstddef>

namespace procure {

// -----------------------------------------------------------------------------
// MarketProcess: trend-following daily price update
// -----------------------------------------------------------------------------
//
// @brief  Advances MarketConditions by one simulated day.
//
// @details
// advance() runs, in this order:
//   1. date <- simulated day
//   2. change_pct drawn from a band chosen by the CURRENT trend label:
//        Rising  U(-1%, +3%)
//        Falling U(-3%, +1%)
//        Stable  U(-1.5%, +1.5%)
//   3. average_price <- clamp(roundCents(old * (1 + change_pct)))
//   4. price_history.push({date, average_price}); the ring evicts oldest
//   5. price_trend re-classified by classifyTrend()
//   6. every regional price, then every bean price, moves by change_pct
//      plus independent U(-noise, +noise), rounded to cents
//   7. chance(factor_resample_probability): one factor re-sampled
//   8. chance(forecast_resample_probability): forecast pair re-sampled
//
// The momentum bias of step 2 is intentional; the process is not a
// martingale.
//
// Thread model: NOT thread-safe; called only from MarketEngine::advance_step().
// -----------------------------------------------------------------------------
class MarketProcess {
 public:
  MarketProcess(const domain::SimulationConfig& config, IRandomSource& rng);

  // -------------------------------------------------------------------------
  // advance(conditions, date)
  // -------------------------------------------------------------------------
  // @brief  Mutates `conditions` in place.
  //
  // @return The {old_price, new_price, change_pct} record for the change-log.
  // -------------------------------------------------------------------------
  domain::MarketChange advance(domain::MarketConditions& conditions,
                               TimestampMs date);

  // -------------------------------------------------------------------------
  // classifyTrend(history, window, threshold, current)
  // -------------------------------------------------------------------------
  // Compares the first and last of the most recent `window` points:
  // last > first * (1 + threshold) is Rising, last < first * (1 - threshold)
  // is Falling, anything else Stable. With fewer than `window` points the
  // current label is returned unchanged.
  // -------------------------------------------------------------------------
  static domain::PriceTrend classifyTrend(const domain::PriceHistory& history,
                                          std::size_t window, double threshold,
                                          domain::PriceTrend current);

 private:
  double sampleChange(domain::PriceTrend trend);
  void resampleFactor(domain::MarketConditions& conditions);

  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
