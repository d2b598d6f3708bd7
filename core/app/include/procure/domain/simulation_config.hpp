#pragma once

#include <cstddef>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// SimulationConfig: engine-wide simulation parameters
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the probabilities, bounds, and ranges
//         that drive every stochastic component of the engine.
//
// @details
// Copied by value into MarketEngine at construction, which hands a const
// reference to each component it owns. Nothing mutates it afterwards, so a
// run is fully described by (config, seed, start instant).
//
// The defaults reproduce the reference market model. main() may override
// any subset from a JSON file via loadSimulationConfig() (see
// config/config_loader.hpp); keys that are absent keep these values.
//
// Thread model:
//   Plain data struct with value semantics; no shared mutable state.
// -----------------------------------------------------------------------------
struct SimulationConfig {
  // --- Population ------------------------------------------------------------
  std::size_t supplier_count{10};

  // --- Market process --------------------------------------------------------
  /// Base price for the initial snapshot is drawn from [min, max].
  double initial_price_min{4.0};
  double initial_price_max{6.0};
  /// Daily return band for the back-filled history walk.
  double history_daily_return{0.03};

  /// average_price is clamped to [min_price, max_price] after every step.
  double min_price{3.0};
  double max_price{10.0};

  /// Capacity of the price_history ring.
  std::size_t price_history_capacity{30};

  /// Trend is re-classified from the last `trend_window` points; a move of
  /// more than `trend_threshold` (fraction) between first and last is a
  /// Rising/Falling trend.
  std::size_t trend_window{5};
  double trend_threshold{0.02};

  /// Independent per-entry noise added to regional and bean price moves.
  double price_noise{0.01};

  double factor_resample_probability{0.10};
  double forecast_resample_probability{0.05};

  // --- Order lifecycle -------------------------------------------------------
  /// Pending orders are eligible to ship once delivery is this close.
  int dispatch_window_days{30};
  double ship_probability{0.80};
  /// Conditional on not shipping this step.
  double delay_probability{0.50};
  int min_delay_days{5};
  int max_delay_days{15};
  double resume_probability{0.30};

  // --- Supplier drift --------------------------------------------------------
  double supplier_drift_probability{0.20};
  double score_drift{0.5};
  double capacity_drift{0.10};
  /// Quality, reliability, sustainability stay within [min_score, max_score].
  double min_score{5.0};
  double max_score{10.0};

  // --- Fallback synthesis ----------------------------------------------------
  double fallback_contract_probability{0.50};
  int min_contract_days{90};
  int max_contract_days{365};
  /// Between-step order placement when orders already exist.
  double fallback_order_probability{0.40};
  int min_delivery_lead_days{30};
  int max_delivery_lead_days{60};
};

}  // namespace domain
}  // namespace procure
