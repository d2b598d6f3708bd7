#include "procure/market/market_process.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/random/sampling.hpp"
#include "procure/util/rounding.hpp"

namespace procure {

MarketProcess::MarketProcess(const domain::SimulationConfig& config,
                             IRandomSource& rng)
    : config_(config), rng_(rng) {}

// -----------------------------------------------------------------------------
// advance()
// -----------------------------------------------------------------------------
domain::MarketChange MarketProcess::advance(
    domain::MarketConditions& conditions, TimestampMs date) {
  conditions.date = date;

  const double old_price = conditions.average_price;
  const double change_pct = sampleChange(conditions.price_trend);

  const double new_price =
      clampTo(roundCents(old_price * (1.0 + change_pct)), config_.min_price,
              config_.max_price);
  conditions.average_price = new_price;

  conditions.price_history.push({date, new_price});
  conditions.price_trend =
      classifyTrend(conditions.price_history, config_.trend_window,
                    config_.trend_threshold, conditions.price_trend);

  for (auto& entry : conditions.regional_prices) {
    const double change =
        change_pct + rng_.uniform(-config_.price_noise, config_.price_noise);
    entry.second = roundCents(entry.second * (1.0 + change));
  }
  for (auto& entry : conditions.bean_prices) {
    const double change =
        change_pct + rng_.uniform(-config_.price_noise, config_.price_noise);
    entry.second = roundCents(entry.second * (1.0 + change));
  }

  if (rng_.chance(config_.factor_resample_probability)) {
    resampleFactor(conditions);
  }

  if (rng_.chance(config_.forecast_resample_probability)) {
    conditions.forecast.short_term =
        pick(rng_, catalogue::shortTermForecasts());
    conditions.forecast.long_term = pick(rng_, catalogue::longTermForecasts());
  }

  return domain::MarketChange{old_price, new_price, change_pct};
}

// -----------------------------------------------------------------------------
// classifyTrend()
// -----------------------------------------------------------------------------
domain::PriceTrend MarketProcess::classifyTrend(
    const domain::PriceHistory& history, std::size_t window, double threshold,
    domain::PriceTrend current) {
  if (window < 2 || history.size() < window) {
    return current;
  }

  const auto recent = history.recent(window);
  const double first = recent.front().price;
  const double last = recent.back().price;

  if (last > first * (1.0 + threshold)) {
    return domain::PriceTrend::Rising;
  }
  if (last < first * (1.0 - threshold)) {
    return domain::PriceTrend::Falling;
  }
  return domain::PriceTrend::Stable;
}

double MarketProcess::sampleChange(domain::PriceTrend trend) {
  switch (trend) {
    case domain::PriceTrend::Rising:
      return rng_.uniform(-0.01, 0.03);
    case domain::PriceTrend::Falling:
      return rng_.uniform(-0.03, 0.01);
    case domain::PriceTrend::Stable:
      break;
  }
  return rng_.uniform(-0.015, 0.015);
}

// -----------------------------------------------------------------------------
// resampleFactor()
// -----------------------------------------------------------------------------
// Status always comes from the shared re-sample vocabulary; details only
// change when the factor name is in the catalogue.
// -----------------------------------------------------------------------------
void MarketProcess::resampleFactor(domain::MarketConditions& conditions) {
  if (conditions.market_factors.empty()) {
    return;
  }

  auto& factor =
      conditions.market_factors[rng_.index(conditions.market_factors.size())];
  factor.status = pick(rng_, catalogue::resampleStatuses());
  factor.impact = pick(rng_, catalogue::impactLevels());

  if (const auto* vocab = catalogue::findFactor(factor.name)) {
    factor.details = pick(rng_, vocab->extended_details);
  }
}

}  // namespace procure
