#include "procure/generator/entity_generator.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/random/sampling.hpp"
#include "procure/util/rounding.hpp"

#include <string>

namespace procure {

namespace {

constexpr int kHistoryDays = 30;

const std::vector<domain::PriceTrend>& initialTrends() {
  static const std::vector<domain::PriceTrend> kTrends = {
      domain::PriceTrend::Rising, domain::PriceTrend::Stable,
      domain::PriceTrend::Falling};
  return kTrends;
}

}  // namespace

EntityGenerator::EntityGenerator(const domain::SimulationConfig& config,
                                 IRandomSource& rng)
    : config_(config), rng_(rng) {}

InitialData EntityGenerator::generateInitialData(TimestampMs now,
                                                 std::size_t count) {
  InitialData data;
  data.suppliers = generateSuppliers(count);
  data.market_conditions = generateMarketConditions(now);
  return data;
}

// -----------------------------------------------------------------------------
// generateSuppliers()
// -----------------------------------------------------------------------------
std::vector<domain::Supplier> EntityGenerator::generateSuppliers(
    std::size_t count) {
  std::vector<domain::Supplier> suppliers;
  suppliers.reserve(count);

  for (std::size_t i = 1; i <= count; ++i) {
    const auto& region = pick(rng_, catalogue::regions());

    domain::Supplier s;
    s.id = "S" + std::to_string(i);
    s.name = region.name + " Coffee Cooperative " + std::to_string(i);
    s.region = region.name;

    const auto bean_count = static_cast<std::size_t>(rng_.uniform_int(1, 2));
    s.bean_types = sample(rng_, region.beans, bean_count);

    const auto cert_count = static_cast<std::size_t>(rng_.uniform_int(0, 3));
    s.certifications = sample(rng_, catalogue::certifications(), cert_count);

    s.quality_score =
        roundTenths(rng_.uniform(region.quality_min, region.quality_max));
    s.capacity_kg_per_year = rng_.uniform_int(10, 100) * 1000;
    s.reliability_score = roundTenths(rng_.uniform(6.0, 9.5));
    s.years_in_business = static_cast<int>(rng_.uniform_int(3, 50));
    s.sustainability_score = roundTenths(rng_.uniform(5.0, 10.0));

    suppliers.push_back(std::move(s));
  }

  return suppliers;
}

// -----------------------------------------------------------------------------
// generateMarketConditions()
// -----------------------------------------------------------------------------
domain::MarketConditions EntityGenerator::generateMarketConditions(
    TimestampMs now) {
  domain::MarketConditions mc;
  mc.date = now;
  mc.price_history = domain::PriceHistory(config_.price_history_capacity);

  const double base_price = roundCents(
      rng_.uniform(config_.initial_price_min, config_.initial_price_max));
  mc.average_price = base_price;

  // Walk forward from the base price, oldest day first.
  double walk = base_price;
  for (int days_ago = kHistoryDays; days_ago > 0; --days_ago) {
    const double change = rng_.uniform(-config_.history_daily_return,
                                       config_.history_daily_return);
    walk = roundCents(walk * (1.0 + change));
    mc.price_history.push({addDays(now, -days_ago), walk});
  }

  for (const auto& region : catalogue::regions()) {
    const double variation = rng_.uniform(catalogue::kRegionalOffsetMin,
                                          catalogue::kRegionalOffsetMax);
    mc.regional_prices[region.name] = roundCents(base_price * (1.0 + variation));
  }

  mc.bean_prices[catalogue::kBaseBean] = base_price;
  for (const auto& band : catalogue::beanPriceBands()) {
    mc.bean_prices[band.bean] = roundCents(
        base_price * rng_.uniform(band.multiplier_min, band.multiplier_max));
  }

  for (const auto& vocab : catalogue::marketFactors()) {
    domain::MarketFactor factor;
    factor.name = vocab.name;
    factor.status = pick(rng_, vocab.statuses);
    factor.impact = pick(rng_, catalogue::impactLevels());
    factor.details = pick(rng_, vocab.initial_details);
    mc.market_factors.push_back(std::move(factor));
  }

  mc.price_trend = pick(rng_, initialTrends());
  mc.forecast.short_term = pick(rng_, catalogue::shortTermForecasts());
  mc.forecast.long_term = pick(rng_, catalogue::longTermForecasts());

  return mc;
}

}  // namespace procure
