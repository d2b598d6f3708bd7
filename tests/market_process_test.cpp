// =============================================================================
// market_process_test.cpp
// =============================================================================
// Unit tests for procure::MarketProcess.
//
// Validates:
//   - average_price is rounded then clamped to [3.0, 10.0]
//   - The history ring keeps its capacity and receives the new point
//   - Trend classification over the recent window
//   - Factor and forecast re-sampling consume the scripted draws
//   - Long seeded runs never leave the price band
// =============================================================================

#include "procure/catalogue/catalogue.hpp"
#include "procure/generator/entity_generator.hpp"
#include "procure/market/market_process.hpp"
#include "procure/random/mersenne_random_source.hpp"
#include "support/scripted_random_source.hpp"

#include <gtest/gtest.h>

using procure::domain::MarketConditions;
using procure::domain::PriceTrend;
using procure::testing::ScriptedRandomSource;

class MarketProcessTest : public ::testing::Test {
 protected:
  static MarketConditions bareConditions(double price, PriceTrend trend) {
    MarketConditions mc;
    mc.average_price = price;
    mc.price_trend = trend;
    return mc;
  }

  static procure::domain::PriceHistory historyOf(
      const std::vector<double>& prices) {
    procure::domain::PriceHistory history(30);
    procure::TimestampMs date = 0;
    for (double p : prices) {
      history.push({date, p});
      date = procure::addDays(date, 1);
    }
    return history;
  }

  procure::domain::SimulationConfig config;
  procure::TimestampMs today = procure::makeTimestamp(2025, 4, 1);
};

// -----------------------------------------------------------------------------
// 1. 9.95 under a Rising trend with the largest sampled move stays <= 10.0.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, RisingPriceIsClampedAtCeiling) {
  ScriptedRandomSource rng;
  rng.pushUnit(0.999999);  // change_pct ~ +3%

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(9.95, PriceTrend::Rising);

  const auto change = process.advance(mc, today);

  EXPECT_DOUBLE_EQ(mc.average_price, 10.0);
  EXPECT_DOUBLE_EQ(change.old_price, 9.95);
  EXPECT_DOUBLE_EQ(change.new_price, 10.0);
  EXPECT_NEAR(change.change_pct, 0.03, 1e-5);
  EXPECT_EQ(mc.date, today);
}

TEST_F(MarketProcessTest, FallingPriceIsClampedAtFloor) {
  ScriptedRandomSource rng;
  rng.pushUnit(0.0);  // change_pct = -3%

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(3.01, PriceTrend::Falling);

  process.advance(mc, today);
  EXPECT_DOUBLE_EQ(mc.average_price, 3.0);
}

// -----------------------------------------------------------------------------
// 2. A full history evicts its oldest point and gains today's.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, HistoryKeepsCapacity) {
  procure::MersenneRandomSource rng(5);
  procure::EntityGenerator generator(config, rng);
  procure::MarketProcess process(config, rng);

  MarketConditions mc = generator.generateMarketConditions(today);
  ASSERT_EQ(mc.price_history.size(), 30u);
  const auto second_oldest = mc.price_history[1];

  const auto tomorrow = procure::addDays(today, 1);
  process.advance(mc, tomorrow);

  EXPECT_EQ(mc.price_history.size(), 30u);
  EXPECT_EQ(mc.price_history.front().date, second_oldest.date);
  EXPECT_EQ(mc.price_history.back().date, tomorrow);
  EXPECT_DOUBLE_EQ(mc.price_history.back().price, mc.average_price);
}

// -----------------------------------------------------------------------------
// 3. Trend thresholds over the last five points.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, ClassifiesTrendFromRecentWindow) {
  using procure::MarketProcess;

  EXPECT_EQ(MarketProcess::classifyTrend(historyOf({5.0, 5.0, 5.0, 5.0, 5.2}),
                                         5, 0.02, PriceTrend::Stable),
            PriceTrend::Rising);
  EXPECT_EQ(MarketProcess::classifyTrend(historyOf({5.0, 5.0, 5.0, 5.0, 4.8}),
                                         5, 0.02, PriceTrend::Stable),
            PriceTrend::Falling);
  EXPECT_EQ(MarketProcess::classifyTrend(historyOf({5.0, 5.3, 4.7, 5.0, 5.05}),
                                         5, 0.02, PriceTrend::Rising),
            PriceTrend::Stable);

  // Only the last window counts.
  EXPECT_EQ(MarketProcess::classifyTrend(
                historyOf({9.0, 5.0, 5.0, 5.0, 5.0, 5.0}), 5, 0.02,
                PriceTrend::Falling),
            PriceTrend::Stable);
}

TEST_F(MarketProcessTest, ShortHistoryKeepsCurrentTrend) {
  EXPECT_EQ(procure::MarketProcess::classifyTrend(historyOf({5.0, 9.0}), 5,
                                                  0.02, PriceTrend::Falling),
            PriceTrend::Falling);
}

// -----------------------------------------------------------------------------
// 4. Regional and bean prices follow the headline move plus noise.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, RegionalAndBeanPricesMove) {
  ScriptedRandomSource rng;
  rng.pushUniform(0.01, -0.015, 0.015)  // headline +1%
      .pushUniform(0.0, -0.01, 0.01)    // Brazil noise
      .pushUniform(0.0, -0.01, 0.01);   // Arabica noise

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(5.0, PriceTrend::Stable);
  mc.regional_prices["Brazil"] = 4.0;
  mc.bean_prices["Arabica"] = 5.0;

  process.advance(mc, today);

  EXPECT_DOUBLE_EQ(mc.average_price, 5.05);
  EXPECT_DOUBLE_EQ(mc.regional_prices.at("Brazil"), 4.04);
  EXPECT_DOUBLE_EQ(mc.bean_prices.at("Arabica"), 5.05);
}

// -----------------------------------------------------------------------------
// 5. A factor re-sample draws index, status, impact and extended details.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, ResamplesOneFactor) {
  const auto& statuses = procure::catalogue::resampleStatuses();
  const auto& impacts = procure::catalogue::impactLevels();
  const auto* weather = procure::catalogue::findFactor("Weather Conditions");
  ASSERT_NE(weather, nullptr);
  const auto last_detail = weather->extended_details.size() - 1;

  ScriptedRandomSource rng;
  rng.pushUnit(0.5)  // headline change
      .pushChance(true)
      .pushIndex(0, 2)
      .pushIndex(2, statuses.size())
      .pushIndex(0, impacts.size())
      .pushIndex(last_detail, weather->extended_details.size())
      .pushChance(false);

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(5.0, PriceTrend::Stable);
  mc.market_factors.push_back({"Weather Conditions", "Favorable", "Low", "x"});
  mc.market_factors.push_back({"Global Demand", "Stable", "Low", "y"});

  process.advance(mc, today);

  EXPECT_EQ(mc.market_factors[0].status, statuses[2]);
  EXPECT_EQ(mc.market_factors[0].impact, impacts[0]);
  EXPECT_EQ(mc.market_factors[0].details,
            weather->extended_details[last_detail]);
  EXPECT_EQ(mc.market_factors[1].details, "y");
  EXPECT_EQ(rng.remaining(), 0u);
}

TEST_F(MarketProcessTest, UnknownFactorKeepsDetails) {
  ScriptedRandomSource rng;
  rng.pushUnit(0.5).pushChance(true).pushIndex(0, 1).pushIndex(0, 3).pushIndex(
      0, procure::catalogue::impactLevels().size());

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(5.0, PriceTrend::Stable);
  mc.market_factors.push_back({"Shipping Costs", "High", "High", "Red Sea"});

  process.advance(mc, today);

  EXPECT_EQ(mc.market_factors[0].details, "Red Sea");
  EXPECT_EQ(mc.market_factors[0].status,
            procure::catalogue::resampleStatuses()[0]);
}

// -----------------------------------------------------------------------------
// 6. Forecast re-sample replaces both horizons.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, ResamplesForecast) {
  const auto& short_terms = procure::catalogue::shortTermForecasts();
  const auto& long_terms = procure::catalogue::longTermForecasts();

  ScriptedRandomSource rng;
  rng.pushUnit(0.5)
      .pushChance(false)
      .pushChance(true)
      .pushIndex(1, short_terms.size())
      .pushIndex(0, long_terms.size());

  procure::MarketProcess process(config, rng);
  MarketConditions mc = bareConditions(5.0, PriceTrend::Stable);
  process.advance(mc, today);

  EXPECT_EQ(mc.forecast.short_term, short_terms[1]);
  EXPECT_EQ(mc.forecast.long_term, long_terms[0]);
}

// -----------------------------------------------------------------------------
// 7. A thousand seeded steps stay inside the configured band.
// -----------------------------------------------------------------------------
TEST_F(MarketProcessTest, PriceStaysInBandOverLongRun) {
  procure::MersenneRandomSource rng(99);
  procure::EntityGenerator generator(config, rng);
  procure::MarketProcess process(config, rng);

  MarketConditions mc = generator.generateMarketConditions(today);
  procure::TimestampMs date = today;
  for (int i = 0; i < 1000; ++i) {
    date = procure::addDays(date, 1);
    process.advance(mc, date);
    ASSERT_GE(mc.average_price, config.min_price);
    ASSERT_LE(mc.average_price, config.max_price);
    ASSERT_LE(mc.price_history.size(), config.price_history_capacity);
  }
}
