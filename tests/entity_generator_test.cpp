// =============================================================================
// entity_generator_test.cpp
// =============================================================================
// Unit tests for procure::EntityGenerator.
//
// Validates:
//   - Supplier ids, names and field ranges over a seeded population
//   - Scripted draws map onto one supplier field by field
//   - Initial market snapshot: 30-day history, catalogue coverage, three
//     factors, bean price bands relative to the base price
// =============================================================================

#include "procure/catalogue/catalogue.hpp"
#include "procure/generator/entity_generator.hpp"
#include "procure/random/mersenne_random_source.hpp"
#include "support/scripted_random_source.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

using procure::testing::ScriptedRandomSource;

class EntityGeneratorTest : public ::testing::Test {
 protected:
  procure::domain::SimulationConfig config;
  procure::TimestampMs now = procure::makeTimestamp(2025, 6, 1);
};

// -----------------------------------------------------------------------------
// 1. A seeded population satisfies every per-field range.
// -----------------------------------------------------------------------------
TEST_F(EntityGeneratorTest, SuppliersStayInRange) {
  procure::MersenneRandomSource rng(7);
  procure::EntityGenerator generator(config, rng);

  const auto suppliers = generator.generateSuppliers(50);
  ASSERT_EQ(suppliers.size(), 50u);

  for (std::size_t i = 0; i < suppliers.size(); ++i) {
    const auto& s = suppliers[i];
    EXPECT_EQ(s.id, "S" + std::to_string(i + 1));
    EXPECT_EQ(s.name,
              s.region + " Coffee Cooperative " + std::to_string(i + 1));
    EXPECT_FALSE(s.bean_types.empty());
    EXPECT_LE(s.bean_types.size(), 2u);
    EXPECT_LE(s.certifications.size(), 3u);
    EXPECT_EQ(std::set<std::string>(s.certifications.begin(),
                                    s.certifications.end())
                  .size(),
              s.certifications.size());
    EXPECT_GE(s.capacity_kg_per_year, 10000);
    EXPECT_LE(s.capacity_kg_per_year, 100000);
    EXPECT_EQ(s.capacity_kg_per_year % 1000, 0);
    EXPECT_GE(s.reliability_score, 6.0);
    EXPECT_LE(s.reliability_score, 9.5);
    EXPECT_GE(s.sustainability_score, 5.0);
    EXPECT_LE(s.sustainability_score, 10.0);
    EXPECT_GE(s.years_in_business, 3);
    EXPECT_LE(s.years_in_business, 50);
    EXPECT_FALSE(s.country.has_value());
  }
}

// -----------------------------------------------------------------------------
// 2. One supplier from a fully scripted draw sequence.
// -----------------------------------------------------------------------------
TEST_F(EntityGeneratorTest, ScriptedSupplierFields) {
  const auto& regions = procure::catalogue::regions();
  ScriptedRandomSource rng;
  rng.pushIndex(1, regions.size())  // Colombia
      .pushInt(1, 1, 2)             // one bean
      .pushIndex(0, 3)              // first bean of the palette
      .pushInt(0, 0, 3)             // no certifications
      .pushUniform(8.0, 7.0, 9.0)   // quality
      .pushInt(50, 10, 100)         // capacity
      .pushUniform(7.5, 6.0, 9.5)   // reliability
      .pushInt(20, 3, 50)           // years in business
      .pushUniform(9.0, 5.0, 10.0); // sustainability

  procure::EntityGenerator generator(config, rng);
  const auto suppliers = generator.generateSuppliers(1);

  ASSERT_EQ(suppliers.size(), 1u);
  const auto& s = suppliers[0];
  EXPECT_EQ(s.region, "Colombia");
  EXPECT_EQ(s.name, "Colombia Coffee Cooperative 1");
  ASSERT_EQ(s.bean_types.size(), 1u);
  EXPECT_EQ(s.bean_types[0], "Arabica");
  EXPECT_TRUE(s.certifications.empty());
  EXPECT_DOUBLE_EQ(s.quality_score, 8.0);
  EXPECT_EQ(s.capacity_kg_per_year, 50000);
  EXPECT_DOUBLE_EQ(s.reliability_score, 7.5);
  EXPECT_EQ(s.years_in_business, 20);
  EXPECT_DOUBLE_EQ(s.sustainability_score, 9.0);
  EXPECT_EQ(rng.remaining(), 0u);
}

// -----------------------------------------------------------------------------
// 3. The initial snapshot covers every catalogue region, bean and factor.
// -----------------------------------------------------------------------------
TEST_F(EntityGeneratorTest, InitialMarketSnapshot) {
  procure::MersenneRandomSource rng(11);
  procure::EntityGenerator generator(config, rng);

  const auto mc = generator.generateMarketConditions(now);

  EXPECT_EQ(mc.date, now);
  EXPECT_GE(mc.average_price, 4.0);
  EXPECT_LE(mc.average_price, 6.0);

  ASSERT_EQ(mc.price_history.size(), 30u);
  EXPECT_EQ(mc.price_history.front().date, procure::addDays(now, -30));
  EXPECT_EQ(mc.price_history.back().date, procure::addDays(now, -1));

  EXPECT_EQ(mc.regional_prices.size(), procure::catalogue::regions().size());
  for (const auto& region : procure::catalogue::regions()) {
    ASSERT_EQ(mc.regional_prices.count(region.name), 1u) << region.name;
    EXPECT_GE(mc.regional_prices.at(region.name), mc.average_price * 0.89);
    EXPECT_LE(mc.regional_prices.at(region.name), mc.average_price * 1.16);
  }

  EXPECT_DOUBLE_EQ(mc.bean_prices.at("Arabica"), mc.average_price);
  EXPECT_LT(mc.bean_prices.at("Robusta"), mc.average_price);
  EXPECT_GT(mc.bean_prices.at("Gesha"), mc.average_price);

  ASSERT_EQ(mc.market_factors.size(), 3u);
  for (const auto& factor : mc.market_factors) {
    const auto* vocab = procure::catalogue::findFactor(factor.name);
    ASSERT_NE(vocab, nullptr) << factor.name;
    EXPECT_NE(std::find(vocab->statuses.begin(), vocab->statuses.end(),
                        factor.status),
              vocab->statuses.end());
  }
  EXPECT_FALSE(mc.forecast.short_term.empty());
  EXPECT_FALSE(mc.forecast.long_term.empty());
}

// -----------------------------------------------------------------------------
// 4. generateInitialData() starts with no contracts and no orders.
// -----------------------------------------------------------------------------
TEST_F(EntityGeneratorTest, InitialDataHasNoContractsOrOrders) {
  procure::MersenneRandomSource rng(3);
  procure::EntityGenerator generator(config, rng);

  const auto data = generator.generateInitialData(now, 10);
  EXPECT_EQ(data.suppliers.size(), 10u);
  EXPECT_TRUE(data.contracts.empty());
  EXPECT_TRUE(data.orders.empty());
  EXPECT_EQ(data.market_conditions.price_history.size(), 30u);
}
