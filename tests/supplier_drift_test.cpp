// =============================================================================
// supplier_drift_test.cpp
// =============================================================================
// Unit tests for procure::SupplierDrift.
//
// Validates:
//   - At most one supplier attribute changes per call
//   - Scores are clamped to [5, 10] and rounded to one decimal
//   - Capacity moves by at most +/-10% and is truncated to an integer
//   - No draw beyond the gate when the gate fails or the list is empty
// =============================================================================

#include "procure/random/mersenne_random_source.hpp"
#include "procure/suppliers/supplier_drift.hpp"
#include "support/scripted_random_source.hpp"

#include <gtest/gtest.h>

#include <vector>

using procure::domain::Supplier;
using procure::domain::SupplierAttribute;
using procure::testing::ScriptedRandomSource;

class SupplierDriftTest : public ::testing::Test {
 protected:
  static Supplier makeSupplier(const std::string& id) {
    Supplier s;
    s.id = id;
    s.name = "Kenya Coffee Cooperative " + id;
    s.region = "Kenya";
    s.bean_types = {"Arabica"};
    s.quality_score = 9.8;
    s.reliability_score = 5.2;
    s.sustainability_score = 7.0;
    s.capacity_kg_per_year = 50000;
    s.years_in_business = 12;
    return s;
  }

  procure::domain::SimulationConfig config;
};

// -----------------------------------------------------------------------------
// 1. A failed gate draws once and changes nothing.
// -----------------------------------------------------------------------------
TEST_F(SupplierDriftTest, GateFailsQuietly) {
  ScriptedRandomSource rng;
  rng.pushChance(false);
  procure::SupplierDrift drift(config, rng);

  std::vector<Supplier> suppliers = {makeSupplier("S1")};
  EXPECT_FALSE(drift.maybeDrift(suppliers).has_value());
  EXPECT_EQ(rng.draws(), 1u);
  EXPECT_DOUBLE_EQ(suppliers[0].quality_score, 9.8);
}

TEST_F(SupplierDriftTest, EmptyListIsNoOp) {
  ScriptedRandomSource rng(0.0);
  procure::SupplierDrift drift(config, rng);

  std::vector<Supplier> suppliers;
  EXPECT_FALSE(drift.maybeDrift(suppliers).has_value());
}

// -----------------------------------------------------------------------------
// 2. Quality +0.5 from 9.8 clamps at 10.0.
// -----------------------------------------------------------------------------
TEST_F(SupplierDriftTest, QualityClampsAtCeiling) {
  ScriptedRandomSource rng;
  rng.pushChance(true)
      .pushIndex(1, 2)        // second supplier
      .pushIndex(0, 4)        // quality
      .pushUnit(0.999999);    // delta ~ +0.5
  procure::SupplierDrift drift(config, rng);

  std::vector<Supplier> suppliers = {makeSupplier("S1"), makeSupplier("S2")};
  const auto change = drift.maybeDrift(suppliers);

  ASSERT_TRUE(change.has_value());
  EXPECT_EQ(change->id, "S2");
  EXPECT_EQ(change->update_type, SupplierAttribute::Quality);
  EXPECT_DOUBLE_EQ(change->old_value, 9.8);
  EXPECT_DOUBLE_EQ(change->new_value, 10.0);
  EXPECT_DOUBLE_EQ(suppliers[1].quality_score, 10.0);
  EXPECT_DOUBLE_EQ(suppliers[0].quality_score, 9.8);
}

TEST_F(SupplierDriftTest, ReliabilityClampsAtFloor) {
  ScriptedRandomSource rng;
  rng.pushUnit(0.0);  // delta = -0.5
  procure::SupplierDrift drift(config, rng);

  Supplier s = makeSupplier("S1");
  const auto change = drift.drift(s, SupplierAttribute::Reliability);

  EXPECT_DOUBLE_EQ(s.reliability_score, 5.0);
  EXPECT_DOUBLE_EQ(change.new_value, 5.0);
}

TEST_F(SupplierDriftTest, ScoreRoundsToTenths) {
  ScriptedRandomSource rng;
  rng.pushUniform(0.23, -0.5, 0.5);
  procure::SupplierDrift drift(config, rng);

  Supplier s = makeSupplier("S1");
  drift.drift(s, SupplierAttribute::Sustainability);
  EXPECT_DOUBLE_EQ(s.sustainability_score, 7.2);
}

// -----------------------------------------------------------------------------
// 3. Capacity -10% from 50,000 truncates to 45,000.
// -----------------------------------------------------------------------------
TEST_F(SupplierDriftTest, CapacityMovesByPercent) {
  ScriptedRandomSource rng;
  rng.pushUnit(0.0);
  procure::SupplierDrift drift(config, rng);

  Supplier s = makeSupplier("S1");
  const auto change = drift.drift(s, SupplierAttribute::Capacity);

  EXPECT_EQ(s.capacity_kg_per_year, 45000);
  EXPECT_DOUBLE_EQ(change.old_value, 50000.0);
  EXPECT_DOUBLE_EQ(change.new_value, 45000.0);
}

// -----------------------------------------------------------------------------
// 4. Seeded long run: every score stays within [5, 10].
// -----------------------------------------------------------------------------
TEST_F(SupplierDriftTest, ScoresStayInBand) {
  procure::MersenneRandomSource rng(17);
  procure::SupplierDrift drift(config, rng);

  std::vector<Supplier> suppliers = {makeSupplier("S1"), makeSupplier("S2"),
                                     makeSupplier("S3")};
  for (int i = 0; i < 5000; ++i) {
    drift.maybeDrift(suppliers);
  }
  for (const auto& s : suppliers) {
    EXPECT_GE(s.quality_score, 5.0);
    EXPECT_LE(s.quality_score, 10.0);
    EXPECT_GE(s.reliability_score, 5.0);
    EXPECT_LE(s.reliability_score, 10.0);
    EXPECT_GE(s.sustainability_score, 5.0);
    EXPECT_LE(s.sustainability_score, 10.0);
    EXPECT_GT(s.capacity_kg_per_year, 0);
  }
}
