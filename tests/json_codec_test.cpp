// =============================================================================
// json_codec_test.cpp
// =============================================================================
// Unit tests for the nlohmann::json adapters in procure::domain.
//
// Validates:
//   - Contract rendering: plain dates, derived price_per_kg, optional fields
//   - Order ingestion shim: legacy field names, "placed", computed value
//   - Malformed payloads throw (missing id, unknown status, bad date)
//   - Change-log key names and the empty market_conditions object
// =============================================================================

#include "procure/domain/json_codec.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using nlohmann::json;
using procure::domain::Contract;
using procure::domain::ContractStatus;
using procure::domain::DeliveryField;
using procure::domain::Order;
using procure::domain::OrderStatus;

// -----------------------------------------------------------------------------
// 1. Contract to_json.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, ContractRendersDatesAndDerivedPrice) {
  Contract c;
  c.id = "c1";
  c.supplier_id = "S1";
  c.supplier_name = "Kenya Coffee Cooperative 1";
  c.status = ContractStatus::Active;
  c.price_per_pound = 5.0;
  c.start_date = procure::makeTimestamp(2025, 1, 15, 8, 0, 0);
  c.end_date = procure::addDays(c.start_date, 90);
  c.terms.payment_terms = "Net 30";

  const json j = c;
  EXPECT_EQ(j.at("status"), "active");
  EXPECT_EQ(j.at("start_date"), "2025-01-15");
  EXPECT_EQ(j.at("end_date"), "2025-04-15");
  EXPECT_DOUBLE_EQ(j.at("price_per_kg").get<double>(), 11.02);
  EXPECT_EQ(j.at("terms").at("payment_terms"), "Net 30");
  EXPECT_FALSE(j.at("terms").contains("delivery_terms"));
  EXPECT_FALSE(j.contains("volume_lbs"));
  EXPECT_FALSE(j.contains("finalized_date"));
}

TEST(JsonCodecTest, ContractIngestion) {
  const json payload = {{"id", "c9"},
                        {"supplier_id", "S2"},
                        {"status", "proposed"},
                        {"price_per_pound", 4.5},
                        {"volume_lbs", 10000},
                        {"start_date", "2025-02-01"},
                        {"end_date", "2025-08-01T00:00:00Z"},
                        {"volume_range", {{"min_lbs", 6000}}}};

  const auto c = payload.get<Contract>();
  EXPECT_EQ(c.id, "c9");
  EXPECT_EQ(c.status, ContractStatus::Proposed);
  EXPECT_EQ(c.volume_lbs, 10000);
  EXPECT_EQ(c.start_date, procure::makeTimestamp(2025, 2, 1));
  EXPECT_EQ(c.end_date, procure::makeTimestamp(2025, 8, 1));
  ASSERT_TRUE(c.volume_range.has_value());
  EXPECT_EQ(c.volume_range->min_lbs, 6000);
  EXPECT_EQ(c.volume_range->max_lbs, 20000);
  EXPECT_FALSE(c.price_per_kg.has_value());
}

// -----------------------------------------------------------------------------
// 2. Order ingestion shim.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, OrderAcceptsLegacyDeliveryField) {
  const json payload = {{"id", "o1"},
                        {"status", "placed"},
                        {"volume_lbs", 1000},
                        {"price_per_pound", 4.5},
                        {"expected_delivery", "2025-03-01T12:00:00"}};

  const auto order = payload.get<Order>();
  EXPECT_EQ(order.status, OrderStatus::Pending);
  EXPECT_DOUBLE_EQ(order.total_value, 4500.0);
  ASSERT_TRUE(order.expected_delivery.has_value());
  EXPECT_EQ(order.expected_delivery->field, DeliveryField::ExpectedDelivery);
  EXPECT_EQ(order.expected_delivery->value,
            procure::makeTimestamp(2025, 3, 1, 12, 0, 0));

  const json back = order;
  EXPECT_EQ(back.at("expected_delivery"), "2025-03-01T12:00:00");
  EXPECT_FALSE(back.contains("expected_delivery_date"));
  EXPECT_TRUE(back.at("actual_delivery_date").is_null());
  EXPECT_EQ(back.at("status"), "pending");
}

TEST(JsonCodecTest, OrderKeepsUnparsableDeliveryText) {
  const json payload = {{"id", "o2"},
                        {"status", "in_transit"},
                        {"expected_delivery_date", "next tuesday"}};

  const auto order = payload.get<Order>();
  ASSERT_TRUE(order.expected_delivery.has_value());
  EXPECT_FALSE(order.expected_delivery->value.has_value());
  EXPECT_EQ(json(order).at("expected_delivery_date"), "next tuesday");
}

// -----------------------------------------------------------------------------
// 3. Malformed payloads throw.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, MalformedPayloadsThrow) {
  EXPECT_THROW(json({{"status", "pending"}}).get<Order>(), json::exception);
  EXPECT_THROW(json({{"id", "o3"}, {"status", "lost"}}).get<Order>(),
               std::invalid_argument);
  EXPECT_THROW(json({{"id", "c3"}, {"start_date", "soon"}}).get<Contract>(),
               std::invalid_argument);
  EXPECT_THROW(json({{"id", "c4"}, {"volume_lbs", "many"}}).get<Contract>(),
               json::exception);
}

// -----------------------------------------------------------------------------
// 4. Change-log shapes.
// -----------------------------------------------------------------------------
TEST(JsonCodecTest, ChangeLogKeys) {
  procure::domain::StepChanges changes;
  EXPECT_TRUE(json(changes).at("market_conditions").empty());

  procure::domain::OrderChange order_change;
  order_change.id = "o1";
  order_change.old_status = OrderStatus::Pending;
  order_change.new_status = OrderStatus::Delayed;
  order_change.delay_days = 6;

  procure::domain::ContractChange contract_change;
  contract_change.contract_id = "c1";
  contract_change.action = "created";

  procure::domain::SupplierChange supplier_change;
  supplier_change.id = "S1";
  supplier_change.update_type = procure::domain::SupplierAttribute::Capacity;
  supplier_change.old_value = 50000.0;
  supplier_change.new_value = 47500.0;

  changes.orders.push_back(order_change);
  changes.contracts.push_back(contract_change);
  changes.suppliers.push_back(supplier_change);
  changes.market_conditions = procure::domain::MarketChange{5.0, 5.1, 0.02};

  const json j = changes;
  EXPECT_EQ(j.at("orders")[0].at("id"), "o1");
  EXPECT_FALSE(j.at("orders")[0].contains("action"));
  EXPECT_EQ(j.at("orders")[0].at("new_status"), "delayed");
  EXPECT_EQ(j.at("orders")[0].at("delay_days"), 6);
  EXPECT_EQ(j.at("contracts")[0].at("contract_id"), "c1");
  EXPECT_EQ(j.at("contracts")[0].at("action"), "created");
  EXPECT_EQ(j.at("suppliers")[0].at("update_type"), "capacity");
  EXPECT_EQ(j.at("suppliers")[0].at("new_value"), 47500);
  EXPECT_DOUBLE_EQ(j.at("market_conditions").at("new_price").get<double>(),
                   5.1);
}
