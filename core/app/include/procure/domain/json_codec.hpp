#pragma once

#include "procure/domain/contract.hpp"
#include "procure/domain/market_conditions.hpp"
#include "procure/domain/order.hpp"
#include "procure/domain/step_changes.hpp"
#include "procure/domain/supplier.hpp"
#include "procure/domain/tracking_view.hpp"

#include <nlohmann/json.hpp>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// JSON codec for the domain records
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json to_json / from_json overloads, found by ADL, so
//         callers write `nlohmann::json j = order;` and `j.get<Order>()`.
//
// @details
// Serialization is the only place timestamps become text:
//   - entity dates (contract span, order dates)  -> "YYYY-MM-DD"
//   - market date and price history points       -> "YYYY-MM-DDTHH:MM:SS"
//   - an order's expected delivery keeps the field name and shape it was
//     ingested with (see orders/delivery_date.hpp)
// Absent optionals are omitted, except actual_delivery_date which is
// written as null until the order is delivered.
//
// Decoding is defined only for the records callers hand in (Contract,
// Order). It validates shape once, here:
//   - "id" is required (nlohmann::json::out_of_range when missing);
//   - an unknown status label or an unparsable contract/order date throws
//     std::invalid_argument;
//   - an unparsable expected delivery date does NOT throw: the order is
//     accepted and OrderLifecycle skips it.
// MarketEngine's *_json accessors catch these and reject the payload.
// -----------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Supplier& supplier);

void to_json(nlohmann::json& j, const PricePoint& point);
void to_json(nlohmann::json& j, const MarketFactor& factor);
void to_json(nlohmann::json& j, const MarketConditions& conditions);

void to_json(nlohmann::json& j, const VolumeRange& range);
void from_json(const nlohmann::json& j, VolumeRange& range);
void to_json(nlohmann::json& j, const ContractTerms& terms);
void from_json(const nlohmann::json& j, ContractTerms& terms);
void to_json(nlohmann::json& j, const Contract& contract);
void from_json(const nlohmann::json& j, Contract& contract);

void to_json(nlohmann::json& j, const ShippingDetails& details);
void from_json(const nlohmann::json& j, ShippingDetails& details);
void to_json(nlohmann::json& j, const Order& order);
void from_json(const nlohmann::json& j, Order& order);

void to_json(nlohmann::json& j, const SupplierChange& change);
void to_json(nlohmann::json& j, const ContractChange& change);
void to_json(nlohmann::json& j, const OrderChange& change);
void to_json(nlohmann::json& j, const SynthesisFailure& failure);
void to_json(nlohmann::json& j, const StepChanges& changes);

void to_json(nlohmann::json& j, const TrackingView& view);

}  // namespace domain
}  // namespace procure
