#pragma once

#include "procure/domain/contract_status.hpp"
#include "procure/domain/market_conditions.hpp"
#include "procure/domain/order_status.hpp"
#include "procure/domain/supplier.hpp"

#include <optional>
#include <string>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// Wire labels for the domain enums
// -----------------------------------------------------------------------------
//
// @brief  Convert enum values to and from the lower-case labels used in JSON
//         payloads, IPC commands, and change-log entries.
//
// @details
// parse* functions return std::nullopt for unknown labels so callers decide
// whether that is an error payload (ProcurementDesk) or a rejected
// ingestion (MarketEngine::add_order_json).
//
// parseOrderStatus() accepts the legacy "placed" label and maps it to
// OrderStatus::Pending: it is the same lifecycle entry state under an older
// name.
// -----------------------------------------------------------------------------

const char* toString(OrderStatus status);
const char* toString(ContractStatus status);
const char* toString(PriceTrend trend);
const char* toString(SupplierAttribute attribute);

std::optional<OrderStatus> parseOrderStatus(const std::string& label);
std::optional<ContractStatus> parseContractStatus(const std::string& label);
std::optional<PriceTrend> parsePriceTrend(const std::string& label);
std::optional<SupplierAttribute> parseSupplierAttribute(
    const std::string& label);

}  // namespace domain
}  // namespace procure
