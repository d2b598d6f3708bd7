#pragma once

#include "procure/domain/order_status.hpp"
#include "procure/time/calendar.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// DeliveryField
// -----------------------------------------------------------------------------
// Which of the two accepted field names carried the expected delivery date
// when the order was ingested. Callers that wrote the legacy
// "expected_delivery" spelling get full ISO timestamps back under that same
// name; "expected_delivery_date" round-trips as a plain YYYY-MM-DD date.
// -----------------------------------------------------------------------------
enum class DeliveryField {
  ExpectedDeliveryDate,  // "expected_delivery_date", plain date
  ExpectedDelivery,      // "expected_delivery", ISO timestamp (legacy)
};

// -----------------------------------------------------------------------------
// DeliveryDate
// -----------------------------------------------------------------------------
//
// @brief  The normalized expected-delivery date of an order.
//
// @details
// Built once at ingestion by normalizeDeliveryDate() (orders/delivery_date.hpp)
// so no per-operation code has to guess field names or date formats.
//
//   text  : the textual value as last written (what get_orders() returns)
//   value : parsed epoch ms; std::nullopt when `text` is unparsable, in
//            which case OrderLifecycle silently skips the order
//   field : which field name the caller used
// -----------------------------------------------------------------------------
struct DeliveryDate {
  std::string text;
  std::optional<TimestampMs> value;
  DeliveryField field{DeliveryField::ExpectedDeliveryDate};
};

struct ShippingDetails {
  std::string carrier;
  std::string tracking_number;
  std::string origin_port;
  std::string destination_port;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: A purchase order placed against an active contract.
//
// @details
// Created by ProcurementDesk::create_order() or by the fallback
// OrderPlacementPolicy, and only ever mutated through status transitions
// (OrderLifecycle, update_order_status) and delivery-date updates. Never
// deleted. contract_id and supplier_id must reference existing entities at
// creation time.
//
// An order is inserted fully formed (shipping details included); the
// engine never appends a partially built order.
// -----------------------------------------------------------------------------
struct Order {
  std::string id;
  std::string contract_id;
  std::string supplier_id;
  std::string supplier_name;
  OrderStatus status{OrderStatus::Pending};
  std::int64_t volume_lbs{0};
  double price_per_pound{0.0};
  double total_value{0.0};                       // volume_lbs * price_per_pound
  std::optional<TimestampMs> order_date;
  std::optional<DeliveryDate> expected_delivery;  // Absent -> lifecycle skips
  std::optional<TimestampMs> actual_delivery_date;  // Set only on delivery
  std::optional<ShippingDetails> shipping_details;
};

}  // namespace domain
}  // namespace procure
