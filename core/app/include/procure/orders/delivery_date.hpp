#pragma once

#include "procure/domain/order.hpp"

#include <cstdint>
#include <string>

namespace procure {

// -----------------------------------------------------------------------------
// Delivery-date normalization
// -----------------------------------------------------------------------------
//
// @brief  The single place that interprets an order's expected delivery date.
//
// @details
// Orders reach the engine carrying the date under one of two field names
// and in one of two textual shapes (plain date or full timestamp).
// normalizeDeliveryDate() runs once at ingestion and produces a
// domain::DeliveryDate; from then on OrderLifecycle and the accessors work
// on the parsed value and never look at field names again.
//
// Rendering follows the field name the caller used:
//   ExpectedDeliveryDate -> "YYYY-MM-DD"
//   ExpectedDelivery     -> "YYYY-MM-DDTHH:MM:SS"
// -----------------------------------------------------------------------------

domain::DeliveryDate normalizeDeliveryDate(const std::string& text,
                                           domain::DeliveryField field);

// Builds a DeliveryDate from a timestamp, rendered for `field`.
domain::DeliveryDate makeDeliveryDate(TimestampMs when,
                                      domain::DeliveryField field);

// -------------------------------------------------------------------------
// pushDeliveryDate(date, days)
// -------------------------------------------------------------------------
// @brief  Moves a parsed delivery date forward and re-renders its text in
//         the shape the field was written in.
//
// @return false (and leaves `date` untouched) when the date never parsed.
// -------------------------------------------------------------------------
bool pushDeliveryDate(domain::DeliveryDate& date, std::int64_t days);

std::string renderDeliveryDate(TimestampMs when, domain::DeliveryField field);

}  // namespace procure
