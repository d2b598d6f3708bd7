#pragma once

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: purchase order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a purchase order can occupy.
//
// @details
// The simulated lifecycle (OrderLifecycle, once per step):
//
//   Pending ───────────> InTransit ───────────> Delivered
//      │                   ▲                      (absorbing)
//      │                   │ 30% per step
//      └──> Delayed ───────┘
//           (delivery date pushed 5-15 days)
//
//   Cancelled is reachable only through external status updates and is
//   absorbing. PartiallyDelivered is an externally managed side-state that
//   the lifecycle machine leaves untouched.
//
// Wire labels: "pending", "in_transit", "delayed", "delivered",
// "partially_delivered", "cancelled". The legacy label "placed" is accepted
// on ingestion and normalized to Pending (see domain/labels.hpp).
//
// Thread model:
//   Plain enum, value type. Thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,             // Placed with the supplier, not yet shipped
  InTransit,           // Shipped, travelling to destination
  Delayed,             // Held up; expected delivery already pushed out
  Delivered,           // Arrived; absorbing
  PartiallyDelivered,  // Part of the volume arrived (externally managed)
  Cancelled,           // Cancelled by request; absorbing
};

}  // namespace domain
}  // namespace procure
