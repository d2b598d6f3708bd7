#pragma once

#include "procure/domain/order.hpp"

#include <optional>
#include <string>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// TrackingView
// -----------------------------------------------------------------------------
// Human-readable tracking narrative for one order. Derived purely from the
// order's current status and regenerated on every request, so repeated
// calls for the same status may report a different random location.
// Nothing here is persisted back into the order.
// -----------------------------------------------------------------------------
struct TrackingView {
  std::string order_id;
  std::string supplier_name;
  OrderStatus current_status{OrderStatus::Pending};
  TimestampMs status_updated{0};
  std::optional<ShippingDetails> shipping_details;

  std::optional<std::string> location;
  std::optional<std::string> status_details;
  std::optional<TimestampMs> next_update_expected;    // pending
  std::optional<std::string> estimated_arrival;       // in transit
  std::optional<std::string> transportation_method;   // in transit
  std::optional<std::string> delay_duration;          // delayed
  std::optional<TimestampMs> revised_delivery;        // delayed
  std::optional<TimestampMs> delivery_date;           // (partially) delivered
  std::optional<std::string> received_by;
  std::optional<std::string> quality_check_status;
  std::optional<std::string> delivery_percentage;     // partially delivered
  std::optional<TimestampMs> remaining_delivery_expected;
};

}  // namespace domain
}  // namespace procure
