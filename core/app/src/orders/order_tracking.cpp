#include "procure/orders/order_tracking.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/random/sampling.hpp"

#include <string>

namespace procure {

domain::TrackingView buildTrackingView(IRandomSource& rng,
                                       const domain::Order& order,
                                       TimestampMs now) {
  using S = domain::OrderStatus;

  domain::TrackingView view;
  view.order_id = order.id;
  view.supplier_name =
      order.supplier_name.empty() ? "Unknown Supplier" : order.supplier_name;
  view.current_status = order.status;
  view.status_updated = now;
  view.shipping_details = order.shipping_details;

  switch (order.status) {
    case S::Pending:
      view.location = "Supplier facility";
      view.status_details = "Order is being processed by the supplier";
      view.next_update_expected = addDays(now, rng.uniform_int(1, 5));
      break;

    case S::InTransit:
      view.location = pick(rng, catalogue::transitLocations());
      view.status_details = "Order is in transit to destination";
      view.estimated_arrival =
          order.expected_delivery ? order.expected_delivery->text : "Unknown";
      view.transportation_method =
          order.shipping_details ? order.shipping_details->carrier : "Unknown";
      break;

    case S::Delayed: {
      view.location = pick(rng, catalogue::delayLocations());
      view.status_details = pick(rng, catalogue::delayCauses());
      view.delay_duration = std::to_string(rng.uniform_int(3, 15)) + " days";
      TimestampMs base = now;
      if (order.expected_delivery && order.expected_delivery->value) {
        base = *order.expected_delivery->value;
      }
      view.revised_delivery = addDays(base, rng.uniform_int(3, 15));
      break;
    }

    case S::Delivered:
    case S::PartiallyDelivered:
      view.location = catalogue::kWarehouse;
      view.delivery_date = order.actual_delivery_date.value_or(now);
      view.received_by = catalogue::kReceivedBy;
      view.quality_check_status = pick(rng, catalogue::qualityCheckStatuses());
      if (order.status == S::PartiallyDelivered) {
        view.delivery_percentage =
            std::to_string(rng.uniform_int(50, 95)) + "%";
        view.remaining_delivery_expected = addDays(now, rng.uniform_int(7, 21));
      }
      break;

    case S::Cancelled:
      break;
  }

  return view;
}

}  // namespace procure
