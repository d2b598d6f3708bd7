#pragma once

#include "procure/domain/order.hpp"
#include "procure/domain/tracking_view.hpp"
#include "procure/random/i_random_source.hpp"
#include "procure/time/calendar.hpp"

namespace procure {

// -----------------------------------------------------------------------------
// buildTrackingView(rng, order, now)
// -----------------------------------------------------------------------------
//
// @brief  Synthesizes a fresh tracking narrative from the order's status.
//
// @details
//   Pending            supplier facility, next update in U{1..5} days
//   InTransit          one of six route locations, estimated arrival and
//                      carrier taken from the order
//   Delayed            one of four locations, one of four causes,
//                      "N days" with N in U{3..15}, revised delivery =
//                      expected delivery (or now) + U{3..15} days
//   Delivered          warehouse, delivery date, receiver, QC status
//   PartiallyDelivered as Delivered plus a delivered share U{50..95}% and
//                      the remainder due in U{7..21} days
//   Cancelled          header fields only
//
// Nothing is written back into the order.
// -----------------------------------------------------------------------------
domain::TrackingView buildTrackingView(IRandomSource& rng,
                                       const domain::Order& order,
                                       TimestampMs now);

}  // namespace procure
