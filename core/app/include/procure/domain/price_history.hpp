#pragma once

#include "procure/time/calendar.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace procure {
namespace domain {

struct PricePoint {
  TimestampMs date{0};
  double price{0.0};
};

// -----------------------------------------------------------------------------
// PriceHistory: fixed-capacity ring of daily price points
// -----------------------------------------------------------------------------
//
// @brief  Ordered oldest-first sequence of at most capacity() points.
//
// @details
// push() appends at the back; when the ring is full the oldest point is
// evicted first, so after any push:
//   size() <= capacity()
//   at(0) is the point that sat at index (old_size + 1 - capacity) before.
//
// A capacity of zero is promoted to one so the latest price is always kept.
//
// Thread model: Value type, no internal locking.
// -----------------------------------------------------------------------------
class PriceHistory {
 public:
  using const_iterator = std::deque<PricePoint>::const_iterator;

  explicit PriceHistory(std::size_t capacity = 30)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  void push(PricePoint point) {
    points_.push_back(point);
    while (points_.size() > capacity_) {
      points_.pop_front();
    }
  }

  void clear() { points_.clear(); }

  std::size_t size() const { return points_.size(); }
  std::size_t capacity() const { return capacity_; }
  bool empty() const { return points_.empty(); }

  const PricePoint& at(std::size_t i) const { return points_.at(i); }
  const PricePoint& operator[](std::size_t i) const { return points_[i]; }
  const PricePoint& front() const { return points_.front(); }
  const PricePoint& back() const { return points_.back(); }

  const_iterator begin() const { return points_.begin(); }
  const_iterator end() const { return points_.end(); }

  // The most recent n points, oldest first (fewer if the ring is shorter).
  std::vector<PricePoint> recent(std::size_t n) const {
    const std::size_t take = n < points_.size() ? n : points_.size();
    return std::vector<PricePoint>(points_.end() - static_cast<long>(take),
                                   points_.end());
  }

 private:
  std::size_t capacity_;
  std::deque<PricePoint> points_;
};

}  // namespace domain
}  // namespace procure
