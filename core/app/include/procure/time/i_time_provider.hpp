#pragma once

#include "procure/time/calendar.hpp"

namespace procure {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts the concept of "current time"
//         away from std::chrono::system_clock.
//
// @details
// The simulation keeps two notions of time apart:
//   - wall-clock time, read once when the engine initializes so the first
//     simulated day lines up with "today" (LiveTimeProvider), and
//   - simulated time, which only moves when MarketEngine::advance_step()
//     pushes it forward by one day (SimulationTimeProvider).
//
// Components that stamp dates (order dates, contract spans, tracking views)
// read the simulated clock through this interface and never call
// std::chrono directly, so tests can pin "now" to a fixed instant and get
// reproducible dates.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time as milliseconds since the Unix epoch
  //         (1970-01-01 00:00:00 UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual TimestampMs now_ms() const = 0;
};

}  // namespace procure
