#pragma once

#include "procure/time/i_time_provider.hpp"

#include <atomic>

namespace procure {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven simulated clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         by its owner rather than read from the system clock.
//
// @details
// MarketEngine owns one instance. initialize() sets it to the wall-clock
// instant the population was generated; every advance_step() moves it
// forward by exactly one day via advance_days(1). Everything the engine
// stamps during a step (price history points, order delivery checks,
// fallback contract spans) reads this value, so a run is reproducible given
// a seed and a starting instant.
//
// Tests also construct it directly with a fixed instant and hand it to
// components (OrderLifecycle, tracking views) as their time source.
//
// Internal storage:
//   std::atomic<TimestampMs> current_time_ms_
//
// Why std::atomic:
//   The simulation service reads the date for STATUS replies from the IPC
//   thread while the timer thread is the single writer. The atomic gives
//   readers a torn-free value without widening the engine lock.
//
// Thread model:
//   - set_time()/advance_days() are called by the owning engine (single
//     writer, under the caller's lock).
//   - now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(TimestampMs start_ms)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by set_time() or advance_days().
  //
  // @return Epoch milliseconds of the current simulated instant. Returns 0
  //         if the clock was never set.
  // -------------------------------------------------------------------------
  TimestampMs now_ms() const override;

  // -------------------------------------------------------------------------
  // set_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @details
  // Monotonicity is not enforced; initialize() rewinds the clock when the
  // population is regenerated, and tests set arbitrary instants.
  // -------------------------------------------------------------------------
  void set_time(TimestampMs new_time_ms);

  // -------------------------------------------------------------------------
  // advance_days(days)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by whole simulated days.
  //
  // @return The new simulated instant.
  // -------------------------------------------------------------------------
  TimestampMs advance_days(std::int64_t days);

 private:
  std::atomic<TimestampMs> current_time_ms_{0};
};

}  // namespace procure
