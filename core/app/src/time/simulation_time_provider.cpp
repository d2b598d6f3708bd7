#include "procure/time/simulation_time_provider.hpp"

namespace procure {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
TimestampMs SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// set_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::set_time(TimestampMs new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_days(): one fetch_add so a concurrent reader never sees a half step
// -----------------------------------------------------------------------------
TimestampMs SimulationTimeProvider::advance_days(std::int64_t days) {
  const TimestampMs delta = days * kMillisPerDay;
  return current_time_ms_.fetch_add(delta) + delta;
}

}  // namespace procure
