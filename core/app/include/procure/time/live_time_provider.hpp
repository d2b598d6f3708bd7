#pragma once

#include "procure/time/i_time_provider.hpp"

namespace procure {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by main() to anchor the first simulated day to the real date. The
// engine reads it exactly once per initialize(); after that only the
// simulated clock moves.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
//   No internal mutex is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  TimestampMs now_ms() const override;
};

}  // namespace procure
