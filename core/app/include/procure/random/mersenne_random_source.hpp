#pragma once

#include "procure/random/i_random_source.hpp"

#include <cstdint>
#include <random>

namespace procure {

// -----------------------------------------------------------------------------
// MersenneRandomSource: seeded production implementation of IRandomSource
// -----------------------------------------------------------------------------
//
// @brief  std::mt19937_64 behind the IRandomSource interface.
//
// @details
// Two sources built with the same seed produce identical draw sequences,
// which makes a whole simulation run reproducible from its seed. main()
// takes the seed from --seed or, when absent, from std::random_device.
//
// Thread model: NOT thread-safe (the engine is single-writer).
// -----------------------------------------------------------------------------
class MersenneRandomSource final : public IRandomSource {
 public:
  explicit MersenneRandomSource(std::uint64_t seed);

  double next_unit() override;

  std::uint64_t seed() const { return seed_; }

 private:
  std::uint64_t seed_;
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

}  // namespace procure
