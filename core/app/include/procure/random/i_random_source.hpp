#pragma once

#include <cstddef>
#include <cstdint>

namespace procure {

// -----------------------------------------------------------------------------
// IRandomSource: the single injectable source of randomness
// -----------------------------------------------------------------------------
//
// @brief  Abstracts every random draw the simulation makes behind one
//         primitive: next_unit(), a uniform double in [0, 1).
//
// @details
// Probabilistic branching is part of the business logic here (an order has
// an 80% chance to ship, a supplier a 20% chance to drift, ...). To make
// those paths testable, no component owns an engine or calls <random>
// directly. They receive an IRandomSource& and use the derived helpers
// below, all of which consume exactly ONE next_unit() draw:
//
//   uniform(lo, hi)      lo + u * (hi - lo)
//   uniform_int(lo, hi)  integer in [lo, hi], inclusive
//   index(n)             integer in [0, n)
//   chance(p)            u < p
//
// Because every helper costs one draw, a test double that replays a fixed
// list of unit values (tests/support/scripted_random_source.hpp) pins the
// exact transition path of a step.
//
// Implementations:
//   - MersenneRandomSource: std::mt19937_64 with an explicit seed.
//
// Thread model:
//   NOT thread-safe. The owning MarketEngine is single-writer; callers
//   serialize access through the simulation service lock.
//
// Ownership:
//   Components hold a non-owning reference. The source must outlive them.
// -----------------------------------------------------------------------------
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Uniform double in [0, 1).
  virtual double next_unit() = 0;

  double uniform(double lo, double hi) { return lo + next_unit() * (hi - lo); }

  // -------------------------------------------------------------------------
  // uniform_int(lo, hi)
  // -------------------------------------------------------------------------
  // @brief  Uniform integer in the closed range [lo, hi].
  //
  // @details
  // Maps the unit draw onto (hi - lo + 1) equal buckets. The final clamp
  // guards against a unit value that rounds up to exactly 1.0. If hi < lo
  // the result is lo.
  // -------------------------------------------------------------------------
  std::int64_t uniform_int(std::int64_t lo, std::int64_t hi) {
    const double u = next_unit();
    if (hi <= lo) {
      return lo;
    }
    const auto span = static_cast<double>(hi - lo + 1);
    auto offset = static_cast<std::int64_t>(u * span);
    if (offset > hi - lo) {
      offset = hi - lo;
    }
    return lo + offset;
  }

  // Uniform index in [0, n). n must be non-zero.
  std::size_t index(std::size_t n) {
    return static_cast<std::size_t>(
        uniform_int(0, static_cast<std::int64_t>(n) - 1));
  }

  bool chance(double probability) { return next_unit() < probability; }
};

}  // namespace procure
