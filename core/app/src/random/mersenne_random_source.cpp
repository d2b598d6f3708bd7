#include "procure/random/mersenne_random_source.hpp"

namespace procure {

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed)
    : seed_(seed), engine_(seed) {}

// -----------------------------------------------------------------------------
// next_unit(): one draw from [0, 1)
// -----------------------------------------------------------------------------
double MersenneRandomSource::next_unit() {
  double u = unit_(engine_);
  // Some standard library implementations can return exactly 1.0 from
  // uniform_real_distribution due to rounding; fold it back into range.
  if (u >= 1.0) {
    u = 0.0;
  }
  return u;
}

}  // namespace procure
