#pragma once

#include <algorithm>
#include <cmath>

namespace procure {

// -----------------------------------------------------------------------------
// Rounding helpers
// -----------------------------------------------------------------------------
// Prices are carried to cents and supplier scores to tenths everywhere a value
// is stored, so the stored value is exactly what a caller reads back in JSON.
// std::round rounds half away from zero.
// -----------------------------------------------------------------------------

inline double roundCents(double value) {
  return std::round(value * 100.0) / 100.0;
}

inline double roundTenths(double value) {
  return std::round(value * 10.0) / 10.0;
}

inline double clampTo(double value, double lo, double hi) {
  return std::max(lo, std::min(hi, value));
}

}  // namespace procure
