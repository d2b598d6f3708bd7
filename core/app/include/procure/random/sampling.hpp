#pragma once

#include "procure/random/i_random_source.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <vector>

namespace procure {

// -----------------------------------------------------------------------------
// Sampling helpers built on IRandomSource
// -----------------------------------------------------------------------------

// Uniformly chosen element. `items` must be non-empty.
template <typename T>
const T& pick(IRandomSource& rng, const std::vector<T>& items) {
  return items[rng.index(items.size())];
}

// -------------------------------------------------------------------------
// sample(rng, items, k)
// -------------------------------------------------------------------------
// @brief  k distinct elements drawn without replacement, in draw order.
//
// @details
// Partial Fisher-Yates over an index vector: draw i picks uniformly from
// the items not yet taken, costing one index() draw per selected element.
// k is clamped to items.size().
// -------------------------------------------------------------------------
template <typename T>
std::vector<T> sample(IRandomSource& rng, const std::vector<T>& items,
                      std::size_t k) {
  k = std::min(k, items.size());

  std::vector<std::size_t> pool(items.size());
  std::iota(pool.begin(), pool.end(), std::size_t{0});

  std::vector<T> chosen;
  chosen.reserve(k);
  for (std::size_t i = 0; i < k; ++i) {
    const std::size_t j = i + rng.index(pool.size() - i);
    std::swap(pool[i], pool[j]);
    chosen.push_back(items[pool[i]]);
  }
  return chosen;
}

}  // namespace procure
