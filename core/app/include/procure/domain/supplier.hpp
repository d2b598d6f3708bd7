#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// SupplierAttribute
// -----------------------------------------------------------------------------
// The four supplier attributes SupplierDrift may perturb. The three scores
// are clamped to the configured score band; capacity is unbounded.
// -----------------------------------------------------------------------------
enum class SupplierAttribute {
  Quality,
  Reliability,
  Sustainability,
  Capacity,
};

// -----------------------------------------------------------------------------
// Supplier
// -----------------------------------------------------------------------------
// Responsibility: One coffee-producing cooperative in the simulated market.
//
// @details
// Created once by EntityGenerator at initialization and never deleted.
// SupplierDrift mutates the engine's authoritative copy in place; every
// copy handed out by MarketEngine::get_suppliers() is an independent value.
//
// Invariants:
//   - bean_types is non-empty and a subset of the region's bean palette.
//   - certifications holds distinct entries from the fixed catalogue.
//   - quality/reliability/sustainability stay within [5.0, 10.0] after
//     every drift.
// -----------------------------------------------------------------------------
struct Supplier {
  std::string id;                          // "S<n>"
  std::string name;                        // "<Region> Coffee Cooperative <n>"
  std::string region;                      // Catalogue region (a country name)
  std::optional<std::string> country;      // Explicit override; wins over region
  std::vector<std::string> bean_types;     // Ordered, non-empty
  std::vector<std::string> certifications; // May be empty
  double quality_score{0.0};
  double reliability_score{0.0};
  double sustainability_score{0.0};
  std::int64_t capacity_kg_per_year{0};
  int years_in_business{0};
};

}  // namespace domain
}  // namespace procure
