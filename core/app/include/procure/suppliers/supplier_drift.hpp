#pragma once

#include "procure/domain/simulation_config.hpp"
#include "procure/domain/step_changes.hpp"
#include "procure/domain/supplier.hpp"
#include "procure/random/i_random_source.hpp"

#include <optional>
#include <vector>

namespace procure {

// -----------------------------------------------------------------------------
// SupplierDrift
// -----------------------------------------------------------------------------
// Responsibility: Occasionally perturbs one attribute of one supplier.
//
// @details
// maybeDrift() draws chance(supplier_drift_probability); on success it picks
// a supplier and one of the four attributes uniformly, then:
//   score     new = roundTenths(clamp(old + U(-score_drift, +score_drift),
//                                     min_score, max_score))
//   capacity  new = trunc(old * (1 + U(-capacity_drift, +capacity_drift)))
// Capacity is deliberately unclamped.
//
// Returns std::nullopt when the gate fails or there are no suppliers.
// -----------------------------------------------------------------------------
class SupplierDrift {
 public:
  SupplierDrift(const domain::SimulationConfig& config, IRandomSource& rng);

  std::optional<domain::SupplierChange> maybeDrift(
      std::vector<domain::Supplier>& suppliers);

  // Applies one perturbation to the given supplier, without the gate.
  domain::SupplierChange drift(domain::Supplier& supplier,
                               domain::SupplierAttribute attribute);

 private:
  double driftScore(double old_value);

  const domain::SimulationConfig& config_;
  IRandomSource& rng_;
};

}  // namespace procure
