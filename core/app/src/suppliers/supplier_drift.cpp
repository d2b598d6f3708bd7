#include "procure/suppliers/supplier_drift.hpp"

#include "procure/util/rounding.hpp"

#include <array>

namespace procure {

namespace {

constexpr std::array<domain::SupplierAttribute, 4> kAttributes = {
    domain::SupplierAttribute::Quality,
    domain::SupplierAttribute::Reliability,
    domain::SupplierAttribute::Sustainability,
    domain::SupplierAttribute::Capacity,
};

}  // namespace

SupplierDrift::SupplierDrift(const domain::SimulationConfig& config,
                             IRandomSource& rng)
    : config_(config), rng_(rng) {}

std::optional<domain::SupplierChange> SupplierDrift::maybeDrift(
    std::vector<domain::Supplier>& suppliers) {
  if (!rng_.chance(config_.supplier_drift_probability) || suppliers.empty()) {
    return std::nullopt;
  }

  auto& supplier = suppliers[rng_.index(suppliers.size())];
  const auto attribute = kAttributes[rng_.index(kAttributes.size())];
  return drift(supplier, attribute);
}

// -----------------------------------------------------------------------------
// drift()
// -----------------------------------------------------------------------------
domain::SupplierChange SupplierDrift::drift(domain::Supplier& supplier,
                                            domain::SupplierAttribute attribute) {
  domain::SupplierChange change;
  change.id = supplier.id;
  change.name = supplier.name;
  change.update_type = attribute;

  switch (attribute) {
    case domain::SupplierAttribute::Quality:
      change.old_value = supplier.quality_score;
      supplier.quality_score = driftScore(supplier.quality_score);
      change.new_value = supplier.quality_score;
      break;
    case domain::SupplierAttribute::Reliability:
      change.old_value = supplier.reliability_score;
      supplier.reliability_score = driftScore(supplier.reliability_score);
      change.new_value = supplier.reliability_score;
      break;
    case domain::SupplierAttribute::Sustainability:
      change.old_value = supplier.sustainability_score;
      supplier.sustainability_score = driftScore(supplier.sustainability_score);
      change.new_value = supplier.sustainability_score;
      break;
    case domain::SupplierAttribute::Capacity: {
      change.old_value = static_cast<double>(supplier.capacity_kg_per_year);
      const double pct =
          rng_.uniform(-config_.capacity_drift, config_.capacity_drift);
      supplier.capacity_kg_per_year = static_cast<std::int64_t>(
          static_cast<double>(supplier.capacity_kg_per_year) * (1.0 + pct));
      change.new_value = static_cast<double>(supplier.capacity_kg_per_year);
      break;
    }
  }

  return change;
}

double SupplierDrift::driftScore(double old_value) {
  const double delta = rng_.uniform(-config_.score_drift, config_.score_drift);
  return roundTenths(
      clampTo(old_value + delta, config_.min_score, config_.max_score));
}

}  // namespace procure
