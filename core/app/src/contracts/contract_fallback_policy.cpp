#include "procure/contracts/contract_fallback_policy.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/random/sampling.hpp"
#include "procure/util/rounding.hpp"

#include <iostream>

namespace procure {

ContractFallbackPolicy::ContractFallbackPolicy(
    const domain::SimulationConfig& config, IRandomSource& rng)
    : config_(config), rng_(rng) {}

bool ContractFallbackPolicy::hasActive(
    const std::vector<domain::Contract>& contracts) {
  for (const auto& c : contracts) {
    if (c.status == domain::ContractStatus::Active) {
      return true;
    }
  }
  return false;
}

bool ContractFallbackPolicy::shouldSynthesize(
    const std::vector<domain::Contract>& contracts) {
  if (hasActive(contracts)) {
    return false;
  }
  return rng_.chance(config_.fallback_contract_probability);
}

// -----------------------------------------------------------------------------
// synthesize()
// -----------------------------------------------------------------------------
domain::Result<domain::Contract> ContractFallbackPolicy::synthesize(
    const std::vector<domain::Supplier>& suppliers,
    const domain::MarketConditions& market, TimestampMs now) {
  if (suppliers.empty()) {
    return domain::Result<domain::Contract>::failure(
        "no suppliers available for a fallback contract");
  }

  const auto& supplier = pick(rng_, suppliers);

  domain::Contract contract;
  contract.id =
      "contract_" + supplier.id + "_" + formatCompactTimestamp(now);
  contract.supplier_id = supplier.id;
  contract.supplier_name = supplier.name;
  contract.status = domain::ContractStatus::Active;

  contract.start_date = now;
  contract.end_date = addDays(
      now, rng_.uniform_int(config_.min_contract_days, config_.max_contract_days));

  const double quality_factor = supplier.quality_score / 10.0;
  contract.price_per_pound =
      roundCents(market.average_price * (0.9 + quality_factor * 0.3));

  domain::VolumeRange range;
  range.min_lbs = rng_.uniform_int(5000, 10000);
  range.max_lbs = rng_.uniform_int(15000, 30000);
  contract.volume_range = range;

  contract.bean_types = supplier.bean_types;
  if (contract.bean_types.empty()) {
    contract.bean_types.push_back(catalogue::kDefaultBean);
  }

  contract.terms.payment_terms = pick(rng_, catalogue::paymentTerms());
  contract.terms.delivery_terms = pick(rng_, catalogue::deliveryTerms());
  contract.terms.quality_requirements = catalogue::kQualityRequirement;
  contract.terms.sustainability_requirements =
      pick(rng_, catalogue::sustainabilityRequirements());

  std::cout << "[ContractFallback] Created sample contract with "
            << supplier.name << " for " << contract.price_per_pound
            << "/lb\n";

  return domain::Result<domain::Contract>::success(std::move(contract));
}

}  // namespace procure
