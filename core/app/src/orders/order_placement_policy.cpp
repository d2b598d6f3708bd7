#include "procure/orders/order_placement_policy.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/orders/delivery_date.hpp"
#include "procure/random/sampling.hpp"
#include "procure/util/rounding.hpp"

namespace procure {

namespace {

constexpr std::int64_t kDefaultMinVolume = 5000;
constexpr std::int64_t kDefaultMaxVolume = 20000;

std::vector<const domain::Contract*> activeContracts(
    const std::vector<domain::Contract>& contracts) {
  std::vector<const domain::Contract*> active;
  for (const auto& c : contracts) {
    if (c.status == domain::ContractStatus::Active) {
      active.push_back(&c);
    }
  }
  return active;
}

}  // namespace

// -----------------------------------------------------------------------------
// makeOrder()
// -----------------------------------------------------------------------------
domain::Order makeOrder(IRandomSource& rng,
                        const domain::SimulationConfig& config,
                        const domain::Contract& contract,
                        std::int64_t volume_lbs, TimestampMs now,
                        std::string id, const CountryLookup& country_for) {
  domain::Order order;
  order.id = std::move(id);
  order.contract_id = contract.id;
  order.supplier_id = contract.supplier_id;
  order.supplier_name = contract.supplier_name;
  order.status = domain::OrderStatus::Pending;
  order.volume_lbs = volume_lbs;
  order.price_per_pound = contract.price_per_pound;
  order.total_value =
      roundCents(static_cast<double>(volume_lbs) * contract.price_per_pound);
  order.order_date = now;

  const std::int64_t lead_days = rng.uniform_int(
      config.min_delivery_lead_days, config.max_delivery_lead_days);
  order.expected_delivery = makeDeliveryDate(
      addDays(now, lead_days), domain::DeliveryField::ExpectedDeliveryDate);

  domain::ShippingDetails shipping;
  shipping.carrier = pick(rng, catalogue::carriers());
  shipping.tracking_number =
      "TRK" + std::to_string(rng.uniform_int(100000, 999999));
  shipping.origin_port = "Port of " + country_for(contract.supplier_id);
  shipping.destination_port = catalogue::kDestinationPort;
  order.shipping_details = std::move(shipping);

  return order;
}

std::string makeOrderId(const std::string& contract_id, TimestampMs now,
                        std::size_t sequence) {
  return "order_" + contract_id + "_" + formatCompactTimestamp(now) + "_" +
         std::to_string(sequence);
}

// -----------------------------------------------------------------------------
// OrderPlacementPolicy
// -----------------------------------------------------------------------------
OrderPlacementPolicy::OrderPlacementPolicy(
    const domain::SimulationConfig& config, IRandomSource& rng)
    : config_(config), rng_(rng) {}

bool OrderPlacementPolicy::shouldPlace(
    const std::vector<domain::Contract>& contracts, std::size_t order_count) {
  if (activeContracts(contracts).empty()) {
    return false;
  }
  if (order_count == 0) {
    return true;
  }
  return rng_.chance(config_.fallback_order_probability);
}

domain::Result<domain::Order> OrderPlacementPolicy::place(
    const std::vector<domain::Contract>& contracts, TimestampMs now,
    std::size_t sequence, const CountryLookup& country_for) {
  const auto active = activeContracts(contracts);
  if (active.empty()) {
    return domain::Result<domain::Order>::failure(
        "no active contract to place an order against");
  }

  const domain::Contract& contract = *active[rng_.index(active.size())];

  std::int64_t min_volume = kDefaultMinVolume;
  std::int64_t max_volume = kDefaultMaxVolume;
  if (contract.volume_range) {
    min_volume = contract.volume_range->min_lbs;
    max_volume = contract.volume_range->max_lbs;
  }
  if (max_volume < min_volume) {
    return domain::Result<domain::Order>::failure(
        "contract " + contract.id + " has an inverted volume range");
  }

  const std::int64_t volume = rng_.uniform_int(min_volume, max_volume);
  return domain::Result<domain::Order>::success(
      makeOrder(rng_, config_, contract, volume, now,
                makeOrderId(contract.id, now, sequence), country_for));
}

}  // namespace procure
