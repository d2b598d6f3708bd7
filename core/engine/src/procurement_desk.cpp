#include "procure/engine/procurement_desk.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/domain/json_codec.hpp"
#include "procure/domain/labels.hpp"
#include "procure/orders/order_placement_policy.hpp"
#include "procure/util/rounding.hpp"

#include <algorithm>
#include <array>
#include <iostream>

namespace procure {

namespace {

constexpr std::array<const char*, 5> kProtectedContractFields = {
    "id", "supplier_id", "supplier_name", "status", "proposed_date"};

constexpr std::array<const char*, 7> kValidOrderStatuses = {
    "placed",    "pending",   "in_transit", "partially_delivered",
    "delivered", "cancelled", "delayed"};

bool isProtected(const std::string& key) {
  return std::any_of(kProtectedContractFields.begin(),
                     kProtectedContractFields.end(),
                     [&key](const char* field) { return key == field; });
}

std::string validStatusList() {
  std::string list;
  for (const char* label : kValidOrderStatuses) {
    if (!list.empty()) list += ", ";
    list += label;
  }
  return list;
}

std::string contractNotFound(const std::string& id) {
  return "Contract with ID " + id + " not found";
}

std::string orderNotFound(const std::string& id) {
  return "Order with ID " + id + " not found";
}

}  // namespace

ProcurementDesk::ProcurementDesk(MarketEngine& engine, IRandomSource& rng)
    : engine_(engine), rng_(rng) {}

nlohmann::json ProcurementDesk::error(const std::string& message) {
  return nlohmann::json{{"error", message}};
}

// -----------------------------------------------------------------------------
// Sourcing tools
// -----------------------------------------------------------------------------
nlohmann::json ProcurementDesk::list_suppliers() const {
  return engine_.get_suppliers();
}

nlohmann::json ProcurementDesk::get_supplier_details(
    const std::string& supplier_id) const {
  if (auto supplier = engine_.find_supplier(supplier_id)) {
    return *supplier;
  }
  return error("Supplier with ID " + supplier_id + " not found");
}

nlohmann::json ProcurementDesk::get_market_conditions() const {
  return engine_.get_market_conditions();
}

nlohmann::json ProcurementDesk::find_suppliers_by_region(
    const std::string& region) const {
  const auto& groups = catalogue::regionGroups();
  const auto group = groups.find(region);

  nlohmann::json matches = nlohmann::json::array();
  for (const auto& supplier : engine_.get_suppliers()) {
    bool match = supplier.region == region;
    if (!match && group != groups.end()) {
      const auto& members = group->second;
      match = std::find(members.begin(), members.end(), supplier.region) !=
              members.end();
    }
    if (match) {
      matches.push_back(supplier);
    }
  }
  return matches;
}

// -----------------------------------------------------------------------------
// Negotiation tools
// -----------------------------------------------------------------------------
nlohmann::json ProcurementDesk::get_active_contracts() const {
  nlohmann::json active = nlohmann::json::array();
  for (const auto& contract : engine_.get_contracts()) {
    if (contract.status == domain::ContractStatus::Active) {
      active.push_back(contract);
    }
  }
  return active;
}

nlohmann::json ProcurementDesk::get_contract_details(
    const std::string& contract_id) const {
  if (auto contract = engine_.find_contract(contract_id)) {
    return *contract;
  }
  return error(contractNotFound(contract_id));
}

nlohmann::json ProcurementDesk::propose_contract(const std::string& supplier_id,
                                                 std::int64_t volume,
                                                 double price_per_pound,
                                                 int duration_months) {
  auto supplier = engine_.find_supplier(supplier_id);
  if (!supplier) {
    return error("Supplier with ID " + supplier_id + " not found");
  }
  if (volume <= 0 || price_per_pound <= 0.0 || duration_months <= 0) {
    return error("volume, price_per_pound and duration_months must be positive");
  }

  const TimestampMs now = engine_.simulation_date();

  domain::Contract contract;
  contract.id = "contract_" + supplier_id + "_" + formatCompactTimestamp(now) +
                "_" + std::to_string(engine_.contract_count() + 1);
  contract.supplier_id = supplier_id;
  contract.supplier_name = supplier->name;
  contract.status = domain::ContractStatus::Proposed;
  contract.volume_lbs = volume;
  contract.price_per_pound = price_per_pound;
  contract.total_value =
      roundCents(static_cast<double>(volume) * price_per_pound);
  contract.start_date = now;
  contract.end_date = addDays(now, 30 * static_cast<std::int64_t>(duration_months));
  contract.duration_months = duration_months;
  contract.bean_types = supplier->bean_types;
  contract.terms.payment_terms = "Net 30";
  contract.terms.quality_requirements = "Minimum 80/100 quality score";
  contract.terms.delivery_schedule = "Monthly";
  contract.terms.sustainability_requirements = "Rainforest Alliance Certified";
  contract.proposed_date = now;

  nlohmann::json reply = contract;
  engine_.add_contract(std::move(contract));
  return reply;
}

// -----------------------------------------------------------------------------
// negotiate_contract()
// -----------------------------------------------------------------------------
// The merge runs on the JSON form so "any field the contract carries" means
// exactly the fields a caller sees in get_contract_details().
// -----------------------------------------------------------------------------
nlohmann::json ProcurementDesk::negotiate_contract(
    const std::string& contract_id, const nlohmann::json& counter_offer) {
  auto contract = engine_.find_contract(contract_id);
  if (!contract) {
    return error(contractNotFound(contract_id));
  }
  if (contract->status != domain::ContractStatus::Proposed) {
    return error("Contract with ID " + contract_id +
                 " is not in 'proposed' status and cannot be negotiated");
  }
  if (!counter_offer.is_object()) {
    return error("counter_offer must be a JSON object");
  }

  nlohmann::json merged = *contract;
  for (const auto& item : counter_offer.items()) {
    if (merged.contains(item.key()) && !isProtected(item.key())) {
      merged[item.key()] = item.value();
    }
  }

  domain::Contract updated;
  try {
    updated = merged.get<domain::Contract>();
  } catch (const std::exception& e) {
    std::cerr << "[ProcurementDesk] Rejected counter-offer for " << contract_id
              << ": " << e.what() << "\n";
    return error(std::string("Invalid counter-offer: ") + e.what());
  }

  // price_per_kg is serialized even when derived; keep deriving it unless the
  // caller set it explicitly.
  if (!contract->price_per_kg && !counter_offer.contains("price_per_kg")) {
    updated.price_per_kg.reset();
  }

  const bool terms_changed = counter_offer.contains("price_per_pound") ||
                             counter_offer.contains("volume_lbs");
  if (terms_changed && updated.volume_lbs) {
    updated.total_value = roundCents(static_cast<double>(*updated.volume_lbs) *
                                     updated.price_per_pound);
  }

  nlohmann::json reply = updated;
  engine_.update_contract(std::move(updated));
  return reply;
}

nlohmann::json ProcurementDesk::finalize_contract(
    const std::string& contract_id) {
  auto contract = engine_.find_contract(contract_id);
  if (!contract) {
    return error(contractNotFound(contract_id));
  }
  if (contract->status != domain::ContractStatus::Proposed) {
    return error("Contract with ID " + contract_id +
                 " is not in 'proposed' status and cannot be finalized");
  }

  contract->status = domain::ContractStatus::Active;
  contract->finalized_date = engine_.simulation_date();

  nlohmann::json reply = *contract;
  engine_.update_contract(std::move(*contract));
  return reply;
}

nlohmann::json ProcurementDesk::reject_contract(
    const std::string& contract_id) {
  auto contract = engine_.find_contract(contract_id);
  if (!contract) {
    return error(contractNotFound(contract_id));
  }
  if (contract->status != domain::ContractStatus::Proposed) {
    return error("Contract with ID " + contract_id +
                 " is not in 'proposed' status and cannot be rejected");
  }

  engine_.update_contract_status(contract_id, domain::ContractStatus::Rejected);
  contract->status = domain::ContractStatus::Rejected;
  return *contract;
}

// -----------------------------------------------------------------------------
// Order management tools
// -----------------------------------------------------------------------------
nlohmann::json ProcurementDesk::get_active_orders() const {
  using S = domain::OrderStatus;
  nlohmann::json active = nlohmann::json::array();
  for (const auto& order : engine_.get_orders()) {
    if (order.status == S::Pending || order.status == S::InTransit ||
        order.status == S::PartiallyDelivered || order.status == S::Delayed) {
      active.push_back(order);
    }
  }
  return active;
}

nlohmann::json ProcurementDesk::get_order_details(
    const std::string& order_id) const {
  if (auto order = engine_.find_order(order_id)) {
    return *order;
  }
  return error(orderNotFound(order_id));
}

nlohmann::json ProcurementDesk::create_order(const std::string& contract_id,
                                             std::int64_t volume) {
  auto contract = engine_.find_contract(contract_id);
  if (!contract) {
    return error(contractNotFound(contract_id));
  }
  if (contract->status != domain::ContractStatus::Active) {
    return error("Contract with ID " + contract_id + " is not active");
  }
  if (volume <= 0) {
    return error("volume must be positive");
  }

  const TimestampMs now = engine_.simulation_date();
  domain::Order order = makeOrder(
      rng_, engine_.config(), *contract, volume, now,
      makeOrderId(contract_id, now, engine_.order_count() + 1),
      [this](const std::string& supplier_id) {
        return engine_.get_country_for_supplier(supplier_id);
      });

  nlohmann::json reply = order;
  engine_.add_order(std::move(order));
  return reply;
}

nlohmann::json ProcurementDesk::track_order(const std::string& order_id) {
  if (auto view = engine_.get_order_tracking(order_id)) {
    return *view;
  }
  return error(orderNotFound(order_id));
}

nlohmann::json ProcurementDesk::update_order_status(
    const std::string& order_id, const std::string& new_status) {
  auto status = domain::parseOrderStatus(new_status);
  if (!status) {
    return error("Invalid status. Must be one of: " + validStatusList());
  }
  if (!engine_.update_order_status(order_id, *status)) {
    return error(orderNotFound(order_id));
  }
  return *engine_.find_order(order_id);
}

}  // namespace procure
