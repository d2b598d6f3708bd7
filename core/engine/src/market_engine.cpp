#include "procure/engine/market_engine.hpp"

#include "procure/catalogue/catalogue.hpp"
#include "procure/domain/json_codec.hpp"
#include "procure/orders/delivery_date.hpp"
#include "procure/orders/order_tracking.hpp"

#include <iostream>
#include <utility>

namespace procure {

namespace {

// Works for const and non-const collections; first match wins.
template <typename Items>
auto findById(Items& items, const std::string& id) -> decltype(&items[0]) {
  for (auto& item : items) {
    if (item.id == id) {
      return &item;
    }
  }
  return nullptr;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
MarketEngine::MarketEngine(domain::SimulationConfig config, IRandomSource& rng,
                           const ITimeProvider& wall_clock)
    : config_(std::move(config)),
      rng_(rng),
      wall_clock_(wall_clock),
      sim_clock_(wall_clock.now_ms()),
      generator_(config_, rng_),
      market_(config_, rng_),
      lifecycle_(config_, rng_),
      drift_(config_, rng_),
      contract_fallback_(config_, rng_),
      order_placement_(config_, rng_) {
  state_.market_conditions.price_history =
      domain::PriceHistory(config_.price_history_capacity);
  state_.market_conditions.date = sim_clock_.now_ms();
}

// -----------------------------------------------------------------------------
// initialize()
// -----------------------------------------------------------------------------
InitialData MarketEngine::initialize() {
  return initialize(config_.supplier_count);
}

InitialData MarketEngine::initialize(std::size_t count) {
  const TimestampMs now = wall_clock_.now_ms();
  sim_clock_.set_time(now);

  InitialData data = generator_.generateInitialData(now, count);

  state_ = SimulationState{};
  state_.suppliers = data.suppliers;
  state_.market_conditions = data.market_conditions;

  std::cout << "[MarketEngine] Initialized " << state_.suppliers.size()
            << " suppliers at " << formatIsoTimestamp(now)
            << ", average price " << state_.market_conditions.average_price
            << "\n";
  return data;
}

// -----------------------------------------------------------------------------
// advance_step()
// -----------------------------------------------------------------------------
void MarketEngine::advance_step() {
  ++state_.simulation_step;
  const TimestampMs now = sim_clock_.advance_days(1);
  state_.changes = domain::StepChanges{};

  // ---  1) Market process ----------------------------------------------------
  state_.changes.market_conditions =
      market_.advance(state_.market_conditions, now);

  // ---  2) Order lifecycle ---------------------------------------------------
  auto order_changes = lifecycle_.advance(state_.orders, now);
  state_.changes.orders = std::move(order_changes);

  // ---  3) Supplier drift ----------------------------------------------------
  if (auto change = drift_.maybeDrift(state_.suppliers)) {
    state_.changes.suppliers.push_back(std::move(*change));
  }

  // ---  4) Contract fallback -------------------------------------------------
  runContractFallback(now);
}

void MarketEngine::runContractFallback(TimestampMs now) {
  if (!contract_fallback_.shouldSynthesize(state_.contracts)) {
    return;
  }

  try {
    auto result = contract_fallback_.synthesize(
        state_.suppliers, state_.market_conditions, now);
    if (!result.ok()) {
      recordFailure("contract_fallback", result.error().reason);
      return;
    }

    domain::Contract& contract = result.value();
    domain::ContractChange change;
    change.contract_id = contract.id;
    change.action = "created";
    change.supplier = contract.supplier_name;

    state_.contracts.push_back(std::move(contract));
    state_.changes.contracts.push_back(std::move(change));
  } catch (const std::exception& e) {
    recordFailure("contract_fallback", e.what());
  }
}

void MarketEngine::recordFailure(const std::string& component,
                                 const std::string& reason) {
  std::cerr << "[MarketEngine] " << component << " failed: " << reason << "\n";
  state_.changes.failures.push_back(domain::SynthesisFailure{component, reason});
}

// -----------------------------------------------------------------------------
// Copy-on-read accessors
// -----------------------------------------------------------------------------
std::vector<domain::Supplier> MarketEngine::get_suppliers() const {
  return state_.suppliers;
}

std::vector<domain::Contract> MarketEngine::get_contracts() const {
  return state_.contracts;
}

std::vector<domain::Order> MarketEngine::get_orders() const {
  return state_.orders;
}

domain::MarketConditions MarketEngine::get_market_conditions() const {
  return state_.market_conditions;
}

domain::StepChanges MarketEngine::get_changes() const { return state_.changes; }

std::optional<domain::Supplier> MarketEngine::find_supplier(
    const std::string& id) const {
  if (const auto* s = findById(state_.suppliers, id)) return *s;
  return std::nullopt;
}

std::optional<domain::Contract> MarketEngine::find_contract(
    const std::string& id) const {
  if (const auto* c = findById(state_.contracts, id)) return *c;
  return std::nullopt;
}

std::optional<domain::Order> MarketEngine::find_order(
    const std::string& id) const {
  if (const auto* o = findById(state_.orders, id)) return *o;
  return std::nullopt;
}

domain::Contract* MarketEngine::findContractMutable(const std::string& id) {
  return findById(state_.contracts, id);
}

domain::Order* MarketEngine::findOrderMutable(const std::string& id) {
  return findById(state_.orders, id);
}

void MarketEngine::set_market_conditions(domain::MarketConditions conditions) {
  state_.market_conditions = std::move(conditions);
}

// -----------------------------------------------------------------------------
// add_contract() / add_order()
// -----------------------------------------------------------------------------
// Duplicate ids are accepted; later lookups resolve to the first entry.
// -----------------------------------------------------------------------------
void MarketEngine::add_contract(domain::Contract contract) {
  if (findById(state_.contracts, contract.id) != nullptr) {
    std::cerr << "[MarketEngine] Duplicate contract id accepted: "
              << contract.id << "\n";
  }

  domain::ContractChange change;
  change.contract_id = contract.id;
  change.action = "add";
  state_.contracts.push_back(std::move(contract));
  state_.changes.contracts.push_back(std::move(change));
}

void MarketEngine::add_order(domain::Order order) {
  if (findById(state_.orders, order.id) != nullptr) {
    std::cerr << "[MarketEngine] Duplicate order id accepted: " << order.id
              << "\n";
  }

  domain::OrderChange change;
  change.id = order.id;
  change.action = "created";
  change.supplier = order.supplier_name.empty() ? std::string("Unknown")
                                                : order.supplier_name;
  change.volume = order.volume_lbs;
  state_.orders.push_back(std::move(order));
  state_.changes.orders.push_back(std::move(change));
}

// -----------------------------------------------------------------------------
// update_contract() / update_order()
// -----------------------------------------------------------------------------
bool MarketEngine::update_contract(domain::Contract contract) {
  auto* existing = findContractMutable(contract.id);
  if (existing == nullptr) {
    return false;
  }

  domain::ContractChange change;
  change.contract_id = contract.id;
  change.action = "update";
  if (existing->status != contract.status) {
    change.old_status = existing->status;
    change.new_status = contract.status;
  }

  *existing = std::move(contract);
  state_.changes.contracts.push_back(std::move(change));
  return true;
}

bool MarketEngine::update_order(domain::Order order) {
  auto* existing = findOrderMutable(order.id);
  if (existing == nullptr) {
    return false;
  }

  domain::OrderChange change;
  change.id = order.id;
  change.action = "update";
  if (existing->status != order.status) {
    change.old_status = existing->status;
    change.new_status = order.status;
  }

  *existing = std::move(order);
  state_.changes.orders.push_back(std::move(change));
  return true;
}

// -----------------------------------------------------------------------------
// JSON ingestion
// -----------------------------------------------------------------------------
bool MarketEngine::add_contract_json(const nlohmann::json& payload) {
  try {
    add_contract(payload.get<domain::Contract>());
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[MarketEngine] Rejected contract payload: " << e.what()
              << "\n";
    return false;
  }
}

bool MarketEngine::add_order_json(const nlohmann::json& payload) {
  try {
    add_order(payload.get<domain::Order>());
    return true;
  } catch (const std::exception& e) {
    std::cerr << "[MarketEngine] Rejected order payload: " << e.what() << "\n";
    return false;
  }
}

bool MarketEngine::update_contract_json(const nlohmann::json& payload) {
  try {
    return update_contract(payload.get<domain::Contract>());
  } catch (const std::exception& e) {
    std::cerr << "[MarketEngine] Rejected contract update: " << e.what()
              << "\n";
    return false;
  }
}

bool MarketEngine::update_order_json(const nlohmann::json& payload) {
  try {
    return update_order(payload.get<domain::Order>());
  } catch (const std::exception& e) {
    std::cerr << "[MarketEngine] Rejected order update: " << e.what() << "\n";
    return false;
  }
}

// -----------------------------------------------------------------------------
// Status and delivery updates
// -----------------------------------------------------------------------------
bool MarketEngine::update_contract_status(const std::string& contract_id,
                                          domain::ContractStatus status) {
  auto* contract = findContractMutable(contract_id);
  if (contract == nullptr) {
    return false;
  }

  domain::ContractChange change;
  change.contract_id = contract_id;
  change.action = "update_status";
  change.old_status = contract->status;
  change.new_status = status;

  contract->status = status;
  state_.changes.contracts.push_back(std::move(change));
  return true;
}

bool MarketEngine::update_order_status(const std::string& order_id,
                                       domain::OrderStatus status) {
  auto* order = findOrderMutable(order_id);
  if (order == nullptr) {
    return false;
  }

  domain::OrderChange change;
  change.id = order_id;
  change.action = "update_status";
  change.old_status = order->status;
  change.new_status = status;

  order->status = status;
  if (status == domain::OrderStatus::Delivered) {
    order->actual_delivery_date = simulation_date();
  }
  state_.changes.orders.push_back(std::move(change));
  return true;
}

bool MarketEngine::update_order_expected_delivery(
    const std::string& order_id, const std::string& expected_delivery) {
  auto* order = findOrderMutable(order_id);
  if (order == nullptr) {
    return false;
  }

  domain::OrderChange change;
  change.id = order_id;
  change.action = "update_delivery";

  auto field = domain::DeliveryField::ExpectedDeliveryDate;
  if (order->expected_delivery) {
    change.old_delivery = order->expected_delivery->text;
    field = order->expected_delivery->field;
  }
  order->expected_delivery = normalizeDeliveryDate(expected_delivery, field);
  change.new_delivery = expected_delivery;

  state_.changes.orders.push_back(std::move(change));
  return true;
}

// -----------------------------------------------------------------------------
// place_fallback_order()
// -----------------------------------------------------------------------------
bool MarketEngine::place_fallback_order() {
  if (!order_placement_.shouldPlace(state_.contracts, state_.orders.size())) {
    return false;
  }

  try {
    auto result = order_placement_.place(
        state_.contracts, simulation_date(), state_.orders.size() + 1,
        [this](const std::string& supplier_id) {
          return get_country_for_supplier(supplier_id);
        });
    if (!result.ok()) {
      recordFailure("order_placement", result.error().reason);
      return false;
    }

    std::cout << "[MarketEngine] Placed fallback order "
              << result.value().id << " for " << result.value().volume_lbs
              << " lbs\n";
    add_order(std::move(result.value()));
    return true;
  } catch (const std::exception& e) {
    recordFailure("order_placement", e.what());
    return false;
  }
}

// -----------------------------------------------------------------------------
// Tracking and country lookup
// -----------------------------------------------------------------------------
std::optional<domain::TrackingView> MarketEngine::get_order_tracking(
    const std::string& order_id) {
  const auto* order = findById(state_.orders, order_id);
  if (order == nullptr) {
    return std::nullopt;
  }
  return buildTrackingView(rng_, *order, simulation_date());
}

std::string MarketEngine::get_country_for_region(const std::string& region) {
  return catalogue::countryForRegion(rng_, region);
}

std::string MarketEngine::get_country_for_supplier(
    const std::string& supplier_id) {
  const auto* supplier = findById(state_.suppliers, supplier_id);
  if (supplier == nullptr) {
    return catalogue::kUnknownCountry;
  }
  if (supplier->country) {
    return *supplier->country;
  }
  return get_country_for_region(supplier->region);
}

// -----------------------------------------------------------------------------
// snapshot()
// -----------------------------------------------------------------------------
nlohmann::json MarketEngine::snapshot() const {
  nlohmann::json j;
  j["suppliers"] = state_.suppliers;
  j["contracts"] = state_.contracts;
  j["orders"] = state_.orders;
  j["market_conditions"] = state_.market_conditions;
  j["simulation_date"] = formatIsoTimestamp(simulation_date());
  j["simulation_step"] = state_.simulation_step;
  return j;
}

}  // namespace procure
