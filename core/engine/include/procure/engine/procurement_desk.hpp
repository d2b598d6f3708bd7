#pragma once

#include "procure/engine/market_engine.hpp"
#include "procure/random/i_random_source.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace procure {

// -----------------------------------------------------------------------------
// ProcurementDesk: the tool surface used by sourcing, negotiation and order
//                   management agents
// -----------------------------------------------------------------------------
//
// @brief  Thin facade over MarketEngine returning JSON payloads.
//
// @details
// Every tool reads through the engine's copy-on-read accessors and writes
// back through its mutating accessors, so the change-log records each
// effect. Tools never throw for caller mistakes; they return
// {"error": "<message>"} instead:
//   - unknown ids:           "<Entity> with ID <id> not found"
//   - wrong contract state:  negotiate/finalize/reject need Proposed,
//                            create_order needs Active
//   - bad arguments:         non-positive volume, price or duration, an
//                            unknown status label, a non-object counter-offer
//
// Identifiers are built from the simulated clock plus the engine's entity
// count, so two proposals in one simulated day still get distinct ids:
//   contract_<supplier id>_<YYYYMMDDHHMMSS>_<n>
//   order_<contract id>_<YYYYMMDDHHMMSS>_<n>
//
// Thread model:
//   Same as MarketEngine: the caller holds the engine lock around each call.
//
// Ownership:
//   Non-owning references to the engine and the random source.
// -----------------------------------------------------------------------------
class ProcurementDesk {
 public:
  ProcurementDesk(MarketEngine& engine, IRandomSource& rng);

  // --- Sourcing ----------------------------------------------------------------
  nlohmann::json list_suppliers() const;
  nlohmann::json get_supplier_details(const std::string& supplier_id) const;
  nlohmann::json get_market_conditions() const;

  // Suppliers whose region equals `region`, or lies in the region group
  // named `region` ("Africa", "Central America", ...).
  nlohmann::json find_suppliers_by_region(const std::string& region) const;

  // --- Negotiation -------------------------------------------------------------
  nlohmann::json get_active_contracts() const;
  nlohmann::json get_contract_details(const std::string& contract_id) const;

  // -------------------------------------------------------------------------
  // propose_contract(supplier_id, volume, price_per_pound, duration_months)
  // -------------------------------------------------------------------------
  // Adds a Proposed contract starting at the simulated date and ending
  // 30 * duration_months days later, with total_value = volume * price
  // (cents) and the standard proposal terms.
  // -------------------------------------------------------------------------
  nlohmann::json propose_contract(const std::string& supplier_id,
                                  std::int64_t volume, double price_per_pound,
                                  int duration_months);

  // -------------------------------------------------------------------------
  // negotiate_contract(contract_id, counter_offer)
  // -------------------------------------------------------------------------
  // Overwrites every field of the contract that also appears in
  // counter_offer, except id, supplier_id, supplier_name, status and
  // proposed_date. Keys the contract does not carry are ignored.
  // total_value is recomputed when price_per_pound or volume_lbs changed.
  // -------------------------------------------------------------------------
  nlohmann::json negotiate_contract(const std::string& contract_id,
                                    const nlohmann::json& counter_offer);

  nlohmann::json finalize_contract(const std::string& contract_id);
  nlohmann::json reject_contract(const std::string& contract_id);

  // --- Order management --------------------------------------------------------
  // Pending, InTransit, PartiallyDelivered and Delayed orders.
  nlohmann::json get_active_orders() const;
  nlohmann::json get_order_details(const std::string& order_id) const;
  nlohmann::json create_order(const std::string& contract_id,
                              std::int64_t volume);
  nlohmann::json track_order(const std::string& order_id);
  nlohmann::json update_order_status(const std::string& order_id,
                                     const std::string& new_status);

 private:
  static nlohmann::json error(const std::string& message);

  MarketEngine& engine_;
  IRandomSource& rng_;
};

}  // namespace procure
