#pragma once

#include "procure/domain/contract_status.hpp"
#include "procure/time/calendar.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace procure {
namespace domain {

inline constexpr double kKgPerPound = 0.45359237;

struct VolumeRange {
  std::int64_t min_lbs{0};
  std::int64_t max_lbs{0};
};

// Nested contract terms. Every field is optional: negotiated and
// synthesized contracts fill different subsets.
struct ContractTerms {
  std::optional<std::string> payment_terms;
  std::optional<std::string> delivery_terms;
  std::optional<std::string> quality_requirements;
  std::optional<std::string> sustainability_requirements;
  std::optional<std::string> delivery_schedule;
};

// -----------------------------------------------------------------------------
// Contract
// -----------------------------------------------------------------------------
// Responsibility: A supply agreement with one supplier.
//
// @details
// Created either by the negotiation surface (ProcurementDesk, status
// Proposed) or by ContractFallbackPolicy (status Active, bypassing
// Proposed). Mutated only by status transitions and counter-offer field
// overwrites; never deleted.
//
// supplier_id must name an existing supplier when the contract is created.
// The engine does not re-check the reference afterwards.
// -----------------------------------------------------------------------------
struct Contract {
  std::string id;
  std::string supplier_id;
  std::string supplier_name;
  ContractStatus status{ContractStatus::Proposed};
  double price_per_pound{0.0};
  std::optional<double> price_per_kg;        // Derived from per-pound when absent
  std::optional<std::int64_t> volume_lbs;    // Negotiated fixed volume
  std::optional<VolumeRange> volume_range;   // Synthesized min/max volume
  std::optional<double> total_value;
  TimestampMs start_date{0};
  TimestampMs end_date{0};
  std::optional<int> duration_months;
  std::vector<std::string> bean_types;
  ContractTerms terms;
  std::optional<TimestampMs> proposed_date;
  std::optional<TimestampMs> finalized_date;

  // Per-kilogram price: the explicit value, or the per-pound price
  // converted when none was set.
  double effectivePricePerKg() const {
    return price_per_kg ? *price_per_kg : price_per_pound / kKgPerPound;
  }
};

}  // namespace domain
}  // namespace procure
