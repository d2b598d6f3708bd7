#pragma once

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// ContractStatus
// -----------------------------------------------------------------------------
// Negotiated contracts start as Proposed and move to Active when finalized.
// Contracts synthesized by ContractFallbackPolicy are inserted directly as
// Active. Rejected and Expired are soft end states: contracts are never
// deleted, they only stop counting as active.
// -----------------------------------------------------------------------------
enum class ContractStatus {
  Proposed,
  Active,
  Rejected,
  Expired,
};

}  // namespace domain
}  // namespace procure
