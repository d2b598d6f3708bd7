#include "procure/domain/labels.hpp"

namespace procure {
namespace domain {

// -----------------------------------------------------------------------------
// toString()
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:            return "pending";
    case S::InTransit:          return "in_transit";
    case S::Delayed:            return "delayed";
    case S::Delivered:          return "delivered";
    case S::PartiallyDelivered: return "partially_delivered";
    case S::Cancelled:          return "cancelled";
  }
  return "unknown";
}

const char* toString(ContractStatus status) {
  using S = ContractStatus;
  switch (status) {
    case S::Proposed: return "proposed";
    case S::Active:   return "active";
    case S::Rejected: return "rejected";
    case S::Expired:  return "expired";
  }
  return "unknown";
}

const char* toString(PriceTrend trend) {
  switch (trend) {
    case PriceTrend::Rising:  return "Rising";
    case PriceTrend::Falling: return "Falling";
    case PriceTrend::Stable:  return "Stable";
  }
  return "Stable";
}

const char* toString(SupplierAttribute attribute) {
  using A = SupplierAttribute;
  switch (attribute) {
    case A::Quality:        return "quality";
    case A::Reliability:    return "reliability";
    case A::Sustainability: return "sustainability";
    case A::Capacity:       return "capacity";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parse*()
// -----------------------------------------------------------------------------
std::optional<OrderStatus> parseOrderStatus(const std::string& label) {
  using S = OrderStatus;
  if (label == "pending" || label == "placed") return S::Pending;
  if (label == "in_transit") return S::InTransit;
  if (label == "delayed") return S::Delayed;
  if (label == "delivered") return S::Delivered;
  if (label == "partially_delivered") return S::PartiallyDelivered;
  if (label == "cancelled") return S::Cancelled;
  return std::nullopt;
}

std::optional<ContractStatus> parseContractStatus(const std::string& label) {
  using S = ContractStatus;
  if (label == "proposed") return S::Proposed;
  if (label == "active") return S::Active;
  if (label == "rejected") return S::Rejected;
  if (label == "expired") return S::Expired;
  return std::nullopt;
}

std::optional<PriceTrend> parsePriceTrend(const std::string& label) {
  if (label == "Rising") return PriceTrend::Rising;
  if (label == "Falling") return PriceTrend::Falling;
  if (label == "Stable") return PriceTrend::Stable;
  return std::nullopt;
}

std::optional<SupplierAttribute> parseSupplierAttribute(
    const std::string& label) {
  using A = SupplierAttribute;
  if (label == "quality") return A::Quality;
  if (label == "reliability") return A::Reliability;
  if (label == "sustainability") return A::Sustainability;
  if (label == "capacity") return A::Capacity;
  return std::nullopt;
}

}  // namespace domain
}  // namespace procure
