#include "procure/domain/json_codec.hpp"

#include "procure/domain/labels.hpp"
#include "procure/orders/delivery_date.hpp"
#include "procure/util/rounding.hpp"

#include <stdexcept>
#include <string>

namespace procure {
namespace domain {

namespace {

template <typename T>
void putOptional(nlohmann::json& j, const char* key,
                 const std::optional<T>& value) {
  if (value) {
    j[key] = *value;
  }
}

void putOptionalDate(nlohmann::json& j, const char* key,
                     const std::optional<TimestampMs>& value) {
  if (value) {
    j[key] = formatDate(*value);
  }
}

bool hasValue(const nlohmann::json& j, const char* key) {
  return j.contains(key) && !j.at(key).is_null();
}

std::optional<std::string> optionalString(const nlohmann::json& j,
                                          const char* key) {
  if (!hasValue(j, key)) {
    return std::nullopt;
  }
  return j.at(key).get<std::string>();
}

// Present-but-unparsable is a shape error; absent is fine.
std::optional<TimestampMs> optionalDate(const nlohmann::json& j,
                                        const char* key) {
  auto text = optionalString(j, key);
  if (!text) {
    return std::nullopt;
  }
  auto parsed = parseTimestamp(*text);
  if (!parsed) {
    throw std::invalid_argument(std::string("unparsable date in '") + key +
                                "': " + *text);
  }
  return parsed;
}

}  // namespace

// -----------------------------------------------------------------------------
// Supplier
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Supplier& supplier) {
  j = nlohmann::json{
      {"id", supplier.id},
      {"name", supplier.name},
      {"region", supplier.region},
      {"bean_types", supplier.bean_types},
      {"certifications", supplier.certifications},
      {"quality_score", supplier.quality_score},
      {"capacity_kg_per_year", supplier.capacity_kg_per_year},
      {"reliability_score", supplier.reliability_score},
      {"years_in_business", supplier.years_in_business},
      {"sustainability_score", supplier.sustainability_score},
  };
  putOptional(j, "country", supplier.country);
}

// -----------------------------------------------------------------------------
// MarketConditions
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const PricePoint& point) {
  j = nlohmann::json{{"date", formatIsoTimestamp(point.date)},
                     {"price", point.price}};
}

void to_json(nlohmann::json& j, const MarketFactor& factor) {
  j = nlohmann::json{{"name", factor.name},
                     {"status", factor.status},
                     {"impact", factor.impact},
                     {"details", factor.details}};
}

void to_json(nlohmann::json& j, const MarketConditions& conditions) {
  nlohmann::json history = nlohmann::json::array();
  for (const auto& point : conditions.price_history) {
    history.push_back(point);
  }

  j = nlohmann::json{
      {"date", formatIsoTimestamp(conditions.date)},
      {"average_price", conditions.average_price},
      {"price_trend", toString(conditions.price_trend)},
      {"price_history", std::move(history)},
      {"regional_prices", conditions.regional_prices},
      {"bean_prices", conditions.bean_prices},
      {"market_factors", conditions.market_factors},
      {"forecast",
       {{"short_term", conditions.forecast.short_term},
        {"long_term", conditions.forecast.long_term}}},
  };
}

// -----------------------------------------------------------------------------
// Contract
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const VolumeRange& range) {
  j = nlohmann::json{{"min_lbs", range.min_lbs}, {"max_lbs", range.max_lbs}};
}

void from_json(const nlohmann::json& j, VolumeRange& range) {
  range.min_lbs = j.value("min_lbs", std::int64_t{5000});
  range.max_lbs = j.value("max_lbs", std::int64_t{20000});
}

void to_json(nlohmann::json& j, const ContractTerms& terms) {
  j = nlohmann::json::object();
  putOptional(j, "payment_terms", terms.payment_terms);
  putOptional(j, "delivery_terms", terms.delivery_terms);
  putOptional(j, "quality_requirements", terms.quality_requirements);
  putOptional(j, "sustainability_requirements",
              terms.sustainability_requirements);
  putOptional(j, "delivery_schedule", terms.delivery_schedule);
}

void from_json(const nlohmann::json& j, ContractTerms& terms) {
  terms.payment_terms = optionalString(j, "payment_terms");
  terms.delivery_terms = optionalString(j, "delivery_terms");
  terms.quality_requirements = optionalString(j, "quality_requirements");
  terms.sustainability_requirements =
      optionalString(j, "sustainability_requirements");
  terms.delivery_schedule = optionalString(j, "delivery_schedule");
}

void to_json(nlohmann::json& j, const Contract& contract) {
  j = nlohmann::json{
      {"id", contract.id},
      {"supplier_id", contract.supplier_id},
      {"supplier_name", contract.supplier_name},
      {"status", toString(contract.status)},
      {"price_per_pound", contract.price_per_pound},
      {"price_per_kg", roundCents(contract.effectivePricePerKg())},
      {"start_date", formatDate(contract.start_date)},
      {"end_date", formatDate(contract.end_date)},
      {"bean_types", contract.bean_types},
      {"terms", contract.terms},
  };
  putOptional(j, "volume_lbs", contract.volume_lbs);
  putOptional(j, "volume_range", contract.volume_range);
  putOptional(j, "total_value", contract.total_value);
  putOptional(j, "duration_months", contract.duration_months);
  putOptionalDate(j, "proposed_date", contract.proposed_date);
  putOptionalDate(j, "finalized_date", contract.finalized_date);
}

void from_json(const nlohmann::json& j, Contract& contract) {
  contract = Contract{};
  contract.id = j.at("id").get<std::string>();
  contract.supplier_id = j.value("supplier_id", std::string());
  contract.supplier_name = j.value("supplier_name", std::string());

  if (auto label = optionalString(j, "status")) {
    auto status = parseContractStatus(*label);
    if (!status) {
      throw std::invalid_argument("unknown contract status: " + *label);
    }
    contract.status = *status;
  }

  contract.price_per_pound = j.value("price_per_pound", 0.0);
  if (hasValue(j, "price_per_kg")) {
    contract.price_per_kg = j.at("price_per_kg").get<double>();
  }
  if (hasValue(j, "volume_lbs")) {
    contract.volume_lbs = j.at("volume_lbs").get<std::int64_t>();
  }
  if (hasValue(j, "volume_range")) {
    contract.volume_range = j.at("volume_range").get<VolumeRange>();
  }
  if (hasValue(j, "total_value")) {
    contract.total_value = j.at("total_value").get<double>();
  }
  if (hasValue(j, "duration_months")) {
    contract.duration_months = j.at("duration_months").get<int>();
  }

  contract.start_date = optionalDate(j, "start_date").value_or(0);
  contract.end_date = optionalDate(j, "end_date").value_or(0);
  contract.proposed_date = optionalDate(j, "proposed_date");
  contract.finalized_date = optionalDate(j, "finalized_date");

  if (hasValue(j, "bean_types")) {
    contract.bean_types = j.at("bean_types").get<std::vector<std::string>>();
  }
  if (hasValue(j, "terms")) {
    contract.terms = j.at("terms").get<ContractTerms>();
  }
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const ShippingDetails& details) {
  j = nlohmann::json{{"carrier", details.carrier},
                     {"tracking_number", details.tracking_number},
                     {"origin_port", details.origin_port},
                     {"destination_port", details.destination_port}};
}

void from_json(const nlohmann::json& j, ShippingDetails& details) {
  details.carrier = j.value("carrier", std::string());
  details.tracking_number = j.value("tracking_number", std::string());
  details.origin_port = j.value("origin_port", std::string());
  details.destination_port = j.value("destination_port", std::string());
}

void to_json(nlohmann::json& j, const Order& order) {
  j = nlohmann::json{
      {"id", order.id},
      {"contract_id", order.contract_id},
      {"supplier_id", order.supplier_id},
      {"supplier_name", order.supplier_name},
      {"status", toString(order.status)},
      {"volume_lbs", order.volume_lbs},
      {"price_per_pound", order.price_per_pound},
      {"total_value", order.total_value},
  };
  putOptionalDate(j, "order_date", order.order_date);

  if (order.expected_delivery) {
    const char* key =
        order.expected_delivery->field == DeliveryField::ExpectedDelivery
            ? "expected_delivery"
            : "expected_delivery_date";
    j[key] = order.expected_delivery->text;
  }

  if (order.actual_delivery_date) {
    j["actual_delivery_date"] = formatDate(*order.actual_delivery_date);
  } else {
    j["actual_delivery_date"] = nullptr;
  }
  putOptional(j, "shipping_details", order.shipping_details);
}

// -----------------------------------------------------------------------------
// from_json(Order): the ingestion shim
// -----------------------------------------------------------------------------
// "expected_delivery" wins when both field names are present.
// -----------------------------------------------------------------------------
void from_json(const nlohmann::json& j, Order& order) {
  order = Order{};
  order.id = j.at("id").get<std::string>();
  order.contract_id = j.value("contract_id", std::string());
  order.supplier_id = j.value("supplier_id", std::string());
  order.supplier_name = j.value("supplier_name", std::string());

  if (auto label = optionalString(j, "status")) {
    auto status = parseOrderStatus(*label);
    if (!status) {
      throw std::invalid_argument("unknown order status: " + *label);
    }
    order.status = *status;
  }

  order.volume_lbs = j.value("volume_lbs", std::int64_t{0});
  order.price_per_pound = j.value("price_per_pound", 0.0);
  if (hasValue(j, "total_value")) {
    order.total_value = j.at("total_value").get<double>();
  } else {
    order.total_value =
        roundCents(static_cast<double>(order.volume_lbs) * order.price_per_pound);
  }

  order.order_date = optionalDate(j, "order_date");
  order.actual_delivery_date = optionalDate(j, "actual_delivery_date");

  if (hasValue(j, "expected_delivery") &&
      j.at("expected_delivery").is_string()) {
    order.expected_delivery =
        normalizeDeliveryDate(j.at("expected_delivery").get<std::string>(),
                              DeliveryField::ExpectedDelivery);
  } else if (hasValue(j, "expected_delivery_date") &&
             j.at("expected_delivery_date").is_string()) {
    order.expected_delivery = normalizeDeliveryDate(
        j.at("expected_delivery_date").get<std::string>(),
        DeliveryField::ExpectedDeliveryDate);
  }

  if (hasValue(j, "shipping_details")) {
    order.shipping_details = j.at("shipping_details").get<ShippingDetails>();
  }
}

// -----------------------------------------------------------------------------
// Change-log
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const SupplierChange& change) {
  j = nlohmann::json{{"id", change.id},
                     {"name", change.name},
                     {"update_type", toString(change.update_type)}};
  if (change.update_type == SupplierAttribute::Capacity) {
    j["old_value"] = static_cast<std::int64_t>(change.old_value);
    j["new_value"] = static_cast<std::int64_t>(change.new_value);
  } else {
    j["old_value"] = change.old_value;
    j["new_value"] = change.new_value;
  }
}

void to_json(nlohmann::json& j, const ContractChange& change) {
  j = nlohmann::json{{"contract_id", change.contract_id},
                     {"action", change.action}};
  if (change.old_status) j["old_status"] = toString(*change.old_status);
  if (change.new_status) j["new_status"] = toString(*change.new_status);
  putOptional(j, "supplier", change.supplier);
}

void to_json(nlohmann::json& j, const OrderChange& change) {
  j = nlohmann::json{{"id", change.id}};
  if (!change.action.empty()) j["action"] = change.action;
  if (change.old_status) j["old_status"] = toString(*change.old_status);
  if (change.new_status) j["new_status"] = toString(*change.new_status);
  putOptional(j, "delay_days", change.delay_days);
  putOptional(j, "supplier", change.supplier);
  putOptional(j, "volume", change.volume);
  putOptional(j, "old_delivery", change.old_delivery);
  putOptional(j, "new_delivery", change.new_delivery);
}

void to_json(nlohmann::json& j, const SynthesisFailure& failure) {
  j = nlohmann::json{{"component", failure.component},
                     {"reason", failure.reason}};
}

void to_json(nlohmann::json& j, const StepChanges& changes) {
  j = nlohmann::json{
      {"suppliers", changes.suppliers},
      {"contracts", changes.contracts},
      {"orders", changes.orders},
      {"market_conditions", nlohmann::json::object()},
      {"failures", changes.failures},
  };
  if (changes.market_conditions) {
    const auto& m = *changes.market_conditions;
    j["market_conditions"] = {{"new_price", m.new_price},
                              {"old_price", m.old_price},
                              {"change_pct", m.change_pct}};
  }
}

// -----------------------------------------------------------------------------
// TrackingView
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const TrackingView& view) {
  j = nlohmann::json{{"order_id", view.order_id},
                     {"supplier_name", view.supplier_name},
                     {"current_status", toString(view.current_status)},
                     {"status_updated", formatDate(view.status_updated)}};
  if (view.shipping_details) {
    j["shipping_details"] = *view.shipping_details;
  } else {
    j["shipping_details"] = nlohmann::json::object();
  }

  putOptional(j, "location", view.location);
  putOptional(j, "status_details", view.status_details);
  putOptionalDate(j, "next_update_expected", view.next_update_expected);
  putOptional(j, "estimated_arrival", view.estimated_arrival);
  putOptional(j, "transportation_method", view.transportation_method);
  putOptional(j, "delay_duration", view.delay_duration);
  putOptionalDate(j, "revised_delivery", view.revised_delivery);
  putOptionalDate(j, "delivery_date", view.delivery_date);
  putOptional(j, "received_by", view.received_by);
  putOptional(j, "quality_check_status", view.quality_check_status);
  putOptional(j, "delivery_percentage", view.delivery_percentage);
  putOptionalDate(j, "remaining_delivery_expected",
                  view.remaining_delivery_expected);
}

}  // namespace domain
}  // namespace procure
