#include "procure/orders/delivery_date.hpp"

namespace procure {

std::string renderDeliveryDate(TimestampMs when, domain::DeliveryField field) {
  if (field == domain::DeliveryField::ExpectedDelivery) {
    return formatIsoTimestamp(when);
  }
  return formatDate(when);
}

domain::DeliveryDate normalizeDeliveryDate(const std::string& text,
                                           domain::DeliveryField field) {
  domain::DeliveryDate date;
  date.text = text;
  date.value = parseTimestamp(text);
  date.field = field;
  return date;
}

domain::DeliveryDate makeDeliveryDate(TimestampMs when,
                                      domain::DeliveryField field) {
  domain::DeliveryDate date;
  date.text = renderDeliveryDate(when, field);
  date.value = when;
  date.field = field;
  return date;
}

bool pushDeliveryDate(domain::DeliveryDate& date, std::int64_t days) {
  if (!date.value) {
    return false;
  }
  const TimestampMs pushed = addDays(*date.value, days);
  date.value = pushed;
  date.text = renderDeliveryDate(pushed, date.field);
  return true;
}

}  // namespace procure
