#include "procure/time/calendar.hpp"

#include <cctype>
#include <cstdio>

namespace procure {

namespace {

struct CivilDate {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

// Inverse of daysFromCivil.
CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

bool isLeapYear(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) {
    return 29;
  }
  return kDays[m - 1];
}

// Floor division for negative epoch values (pre-1970 timestamps).
std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// Reads exactly `width` digits starting at `pos`. Advances pos on success.
bool readDigits(const std::string& text, std::size_t& pos, std::size_t width,
                unsigned& out) {
  if (pos + width > text.size()) {
    return false;
  }
  unsigned value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  out = value;
  pos += width;
  return true;
}

bool expect(const std::string& text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

}  // namespace

std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 +
                       day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

TimestampMs makeTimestamp(std::int64_t year, unsigned month, unsigned day,
                          unsigned hour, unsigned minute, unsigned second) {
  const std::int64_t seconds = daysFromCivil(year, month, day) * 86400 +
                               static_cast<std::int64_t>(hour) * 3600 +
                               static_cast<std::int64_t>(minute) * 60 +
                               static_cast<std::int64_t>(second);
  return seconds * 1000;
}

std::string formatDate(TimestampMs ts) {
  const CivilDate date = civilFromDays(floorDiv(ts, kMillisPerDay));
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u",
                static_cast<long long>(date.year), date.month, date.day);
  return buffer;
}

std::string formatIsoTimestamp(TimestampMs ts) {
  const std::int64_t days = floorDiv(ts, kMillisPerDay);
  const std::int64_t ms_of_day = ts - days * kMillisPerDay;
  const CivilDate date = civilFromDays(days);
  const auto secs = static_cast<unsigned>(ms_of_day / 1000);

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u:%02u:%02u",
                static_cast<long long>(date.year), date.month, date.day,
                secs / 3600, (secs / 60) % 60, secs % 60);
  return buffer;
}

std::string formatCompactTimestamp(TimestampMs ts) {
  const std::int64_t days = floorDiv(ts, kMillisPerDay);
  const std::int64_t ms_of_day = ts - days * kMillisPerDay;
  const CivilDate date = civilFromDays(days);
  const auto secs = static_cast<unsigned>(ms_of_day / 1000);

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%04lld%02u%02u%02u%02u%02u",
                static_cast<long long>(date.year), date.month, date.day,
                secs / 3600, (secs / 60) % 60, secs % 60);
  return buffer;
}

std::optional<TimestampMs> parseTimestamp(const std::string& text) {
  std::size_t pos = 0;
  unsigned year = 0;
  unsigned month = 0;
  unsigned day = 0;

  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
    return std::nullopt;
  }

  // Plain date.
  if (pos == text.size()) {
    return makeTimestamp(year, month, day);
  }

  if (text[pos] != 'T' && text[pos] != ' ') {
    return std::nullopt;
  }
  ++pos;

  unsigned hour = 0;
  unsigned minute = 0;
  unsigned second = 0;
  if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, minute)) {
    return std::nullopt;
  }
  if (pos < text.size() && text[pos] == ':') {
    ++pos;
    if (!readDigits(text, pos, 2, second)) {
      return std::nullopt;
    }
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  std::int64_t millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  return makeTimestamp(year, month, day, hour, minute, second) + millis;
}

std::int64_t daysBetween(TimestampMs from, TimestampMs to) {
  return floorDiv(to - from, kMillisPerDay);
}

}  // namespace procure
