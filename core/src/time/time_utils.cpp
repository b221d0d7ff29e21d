#include "evstream/time/time_utils.hpp"

#include <cstdio>

namespace evstream {

namespace {

constexpr std::int64_t kMicrosPerSecond = 1'000'000;
constexpr std::int64_t kSecondsPerDay = 86'400;

// Days since 1970-01-01 for a proleptic Gregorian date (Hinnant's
// days_from_civil).
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilTime {
  std::int64_t year;
  unsigned month;
  unsigned day;
  unsigned hour;
  unsigned minute;
  unsigned second;
  unsigned micros;
};

CivilTime civil_from_us(std::int64_t epoch_us) {
  std::int64_t secs = epoch_us / kMicrosPerSecond;
  std::int64_t micros = epoch_us % kMicrosPerSecond;
  if (micros < 0) {
    micros += kMicrosPerSecond;
    --secs;
  }
  std::int64_t days = secs / kSecondsPerDay;
  std::int64_t sod = secs % kSecondsPerDay;
  if (sod < 0) {
    sod += kSecondsPerDay;
    --days;
  }

  // Inverse of days_from_civil.
  const std::int64_t z = days + 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);

  CivilTime ct{};
  ct.year = y;
  ct.month = m;
  ct.day = d;
  ct.hour = static_cast<unsigned>(sod / 3600);
  ct.minute = static_cast<unsigned>((sod % 3600) / 60);
  ct.second = static_cast<unsigned>(sod % 60);
  ct.micros = static_cast<unsigned>(micros);
  return ct;
}

// Reads exactly `count` decimal digits starting at `pos`; advances pos.
bool read_digits(std::string_view text, std::size_t& pos, std::size_t count,
                 unsigned& out) {
  if (pos + count > text.size()) {
    return false;
  }
  unsigned value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    char c = text[pos + i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  pos += count;
  out = value;
  return true;
}

bool expect_char(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

bool is_leap(std::int64_t year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(std::int64_t year, unsigned month) {
  static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                       31, 31, 30, 31, 30, 31};
  if (month == 2 && is_leap(year)) {
    return 29;
  }
  return kDays[month - 1];
}

}  // namespace

// -----------------------------------------------------------------------------
// format_iso8601()
// -----------------------------------------------------------------------------
std::string format_iso8601(Timestamp tp) {
  CivilTime ct = civil_from_us(timestamp_to_us(tp));
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02u:%02u:%02u.%06u+00:00",
                static_cast<long long>(ct.year), ct.month, ct.day, ct.hour,
                ct.minute, ct.second, ct.micros);
  return buf;
}

// -----------------------------------------------------------------------------
// parse_iso8601()
// -----------------------------------------------------------------------------
std::optional<Timestamp> parse_iso8601(std::string_view text) {
  std::size_t pos = 0;
  unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

  if (!read_digits(text, pos, 4, year) || !expect_char(text, pos, '-') ||
      !read_digits(text, pos, 2, month) || !expect_char(text, pos, '-') ||
      !read_digits(text, pos, 2, day)) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;
  if (!read_digits(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
      !read_digits(text, pos, 2, minute) || !expect_char(text, pos, ':') ||
      !read_digits(text, pos, 2, second)) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
      hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  // Fraction: 1..9 digits, keep the first six.
  std::int64_t micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0 || digits > 9) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 6; ++i) {
      micros *= 10;
    }
  }

  std::int64_t offset_seconds = 0;
  if (pos < text.size()) {
    char zone = text[pos];
    if (zone == 'Z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      unsigned off_h = 0, off_m = 0;
      if (!read_digits(text, pos, 2, off_h) || !expect_char(text, pos, ':') ||
          !read_digits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
        return std::nullopt;
      }
      offset_seconds = static_cast<std::int64_t>(off_h) * 3600 + off_m * 60;
      if (zone == '-') {
        offset_seconds = -offset_seconds;
      }
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::int64_t days = days_from_civil(year, month, day);
  std::int64_t secs = days * kSecondsPerDay + hour * 3600 + minute * 60 +
                      second - offset_seconds;
  return us_to_timestamp(secs * kMicrosPerSecond + micros);
}

// -----------------------------------------------------------------------------
// format_rotation_stamp()
// -----------------------------------------------------------------------------
std::string format_rotation_stamp(std::int64_t epoch_us) {
  CivilTime ct = civil_from_us(epoch_us);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u_%02u-%02u-%02u-%06u",
                static_cast<long long>(ct.year), ct.month, ct.day, ct.hour,
                ct.minute, ct.second, ct.micros);
  return buf;
}

}  // namespace evstream
