// Repository: Schedcast-air
// Component: UTC Timestamps
// Purpose: ISO-8601 parsing and formatting to/from milliseconds since Unix epoch.
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/Timestamp.hpp"

#include <cstdio>

namespace schedcast::schedule {

namespace {

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerDay = 86'400'000;

bool IsLeap(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned DaysInMonth(int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && IsLeap(y)) return 29;
  return kDays[m - 1];
}

// Civil date from days since epoch (inverse of DaysFromCivil).
void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  if (m <= 2) ++y;
}

class Cursor {
 public:
  explicit Cursor(const std::string& s) : s_(s) {}

  bool AtEnd() const { return pos_ >= s_.size(); }
  char Peek() const { return AtEnd() ? '\0' : s_[pos_]; }
  void Skip() { ++pos_; }

  bool Expect(char c) {
    if (Peek() != c) return false;
    ++pos_;
    return true;
  }

  // Reads exactly n decimal digits.
  bool Digits(int n, int64_t& out) {
    out = 0;
    for (int i = 0; i < n; ++i) {
      char c = Peek();
      if (c < '0' || c > '9') return false;
      out = out * 10 + (c - '0');
      ++pos_;
    }
    return true;
  }

 private:
  const std::string& s_;
  size_t pos_ = 0;
};

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace

int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::optional<int64_t> ParseUtcTimestampMs(const std::string& raw) {
  const std::string text = Trim(raw);
  if (text.empty()) return std::nullopt;

  Cursor c(text);
  int64_t year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int64_t millis = 0;

  if (!c.Digits(4, year) || !c.Expect('-') || !c.Digits(2, month) || !c.Expect('-') ||
      !c.Digits(2, day)) {
    return std::nullopt;
  }
  // A bare date is midnight UTC.
  const bool date_only = c.AtEnd();
  if (!date_only) {
    if (c.Peek() != 'T' && c.Peek() != 't' && c.Peek() != ' ') return std::nullopt;
    c.Skip();
    if (!c.Digits(2, hour) || !c.Expect(':') || !c.Digits(2, minute)) return std::nullopt;
  }

  if (!date_only && c.Expect(':')) {
    if (!c.Digits(2, second)) return std::nullopt;
    if (c.Peek() == '.' || c.Peek() == ',') {
      c.Skip();
      int digits = 0;
      while (c.Peek() >= '0' && c.Peek() <= '9') {
        if (digits < 3) millis = millis * 10 + (c.Peek() - '0');
        ++digits;
        c.Skip();
      }
      if (digits == 0) return std::nullopt;
      for (int i = digits; i < 3; ++i) millis *= 10;
    }
  }

  int64_t offset_minutes = 0;
  if (c.Peek() == 'Z' || c.Peek() == 'z') {
    c.Skip();
  } else if (c.Peek() == '+' || c.Peek() == '-') {
    const int64_t sign = c.Peek() == '-' ? -1 : 1;
    c.Skip();
    int64_t oh = 0, om = 0;
    if (!c.Digits(2, oh)) return std::nullopt;
    if (c.Expect(':')) {
      if (!c.Digits(2, om)) return std::nullopt;
    } else if (!c.AtEnd()) {
      if (!c.Digits(2, om)) return std::nullopt;
    }
    if (oh > 23 || om > 59) return std::nullopt;
    offset_minutes = sign * (oh * 60 + om);
  }
  if (!c.AtEnd()) return std::nullopt;

  if (month < 1 || month > 12) return std::nullopt;
  if (day < 1 || day > static_cast<int64_t>(DaysInMonth(year, static_cast<unsigned>(month)))) {
    return std::nullopt;
  }
  // 24:00:00 is not accepted; leap second 60 is clamped to 59.
  if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
  if (second == 60) second = 59;

  const int64_t days =
      DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  int64_t ms = days * kMsPerDay + ((hour * 60 + minute) * 60 + second) * kMsPerSecond + millis;
  ms -= offset_minutes * 60 * kMsPerSecond;
  return ms;
}

std::string FormatUtcTimestampMs(int64_t utc_ms) {
  int64_t days = utc_ms / kMsPerDay;
  int64_t rem = utc_ms % kMsPerDay;
  if (rem < 0) {
    rem += kMsPerDay;
    --days;
  }
  int64_t y = 0;
  unsigned m = 0, d = 0;
  CivilFromDays(days, y, m, d);

  const int64_t ms = rem % 1000;
  const int64_t total_s = rem / 1000;
  const int hh = static_cast<int>(total_s / 3600);
  const int mm = static_cast<int>((total_s / 60) % 60);
  const int ss = static_cast<int>(total_s % 60);

  char buf[40];
  if (ms != 0) {
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03lldZ",
                  static_cast<long long>(y), m, d, hh, mm, ss, static_cast<long long>(ms));
  } else {
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<long long>(y), m, d, hh, mm, ss);
  }
  return buf;
}

}  // namespace schedcast::schedule
