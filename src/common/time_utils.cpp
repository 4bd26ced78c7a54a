#include "common/time_utils.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace formation {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// 公历日期 -> 距 1970-01-01 的天数（proleptic Gregorian）
std::int64_t DaysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void CivilFromDays(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool ReadDigits(const std::string& s, std::size_t pos, std::size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

std::int64_t FloorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

} // namespace

std::optional<EpochSeconds> ParseIsoTimestamp(const std::string& text) {
  // 去掉首尾空白
  std::size_t b = 0, e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  const std::string s = text.substr(b, e - b);

  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ReadDigits(s, 0, 4, year) || s.size() < 16) return std::nullopt;
  if (s[4] != '-' || !ReadDigits(s, 5, 2, month)) return std::nullopt;
  if (s[7] != '-' || !ReadDigits(s, 8, 2, day)) return std::nullopt;
  if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return std::nullopt;
  if (!ReadDigits(s, 11, 2, hour)) return std::nullopt;
  if (s[13] != ':' || !ReadDigits(s, 14, 2, minute)) return std::nullopt;

  std::size_t pos = 16;
  if (pos < s.size() && s[pos] == ':') {
    if (!ReadDigits(s, pos + 1, 2, second)) return std::nullopt;
    pos += 3;
    // 小数秒直接丢弃
    if (pos < s.size() && s[pos] == '.') {
      ++pos;
      const std::size_t frac_begin = pos;
      while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
      if (pos == frac_begin) return std::nullopt;
    }
  }

  if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
  if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

  int offset_s = 0;
  if (pos < s.size()) {
    const char c = s[pos];
    if ((c == 'Z' || c == 'z') && pos + 1 == s.size()) {
      pos += 1;
    } else if (c == '+' || c == '-') {
      int oh = 0, om = 0;
      if (!ReadDigits(s, pos + 1, 2, oh)) return std::nullopt;
      std::size_t mpos = pos + 3;
      if (mpos < s.size() && s[mpos] == ':') ++mpos;
      if (!ReadDigits(s, mpos, 2, om)) return std::nullopt;
      if (mpos + 2 != s.size() || oh > 23 || om > 59) return std::nullopt;
      offset_s = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
      pos = s.size();
    } else {
      return std::nullopt;
    }
  }

  const std::int64_t days = DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t local = days * kSecondsPerDay + hour * 3600 + minute * 60 + second;
  return static_cast<EpochSeconds>(local - offset_s);
}

std::string FormatIsoTimestamp(EpochSeconds t) {
  const std::int64_t days = FloorDiv(t, kSecondsPerDay);
  const std::int64_t sod = t - days * kSecondsPerDay;

  std::int64_t y = 0;
  unsigned m = 0, d = 0;
  CivilFromDays(days, y, m, d);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                static_cast<long long>(y), m, d,
                static_cast<int>(sod / 3600), static_cast<int>((sod % 3600) / 60), static_cast<int>(sod % 60));
  return buf;
}

int MinutesOfDay(EpochSeconds t) {
  const std::int64_t days = FloorDiv(t, kSecondsPerDay);
  const std::int64_t sod = t - days * kSecondsPerDay;
  return static_cast<int>(sod / 60);
}

int CircularMinuteGap(int minutes_a, int minutes_b) {
  const int diff = std::abs(minutes_a - minutes_b) % 1440;
  return diff < 1440 - diff ? diff : 1440 - diff;
}

} // namespace formation
