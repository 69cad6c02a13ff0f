#include "agripv/core/date.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace agripv {
namespace {

// Civil calendar conversions after Howard Hinnant's public-domain date algorithms.
constexpr std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr Date::YMD civil_from_days(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp + (mp < 10 ? 3 : -9);
  return Date::YMD{static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d)};
}

int parse_digits(const std::string& s, std::size_t pos, std::size_t len, const std::string& whole) {
  int v = 0;
  for (std::size_t k = pos; k < pos + len; ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k]))) {
      throw std::invalid_argument("Invalid date, expected digits: " + whole);
    }
    v = v * 10 + (s[k] - '0');
  }
  return v;
}

} // namespace

bool Date::is_leap_year(int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int Date::days_in_month(int year, int month) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) throw std::invalid_argument("month out of range: " + std::to_string(month));
  if (month == 2 && is_leap_year(year)) return 29;
  return kDays[month - 1];
}

Date Date::from_ymd(int year, int month, int day) {
  const int dim = days_in_month(year, month);
  if (day < 1 || day > dim) {
    throw std::invalid_argument("day out of range: " + std::to_string(year) + "-" + std::to_string(month) + "-" +
                                std::to_string(day));
  }
  return Date(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)));
}

Date Date::parse_iso_ymd(const std::string& iso) {
  if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
    throw std::invalid_argument("Invalid date format, expected YYYY-MM-DD: " + iso);
  }
  return from_ymd(parse_digits(iso, 0, 4, iso), parse_digits(iso, 5, 2, iso), parse_digits(iso, 8, 2, iso));
}

Date Date::parse_month_day(int year, const std::string& mm_dd) {
  if (mm_dd.size() != 5 || mm_dd[2] != '-') {
    throw std::invalid_argument("Invalid month-day, expected MM-DD: " + mm_dd);
  }
  return from_ymd(year, parse_digits(mm_dd, 0, 2, mm_dd), parse_digits(mm_dd, 3, 2, mm_dd));
}

Date::YMD Date::to_ymd() const { return civil_from_days(days_); }

std::string Date::to_string() const {
  const auto ymd = to_ymd();
  std::ostringstream ss;
  ss << std::setfill('0') << std::setw(4) << ymd.year << '-' << std::setw(2) << ymd.month << '-' << std::setw(2)
     << ymd.day;
  return ss.str();
}

} // namespace agripv
