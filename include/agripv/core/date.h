#pragma once
#include <cstdint>
#include <string>

namespace agripv {

// Calendar day, stored as days since 1970-01-01 (proleptic Gregorian).
class Date {
 public:
  // Throws std::invalid_argument for impossible dates (2023-02-29, month 13, ...).
  static Date from_ymd(int year, int month, int day);
  static Date parse_iso_ymd(const std::string& iso);

  // "MM-DD" placed in the given year, e.g. parse_month_day(2024, "03-15").
  static Date parse_month_day(int year, const std::string& mm_dd);

  static bool is_leap_year(int year);
  static int days_in_month(int year, int month);

  Date() = default;
  explicit Date(std::int64_t days_since_epoch) : days_(days_since_epoch) {}

  std::int64_t days_since_epoch() const { return days_; }
  Date add_days(std::int64_t delta) const { return Date(days_ + delta); }

  struct YMD {
    int year;
    int month;
    int day;
  };

  YMD to_ymd() const;
  int year() const { return to_ymd().year; }
  int month() const { return to_ymd().month; }
  std::string to_string() const;

  friend bool operator==(Date a, Date b) { return a.days_ == b.days_; }
  friend bool operator!=(Date a, Date b) { return a.days_ != b.days_; }
  friend bool operator<(Date a, Date b) { return a.days_ < b.days_; }
  friend bool operator<=(Date a, Date b) { return a.days_ <= b.days_; }
  friend bool operator>(Date a, Date b) { return a.days_ > b.days_; }
  friend bool operator>=(Date a, Date b) { return a.days_ >= b.days_; }

  // Whole days from b to a.
  friend std::int64_t operator-(Date a, Date b) { return a.days_ - b.days_; }

 private:
  std::int64_t days_{0};
};

} // namespace agripv
