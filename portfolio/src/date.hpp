#pragma once

#include <cstdint>
#include <string>
#include <chrono>
#include <optional>
#include <functional>

enum class Weekday { Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

// Civil calendar date stored as days since 1970-01-01.
class Date {
public:
    Date() = default;
    Date(int year, unsigned month, unsigned day);

    static Date from_days(int64_t days);
    static Date parse(const std::string& iso);
    static std::optional<Date> try_parse(const std::string& iso);
    static Date from_time_point(std::chrono::system_clock::time_point tp, int utc_offset_minutes = 0);

    int64_t days() const { return days_; }
    int year() const;
    unsigned month() const;
    unsigned day() const;
    Weekday weekday() const;
    bool is_weekend() const;

    // Midnight UTC of this date.
    std::chrono::system_clock::time_point to_time_point() const;

    std::string to_string() const;

    Date add_days(int64_t n) const { return from_days(days_ + n); }
    Date add_months(int n) const;
    Date add_years(int n) const { return add_months(n * 12); }

    Date operator+(int64_t n) const { return add_days(n); }
    Date operator-(int64_t n) const { return add_days(-n); }
    int64_t operator-(const Date& other) const { return days_ - other.days_; }

    Date& operator++() { ++days_; return *this; }

    bool operator==(const Date& o) const { return days_ == o.days_; }
    bool operator!=(const Date& o) const { return days_ != o.days_; }
    bool operator<(const Date& o) const { return days_ < o.days_; }
    bool operator<=(const Date& o) const { return days_ <= o.days_; }
    bool operator>(const Date& o) const { return days_ > o.days_; }
    bool operator>=(const Date& o) const { return days_ >= o.days_; }

private:
    int64_t days_ = 0;
};

struct DateHash {
    size_t operator()(const Date& d) const { return std::hash<int64_t>()(d.days()); }
};
