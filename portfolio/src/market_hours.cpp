#include "market_hours.hpp"

namespace {

Date nth_sunday(int year, unsigned month, int n) {
    Date first(year, month, 1);
    int offset = (7 - static_cast<int>(first.weekday())) % 7;
    return first + offset + (n - 1) * 7;
}

} // namespace

MarketCalendar::MarketCalendar() {
    // NYSE full-day closures
    holidays_ = {
        Date(2025, 1, 1), Date(2025, 1, 20), Date(2025, 2, 17), Date(2025, 4, 18),
        Date(2025, 5, 26), Date(2025, 6, 19), Date(2025, 7, 4), Date(2025, 9, 1),
        Date(2025, 11, 27), Date(2025, 12, 25),

        Date(2026, 1, 1), Date(2026, 1, 19), Date(2026, 2, 16), Date(2026, 4, 3),
        Date(2026, 5, 25), Date(2026, 6, 19), Date(2026, 7, 3), Date(2026, 9, 7),
        Date(2026, 11, 26), Date(2026, 12, 25),

        Date(2027, 1, 1), Date(2027, 1, 18), Date(2027, 2, 15), Date(2027, 3, 26),
        Date(2027, 5, 31), Date(2027, 6, 18), Date(2027, 7, 5), Date(2027, 9, 6),
        Date(2027, 11, 25), Date(2027, 12, 24),
    };
}

bool MarketCalendar::is_holiday(const Date& date) const {
    return holidays_.count(date) > 0;
}

bool MarketCalendar::is_trading_day(const Date& date) const {
    return !date.is_weekend() && !is_holiday(date);
}

Date MarketCalendar::previous_trading_day(const Date& date) const {
    Date d = date - 1;
    while (!is_trading_day(d)) d = d - 1;
    return d;
}

Date MarketCalendar::next_trading_day(const Date& date) const {
    Date d = date;
    while (!is_trading_day(d)) d = d + 1;
    return d;
}

Date MarketCalendar::most_recent_trading_day(const Date& date) const {
    return is_trading_day(date) ? date : previous_trading_day(date);
}

int MarketCalendar::eastern_offset_minutes(time_point tp) {
    int year = Date::from_time_point(tp).year();
    // DST: second Sunday of March 07:00 UTC until first Sunday of November 06:00 UTC
    auto dst_start = nth_sunday(year, 3, 2).to_time_point() + std::chrono::hours(7);
    auto dst_end = nth_sunday(year, 11, 1).to_time_point() + std::chrono::hours(6);
    bool dst = tp >= dst_start && tp < dst_end;
    return dst ? -4 * 60 : -5 * 60;
}

bool MarketCalendar::is_crypto(const std::string& symbol) {
    const std::string suffix = "-USD";
    return symbol.size() > suffix.size() &&
           symbol.compare(symbol.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Date MarketCalendar::trading_date(time_point tp) const {
    return Date::from_time_point(tp, eastern_offset_minutes(tp));
}

int MarketCalendar::eastern_minute_of_day(time_point tp) const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    secs += static_cast<int64_t>(eastern_offset_minutes(tp)) * 60;
    int64_t sec_of_day = secs % 86400;
    if (sec_of_day < 0) sec_of_day += 86400;
    return static_cast<int>(sec_of_day / 60);
}

MarketCalendar::time_point MarketCalendar::eastern_wall_to_utc(const Date& date, int minute_of_day) const {
    // Session times are far from the 02:00 transition, so the offset at noon is exact.
    auto noon_utc = date.to_time_point() + std::chrono::hours(17);
    int offset = eastern_offset_minutes(noon_utc);
    return date.to_time_point() + std::chrono::minutes(minute_of_day - offset);
}

MarketCalendar::time_point MarketCalendar::session_open(const Date& date) const {
    return eastern_wall_to_utc(date, kOpenMinute);
}

MarketCalendar::time_point MarketCalendar::session_close(const Date& date) const {
    return eastern_wall_to_utc(date, kCloseMinute);
}

bool MarketCalendar::is_open(time_point tp) const {
    Date d = trading_date(tp);
    if (!is_trading_day(d)) return false;
    int minute = eastern_minute_of_day(tp);
    return minute >= kOpenMinute && minute < kCloseMinute;
}

bool MarketCalendar::is_open_for(const std::string& symbol, time_point tp) const {
    return is_crypto(symbol) || is_open(tp);
}

MarketCalendar::time_point MarketCalendar::last_close(time_point tp) const {
    Date d = trading_date(tp);
    if (is_trading_day(d) && tp >= session_close(d)) {
        return session_close(d);
    }
    return session_close(previous_trading_day(d));
}

MarketCalendar::time_point MarketCalendar::next_open(time_point tp) const {
    Date d = trading_date(tp);
    if (is_trading_day(d) && tp < session_open(d)) {
        return session_open(d);
    }
    return session_open(next_trading_day(d + 1));
}
