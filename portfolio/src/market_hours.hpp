#pragma once

#include "date.hpp"
#include <chrono>
#include <set>
#include <string>

// NYSE regular session calendar, expressed in America/New_York time.
class MarketCalendar {
public:
    using time_point = std::chrono::system_clock::time_point;

    MarketCalendar();

    static constexpr int kOpenMinute = 9 * 60 + 30;
    static constexpr int kCloseMinute = 16 * 60;

    bool is_holiday(const Date& date) const;
    bool is_trading_day(const Date& date) const;

    Date previous_trading_day(const Date& date) const;
    Date next_trading_day(const Date& date) const;      // on or after
    Date most_recent_trading_day(const Date& date) const; // on or before

    bool is_open(time_point tp) const;
    bool is_open_for(const std::string& symbol, time_point tp) const;

    // Eastern calendar date of an instant.
    Date trading_date(time_point tp) const;
    // Minutes past Eastern midnight.
    int eastern_minute_of_day(time_point tp) const;

    time_point session_open(const Date& date) const;
    time_point session_close(const Date& date) const;
    time_point last_close(time_point tp) const;
    time_point next_open(time_point tp) const;

    static int eastern_offset_minutes(time_point tp);
    static bool is_crypto(const std::string& symbol);

private:
    std::set<Date> holidays_;

    time_point eastern_wall_to_utc(const Date& date, int minute_of_day) const;
};
