#include "date.hpp"
#include <stdexcept>
#include <cstdio>

namespace {

// Howard Hinnant's civil calendar algorithms.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(y + (month <= 2));
}

unsigned last_day_of_month(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

} // namespace

Date::Date(int year, unsigned month, unsigned day) {
    if (month < 1 || month > 12 || day < 1 || day > last_day_of_month(year, month)) {
        throw std::invalid_argument("Invalid calendar date");
    }
    days_ = days_from_civil(year, month, day);
}

Date Date::from_days(int64_t days) {
    Date d;
    d.days_ = days;
    return d;
}

std::optional<Date> Date::try_parse(const std::string& iso) {
    int y = 0;
    unsigned m = 0, d = 0;
    char tail = 0;
    if (iso.size() != 10 || std::sscanf(iso.c_str(), "%4d-%2u-%2u%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > last_day_of_month(y, m)) {
        return std::nullopt;
    }
    return Date(y, m, d);
}

Date Date::parse(const std::string& iso) {
    auto d = try_parse(iso);
    if (!d) {
        throw std::invalid_argument("Invalid date '" + iso + "', expected YYYY-MM-DD");
    }
    return *d;
}

Date Date::from_time_point(std::chrono::system_clock::time_point tp, int utc_offset_minutes) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    secs += static_cast<int64_t>(utc_offset_minutes) * 60;
    int64_t days = secs / 86400;
    if (secs % 86400 < 0) days -= 1;
    return from_days(days);
}

int Date::year() const {
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return y;
}

unsigned Date::month() const {
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return m;
}

unsigned Date::day() const {
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    return d;
}

Weekday Date::weekday() const {
    // 1970-01-01 was a Thursday
    int64_t w = (days_ + 4) % 7;
    if (w < 0) w += 7;
    return static_cast<Weekday>(w);
}

bool Date::is_weekend() const {
    auto w = weekday();
    return w == Weekday::Saturday || w == Weekday::Sunday;
}

std::chrono::system_clock::time_point Date::to_time_point() const {
    return std::chrono::system_clock::time_point(std::chrono::seconds(days_ * 86400));
}

std::string Date::to_string() const {
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
    return buf;
}

Date Date::add_months(int n) const {
    int y; unsigned m, d;
    civil_from_days(days_, y, m, d);
    int total = y * 12 + static_cast<int>(m) - 1 + n;
    int ny = total / 12;
    unsigned nm = static_cast<unsigned>(total % 12) + 1;
    unsigned nd = d > last_day_of_month(ny, nm) ? last_day_of_month(ny, nm) : d;
    return Date(ny, nm, nd);
}
