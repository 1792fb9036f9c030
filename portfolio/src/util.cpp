#include "util.hpp"
#include "date.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& text) {
    if (text.size() < 19) return std::nullopt;
    auto date = Date::try_parse(text.substr(0, 10));
    if (!date) return std::nullopt;
    if (text[10] != 'T' && text[10] != ' ') return std::nullopt;
    if (text[13] != ':' || text[16] != ':') return std::nullopt;

    auto two_digits = [&](size_t pos) -> int {
        if (!std::isdigit(static_cast<unsigned char>(text[pos])) ||
            !std::isdigit(static_cast<unsigned char>(text[pos + 1]))) {
            return -1;
        }
        return (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    };
    int hh = two_digits(11);
    int mm = two_digits(14);
    int ss = two_digits(17);
    if (hh < 0 || hh > 23 || mm < 0 || mm > 59 || ss < 0 || ss > 60) return std::nullopt;

    int64_t micros = 0;
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                digits++;
            }
            pos++;
        }
        for (; digits < 6; digits++) micros *= 10;
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        char sign = text[pos];
        if (sign == 'Z') {
            pos++;
        } else if (sign == '+' || sign == '-') {
            if (pos + 3 > text.size()) return std::nullopt;
            int oh = two_digits(pos + 1);
            if (oh < 0) return std::nullopt;
            int om = 0;
            size_t next = pos + 3;
            if (next < text.size() && text[next] == ':') next++;
            if (next + 2 <= text.size()) {
                om = two_digits(next);
                if (om < 0) return std::nullopt;
                next += 2;
            }
            offset_minutes = (oh * 60 + om) * (sign == '-' ? -1 : 1);
            pos = next;
        }
        if (pos != text.size()) return std::nullopt;
    }

    auto tp = date->to_time_point() + std::chrono::hours(hh) + std::chrono::minutes(mm) +
              std::chrono::seconds(ss) + std::chrono::microseconds(micros) -
              std::chrono::minutes(offset_minutes);
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(tp);
}

int64_t current_timestamp_ms() {
    return to_epoch_ms(std::chrono::system_clock::now());
}

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::string trim(const std::string& str) {
    auto first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string redact_dsn(const std::string& dsn) {
    auto scheme = dsn.find("://");
    auto at = dsn.find('@');
    if (scheme == std::string::npos || at == std::string::npos || at < scheme) {
        // key=value form
        auto pw = dsn.find("password=");
        if (pw == std::string::npos) return dsn;
        auto end = dsn.find(' ', pw);
        return dsn.substr(0, pw) + "password=***" + (end == std::string::npos ? "" : dsn.substr(end));
    }
    auto colon = dsn.find(':', scheme + 3);
    if (colon == std::string::npos || colon > at) return dsn;
    return dsn.substr(0, colon + 1) + "***" + dsn.substr(at);
}

} // namespace util
