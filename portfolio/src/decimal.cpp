#include "decimal.hpp"
#include <stdexcept>
#include <limits>
#include <cctype>

namespace {

using wide = __int128;

constexpr int64_t kPow10[] = {
    1, 10, 100, 1000, 10000, 100000, 1000000, 10000000, 100000000
};

int64_t narrow(wide value) {
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(value);
}

// Integer division rounding half away from zero.
wide div_round(wide num, wide den) {
    wide q = num / den;
    wide r = num % den;
    if (r < 0) r = -r;
    wide d = den < 0 ? -den : den;
    if (r * 2 >= d) {
        q += ((num < 0) != (den < 0)) ? -1 : 1;
    }
    return q;
}

} // namespace

Decimal::Decimal(int value) : raw_(static_cast<int64_t>(value) * kOne) {}

Decimal::Decimal(int64_t value) : raw_(narrow(static_cast<wide>(value) * kOne)) {}

Decimal Decimal::from_raw(int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
}

bool Decimal::try_parse(const std::string& text, Decimal& out) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) i++;
    size_t end = text.size();
    while (end > i && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    if (i == end) return false;

    bool negative = false;
    if (text[i] == '-' || text[i] == '+') {
        negative = text[i] == '-';
        i++;
    }

    wide int_part = 0;
    wide frac_part = 0;
    int frac_digits = 0;
    bool seen_digit = false;
    bool seen_dot = false;
    bool round_up = false;

    for (; i < end; i++) {
        char c = text[i];
        if (c == '.') {
            if (seen_dot) return false;
            seen_dot = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        seen_digit = true;
        int digit = c - '0';
        if (!seen_dot) {
            int_part = int_part * 10 + digit;
            if (int_part > std::numeric_limits<int64_t>::max() / kOne) return false;
        } else if (frac_digits < kScale) {
            frac_part = frac_part * 10 + digit;
            frac_digits++;
        } else if (frac_digits == kScale) {
            // first dropped digit decides rounding
            round_up = digit >= 5;
            frac_digits++;
        }
    }
    if (!seen_digit) return false;

    int kept = frac_digits > kScale ? kScale : frac_digits;
    wide raw = int_part * kOne + frac_part * kPow10[kScale - kept];
    if (round_up) raw += 1;
    if (negative) raw = -raw;
    if (raw > std::numeric_limits<int64_t>::max() || raw < std::numeric_limits<int64_t>::min()) {
        return false;
    }
    out.raw_ = static_cast<int64_t>(raw);
    return true;
}

Decimal Decimal::parse(const std::string& text) {
    Decimal out;
    if (!try_parse(text, out)) {
        throw std::invalid_argument("Invalid decimal: '" + text + "'");
    }
    return out;
}

Decimal Decimal::abs() const {
    return raw_ < 0 ? from_raw(narrow(-static_cast<wide>(raw_))) : *this;
}

Decimal Decimal::round(int places) const {
    if (places >= kScale) return *this;
    if (places < 0) places = 0;
    int64_t unit = kPow10[kScale - places];
    wide q = div_round(raw_, unit);
    return from_raw(narrow(q * unit));
}

std::string Decimal::to_string(int places) const {
    if (places > kScale) places = kScale;
    if (places < 0) places = 0;
    Decimal rounded = round(places);
    wide v = rounded.raw_;
    bool negative = v < 0;
    if (negative) v = -v;

    int64_t int_part = static_cast<int64_t>(v / kOne);
    int64_t frac = static_cast<int64_t>(v % kOne);

    std::string out = negative ? "-" : "";
    out += std::to_string(int_part);
    if (places > 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, kScale - digits.size(), '0');
        out += "." + digits.substr(0, places);
    }
    return out;
}

std::string Decimal::to_string() const {
    std::string s = to_string(kScale);
    auto dot = s.find('.');
    if (dot == std::string::npos) return s;
    size_t last = s.find_last_not_of('0');
    if (last == dot) return s.substr(0, dot);
    return s.substr(0, last + 1);
}

double Decimal::to_double() const {
    return static_cast<double>(raw_) / static_cast<double>(kOne);
}

Decimal Decimal::operator+(const Decimal& other) const {
    return from_raw(narrow(static_cast<wide>(raw_) + other.raw_));
}

Decimal Decimal::operator-(const Decimal& other) const {
    return from_raw(narrow(static_cast<wide>(raw_) - other.raw_));
}

Decimal Decimal::operator*(const Decimal& other) const {
    wide product = static_cast<wide>(raw_) * other.raw_;
    return from_raw(narrow(div_round(product, kOne)));
}

Decimal Decimal::operator/(const Decimal& other) const {
    if (other.raw_ == 0) {
        throw std::domain_error("Decimal division by zero");
    }
    wide num = static_cast<wide>(raw_) * kOne;
    return from_raw(narrow(div_round(num, other.raw_)));
}

Decimal Decimal::operator-() const {
    return from_raw(narrow(-static_cast<wide>(raw_)));
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}
