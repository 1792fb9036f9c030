#pragma once

#include <cstdint>
#include <string>
#include <ostream>

// Fixed-point decimal with 8 fractional digits. Add/subtract are exact,
// multiply/divide round half away from zero.
class Decimal {
public:
    static constexpr int kScale = 8;
    static constexpr int64_t kOne = 100000000;

    Decimal() = default;
    Decimal(int value);
    Decimal(int64_t value);

    static Decimal from_raw(int64_t raw);
    static Decimal parse(const std::string& text);
    static bool try_parse(const std::string& text, Decimal& out);

    int64_t raw() const { return raw_; }

    bool is_zero() const { return raw_ == 0; }
    bool is_negative() const { return raw_ < 0; }
    bool is_positive() const { return raw_ > 0; }

    Decimal abs() const;
    Decimal round(int places) const;

    // Plain notation, trailing zeros trimmed ("110", "0.5", "-12.3456").
    std::string to_string() const;
    std::string to_string(int places) const;
    double to_double() const;

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;
    Decimal operator/(const Decimal& other) const;
    Decimal operator-() const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    int64_t raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);
