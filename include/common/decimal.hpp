#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pmm {

/// Fixed-point decimal with 18 fractional digits stored in a signed 128-bit integer.
/// 1.5 is stored as 1'500'000'000'000'000'000. Representable magnitude is about 1.7e20.
///
/// Addition and subtraction are exact. Multiplication and division round half away
/// from zero to the 18th fractional digit, with 256-bit intermediates, so a spread of
/// a few millionths applied to a price of a few millionths keeps every digit.
/// Results outside the representable range throw std::overflow_error.
class Decimal {
public:
    using Raw = __int128;

    static constexpr int kScaleDigits = 18;
    static constexpr Raw kScale       = 1'000'000'000'000'000'000;

    constexpr Decimal() = default;
    // |units| * 1e18 always fits the 128-bit raw range
    constexpr explicit Decimal(int64_t units) : raw_(static_cast<Raw>(units) * kScale) {}

    // Throws std::overflow_error when raw is the one value with no negation.
    static Decimal from_raw(Raw raw);

    // Accepts [+-]digits[.digits][(e|E)[+-]digits]. Digits beyond the 18th
    // fractional place are rounded half away from zero. Returns nullopt on
    // malformed text or when the value does not fit.
    static std::optional<Decimal> parse(std::string_view text);

    // Converts through the 17-significant-digit decimal text of the double.
    // NaN, infinities and out-of-range values yield nullopt.
    static std::optional<Decimal> from_double(double value);

    // Quotient truncated toward zero. Throws std::domain_error on zero divisor.
    static Decimal div_down(Decimal a, Decimal b);

    Raw    raw() const { return raw_; }
    double to_double() const;

    bool is_zero() const { return raw_ == 0; }
    bool is_negative() const { return raw_ < 0; }
    Decimal abs() const { return from_raw(raw_ < 0 ? -raw_ : raw_); }

    // Rounded half away from zero to `places` fractional digits (0..18).
    Decimal rounded(int places) const;

    // Shortest form without trailing zeros, e.g. "0.000024", "3000", "-1.5".
    std::string to_string() const;
    // Fixed number of fractional digits, e.g. to_string(2) == "3000.00".
    std::string to_string(int places) const;

    Decimal operator-() const { return from_raw(-raw_); }

    Decimal& operator+=(Decimal o) { *this = *this + o; return *this; }
    Decimal& operator-=(Decimal o) { *this = *this - o; return *this; }
    Decimal& operator*=(Decimal o) { *this = *this * o; return *this; }
    Decimal& operator/=(Decimal o) { *this = *this / o; return *this; }

    friend Decimal operator+(Decimal a, Decimal b);
    friend Decimal operator-(Decimal a, Decimal b);
    friend Decimal operator*(Decimal a, Decimal b);
    // Throws std::domain_error on zero divisor.
    friend Decimal operator/(Decimal a, Decimal b);

    friend bool operator==(Decimal a, Decimal b) { return a.raw_ == b.raw_; }
    friend bool operator!=(Decimal a, Decimal b) { return a.raw_ != b.raw_; }
    friend bool operator<(Decimal a, Decimal b)  { return a.raw_ < b.raw_; }
    friend bool operator<=(Decimal a, Decimal b) { return a.raw_ <= b.raw_; }
    friend bool operator>(Decimal a, Decimal b)  { return a.raw_ > b.raw_; }
    friend bool operator>=(Decimal a, Decimal b) { return a.raw_ >= b.raw_; }

private:
    Raw raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, Decimal d);

// Shorthand for literals known to be well formed. Throws std::invalid_argument
// on malformed text.
Decimal dec(std::string_view text);

} // namespace pmm
