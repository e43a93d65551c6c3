#include "common/decimal.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace pmm {

namespace {

using Raw = Decimal::Raw;
using u128 = unsigned __int128;

constexpr Raw  kMaxRaw       = static_cast<Raw>(~static_cast<u128>(0) >> 1);
constexpr u128 kLow64        = std::numeric_limits<uint64_t>::max();
constexpr int  kMaxRawDigits = 39;
constexpr int  kMaxExponent  = 4096;

[[noreturn]] void overflow(const char* op) {
    throw std::overflow_error(std::string("Decimal overflow in ") + op);
}

u128 magnitude(Raw raw) {
    return raw < 0 ? 0 - static_cast<u128>(raw) : static_cast<u128>(raw);
}

// 256-bit unsigned product, high and low halves
struct Wide {
    u128 hi = 0;
    u128 lo = 0;
};

Wide mul_wide(u128 a, u128 b) {
    u128 a0 = a & kLow64, a1 = a >> 64;
    u128 b0 = b & kLow64, b1 = b >> 64;

    u128 p00 = a0 * b0;
    u128 p01 = a0 * b1;
    u128 p10 = a1 * b0;
    u128 p11 = a1 * b1;

    u128 mid = (p00 >> 64) + (p01 & kLow64) + (p10 & kLow64);

    Wide r;
    r.lo = (mid << 64) | (p00 & kLow64);
    r.hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);
    return r;
}

// n / d with 0 < d < 2^127
Wide div_wide(Wide n, u128 d, u128& rem) {
    if (n.hi == 0) {
        rem = n.lo % d;
        return Wide{0, n.lo / d};
    }

    Wide q;
    u128 r = 0;
    for (int i = 255; i >= 0; --i) {
        u128 bit = (i >= 128) ? (n.hi >> (i - 128)) & 1 : (n.lo >> i) & 1;
        r = (r << 1) | bit;
        if (r >= d) {
            r -= d;
            if (i >= 128) q.hi |= static_cast<u128>(1) << (i - 128);
            else          q.lo |= static_cast<u128>(1) << i;
        }
    }
    rem = r;
    return q;
}

// a * b / d, rounded half away from zero or truncated toward zero
Raw mul_div(Raw a, Raw b, Raw d, bool round_half, const char* op) {
    bool negative = (a < 0) != (b < 0);
    if (d < 0) negative = !negative;

    u128 divisor = magnitude(d);
    u128 rem = 0;
    Wide q = div_wide(mul_wide(magnitude(a), magnitude(b)), divisor, rem);
    if (q.hi != 0 || q.lo > static_cast<u128>(kMaxRaw)) overflow(op);

    u128 mag = q.lo;
    if (round_half && rem >= divisor - rem) {
        ++mag;
        if (mag > static_cast<u128>(kMaxRaw)) overflow(op);
    }

    Raw v = static_cast<Raw>(mag);
    return negative ? -v : v;
}

Raw round_half_away(Raw n, Raw d) {
    // d > 0
    Raw q = n / d;
    Raw r = n % d;
    if (r < 0) r = -r;
    if (r * 2 >= d) q += (n < 0) ? -1 : 1;
    return q;
}

Raw pow10(int exp) {
    Raw v = 1;
    for (int i = 0; i < exp; ++i) v *= 10;
    return v;
}

std::string whole_digits(u128 v) {
    if (v == 0) return "0";
    std::string s;
    while (v > 0) {
        s.insert(s.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    return s;
}

std::string frac_digits(uint64_t frac) {
    std::string s(Decimal::kScaleDigits, '0');
    for (int i = Decimal::kScaleDigits - 1; i >= 0 && frac > 0; --i) {
        s[i] = static_cast<char>('0' + frac % 10);
        frac /= 10;
    }
    return s;
}

} // anonymous namespace

Decimal Decimal::from_raw(Raw raw) {
    if (raw < -kMaxRaw) overflow("negation");
    Decimal d;
    d.raw_ = raw;
    return d;
}

std::optional<Decimal> Decimal::parse(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    size_t end = text.size();
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    bool negative = false;
    if (pos < end && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    int int_digits = 0;
    while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        digits += text[pos++];
        ++int_digits;
    }
    if (pos < end && text[pos] == '.') {
        ++pos;
        while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            digits += text[pos++];
        }
    }
    if (digits.empty()) return std::nullopt;

    int exponent = 0;
    if (pos < end && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exp_negative = false;
        if (pos < end && (text[pos] == '+' || text[pos] == '-')) {
            exp_negative = text[pos] == '-';
            ++pos;
        }
        if (pos >= end || !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            return std::nullopt;
        }
        while (pos < end && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (exponent < kMaxExponent) exponent = exponent * 10 + (text[pos] - '0');
            ++pos;
        }
        if (exp_negative) exponent = -exponent;
    }
    if (pos != end) return std::nullopt;

    // Strip leading zeros so the digit budget below only counts significant digits
    size_t first = digits.find_first_not_of('0');
    if (first == std::string::npos) return Decimal{};
    int point = int_digits - static_cast<int>(first) + exponent;
    digits.erase(0, first);

    // Digits at indexes [0, keep) land at or above the 1e-18 place.
    int keep = point + kScaleDigits;
    if (keep > kMaxRawDigits) return std::nullopt;

    const u128 max = static_cast<u128>(kMaxRaw);
    u128 raw = 0;
    for (int i = 0; i < keep; ++i) {
        unsigned d = (i < static_cast<int>(digits.size())) ? static_cast<unsigned>(digits[i] - '0') : 0;
        if (raw > (max - d) / 10) return std::nullopt;
        raw = raw * 10 + d;
    }
    if (keep >= 0 && keep < static_cast<int>(digits.size()) && digits[keep] >= '5') {
        if (raw == max) return std::nullopt;
        raw += 1;
    }

    Raw value = static_cast<Raw>(raw);
    return from_raw(negative ? -value : value);
}

std::optional<Decimal> Decimal::from_double(double value) {
    if (!std::isfinite(value)) return std::nullopt;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    return parse(buf);
}

Decimal Decimal::div_down(Decimal a, Decimal b) {
    if (b.raw_ == 0) throw std::domain_error("Decimal division by zero");
    return from_raw(mul_div(a.raw_, kScale, b.raw_, false, "division"));
}

double Decimal::to_double() const {
    Raw whole = raw_ / kScale;
    auto frac = static_cast<int64_t>(raw_ % kScale);
    return static_cast<double>(whole) + static_cast<double>(frac) / static_cast<double>(kScale);
}

Decimal Decimal::rounded(int places) const {
    if (places >= kScaleDigits) return *this;
    if (places < 0) places = 0;
    Raw factor = pow10(kScaleDigits - places);
    Raw out = 0;
    if (__builtin_mul_overflow(round_half_away(raw_, factor), factor, &out)) overflow("rounding");
    return from_raw(out);
}

std::string Decimal::to_string() const {
    u128 abs = magnitude(raw_);
    std::string s = (raw_ < 0) ? "-" : "";
    s += whole_digits(abs / static_cast<u128>(kScale));
    auto frac = static_cast<uint64_t>(abs % static_cast<u128>(kScale));
    if (frac != 0) {
        std::string f = frac_digits(frac);
        f.erase(f.find_last_not_of('0') + 1);
        s += "." + f;
    }
    return s;
}

std::string Decimal::to_string(int places) const {
    if (places < 0) places = 0;
    if (places > kScaleDigits) places = kScaleDigits;
    Decimal r = rounded(places);
    u128 abs = magnitude(r.raw_);
    std::string s = (r.raw_ < 0) ? "-" : "";
    s += whole_digits(abs / static_cast<u128>(kScale));
    if (places > 0) {
        auto frac = static_cast<uint64_t>(abs % static_cast<u128>(kScale));
        s += "." + frac_digits(frac).substr(0, places);
    }
    return s;
}

Decimal operator+(Decimal a, Decimal b) {
    Raw out = 0;
    if (__builtin_add_overflow(a.raw_, b.raw_, &out)) overflow("addition");
    return Decimal::from_raw(out);
}

Decimal operator-(Decimal a, Decimal b) {
    Raw out = 0;
    if (__builtin_sub_overflow(a.raw_, b.raw_, &out)) overflow("subtraction");
    return Decimal::from_raw(out);
}

Decimal operator*(Decimal a, Decimal b) {
    return Decimal::from_raw(mul_div(a.raw_, b.raw_, Decimal::kScale, true, "multiplication"));
}

Decimal operator/(Decimal a, Decimal b) {
    if (b.raw_ == 0) throw std::domain_error("Decimal division by zero");
    return Decimal::from_raw(mul_div(a.raw_, Decimal::kScale, b.raw_, true, "division"));
}

std::ostream& operator<<(std::ostream& os, Decimal d) {
    return os << d.to_string();
}

Decimal dec(std::string_view text) {
    auto d = Decimal::parse(text);
    if (!d) throw std::invalid_argument("invalid decimal literal: " + std::string(text));
    return *d;
}

} // namespace pmm
