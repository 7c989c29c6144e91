#ifndef TENEX_MATH_HPP
#define TENEX_MATH_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <optional>

#include "types.hpp"

namespace tenex {

// =============================================================================
// MathError - raised by checked fixed-point operations
// =============================================================================

class MathError : public std::runtime_error {
public:
    MathError(int32_t code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// =============================================================================
// Checked Fixed-Point Arithmetic
// =============================================================================
//
// Every monetary quantity goes through these helpers. None of them wraps:
// overflow, underflow and division by zero throw MathError.

namespace fp {

U128 add(U128 a, U128 b);
U128 sub(U128 a, U128 b);
U128 mul(U128 a, U128 b);
U128 div(U128 a, U128 b);

// a * b / c with the intermediate product checked
U128 mul_div(U128 a, U128 b, U128 c);

// a - b, or 0 when b > a
inline U128 sub_or_zero(U128 a, U128 b) {
    return a > b ? a - b : 0;
}

// value * rate / PRECISION
inline U128 apply_rate(U128 value, FixedPoint rate) {
    return mul_div(value, rate, PRECISION);
}

inline U128 min(U128 a, U128 b) { return a < b ? a : b; }
inline U128 max(U128 a, U128 b) { return a > b ? a : b; }

// Signed difference of two unsigned amounts
I128 diff(U128 a, U128 b);

} // namespace fp

// =============================================================================
// Unit Conversion (macro = 18 decimals, micro = 9 decimals)
// =============================================================================

inline Amount to_micro(Amount macro) {
    return macro / MICRO_PER_MACRO;
}

inline Amount to_macro(Amount micro) {
    return fp::mul(micro, MICRO_PER_MACRO);
}

// Whole tokens in macro units (test and config helper)
inline Amount tokens(uint64_t n) {
    return fp::mul(static_cast<U128>(n), ONE_TOKEN);
}

// =============================================================================
// Decimal Formatting
// =============================================================================

std::string to_string(U128 value);
std::string to_string(I128 value);

// Parse a non-negative decimal integer; nullopt on junk or overflow
std::optional<U128> parse_u128(std::string_view text);

// "12.345" style rendering of a fixed-point value with the given decimals
std::string format_units(U128 value, unsigned decimals);

} // namespace tenex

#endif // TENEX_MATH_HPP
