// =============================================================================
// math.cpp - Checked Fixed-Point Arithmetic and Error Classification
// =============================================================================

#include "tenex/math.hpp"
#include <algorithm>

namespace tenex {

// =============================================================================
// Checked Operations
// =============================================================================

namespace fp {

U128 add(U128 a, U128 b) {
    U128 r = a + b;
    if (r < a) {
        throw MathError(errors::MATH_OVERFLOW, "fp::add overflow");
    }
    return r;
}

U128 sub(U128 a, U128 b) {
    if (b > a) {
        throw MathError(errors::MATH_UNDERFLOW, "fp::sub underflow");
    }
    return a - b;
}

U128 mul(U128 a, U128 b) {
    if (a == 0 || b == 0) return 0;
    U128 r = a * b;
    if (r / a != b) {
        throw MathError(errors::MATH_OVERFLOW, "fp::mul overflow");
    }
    return r;
}

U128 div(U128 a, U128 b) {
    if (b == 0) {
        throw MathError(errors::DIVISION_BY_ZERO, "fp::div by zero");
    }
    return a / b;
}

U128 mul_div(U128 a, U128 b, U128 c) {
    return div(mul(a, b), c);
}

I128 diff(U128 a, U128 b) {
    if (a >= b) return static_cast<I128>(a - b);
    return -static_cast<I128>(b - a);
}

} // namespace fp

// =============================================================================
// Decimal Formatting
// =============================================================================

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string(I128 value) {
    if (value < 0) {
        return "-" + to_string(static_cast<U128>(-(value + 1)) + 1);
    }
    return to_string(static_cast<U128>(value));
}

std::optional<U128> parse_u128(std::string_view text) {
    if (text.empty()) return std::nullopt;
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (~U128(0) - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

std::string format_units(U128 value, unsigned decimals) {
    std::string digits = to_string(value);
    if (decimals == 0) return digits;
    if (digits.size() <= decimals) {
        digits.insert(0, decimals - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - decimals, 1, '.');
    while (digits.back() == '0') digits.pop_back();
    if (digits.back() == '.') digits.pop_back();
    return digits;
}

// =============================================================================
// Error Classification
// =============================================================================

ErrorKind error_kind(int32_t code) {
    if (code == errors::OK) return ErrorKind::NONE;
    if (code <= -70) return ErrorKind::ARITHMETIC;
    if (code <= -60) return ErrorKind::ADMISSION;
    if (code <= -50) return ErrorKind::INVARIANT_BREACH;
    if (code <= -40) return ErrorKind::SLIPPAGE_VIOLATION;
    if (code <= -30) return ErrorKind::EXTERNAL_CALL_FAILURE;
    if (code <= -20) return ErrorKind::RESOURCE_EXHAUSTION;
    return ErrorKind::VALIDATION;
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::AMOUNT_ZERO: return "AMOUNT_ZERO";
        case errors::AMOUNT_TOO_SMALL: return "AMOUNT_TOO_SMALL";
        case errors::INVALID_LEVERAGE: return "INVALID_LEVERAGE";
        case errors::POSITION_EXISTS: return "POSITION_EXISTS";
        case errors::POSITION_NOT_FOUND: return "POSITION_NOT_FOUND";
        case errors::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case errors::INVALID_SLIPPAGE: return "INVALID_SLIPPAGE";
        case errors::INVALID_PARAMETER: return "INVALID_PARAMETER";
        case errors::INVALID_DISTRIBUTION: return "INVALID_DISTRIBUTION";
        case errors::INVALID_JUSTIFICATION: return "INVALID_JUSTIFICATION";
        case errors::INVALID_CONTENT_HASH: return "INVALID_CONTENT_HASH";
        case errors::NOT_LIQUIDATABLE: return "NOT_LIQUIDATABLE";
        case errors::NO_REWARDS: return "NO_REWARDS";
        case errors::NO_VESTING_SCHEDULES: return "NO_VESTING_SCHEDULES";
        case errors::PAIR_INACTIVE: return "PAIR_INACTIVE";
        case errors::BUYBACK_NOT_READY: return "BUYBACK_NOT_READY";
        case errors::INVALID_PRICE: return "INVALID_PRICE";
        case errors::INSUFFICIENT_LIQUIDITY: return "INSUFFICIENT_LIQUIDITY";
        case errors::UTILIZATION_EXCEEDED: return "UTILIZATION_EXCEEDED";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::STAKE_FAILED: return "STAKE_FAILED";
        case errors::UNSTAKE_FAILED: return "UNSTAKE_FAILED";
        case errors::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case errors::ZERO_PROCEEDS: return "ZERO_PROCEEDS";
        case errors::COMPENSATION_FAILED: return "COMPENSATION_FAILED";
        case errors::SLIPPAGE_TOO_HIGH: return "SLIPPAGE_TOO_HIGH";
        case errors::INSUFFICIENT_PROCEEDS: return "INSUFFICIENT_PROCEEDS";
        case errors::PAUSED: return "PAUSED";
        case errors::CIRCUIT_BREAKER: return "CIRCUIT_BREAKER";
        case errors::RATE_LIMITED: return "RATE_LIMITED";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::REENTRANCY: return "REENTRANCY";
        case errors::MATH_OVERFLOW: return "MATH_OVERFLOW";
        case errors::MATH_UNDERFLOW: return "MATH_UNDERFLOW";
        case errors::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        default: return "UNKNOWN";
    }
}

} // namespace tenex
