#ifndef TENEX_TYPES_HPP
#define TENEX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <cstring>
#include <vector>

namespace tenex {

// =============================================================================
// Identity Types
// =============================================================================

using Address = std::array<uint8_t, 20>;      // EVM caller address
using Hotkey = std::array<uint8_t, 32>;       // Validator hotkey (bytes32)
using ContentHash = std::array<uint8_t, 32>;  // Off-chain evidence digest

using Netuid = uint16_t;
using BlockHeight = uint64_t;

template <size_t N>
constexpr bool is_zero(const std::array<uint8_t, N>& bytes) {
    for (auto b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

// Hash for address-keyed tables
struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// Position key: (user, netuid)
struct PositionKey {
    Address user;
    Netuid netuid;

    bool operator==(const PositionKey& other) const {
        return user == other.user && netuid == other.netuid;
    }

    uint64_t hash() const {
        uint64_t h = netuid;
        for (auto b : user) h = h * 31 + b;
        return h;
    }
};

struct PositionKeyHash {
    size_t operator()(const PositionKey& k) const { return static_cast<size_t>(k.hash()); }
};

// =============================================================================
// Fixed-Point Representation (9 decimals)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

using Amount = U128;      // Token quantity (macro or micro units)
using FixedPoint = U128;  // Ratio scaled by PRECISION

constexpr U128 PRECISION = 1000000000ULL;          // 1e9 == 100%
constexpr U128 ACC_PRECISION = 1000000000000ULL;   // 1e12, reward accumulators
constexpr U128 MICRO_PER_MACRO = 1000000000ULL;    // 1e9 wei per rao
constexpr U128 ONE_TOKEN = PRECISION * MICRO_PER_MACRO;  // 1e18 (macro)

// Sentinel health ratio for positions without debt
constexpr U128 MAX_HEALTH_RATIO = ~U128(0);

// =============================================================================
// Protocol Constants
// =============================================================================

namespace limits {
constexpr U128 MAX_LEVERAGE_CAP = 20 * PRECISION;               // 20x
constexpr U128 MAX_LIQUIDATION_THRESHOLD = 2 * PRECISION;       // 200%
constexpr U128 MAX_BUFFER_RATIO = PRECISION / 2;                // 50%
constexpr uint64_t MAX_COOLDOWN_BLOCKS = 7200;
constexpr U128 MAX_TRADING_FEE = PRECISION / 100;               // 1%
constexpr U128 MAX_BORROWING_FEE = PRECISION / 1000;            // 0.1% per 360 blocks
constexpr U128 MAX_LIQUIDATION_FEE = PRECISION / 10;            // 10%
constexpr Amount MIN_COLLATERAL = ONE_TOKEN / 10;               // 0.1 token
constexpr Amount MIN_LIQUIDITY_DEPOSIT = ONE_TOKEN / 10;        // 0.1 token
constexpr size_t MAX_JUSTIFICATION_LENGTH = 1024;
constexpr uint64_t RATE_PERIOD_BLOCKS = 360;
constexpr U128 BUYBACK_RAMP_STEP = PRECISION / 10;              // +10% per missed interval
constexpr U128 BUYBACK_RAMP_CAP = PRECISION / 2;                // at most +50%
constexpr size_t NUM_TIERS = 6;
}

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t AMOUNT_ZERO = -1;
constexpr int32_t AMOUNT_TOO_SMALL = -2;
constexpr int32_t INVALID_LEVERAGE = -3;
constexpr int32_t POSITION_EXISTS = -4;
constexpr int32_t POSITION_NOT_FOUND = -5;
constexpr int32_t INVALID_AMOUNT = -6;
constexpr int32_t INVALID_SLIPPAGE = -7;
constexpr int32_t INVALID_PARAMETER = -8;
constexpr int32_t INVALID_DISTRIBUTION = -9;
constexpr int32_t INVALID_JUSTIFICATION = -10;
constexpr int32_t INVALID_CONTENT_HASH = -11;
constexpr int32_t NOT_LIQUIDATABLE = -12;
constexpr int32_t NO_REWARDS = -13;
constexpr int32_t NO_VESTING_SCHEDULES = -14;
constexpr int32_t PAIR_INACTIVE = -15;
constexpr int32_t BUYBACK_NOT_READY = -16;
constexpr int32_t INVALID_PRICE = -17;

// Resource exhaustion
constexpr int32_t INSUFFICIENT_LIQUIDITY = -20;
constexpr int32_t UTILIZATION_EXCEEDED = -21;
constexpr int32_t INSUFFICIENT_BALANCE = -22;

// External calls
constexpr int32_t STAKE_FAILED = -30;
constexpr int32_t UNSTAKE_FAILED = -31;
constexpr int32_t TRANSFER_FAILED = -32;
constexpr int32_t ZERO_PROCEEDS = -33;
constexpr int32_t COMPENSATION_FAILED = -34;  // reversal of an executed stake/unstake failed

// Slippage
constexpr int32_t SLIPPAGE_TOO_HIGH = -40;

// Invariant breach
constexpr int32_t INSUFFICIENT_PROCEEDS = -50;

// Admission control
constexpr int32_t PAUSED = -60;
constexpr int32_t CIRCUIT_BREAKER = -61;
constexpr int32_t RATE_LIMITED = -62;
constexpr int32_t UNAUTHORIZED = -63;
constexpr int32_t REENTRANCY = -64;

// Arithmetic
constexpr int32_t MATH_OVERFLOW = -70;
constexpr int32_t MATH_UNDERFLOW = -71;
constexpr int32_t DIVISION_BY_ZERO = -72;
}

enum class ErrorKind : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    RESOURCE_EXHAUSTION = 2,
    EXTERNAL_CALL_FAILURE = 3,
    SLIPPAGE_VIOLATION = 4,
    INVARIANT_BREACH = 5,
    ADMISSION = 6,
    ARITHMETIC = 7
};

// Classify a status code for callers that react by kind (retry vs abort)
ErrorKind error_kind(int32_t code);

// Stable identifier for a status code, e.g. "INSUFFICIENT_LIQUIDITY"
const char* error_name(int32_t code);

} // namespace tenex

#endif // TENEX_TYPES_HPP
