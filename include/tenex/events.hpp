#ifndef TENEX_EVENTS_HPP
#define TENEX_EVENTS_HPP

#include <functional>
#include <string>
#include <variant>

#include "types.hpp"

namespace tenex {

// =============================================================================
// Protocol Events (published after a successful commit)
// =============================================================================

struct PositionOpened {
    Address user;
    Netuid netuid;
    Amount collateral;
    Amount borrowed;
    Amount token_amount;
    FixedPoint leverage;
    Amount entry_price;
    Amount trading_fee;
    Hotkey validator;
    BlockHeight block;
};

struct PositionClosed {
    Address user;
    Netuid netuid;
    Amount token_amount_closed;
    Amount proceeds;
    Amount borrowed_repaid;
    Amount borrowing_fees_paid;
    Amount trading_fee;
    Amount net_return;
    I128 pnl;
    bool fully_closed;
    BlockHeight block;
};

struct CollateralAdded {
    Address user;
    Netuid netuid;
    Amount amount;
    Amount token_amount_added;
    BlockHeight block;
};

struct PositionLiquidated {
    Address user;
    Address liquidator;
    Netuid netuid;
    Amount position_value;
    Amount proceeds;
    Amount debt_repaid;
    Amount bad_debt;
    Amount lp_loss;
    Amount liquidation_fee;
    Amount liquidator_bonus;
    Amount user_return;
    std::string justification;
    ContentHash content_hash;
    BlockHeight block;
};

struct LiquidityAdded {
    Address provider;
    Amount amount;
    Amount shares;
    BlockHeight block;
};

struct LiquidityRemoved {
    Address provider;
    Amount amount;
    Amount shares;
    BlockHeight block;
};

struct RewardsClaimed {
    Address account;
    Amount amount;
    bool liquidator;  // false: LP rewards
    BlockHeight block;
};

struct BuybackExecuted {
    Amount spent;
    Amount tokens_received;
    FixedPoint slippage;
    FixedPoint spend_fraction;
    size_t schedule_index;
    BlockHeight block;
};

struct VestedClaimed {
    Address beneficiary;
    Address destination;
    Amount amount;
    BlockHeight block;
};

struct CircuitBreakerChanged {
    bool engaged;
    Amount total_lp_stakes;
    FixedPoint utilization;
    BlockHeight block;
};

using Event = std::variant<PositionOpened, PositionClosed, CollateralAdded, PositionLiquidated,
                           LiquidityAdded, LiquidityRemoved, RewardsClaimed, BuybackExecuted,
                           VestedClaimed, CircuitBreakerChanged>;

using EventCallback = std::function<void(const Event&)>;

// Event type name, e.g. "PositionOpened"
const char* event_name(const Event& event);

// One-line JSON rendering; amounts are decimal strings
std::string event_to_json(const Event& event);

// 0x-prefixed lowercase hex
template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (auto b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace tenex

#endif // TENEX_EVENTS_HPP
