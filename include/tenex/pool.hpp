#ifndef TENEX_POOL_HPP
#define TENEX_POOL_HPP

#include "types.hpp"
#include "state.hpp"
#include "fees.hpp"

namespace tenex {

struct LiquidityResult {
    int32_t status;
    Amount amount;
    Amount shares;
};

// =============================================================================
// LiquidityPool - pooled LP collateral backing every borrow
// =============================================================================

class LiquidityPool {
public:
    LiquidityPool(ProtocolState& state, FeeAccounting& fees);

    // Issues shares at the current stake-per-share (1:1 until bad debt is absorbed)
    LiquidityResult deposit(const Address& provider, Amount amount);

    // amount is in stake units; 0 redeems every share the provider holds
    LiquidityResult withdraw(const Address& provider, Amount amount);

    // Writes off unrecoverable principal: the buyback pool pays first, then
    // total_lp_stakes shrinks, lowering every share's value. Returns the LP loss.
    Amount absorb_bad_debt(Amount bad_debt);

    // Re-evaluates the breaker flag, returns true when it flipped
    bool circuit_breaker_check();

    // Recomputes utilization and borrowing rate of one pair / every pair
    void refresh_pair(Netuid netuid);
    void refresh_all_pairs();

    // =========================================================================
    // Queries
    // =========================================================================

    // total_lp_stakes - total_borrowed, clamped at 0
    static Amount available_liquidity(const ProtocolState& state);
    static FixedPoint utilization(const ProtocolState& state);

    // Stake a number of shares redeems for
    static Amount share_value(const ProtocolState& state, Amount shares);

private:
    ProtocolState& state_;
    FeeAccounting& fees_;
};

} // namespace tenex

#endif // TENEX_POOL_HPP
