#ifndef TENEX_FEES_HPP
#define TENEX_FEES_HPP

#include "types.hpp"
#include "state.hpp"
#include "gateway.hpp"

namespace tenex {

// Portions of a fee routed to each recipient class
struct FeeSplit {
    Amount lp;
    Amount liquidator;
    Amount protocol;
};

struct ClaimResult {
    int32_t status;
    Amount amount;
};

// =============================================================================
// FeeAccounting - accumulator-per-share reward bookkeeping
// =============================================================================
//
// Every participant's pending reward is (units * accumulator / ACC_PRECISION)
// minus the debt recorded at its last settlement. Callers must settle a
// participant before changing its shares or score.

class FeeAccounting {
public:
    FeeAccounting(ProtocolState& state, const StakingGateway& gateway);

    // Split by a distribution; the protocol share absorbs rounding dust
    static FeeSplit split(Amount fee, const FeeDistribution& distribution);

    FeeSplit distribute_trading_fee(Amount fee);
    FeeSplit distribute_borrowing_fee(Amount fee);

    // Single-recipient credits (liquidation fees are split by the caller)
    void credit_lp(Amount amount);
    void credit_liquidators(Amount amount);
    void credit_protocol(Amount amount);

    void settle_lp(const Address& provider);
    void settle_liquidator(const Address& liquidator);

    // Settles, then grows the liquidator's score
    void add_liquidator_score(const Address& liquidator, Amount value);

    ClaimResult claim_lp_rewards(const Address& provider);
    ClaimResult claim_liquidator_rewards(const Address& liquidator);

    // Tier-discounted fee for a user
    Amount discounted_fee(const Address& user, Amount fee) const;

    // =========================================================================
    // Queries
    // =========================================================================

    static Amount pending_lp_rewards(const ProtocolState& state, const Address& provider);
    static Amount pending_liquidator_rewards(const ProtocolState& state, const Address& liquidator);

    // Tier 0..5 from the user's stake under the protocol validator
    static uint8_t user_tier(const ProtocolState& state, const StakingGateway& gateway,
                             const Address& user);
    static FixedPoint tier_max_leverage(const ProtocolState& state, uint8_t tier);
    static FixedPoint tier_discount(const ProtocolState& state, uint8_t tier);

private:
    ProtocolState& state_;
    const StakingGateway& gateway_;

    FeeSplit distribute(Amount fee, const FeeDistribution& distribution);
};

} // namespace tenex

#endif // TENEX_FEES_HPP
