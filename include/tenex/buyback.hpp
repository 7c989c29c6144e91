#ifndef TENEX_BUYBACK_HPP
#define TENEX_BUYBACK_HPP

#include "types.hpp"
#include "state.hpp"
#include "gateway.hpp"
#include "fees.hpp"

namespace tenex {

struct BuybackResult {
    int32_t status;
    Amount spent;             // macro
    Amount tokens_received;   // alpha, micro
    FixedPoint slippage;
    FixedPoint spend_fraction;
    size_t schedule_index;
};

// =============================================================================
// BuybackEngine - periodic protocol-token buybacks with linear vesting
// =============================================================================

class BuybackEngine {
public:
    BuybackEngine(ProtocolState& state, StakingGateway& gateway);

    // Spends part of the buyback pool and vests the purchase to the treasury
    BuybackResult execute();

    // Transfers everything vested and unclaimed across the beneficiary's schedules.
    // Returns OK with amount 0 when nothing is claimable yet.
    ClaimResult claim_vested(const Address& beneficiary, const Address& destination);

    // =========================================================================
    // Queries
    // =========================================================================

    static bool can_execute(const ProtocolState& state);

    // Buyback rate boosted by +10% per missed interval (at most +50%), capped at 100%
    static FixedPoint spend_fraction(const ProtocolState& state);
    static Amount planned_spend(const ProtocolState& state);

    // 0 before the cliff, linear from start to end, total at or after end.
    // A revoked schedule stays frozen at what was claimed.
    static Amount vested_amount(const VestingSchedule& schedule, BlockHeight block);

    // Vested but unclaimed across all schedules of a beneficiary
    static Amount claimable(const ProtocolState& state, const Address& beneficiary);

private:
    ProtocolState& state_;
    StakingGateway& gateway_;
};

} // namespace tenex

#endif // TENEX_BUYBACK_HPP
