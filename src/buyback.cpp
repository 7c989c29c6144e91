// =============================================================================
// buyback.cpp - Buyback Execution and Vesting
// =============================================================================

#include "tenex/buyback.hpp"
#include "tenex/math.hpp"
#include "tenex/log.hpp"

namespace tenex {

BuybackEngine::BuybackEngine(ProtocolState& state, StakingGateway& gateway)
    : state_(state), gateway_(gateway) {}

// =============================================================================
// Scheduling
// =============================================================================

FixedPoint BuybackEngine::spend_fraction(const ProtocolState& state) {
    const ProtocolParams& p = state.params;
    uint64_t since = state.current_block > state.last_buyback_block
        ? state.current_block - state.last_buyback_block
        : 0;
    uint64_t intervals = since / p.buyback_interval_blocks;

    FixedPoint boost = 0;
    if (intervals > 1) {
        boost = fp::min(fp::mul(intervals - 1, limits::BUYBACK_RAMP_STEP),
                        limits::BUYBACK_RAMP_CAP);
    }
    return fp::min(fp::mul_div(p.buyback_rate, PRECISION + boost, PRECISION), PRECISION);
}

Amount BuybackEngine::planned_spend(const ProtocolState& state) {
    return fp::apply_rate(state.buyback_pool, spend_fraction(state));
}

bool BuybackEngine::can_execute(const ProtocolState& state) {
    const ProtocolParams& p = state.params;
    if (state.current_block < state.last_buyback_block) return false;
    if (state.current_block - state.last_buyback_block < p.buyback_interval_blocks) return false;
    if (state.buyback_pool < p.buyback_execution_threshold) return false;
    return state.native_balance >= planned_spend(state);
}

// =============================================================================
// Execute
// =============================================================================

BuybackResult BuybackEngine::execute() {
    if (!can_execute(state_)) return BuybackResult{.status = errors::BUYBACK_NOT_READY};

    const ProtocolParams& p = state_.params;
    FixedPoint fraction = spend_fraction(state_);
    Amount spend_micro = to_micro(fp::apply_rate(state_.buyback_pool, fraction));
    if (spend_micro == 0) return BuybackResult{.status = errors::AMOUNT_TOO_SMALL};

    Amount expected = gateway_.price_simulate_buy(p.protocol_netuid, spend_micro);
    std::optional<Amount> received = gateway_.stake(p.protocol_validator_hotkey, spend_micro,
                                                    p.protocol_netuid);
    if (!received) return BuybackResult{.status = errors::STAKE_FAILED};

    try {
        Amount spent = to_macro(spend_micro);
        FixedPoint slippage = expected > *received
            ? fp::mul_div(expected - *received, PRECISION, expected)
            : 0;

        state_.native_balance = fp::sub(state_.native_balance, spent);
        state_.buyback_pool = fp::sub(state_.buyback_pool, spent);
        state_.total_buyback_spent = fp::add(state_.total_buyback_spent, spent);
        state_.total_tokens_bought = fp::add(state_.total_tokens_bought, *received);
        state_.buyback_count++;
        state_.last_buyback_block = state_.current_block;

        std::vector<VestingSchedule>& schedules = state_.vesting.touch(p.treasury);
        schedules.push_back(VestingSchedule{
            .total_amount = *received,
            .claimed_amount = 0,
            .start_block = state_.current_block,
            .cliff_block = state_.current_block + p.cliff_duration_blocks,
            .end_block = state_.current_block + p.vesting_duration_blocks,
            .revoked = false
        });
        size_t index = schedules.size() - 1;

        state_.pending_events.emplace_back(BuybackExecuted{
            .spent = spent,
            .tokens_received = *received,
            .slippage = slippage,
            .spend_fraction = fraction,
            .schedule_index = index,
            .block = state_.current_block
        });

        return BuybackResult{
            .status = errors::OK,
            .spent = spent,
            .tokens_received = *received,
            .slippage = slippage,
            .spend_fraction = fraction,
            .schedule_index = index
        };
    } catch (const MathError&) {
        if (*received > 0 &&
            !gateway_.unstake(p.protocol_validator_hotkey, *received, p.protocol_netuid)) {
            log::error("buyback", "compensating unstake failed, stranded alpha " +
                                  to_string(*received));
            return BuybackResult{.status = errors::COMPENSATION_FAILED};
        }
        throw;
    }
}

// =============================================================================
// Vesting
// =============================================================================

Amount BuybackEngine::vested_amount(const VestingSchedule& schedule, BlockHeight block) {
    if (schedule.revoked) return schedule.claimed_amount;
    if (block < schedule.cliff_block) return 0;
    if (block >= schedule.end_block) return schedule.total_amount;
    return fp::mul_div(schedule.total_amount, block - schedule.start_block,
                       schedule.end_block - schedule.start_block);
}

Amount BuybackEngine::claimable(const ProtocolState& state, const Address& beneficiary) {
    const std::vector<VestingSchedule>* schedules = state.vesting.find(beneficiary);
    if (schedules == nullptr) return 0;

    Amount total = 0;
    for (const auto& schedule : *schedules) {
        if (schedule.revoked) continue;
        Amount vested = vested_amount(schedule, state.current_block);
        total = fp::add(total, fp::sub_or_zero(vested, schedule.claimed_amount));
    }
    return total;
}

ClaimResult BuybackEngine::claim_vested(const Address& beneficiary, const Address& destination) {
    const std::vector<VestingSchedule>* schedules = state_.vesting.find(beneficiary);
    if (schedules == nullptr || schedules->empty()) {
        return ClaimResult{errors::NO_VESTING_SCHEDULES, 0};
    }
    if (is_zero(destination)) return ClaimResult{errors::INVALID_PARAMETER, 0};

    Amount amount = claimable(state_, beneficiary);
    if (amount == 0) return ClaimResult{errors::OK, 0};

    const ProtocolParams& p = state_.params;
    if (!gateway_.transfer_stake(p.protocol_validator_hotkey, destination, p.protocol_netuid,
                                 amount)) {
        return ClaimResult{errors::TRANSFER_FAILED, 0};
    }

    for (auto& schedule : *state_.vesting.find_mut(beneficiary)) {
        if (schedule.revoked) continue;
        schedule.claimed_amount = fp::max(schedule.claimed_amount,
                                          vested_amount(schedule, state_.current_block));
    }

    state_.pending_events.emplace_back(VestedClaimed{
        .beneficiary = beneficiary,
        .destination = destination,
        .amount = amount,
        .block = state_.current_block
    });
    return ClaimResult{errors::OK, amount};
}

} // namespace tenex
