// =============================================================================
// fees.cpp - Fee Distribution and Reward Accumulators
// =============================================================================

#include "tenex/fees.hpp"
#include "tenex/math.hpp"

namespace tenex {

FeeAccounting::FeeAccounting(ProtocolState& state, const StakingGateway& gateway)
    : state_(state), gateway_(gateway) {}

// =============================================================================
// Distribution
// =============================================================================

FeeSplit FeeAccounting::split(Amount fee, const FeeDistribution& distribution) {
    FeeSplit out{};
    out.lp = fp::apply_rate(fee, distribution.lp_share);
    out.liquidator = fp::apply_rate(fee, distribution.liquidator_share);
    out.protocol = fp::sub(fee, fp::add(out.lp, out.liquidator));
    return out;
}

FeeSplit FeeAccounting::distribute(Amount fee, const FeeDistribution& distribution) {
    FeeSplit parts = split(fee, distribution);
    credit_lp(parts.lp);
    credit_liquidators(parts.liquidator);
    credit_protocol(parts.protocol);
    return parts;
}

FeeSplit FeeAccounting::distribute_trading_fee(Amount fee) {
    return distribute(fee, state_.params.trading_distribution);
}

FeeSplit FeeAccounting::distribute_borrowing_fee(Amount fee) {
    return distribute(fee, state_.params.borrowing_distribution);
}

void FeeAccounting::credit_lp(Amount amount) {
    if (amount == 0) return;
    // No shares outstanding: nobody can be owed this amount
    if (state_.total_lp_shares == 0) {
        state_.unallocated_fees = fp::add(state_.unallocated_fees, amount);
        return;
    }
    state_.acc_lp_fees_per_share = fp::add(
        state_.acc_lp_fees_per_share,
        fp::mul_div(amount, ACC_PRECISION, state_.total_lp_shares));
}

void FeeAccounting::credit_liquidators(Amount amount) {
    if (amount == 0) return;
    if (state_.total_liquidator_score == 0) {
        state_.unallocated_fees = fp::add(state_.unallocated_fees, amount);
        return;
    }
    state_.acc_liquidator_fees_per_score = fp::add(
        state_.acc_liquidator_fees_per_score,
        fp::mul_div(amount, ACC_PRECISION, state_.total_liquidator_score));
}

void FeeAccounting::credit_protocol(Amount amount) {
    if (amount == 0) return;
    state_.buyback_pool = fp::add(state_.buyback_pool, amount);
    state_.protocol_fees = fp::add(state_.protocol_fees, amount);
}

// =============================================================================
// Settlement
// =============================================================================

void FeeAccounting::settle_lp(const Address& provider) {
    LiquidityProvider* found = state_.liquidity_providers.find_mut(provider);
    if (found == nullptr) return;

    LiquidityProvider& lp = *found;
    Amount accumulated = fp::mul_div(lp.shares, state_.acc_lp_fees_per_share, ACC_PRECISION);
    Amount pending = fp::sub(accumulated, lp.reward_debt);
    if (pending > 0) {
        lp.rewards = fp::add(lp.rewards, pending);
    }
    lp.reward_debt = accumulated;
    lp.last_reward_block = state_.current_block;
}

void FeeAccounting::settle_liquidator(const Address& liquidator) {
    LiquidatorAccount* found = state_.liquidators.find_mut(liquidator);
    if (found == nullptr) return;

    LiquidatorAccount& account = *found;
    Amount accumulated = fp::mul_div(account.score, state_.acc_liquidator_fees_per_score,
                                     ACC_PRECISION);
    Amount pending = fp::sub(accumulated, account.reward_debt);
    if (pending > 0) {
        account.rewards = fp::add(account.rewards, pending);
    }
    account.reward_debt = accumulated;
}

void FeeAccounting::add_liquidator_score(const Address& liquidator, Amount value) {
    settle_liquidator(liquidator);

    LiquidatorAccount& account = state_.liquidators.touch(liquidator);
    account.score = fp::add(account.score, value);
    account.reward_debt = fp::mul_div(account.score, state_.acc_liquidator_fees_per_score,
                                      ACC_PRECISION);
    state_.total_liquidator_score = fp::add(state_.total_liquidator_score, value);
}

// =============================================================================
// Claims
// =============================================================================

ClaimResult FeeAccounting::claim_lp_rewards(const Address& provider) {
    settle_lp(provider);

    LiquidityProvider* lp = state_.liquidity_providers.find_mut(provider);
    if (lp == nullptr || lp->rewards == 0) {
        return ClaimResult{errors::NO_REWARDS, 0};
    }

    Amount amount = lp->rewards;
    int32_t rc = pay_out(state_, provider, amount);
    if (rc != errors::OK) return ClaimResult{rc, 0};

    lp->rewards = 0;
    state_.pending_events.emplace_back(RewardsClaimed{
        .account = provider,
        .amount = amount,
        .liquidator = false,
        .block = state_.current_block
    });
    return ClaimResult{errors::OK, amount};
}

ClaimResult FeeAccounting::claim_liquidator_rewards(const Address& liquidator) {
    settle_liquidator(liquidator);

    LiquidatorAccount* account = state_.liquidators.find_mut(liquidator);
    if (account == nullptr || account->rewards == 0) {
        return ClaimResult{errors::NO_REWARDS, 0};
    }

    Amount amount = account->rewards;
    int32_t rc = pay_out(state_, liquidator, amount);
    if (rc != errors::OK) return ClaimResult{rc, 0};

    account->rewards = 0;
    state_.pending_events.emplace_back(RewardsClaimed{
        .account = liquidator,
        .amount = amount,
        .liquidator = true,
        .block = state_.current_block
    });
    return ClaimResult{errors::OK, amount};
}

// =============================================================================
// Tiers
// =============================================================================

Amount FeeAccounting::discounted_fee(const Address& user, Amount fee) const {
    if (fee == 0) return 0;
    FixedPoint discount = tier_discount(state_, user_tier(state_, gateway_, user));
    return fp::mul_div(fee, PRECISION - discount, PRECISION);
}

uint8_t FeeAccounting::user_tier(const ProtocolState& state, const StakingGateway& gateway,
                                 const Address& user) {
    const ProtocolParams& p = state.params;
    Amount balance = to_macro(gateway.stake_balance(p.protocol_validator_hotkey, user,
                                                    p.protocol_netuid));

    // Thresholds ascend; scan from the top tier down
    for (size_t i = p.tier_thresholds.size(); i > 0; --i) {
        if (balance >= p.tier_thresholds[i - 1]) {
            return static_cast<uint8_t>(i);
        }
    }
    return 0;
}

FixedPoint FeeAccounting::tier_max_leverage(const ProtocolState& state, uint8_t tier) {
    return state.params.tier_max_leverages[tier < limits::NUM_TIERS ? tier : limits::NUM_TIERS - 1];
}

FixedPoint FeeAccounting::tier_discount(const ProtocolState& state, uint8_t tier) {
    return state.params.tier_fee_discounts[tier < limits::NUM_TIERS ? tier : limits::NUM_TIERS - 1];
}

// =============================================================================
// Pending Rewards
// =============================================================================

Amount FeeAccounting::pending_lp_rewards(const ProtocolState& state, const Address& provider) {
    const LiquidityProvider* lp = state.liquidity_providers.find(provider);
    if (lp == nullptr) return 0;

    Amount accumulated = fp::mul_div(lp->shares, state.acc_lp_fees_per_share, ACC_PRECISION);
    return fp::add(lp->rewards, fp::sub_or_zero(accumulated, lp->reward_debt));
}

Amount FeeAccounting::pending_liquidator_rewards(const ProtocolState& state,
                                                 const Address& liquidator) {
    const LiquidatorAccount* account = state.liquidators.find(liquidator);
    if (account == nullptr) return 0;

    Amount accumulated = fp::mul_div(account->score, state.acc_liquidator_fees_per_score,
                                     ACC_PRECISION);
    return fp::add(account->rewards, fp::sub_or_zero(accumulated, account->reward_debt));
}

} // namespace tenex
