// =============================================================================
// pool.cpp - LiquidityPool Implementation
// =============================================================================

#include "tenex/pool.hpp"
#include "tenex/math.hpp"
#include "tenex/risk.hpp"

namespace tenex {

LiquidityPool::LiquidityPool(ProtocolState& state, FeeAccounting& fees)
    : state_(state), fees_(fees) {}

// =============================================================================
// Deposit / Withdraw
// =============================================================================

LiquidityResult LiquidityPool::deposit(const Address& provider, Amount amount) {
    if (amount == 0) return LiquidityResult{errors::AMOUNT_ZERO, 0, 0};
    if (amount < limits::MIN_LIQUIDITY_DEPOSIT) {
        return LiquidityResult{errors::AMOUNT_TOO_SMALL, 0, 0};
    }
    // Outstanding shares with nothing behind them cannot be priced
    if (state_.total_lp_shares > 0 && state_.total_lp_stakes == 0) {
        return LiquidityResult{errors::INSUFFICIENT_LIQUIDITY, 0, 0};
    }

    // Pending rewards belong to the old share balance
    fees_.settle_lp(provider);

    Amount shares = state_.total_lp_shares == 0
        ? amount
        : fp::mul_div(amount, state_.total_lp_shares, state_.total_lp_stakes);
    if (shares == 0) return LiquidityResult{errors::AMOUNT_TOO_SMALL, 0, 0};

    receive_native(state_, amount);

    LiquidityProvider& lp = state_.liquidity_providers.touch(provider);
    lp.stake = fp::add(lp.stake, amount);
    lp.shares = fp::add(lp.shares, shares);
    lp.reward_debt = fp::mul_div(lp.shares, state_.acc_lp_fees_per_share, ACC_PRECISION);
    lp.last_reward_block = state_.current_block;
    lp.is_active = true;

    state_.total_lp_stakes = fp::add(state_.total_lp_stakes, amount);
    state_.total_lp_shares = fp::add(state_.total_lp_shares, shares);
    refresh_all_pairs();

    state_.pending_events.emplace_back(LiquidityAdded{
        .provider = provider,
        .amount = amount,
        .shares = shares,
        .block = state_.current_block
    });
    return LiquidityResult{errors::OK, amount, shares};
}

LiquidityResult LiquidityPool::withdraw(const Address& provider, Amount amount) {
    const LiquidityProvider* current = state_.liquidity_providers.find(provider);
    if (current == nullptr || !current->is_active) {
        return LiquidityResult{errors::INSUFFICIENT_BALANCE, 0, 0};
    }

    Amount redeemable = share_value(state_, current->shares);
    if (amount == 0) amount = redeemable;
    if (amount == 0) return LiquidityResult{errors::AMOUNT_ZERO, 0, 0};
    if (amount > redeemable) return LiquidityResult{errors::INSUFFICIENT_BALANCE, 0, 0};

    // Outstanding borrows must stay within the utilization cap afterwards
    Amount remaining_stakes = state_.total_lp_stakes - amount;
    if (state_.total_borrowed > 0) {
        if (remaining_stakes == 0 ||
            risk::utilization(state_.total_borrowed, remaining_stakes) >
                state_.params.max_utilization_rate) {
            return LiquidityResult{errors::UTILIZATION_EXCEEDED, 0, 0};
        }
    }

    fees_.settle_lp(provider);
    LiquidityProvider& lp = *state_.liquidity_providers.find_mut(provider);

    // Round the burn up so a partial withdrawal never takes more than its shares are worth
    Amount burned = lp.shares;
    if (amount < redeemable) {
        burned = fp::mul_div(amount, state_.total_lp_shares, state_.total_lp_stakes);
        if (share_value(state_, burned) < amount) burned = fp::add(burned, 1);
        burned = fp::min(burned, lp.shares);
    }

    lp.stake = burned == lp.shares
        ? 0
        : fp::sub(lp.stake, fp::mul_div(lp.stake, burned, lp.shares));
    lp.shares = fp::sub(lp.shares, burned);
    lp.reward_debt = fp::mul_div(lp.shares, state_.acc_lp_fees_per_share, ACC_PRECISION);
    lp.is_active = lp.shares > 0;

    state_.total_lp_stakes = fp::sub(state_.total_lp_stakes, amount);
    state_.total_lp_shares = fp::sub(state_.total_lp_shares, burned);

    int32_t rc = pay_out(state_, provider, amount);
    if (rc != errors::OK) return LiquidityResult{rc, 0, 0};

    refresh_all_pairs();

    state_.pending_events.emplace_back(LiquidityRemoved{
        .provider = provider,
        .amount = amount,
        .shares = burned,
        .block = state_.current_block
    });
    return LiquidityResult{errors::OK, amount, burned};
}

// =============================================================================
// Bad Debt
// =============================================================================

Amount LiquidityPool::absorb_bad_debt(Amount bad_debt) {
    if (bad_debt == 0) return 0;

    // Protocol fees waiting for a buyback go first
    Amount covered = fp::min(bad_debt, state_.buyback_pool);
    state_.buyback_pool -= covered;

    Amount lp_loss = fp::min(bad_debt - covered, state_.total_lp_stakes);
    state_.total_lp_stakes -= lp_loss;
    state_.total_lp_losses = fp::add(state_.total_lp_losses, lp_loss);
    state_.total_bad_debt = fp::add(state_.total_bad_debt, bad_debt);

    refresh_all_pairs();
    return lp_loss;
}

// =============================================================================
// Circuit Breaker
// =============================================================================

bool LiquidityPool::circuit_breaker_check() {
    FixedPoint util = utilization(state_);
    bool engaged = state_.total_lp_stakes < state_.params.min_liquidity_threshold ||
                   util > state_.params.max_utilization_rate;
    if (engaged == state_.circuit_breaker) return false;

    state_.circuit_breaker = engaged;
    state_.pending_events.emplace_back(CircuitBreakerChanged{
        .engaged = engaged,
        .total_lp_stakes = state_.total_lp_stakes,
        .utilization = util,
        .block = state_.current_block
    });
    return true;
}

// =============================================================================
// Pair Rates
// =============================================================================

void LiquidityPool::refresh_pair(Netuid netuid) {
    Pair* found = state_.pairs.find_mut(netuid);
    if (found == nullptr) return;

    Pair& pair = *found;
    pair.utilization_rate = risk::utilization(pair.total_borrowed, state_.total_lp_stakes);
    pair.borrowing_rate = risk::borrow_rate_per_360_blocks(pair.utilization_rate,
                                                           state_.params.rate_model());
}

void LiquidityPool::refresh_all_pairs() {
    for (const auto& entry : state_.pairs) {
        refresh_pair(entry.first);
    }
}

// =============================================================================
// Queries
// =============================================================================

Amount LiquidityPool::available_liquidity(const ProtocolState& state) {
    return fp::sub_or_zero(state.total_lp_stakes, state.total_borrowed);
}

Amount LiquidityPool::share_value(const ProtocolState& state, Amount shares) {
    if (shares == 0 || state.total_lp_shares == 0) return 0;
    if (shares == state.total_lp_shares) return state.total_lp_stakes;
    return fp::mul_div(shares, state.total_lp_stakes, state.total_lp_shares);
}

FixedPoint LiquidityPool::utilization(const ProtocolState& state) {
    return risk::utilization(state.total_borrowed, state.total_lp_stakes);
}

} // namespace tenex
