// =============================================================================
// position.cpp - PositionEngine Implementation
// =============================================================================

#include "tenex/position.hpp"
#include "tenex/math.hpp"
#include "tenex/risk.hpp"
#include "tenex/log.hpp"

namespace tenex {

namespace {

constexpr const char* COMPONENT = "position";

// Reverse a stake whose result is being discarded. On failure the gateway
// keeps alpha the ledger does not know about: the caller reports
// COMPENSATION_FAILED instead of its own status.
bool unwind_stake(StakingGateway& gateway, const Hotkey& hotkey, Amount alpha, Netuid netuid) {
    if (alpha == 0) return true;
    if (gateway.unstake(hotkey, alpha, netuid)) return true;
    log::error(COMPONENT, "compensating unstake failed on netuid " + std::to_string(netuid) +
                          ", stranded alpha " + to_string(alpha));
    return false;
}

// Reverse an unstake whose result is being discarded
bool unwind_unstake(StakingGateway& gateway, const Hotkey& hotkey, Amount tao, Netuid netuid) {
    if (tao == 0) return true;
    if (gateway.stake(hotkey, tao, netuid)) return true;
    log::error(COMPONENT, "compensating restake failed on netuid " + std::to_string(netuid) +
                          ", stranded tao " + to_string(tao));
    return false;
}

// Status after reversing: the original failure, or the failed reversal
int32_t reversed(bool compensated, int32_t status) {
    return compensated ? status : errors::COMPENSATION_FAILED;
}

} // namespace

PositionEngine::PositionEngine(ProtocolState& state, StakingGateway& gateway,
                               FeeAccounting& fees, LiquidityPool& pool)
    : state_(state), gateway_(gateway), fees_(fees), pool_(pool) {}

// =============================================================================
// Helpers
// =============================================================================

Amount PositionEngine::min_acceptable(Amount expected, FixedPoint max_slippage) {
    return fp::mul_div(expected, PRECISION - max_slippage, PRECISION);
}

Pair& PositionEngine::pair_for_open(Netuid netuid) {
    if (Pair* existing = state_.pairs.find_mut(netuid)) return *existing;

    Pair& pair = state_.pairs.touch(netuid);
    pair.max_leverage = state_.params.max_leverage;
    pair.is_active = true;
    return pair;
}

void PositionEngine::accrue(Position& position, Netuid netuid) {
    position.accrued_fees = live_accrued_fees(state_, position, netuid);
    position.last_update_block = state_.current_block;
}

void PositionEngine::record_trade(const Address& user, Amount volume) {
    UserAggregate& agg = state_.users.touch(user);
    agg.total_volume = fp::add(agg.total_volume, volume);
    agg.trade_count++;
    state_.total_volume = fp::add(state_.total_volume, volume);
    state_.total_trades++;
}

// =============================================================================
// Open
// =============================================================================

OpenResult PositionEngine::open(const Address& user, Netuid netuid, FixedPoint leverage,
                                FixedPoint max_slippage, Amount collateral,
                                const Hotkey& validator) {
    const ProtocolParams& params = state_.params;

    if (collateral == 0) return OpenResult{.status = errors::AMOUNT_ZERO};
    if (collateral < limits::MIN_COLLATERAL) return OpenResult{.status = errors::AMOUNT_TOO_SMALL};
    if (max_slippage > PRECISION) return OpenResult{.status = errors::INVALID_SLIPPAGE};

    if (find_active(state_, user, netuid) != nullptr) {
        return OpenResult{.status = errors::POSITION_EXISTS};
    }

    Pair& pair = pair_for_open(netuid);
    if (!pair.is_active) return OpenResult{.status = errors::PAIR_INACTIVE};

    uint8_t tier = FeeAccounting::user_tier(state_, gateway_, user);
    FixedPoint cap = fp::min(FeeAccounting::tier_max_leverage(state_, tier),
                             fp::min(params.max_leverage, pair.max_leverage));
    if (leverage < PRECISION || leverage > cap) {
        return OpenResult{.status = errors::INVALID_LEVERAGE};
    }

    Amount borrowed = fp::mul_div(collateral, leverage - PRECISION, PRECISION);

    // Borrow must leave the buffer free and stay under the utilization cap
    if (borrowed > 0) {
        Amount required = fp::mul_div(borrowed, PRECISION + params.liquidity_buffer_ratio,
                                      PRECISION);
        if (LiquidityPool::available_liquidity(state_) < required) {
            return OpenResult{.status = errors::INSUFFICIENT_LIQUIDITY};
        }
        Amount borrowed_after = fp::add(state_.total_borrowed, borrowed);
        if (risk::utilization(borrowed_after, state_.total_lp_stakes) >
            params.max_utilization_rate) {
            return OpenResult{.status = errors::UTILIZATION_EXCEEDED};
        }
    }

    Amount gross = fp::add(collateral, borrowed);
    Amount trading_fee = fees_.discounted_fee(user, fp::apply_rate(gross, params.trading_fee_rate));
    Amount net = fp::sub(gross, trading_fee);
    if (net == 0) return OpenResult{.status = errors::AMOUNT_ZERO};

    Amount net_micro = to_micro(net);
    if (net_micro == 0) return OpenResult{.status = errors::AMOUNT_TOO_SMALL};

    receive_native(state_, collateral);
    Amount staked = to_macro(net_micro);
    if (state_.native_balance < staked) return OpenResult{.status = errors::INSUFFICIENT_LIQUIDITY};

    fees_.distribute_trading_fee(trading_fee);

    Hotkey hotkey = is_zero(validator) ? params.protocol_validator_hotkey : validator;
    Amount expected = gateway_.price_simulate_buy(netuid, net_micro);

    std::optional<Amount> received = gateway_.stake(hotkey, net_micro, netuid);
    if (!received) return OpenResult{.status = errors::STAKE_FAILED};
    if (*received == 0) return OpenResult{.status = errors::ZERO_PROCEEDS};
    if (*received < min_acceptable(expected, max_slippage)) {
        bool compensated = unwind_stake(gateway_, hotkey, *received, netuid);
        return OpenResult{.status = reversed(compensated, errors::SLIPPAGE_TOO_HIGH)};
    }

    try {
        state_.native_balance -= staked;

        Amount entry_price = to_macro(gateway_.current_price(netuid));

        Position& position = state_.positions.touch(PositionKey{user, netuid});
        position = Position{
            .collateral = collateral,
            .borrowed = borrowed,
            .token_amount = *received,
            .leverage = leverage,
            .entry_price = entry_price,
            .last_update_block = state_.current_block,
            .accrued_fees = 0,
            .is_active = true,
            .validator = hotkey
        };

        pair.total_collateral = fp::add(pair.total_collateral, collateral);
        pair.total_borrowed = fp::add(pair.total_borrowed, borrowed);
        state_.total_collateral = fp::add(state_.total_collateral, collateral);
        state_.total_borrowed = fp::add(state_.total_borrowed, borrowed);

        UserAggregate& agg = state_.users.touch(user);
        agg.total_collateral = fp::add(agg.total_collateral, collateral);
        agg.total_borrowed = fp::add(agg.total_borrowed, borrowed);
        record_trade(user, gross);

        pool_.refresh_pair(netuid);

        state_.pending_events.emplace_back(PositionOpened{
            .user = user,
            .netuid = netuid,
            .collateral = collateral,
            .borrowed = borrowed,
            .token_amount = *received,
            .leverage = leverage,
            .entry_price = entry_price,
            .trading_fee = trading_fee,
            .validator = hotkey,
            .block = state_.current_block
        });

        return OpenResult{
            .status = errors::OK,
            .borrowed = borrowed,
            .token_amount = *received,
            .trading_fee = trading_fee,
            .entry_price = entry_price
        };
    } catch (const MathError&) {
        if (!unwind_stake(gateway_, hotkey, *received, netuid)) {
            return OpenResult{.status = errors::COMPENSATION_FAILED};
        }
        throw;
    }
}

// =============================================================================
// Close
// =============================================================================

CloseResult PositionEngine::close(const Address& user, Netuid netuid, Amount amount,
                                  FixedPoint max_slippage) {
    if (max_slippage > PRECISION) return CloseResult{.status = errors::INVALID_SLIPPAGE};

    Position* found = state_.positions.find_mut(PositionKey{user, netuid});
    if (found == nullptr || !found->is_active) {
        return CloseResult{.status = errors::POSITION_NOT_FOUND};
    }
    Position& position = *found;

    if (amount == 0) amount = position.token_amount;
    if (amount > position.token_amount) return CloseResult{.status = errors::INVALID_AMOUNT};

    accrue(position, netuid);

    bool full = amount == position.token_amount;
    Amount repay = full ? position.borrowed
                        : fp::mul_div(position.borrowed, amount, position.token_amount);
    Amount collateral_out = full ? position.collateral
                                 : fp::mul_div(position.collateral, amount, position.token_amount);
    Amount fees_due = full ? position.accrued_fees
                           : fp::mul_div(position.accrued_fees, amount, position.token_amount);

    Hotkey hotkey = position.validator;
    Amount expected = gateway_.price_simulate_sell(netuid, amount);

    std::optional<Amount> received = gateway_.unstake(hotkey, amount, netuid);
    if (!received) return CloseResult{.status = errors::UNSTAKE_FAILED};
    if (*received < min_acceptable(expected, max_slippage)) {
        bool compensated = unwind_unstake(gateway_, hotkey, *received, netuid);
        return CloseResult{.status = reversed(compensated, errors::SLIPPAGE_TOO_HIGH)};
    }

    try {
        Amount proceeds = to_macro(*received);
        receive_native(state_, proceeds);

        Amount trading_fee = fees_.discounted_fee(
            user, fp::apply_rate(proceeds, state_.params.trading_fee_rate));
        Amount costs = fp::add(fp::add(repay, fees_due), trading_fee);

        // All-or-nothing: a close that cannot cover its own debt reverts
        if (proceeds < costs) {
            bool compensated = unwind_unstake(gateway_, hotkey, *received, netuid);
            return CloseResult{.status = reversed(compensated, errors::INSUFFICIENT_PROCEEDS)};
        }
        Amount net_return = proceeds - costs;

        if (full) {
            position = Position{};
            position.last_update_block = state_.current_block;
        } else {
            position.collateral = fp::sub(position.collateral, collateral_out);
            position.borrowed = fp::sub(position.borrowed, repay);
            position.accrued_fees = fp::sub(position.accrued_fees, fees_due);
            position.token_amount = fp::sub(position.token_amount, amount);
        }

        Pair& pair = *state_.pairs.find_mut(netuid);
        pair.total_collateral = fp::sub(pair.total_collateral, collateral_out);
        pair.total_borrowed = fp::sub(pair.total_borrowed, repay);
        state_.total_collateral = fp::sub(state_.total_collateral, collateral_out);
        state_.total_borrowed = fp::sub(state_.total_borrowed, repay);

        UserAggregate& agg = state_.users.touch(user);
        agg.total_collateral = fp::sub(agg.total_collateral, collateral_out);
        agg.total_borrowed = fp::sub(agg.total_borrowed, repay);
        record_trade(user, proceeds);

        fees_.distribute_trading_fee(trading_fee);
        fees_.distribute_borrowing_fee(fees_due);

        int32_t rc = pay_out(state_, user, net_return);
        if (rc != errors::OK) {
            bool compensated = unwind_unstake(gateway_, hotkey, *received, netuid);
            return CloseResult{.status = reversed(compensated, rc)};
        }

        pool_.refresh_pair(netuid);

        I128 pnl = fp::diff(proceeds, fp::add(repay, fees_due)) - static_cast<I128>(collateral_out);

        state_.pending_events.emplace_back(PositionClosed{
            .user = user,
            .netuid = netuid,
            .token_amount_closed = amount,
            .proceeds = proceeds,
            .borrowed_repaid = repay,
            .borrowing_fees_paid = fees_due,
            .trading_fee = trading_fee,
            .net_return = net_return,
            .pnl = pnl,
            .fully_closed = full,
            .block = state_.current_block
        });

        return CloseResult{
            .status = errors::OK,
            .token_amount_closed = amount,
            .proceeds = proceeds,
            .borrowed_repaid = repay,
            .borrowing_fees_paid = fees_due,
            .trading_fee = trading_fee,
            .net_return = net_return,
            .pnl = pnl,
            .fully_closed = full
        };
    } catch (const MathError&) {
        if (!unwind_unstake(gateway_, hotkey, *received, netuid)) {
            return CloseResult{.status = errors::COMPENSATION_FAILED};
        }
        throw;
    }
}

// =============================================================================
// Add Collateral
// =============================================================================

AddCollateralResult PositionEngine::add_collateral(const Address& user, Netuid netuid,
                                                   Amount amount) {
    if (amount == 0) return AddCollateralResult{.status = errors::AMOUNT_ZERO};

    Position* found = state_.positions.find_mut(PositionKey{user, netuid});
    if (found == nullptr || !found->is_active) {
        return AddCollateralResult{.status = errors::POSITION_NOT_FOUND};
    }
    Position& position = *found;

    Amount micro = to_micro(amount);
    if (micro == 0) return AddCollateralResult{.status = errors::AMOUNT_TOO_SMALL};

    // Settle interest at the old block before moving last_update_block
    accrue(position, netuid);

    receive_native(state_, amount);

    std::optional<Amount> received = gateway_.stake(position.validator, micro, netuid);
    if (!received) return AddCollateralResult{.status = errors::STAKE_FAILED};

    try {
        state_.native_balance = fp::sub(state_.native_balance, to_macro(micro));

        position.collateral = fp::add(position.collateral, amount);
        position.token_amount = fp::add(position.token_amount, *received);

        Pair& pair = *state_.pairs.find_mut(netuid);
        pair.total_collateral = fp::add(pair.total_collateral, amount);
        state_.total_collateral = fp::add(state_.total_collateral, amount);

        UserAggregate& agg = state_.users.touch(user);
        agg.total_collateral = fp::add(agg.total_collateral, amount);

        state_.pending_events.emplace_back(CollateralAdded{
            .user = user,
            .netuid = netuid,
            .amount = amount,
            .token_amount_added = *received,
            .block = state_.current_block
        });
        return AddCollateralResult{.status = errors::OK, .token_amount_added = *received};
    } catch (const MathError&) {
        if (!unwind_stake(gateway_, position.validator, *received, netuid)) {
            return AddCollateralResult{.status = errors::COMPENSATION_FAILED};
        }
        throw;
    }
}

// =============================================================================
// Liquidation
// =============================================================================
//
// Waterfall over the unstake proceeds: borrowed principal, then accrued fees,
// then the liquidation fee on what remains. The owner receives the rest.
// Principal that proceeds cannot cover is bad debt, absorbed by the buyback
// pool and then by LP stakes.

LiquidationResult PositionEngine::liquidate(const Address& liquidator, const Address& user,
                                            Netuid netuid, const std::string& justification,
                                            const ContentHash& content_hash) {
    const ProtocolParams& params = state_.params;

    if (justification.empty() || justification.size() > limits::MAX_JUSTIFICATION_LENGTH) {
        return LiquidationResult{.status = errors::INVALID_JUSTIFICATION};
    }
    if (is_zero(content_hash)) return LiquidationResult{.status = errors::INVALID_CONTENT_HASH};

    Position* found = state_.positions.find_mut(PositionKey{user, netuid});
    if (found == nullptr || !found->is_active || found->token_amount == 0) {
        return LiquidationResult{.status = errors::POSITION_NOT_FOUND};
    }
    Position& position = *found;

    Amount value = position_value(gateway_, position, netuid);
    if (value == 0) return LiquidationResult{.status = errors::INVALID_PRICE};

    accrue(position, netuid);
    Amount total_debt = fp::add(position.borrowed, position.accrued_fees);
    if (!risk::is_liquidatable(value, total_debt, params.liquidation_threshold)) {
        return LiquidationResult{.status = errors::NOT_LIQUIDATABLE};
    }

    Hotkey hotkey = position.validator;
    std::optional<Amount> received = gateway_.unstake(hotkey, position.token_amount, netuid);
    if (!received) return LiquidationResult{.status = errors::UNSTAKE_FAILED};
    if (*received == 0) return LiquidationResult{.status = errors::ZERO_PROCEEDS};

    try {
        Amount proceeds = to_macro(*received);
        receive_native(state_, proceeds);

        Amount principal_repaid = fp::min(proceeds, position.borrowed);
        Amount remaining = proceeds - principal_repaid;
        Amount fees_repaid = fp::min(remaining, position.accrued_fees);
        remaining -= fees_repaid;
        Amount bad_debt = position.borrowed - principal_repaid;

        Amount liquidation_fee = fp::apply_rate(remaining, params.liquidation_fee_rate);
        FeeSplit parts = FeeAccounting::split(liquidation_fee, params.liquidation_distribution);
        Amount user_return = remaining - liquidation_fee;

        fees_.distribute_borrowing_fee(fees_repaid);
        fees_.credit_lp(parts.lp);
        fees_.credit_protocol(parts.protocol);

        int32_t rc = pay_out(state_, liquidator, parts.liquidator);
        if (rc == errors::OK) rc = pay_out(state_, user, user_return);
        if (rc != errors::OK) {
            bool compensated = unwind_unstake(gateway_, hotkey, *received, netuid);
            return LiquidationResult{.status = reversed(compensated, rc)};
        }

        fees_.add_liquidator_score(liquidator, value);

        Pair& pair = *state_.pairs.find_mut(netuid);
        pair.total_collateral = fp::sub(pair.total_collateral, position.collateral);
        pair.total_borrowed = fp::sub(pair.total_borrowed, position.borrowed);
        state_.total_collateral = fp::sub(state_.total_collateral, position.collateral);
        state_.total_borrowed = fp::sub(state_.total_borrowed, position.borrowed);

        UserAggregate& agg = state_.users.touch(user);
        agg.total_collateral = fp::sub(agg.total_collateral, position.collateral);
        agg.total_borrowed = fp::sub(agg.total_borrowed, position.borrowed);

        state_.total_liquidations++;
        Amount lp_loss = pool_.absorb_bad_debt(bad_debt);

        position = Position{};
        position.last_update_block = state_.current_block;

        pool_.refresh_pair(netuid);

        Amount debt_repaid = fp::add(principal_repaid, fees_repaid);
        state_.pending_events.emplace_back(PositionLiquidated{
            .user = user,
            .liquidator = liquidator,
            .netuid = netuid,
            .position_value = value,
            .proceeds = proceeds,
            .debt_repaid = debt_repaid,
            .bad_debt = bad_debt,
            .lp_loss = lp_loss,
            .liquidation_fee = liquidation_fee,
            .liquidator_bonus = parts.liquidator,
            .user_return = user_return,
            .justification = justification,
            .content_hash = content_hash,
            .block = state_.current_block
        });

        return LiquidationResult{
            .status = errors::OK,
            .position_value = value,
            .proceeds = proceeds,
            .debt_repaid = debt_repaid,
            .bad_debt = bad_debt,
            .lp_loss = lp_loss,
            .liquidation_fee = liquidation_fee,
            .liquidator_bonus = parts.liquidator,
            .user_return = user_return
        };
    } catch (const MathError&) {
        if (!unwind_unstake(gateway_, hotkey, *received, netuid)) {
            return LiquidationResult{.status = errors::COMPENSATION_FAILED};
        }
        throw;
    }
}

// =============================================================================
// Queries
// =============================================================================

const Position* PositionEngine::find_active(const ProtocolState& state, const Address& user,
                                            Netuid netuid) {
    const Position* position = state.positions.find(PositionKey{user, netuid});
    if (position == nullptr || !position->is_active) return nullptr;
    return position;
}

Amount PositionEngine::live_accrued_fees(const ProtocolState& state, const Position& position,
                                         Netuid netuid) {
    const Pair* pair = state.pairs.find(netuid);
    if (pair == nullptr || state.current_block <= position.last_update_block) {
        return position.accrued_fees;
    }
    uint64_t elapsed = state.current_block - position.last_update_block;
    Amount accrued = risk::accrued_borrowing_fee(position.borrowed, pair->borrowing_rate,
                                                 elapsed);
    return fp::add(position.accrued_fees, accrued);
}

Amount PositionEngine::position_value(const StakingGateway& gateway, const Position& position,
                                      Netuid netuid) {
    return to_macro(gateway.price_simulate_sell(netuid, position.token_amount));
}

std::optional<FixedPoint> PositionEngine::health_ratio(const ProtocolState& state,
                                                       const StakingGateway& gateway,
                                                       const Address& user, Netuid netuid) {
    const Position* position = find_active(state, user, netuid);
    if (position == nullptr) return std::nullopt;

    Amount debt = fp::add(position->borrowed, live_accrued_fees(state, *position, netuid));
    return risk::health_ratio(position_value(gateway, *position, netuid), debt);
}

std::optional<Amount> PositionEngine::liquidation_price(const ProtocolState& state,
                                                        const Address& user, Netuid netuid) {
    const Position* position = find_active(state, user, netuid);
    if (position == nullptr) return std::nullopt;

    return risk::liquidation_price(position->borrowed,
                                   live_accrued_fees(state, *position, netuid),
                                   position->token_amount, state.params.liquidation_threshold);
}

bool PositionEngine::is_liquidatable(const ProtocolState& state, const StakingGateway& gateway,
                                     const Address& user, Netuid netuid) {
    const Position* position = find_active(state, user, netuid);
    if (position == nullptr || position->token_amount == 0) return false;

    Amount value = position_value(gateway, *position, netuid);
    Amount debt = fp::add(position->borrowed, live_accrued_fees(state, *position, netuid));
    return risk::is_liquidatable(value, debt, state.params.liquidation_threshold);
}

} // namespace tenex
