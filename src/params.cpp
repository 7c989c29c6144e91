// =============================================================================
// params.cpp - Protocol Parameter Defaults and Validation
// =============================================================================

#include "tenex/params.hpp"

namespace tenex {

ProtocolParams ProtocolParams::mainnet_defaults() {
    ProtocolParams p{};

    p.max_leverage = 10 * PRECISION;
    p.liquidation_threshold = 1100000000ULL;        // 110%

    p.min_liquidity_threshold = 1000 * ONE_TOKEN;
    p.max_utilization_rate = 900000000ULL;          // 90%
    p.liquidity_buffer_ratio = 200000000ULL;        // 20%

    p.user_cooldown_blocks = 1;
    p.lp_cooldown_blocks = 360;

    p.buyback_rate = 500000000ULL;                  // 50%
    p.buyback_interval_blocks = 7200;
    p.buyback_execution_threshold = ONE_TOKEN;

    p.vesting_duration_blocks = 2628000;
    p.cliff_duration_blocks = 648000;

    p.trading_fee_rate = 3000000ULL;                // 0.3%
    p.borrowing_fee_rate = 50000ULL;                // 0.005% per 360 blocks
    p.liquidation_fee_rate = 20000000ULL;           // 2%

    p.rate_kink = 800000000ULL;                     // 80%
    p.rate_slope1 = 50000ULL;
    p.rate_slope2 = 500000ULL;

    p.trading_distribution = {300000000ULL, 0, 700000000ULL};
    p.borrowing_distribution = {350000000ULL, 0, 650000000ULL};
    p.liquidation_distribution = {0, 400000000ULL, 600000000ULL};

    p.tier_thresholds = {100 * ONE_TOKEN, 1000 * ONE_TOKEN, 5000 * ONE_TOKEN,
                         20000 * ONE_TOKEN, 100000 * ONE_TOKEN};
    p.tier_fee_discounts = {0, 100000000ULL, 200000000ULL, 300000000ULL,
                            400000000ULL, 500000000ULL};
    p.tier_max_leverages = {2 * PRECISION, 3 * PRECISION, 4 * PRECISION,
                            5 * PRECISION, 7 * PRECISION, 10 * PRECISION};

    p.protocol_validator_hotkey = {};
    p.protocol_validator_hotkey[31] = 0x01;
    p.treasury = {};
    p.treasury[19] = 0x01;
    p.protocol_netuid = 67;

    p.function_permissions = {false, false, false};
    return p;
}

namespace validation {

int32_t risk_parameters(FixedPoint max_leverage, FixedPoint liquidation_threshold) {
    if (max_leverage <= PRECISION || max_leverage > limits::MAX_LEVERAGE_CAP) {
        return errors::INVALID_PARAMETER;
    }
    if (liquidation_threshold <= PRECISION ||
        liquidation_threshold > limits::MAX_LIQUIDATION_THRESHOLD) {
        return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

int32_t liquidity_guardrails(Amount min_liquidity_threshold, FixedPoint max_utilization_rate,
                             FixedPoint liquidity_buffer_ratio) {
    if (min_liquidity_threshold == 0) return errors::INVALID_PARAMETER;
    if (max_utilization_rate == 0 || max_utilization_rate > PRECISION) {
        return errors::INVALID_PARAMETER;
    }
    if (liquidity_buffer_ratio > limits::MAX_BUFFER_RATIO) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t action_cooldowns(uint64_t user_blocks, uint64_t lp_blocks) {
    if (user_blocks > limits::MAX_COOLDOWN_BLOCKS || lp_blocks > limits::MAX_COOLDOWN_BLOCKS) {
        return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

int32_t buyback_parameters(FixedPoint rate, uint64_t interval_blocks, Amount threshold) {
    if (rate == 0 || rate > PRECISION) return errors::INVALID_PARAMETER;
    if (interval_blocks == 0 || threshold == 0) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t vesting_parameters(uint64_t duration_blocks, uint64_t cliff_blocks) {
    if (duration_blocks == 0 || cliff_blocks > duration_blocks) {
        return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

int32_t fee_parameters(FixedPoint trading, FixedPoint borrowing, FixedPoint liquidation) {
    if (trading > limits::MAX_TRADING_FEE ||
        borrowing > limits::MAX_BORROWING_FEE ||
        liquidation > limits::MAX_LIQUIDATION_FEE) {
        return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

int32_t rate_model(FixedPoint kink, FixedPoint slope1, FixedPoint slope2) {
    if (kink == 0 || kink >= PRECISION) return errors::INVALID_PARAMETER;
    if (slope1 > slope2 || slope2 > PRECISION) return errors::INVALID_PARAMETER;
    return errors::OK;
}

int32_t fee_distribution(const FeeDistribution& dist) {
    // Each share is at most PRECISION, so the sum cannot wrap
    if (dist.lp_share > PRECISION || dist.liquidator_share > PRECISION ||
        dist.protocol_share > PRECISION) {
        return errors::INVALID_DISTRIBUTION;
    }
    if (dist.lp_share + dist.liquidator_share + dist.protocol_share != PRECISION) {
        return errors::INVALID_DISTRIBUTION;
    }
    return errors::OK;
}

int32_t tier_parameters(const std::array<Amount, limits::NUM_TIERS - 1>& thresholds,
                        const std::array<FixedPoint, limits::NUM_TIERS>& discounts,
                        const std::array<FixedPoint, limits::NUM_TIERS>& leverages,
                        FixedPoint max_leverage) {
    for (size_t i = 0; i < thresholds.size(); ++i) {
        if (thresholds[i] == 0) return errors::INVALID_PARAMETER;
        if (i > 0 && thresholds[i] <= thresholds[i - 1]) return errors::INVALID_PARAMETER;
    }
    for (size_t i = 0; i < discounts.size(); ++i) {
        if (discounts[i] > PRECISION) return errors::INVALID_PARAMETER;
        if (i > 0 && discounts[i] < discounts[i - 1]) return errors::INVALID_PARAMETER;
    }
    for (size_t i = 0; i < leverages.size(); ++i) {
        if (leverages[i] < PRECISION || leverages[i] > max_leverage) {
            return errors::INVALID_PARAMETER;
        }
        if (i > 0 && leverages[i] < leverages[i - 1]) return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

int32_t all(const ProtocolParams& p) {
    int32_t rc = risk_parameters(p.max_leverage, p.liquidation_threshold);
    if (rc != errors::OK) return rc;
    rc = liquidity_guardrails(p.min_liquidity_threshold, p.max_utilization_rate,
                              p.liquidity_buffer_ratio);
    if (rc != errors::OK) return rc;
    rc = action_cooldowns(p.user_cooldown_blocks, p.lp_cooldown_blocks);
    if (rc != errors::OK) return rc;
    rc = buyback_parameters(p.buyback_rate, p.buyback_interval_blocks,
                            p.buyback_execution_threshold);
    if (rc != errors::OK) return rc;
    rc = vesting_parameters(p.vesting_duration_blocks, p.cliff_duration_blocks);
    if (rc != errors::OK) return rc;
    rc = fee_parameters(p.trading_fee_rate, p.borrowing_fee_rate, p.liquidation_fee_rate);
    if (rc != errors::OK) return rc;
    rc = rate_model(p.rate_kink, p.rate_slope1, p.rate_slope2);
    if (rc != errors::OK) return rc;
    for (const auto* dist : {&p.trading_distribution, &p.borrowing_distribution,
                             &p.liquidation_distribution}) {
        rc = fee_distribution(*dist);
        if (rc != errors::OK) return rc;
    }
    rc = tier_parameters(p.tier_thresholds, p.tier_fee_discounts, p.tier_max_leverages,
                         p.max_leverage);
    if (rc != errors::OK) return rc;
    if (is_zero(p.protocol_validator_hotkey) || is_zero(p.treasury)) {
        return errors::INVALID_PARAMETER;
    }
    return errors::OK;
}

} // namespace validation

} // namespace tenex
