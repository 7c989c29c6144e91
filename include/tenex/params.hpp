#ifndef TENEX_PARAMS_HPP
#define TENEX_PARAMS_HPP

#include <array>

#include "types.hpp"
#include "risk.hpp"

namespace tenex {

// =============================================================================
// Fee Distribution (lp + liquidator + protocol == PRECISION)
// =============================================================================

struct FeeDistribution {
    FixedPoint lp_share;
    FixedPoint liquidator_share;
    FixedPoint protocol_share;

    bool operator==(const FeeDistribution& other) const = default;
};

// Function permission slots
namespace functions {
constexpr size_t OPEN_POSITION = 0;
constexpr size_t ADD_LIQUIDITY = 1;
constexpr size_t LIQUIDATE_POSITION = 2;
constexpr size_t COUNT = 3;
}

// =============================================================================
// Protocol Parameters
// =============================================================================

struct ProtocolParams {
    // Risk
    FixedPoint max_leverage;
    FixedPoint liquidation_threshold;

    // Liquidity guardrails
    Amount min_liquidity_threshold;
    FixedPoint max_utilization_rate;
    FixedPoint liquidity_buffer_ratio;

    // Rate limits
    uint64_t user_cooldown_blocks;
    uint64_t lp_cooldown_blocks;

    // Buyback
    FixedPoint buyback_rate;
    uint64_t buyback_interval_blocks;
    Amount buyback_execution_threshold;

    // Vesting
    uint64_t vesting_duration_blocks;
    uint64_t cliff_duration_blocks;

    // Fees
    FixedPoint trading_fee_rate;
    FixedPoint borrowing_fee_rate;   // per 360 blocks at zero utilization
    FixedPoint liquidation_fee_rate;

    // Borrow curve shape (base rate is borrowing_fee_rate)
    FixedPoint rate_kink;
    FixedPoint rate_slope1;
    FixedPoint rate_slope2;

    FeeDistribution trading_distribution;
    FeeDistribution borrowing_distribution;
    FeeDistribution liquidation_distribution;

    // Tiers: thresholds for tiers 1..5, discounts and leverage caps for tiers 0..5
    std::array<Amount, limits::NUM_TIERS - 1> tier_thresholds;
    std::array<FixedPoint, limits::NUM_TIERS> tier_fee_discounts;
    std::array<FixedPoint, limits::NUM_TIERS> tier_max_leverages;

    // Protocol identity
    Hotkey protocol_validator_hotkey;
    Address treasury;
    Netuid protocol_netuid;

    std::array<bool, functions::COUNT> function_permissions;

    RateModel rate_model() const {
        return RateModel{borrowing_fee_rate, rate_kink, rate_slope1, rate_slope2};
    }

    // Mainnet deployment values
    static ProtocolParams mainnet_defaults();
};

// =============================================================================
// Parameter Validation
// =============================================================================
//
// Shared by the admin setters and configuration loading. Each returns
// errors::OK or errors::INVALID_PARAMETER / errors::INVALID_DISTRIBUTION.

namespace validation {

int32_t risk_parameters(FixedPoint max_leverage, FixedPoint liquidation_threshold);
int32_t liquidity_guardrails(Amount min_liquidity_threshold, FixedPoint max_utilization_rate,
                             FixedPoint liquidity_buffer_ratio);
int32_t action_cooldowns(uint64_t user_blocks, uint64_t lp_blocks);
int32_t buyback_parameters(FixedPoint rate, uint64_t interval_blocks, Amount threshold);
int32_t vesting_parameters(uint64_t duration_blocks, uint64_t cliff_blocks);
int32_t fee_parameters(FixedPoint trading, FixedPoint borrowing, FixedPoint liquidation);
int32_t rate_model(FixedPoint kink, FixedPoint slope1, FixedPoint slope2);
int32_t fee_distribution(const FeeDistribution& dist);
int32_t tier_parameters(const std::array<Amount, limits::NUM_TIERS - 1>& thresholds,
                        const std::array<FixedPoint, limits::NUM_TIERS>& discounts,
                        const std::array<FixedPoint, limits::NUM_TIERS>& leverages,
                        FixedPoint max_leverage);

// Full parameter set
int32_t all(const ProtocolParams& params);

} // namespace validation

} // namespace tenex

#endif // TENEX_PARAMS_HPP
