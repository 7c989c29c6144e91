#ifndef TENEX_CONFIG_HPP
#define TENEX_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"
#include "params.hpp"

namespace tenex {

// =============================================================================
// Configuration
// =============================================================================
//
// JSON layout (every key optional, missing keys keep mainnet defaults):
//
//   general       log_level
//   risk          max_leverage, liquidation_threshold
//   liquidity     min_liquidity_threshold, max_utilization_rate, liquidity_buffer_ratio
//   cooldowns     user_blocks, lp_blocks
//   buyback       rate, interval_blocks, execution_threshold
//   vesting       duration_blocks, cliff_blocks
//   fees          trading, borrowing, liquidation
//   rate_model    kink, slope1, slope2
//   distributions trading|borrowing|liquidation -> {lp, liquidator, protocol}
//   tiers         thresholds[5], discounts[6], max_leverages[6]
//   protocol      owner, validator_hotkey, treasury, netuid, function_permissions[3]
//
// Amounts and fixed-point values are decimal strings (plain JSON integers are
// accepted when they fit 64 bits). Addresses and hotkeys are 0x-prefixed hex.

struct GeneralConfig {
    std::string log_level = "info";
};

class ProtocolConfig {
public:
    GeneralConfig general;
    ProtocolParams params = ProtocolParams::mainnet_defaults();
    Address owner{};

    ProtocolConfig() = default;

    // Throws std::runtime_error on unreadable files or malformed values
    static ProtocolConfig from_file(std::string_view path);
    static ProtocolConfig from_json(std::string_view content);

    ProtocolConfig& with_owner(const Address& address) {
        owner = address;
        return *this;
    }

    ProtocolConfig& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    ProtocolConfig& with_params(const ProtocolParams& p) {
        params = p;
        return *this;
    }

    // errors::OK, or the code of the first violated rule
    int32_t validate() const;

    // Sets the global log level from general.log_level
    void apply_logging() const;
};

} // namespace tenex

#endif // TENEX_CONFIG_HPP
