#ifndef TENEX_PROTOCOL_HPP
#define TENEX_PROTOCOL_HPP

#include <atomic>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "types.hpp"
#include "params.hpp"
#include "state.hpp"
#include "events.hpp"
#include "gateway.hpp"
#include "fees.hpp"
#include "pool.hpp"
#include "position.hpp"
#include "buyback.hpp"

namespace tenex {

// =============================================================================
// Query Snapshots
// =============================================================================

struct ProtocolStats {
    Amount total_collateral;
    Amount total_borrowed;
    Amount total_volume;
    uint64_t total_trades;
    Amount protocol_fees;
    Amount total_lp_stakes;
    Amount buyback_pool;
    Amount total_bad_debt;
    Amount total_lp_losses;
    uint64_t total_liquidations;
    Amount unallocated_fees;
    uint64_t buyback_count;
    bool paused;
    bool circuit_breaker;
};

struct UserStats {
    Amount total_collateral;
    Amount total_borrowed;
    Amount total_volume;
    uint64_t trade_count;
    uint8_t tier;
    bool is_liquidity_provider;
};

struct LiquidityStats {
    Amount total_lp_stakes;
    Amount total_lp_shares;
    FixedPoint utilization;
    Amount available_liquidity;
};

// =============================================================================
// Protocol - serialized entry points over one ProtocolState
// =============================================================================
//
// Each entry point checks admission (reentrancy, pause, function permission,
// cooldown) and runs the engines on the live state. A failed operation rolls
// back to the checkpoint taken on entry. Events are published after the lock
// is released. Status codes come from tenex::errors.

class Protocol {
public:
    // Throws std::invalid_argument when params fail validation or owner is zero
    Protocol(StakingGateway& gateway, const Address& owner,
             const ProtocolParams& params = ProtocolParams::mainnet_defaults());
    ~Protocol() = default;

    // Non-copyable
    Protocol(const Protocol&) = delete;
    Protocol& operator=(const Protocol&) = delete;

    // Called once per committed event, outside the state lock
    void set_event_callback(EventCallback callback);

    // =========================================================================
    // Trading
    // =========================================================================

    OpenResult open_position(const Address& caller, Netuid netuid, FixedPoint leverage,
                             FixedPoint max_slippage, Amount collateral,
                             const Hotkey& validator = Hotkey{});
    CloseResult close_position(const Address& caller, Netuid netuid, Amount amount,
                               FixedPoint max_slippage);
    AddCollateralResult add_collateral(const Address& caller, Netuid netuid, Amount amount);
    LiquidationResult liquidate_position(const Address& caller, const Address& user,
                                         Netuid netuid, const std::string& justification,
                                         const ContentHash& content_hash);

    // =========================================================================
    // Liquidity and Rewards
    // =========================================================================

    LiquidityResult add_liquidity(const Address& caller, Amount amount);
    LiquidityResult remove_liquidity(const Address& caller, Amount amount);
    ClaimResult claim_lp_rewards(const Address& caller);
    ClaimResult claim_liquidator_rewards(const Address& caller);

    // =========================================================================
    // Buyback and Vesting
    // =========================================================================

    BuybackResult execute_buyback(const Address& caller);
    ClaimResult claim_vested(const Address& caller, const Address& destination);

    // =========================================================================
    // Administration (owner only)
    // =========================================================================

    int32_t emergency_pause(const Address& caller);
    int32_t reset_liquidity_circuit_breaker(const Address& caller, bool engaged);
    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

    // Host clock; heights never move backwards
    int32_t set_block_number(BlockHeight block);

    int32_t update_risk_parameters(const Address& caller, FixedPoint max_leverage,
                                   FixedPoint liquidation_threshold);
    int32_t update_liquidity_guardrails(const Address& caller, Amount min_liquidity_threshold,
                                        FixedPoint max_utilization_rate,
                                        FixedPoint liquidity_buffer_ratio);
    int32_t update_action_cooldowns(const Address& caller, uint64_t user_blocks,
                                    uint64_t lp_blocks);
    int32_t update_buyback_parameters(const Address& caller, FixedPoint rate,
                                      uint64_t interval_blocks, Amount threshold);
    int32_t update_vesting_parameters(const Address& caller, uint64_t duration_blocks,
                                      uint64_t cliff_blocks);
    int32_t update_fee_parameters(const Address& caller, FixedPoint trading,
                                  FixedPoint borrowing, FixedPoint liquidation);
    int32_t update_rate_model(const Address& caller, FixedPoint kink, FixedPoint slope1,
                              FixedPoint slope2);
    int32_t update_fee_distributions(const Address& caller, const FeeDistribution& trading,
                                     const FeeDistribution& borrowing,
                                     const FeeDistribution& liquidation);
    int32_t update_tier_parameters(const Address& caller,
                                   const std::array<Amount, limits::NUM_TIERS - 1>& thresholds,
                                   const std::array<FixedPoint, limits::NUM_TIERS>& discounts,
                                   const std::array<FixedPoint, limits::NUM_TIERS>& leverages);
    int32_t update_protocol_validator_hotkey(const Address& caller, const Hotkey& hotkey);
    int32_t update_treasury(const Address& caller, const Address& treasury);
    int32_t update_pair(const Address& caller, Netuid netuid, FixedPoint max_leverage,
                        bool active);
    int32_t update_function_permissions(const Address& caller,
                                        const std::array<bool, functions::COUNT>& flags);
    int32_t set_caller_permission(const Address& caller, const Address& account, bool permitted);
    int32_t revoke_vesting_schedule(const Address& caller, const Address& beneficiary,
                                    size_t index);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Position> get_position(const Address& user, Netuid netuid) const;
    std::optional<Pair> get_pair(Netuid netuid) const;
    std::optional<LiquidityProvider> get_liquidity_provider(const Address& provider) const;
    Amount pending_lp_rewards(const Address& provider) const;
    Amount pending_liquidator_rewards(const Address& liquidator) const;
    std::vector<VestingSchedule> get_vesting_schedules(const Address& beneficiary) const;
    Amount vested_amount(const Address& beneficiary) const;  // claimable now

    ProtocolStats get_protocol_stats() const;
    UserStats get_user_stats(const Address& user) const;
    LiquidityStats get_liquidity_stats() const;

    uint8_t user_tier(const Address& user) const;
    std::optional<FixedPoint> health_ratio(const Address& user, Netuid netuid) const;
    std::optional<Amount> liquidation_price(const Address& user, Netuid netuid) const;
    bool is_liquidatable(const Address& user, Netuid netuid) const;
    bool can_execute_buyback() const;

    ProtocolParams params() const;
    Address owner() const;
    BlockHeight block_number() const;
    Amount native_balance() const;

private:
    StakingGateway& gateway_;
    ProtocolState state_;
    mutable std::shared_mutex mutex_;

    // Thread currently inside a mutating entry point
    std::atomic<std::thread::id> active_thread_{};

    EventCallback on_event_;

    template <typename Result, typename Fn>
    Result transact(const char* operation, Fn&& fn);

    template <typename Fn>
    int32_t administer(const char* operation, const Address& caller, Fn&& fn);

    // Shared lock, or none when called from inside an entry point (gateway callback)
    std::shared_lock<std::shared_mutex> read_lock() const;
};

} // namespace tenex

#endif // TENEX_PROTOCOL_HPP
