// =============================================================================
// protocol.cpp - Protocol Orchestrator
// =============================================================================

#include "tenex/protocol.hpp"
#include "tenex/math.hpp"
#include "tenex/log.hpp"

#include <mutex>
#include <stdexcept>

namespace tenex {

namespace {

constexpr const char* COMPONENT = "protocol";

// Engines bound to the ledger for one operation
struct Engines {
    FeeAccounting fees;
    LiquidityPool pool;
    PositionEngine positions;
    BuybackEngine buyback;

    Engines(ProtocolState& state, StakingGateway& gateway)
        : fees(state, gateway),
          pool(state, fees),
          positions(state, gateway, fees, pool),
          buyback(state, gateway) {}

    Engines(const Engines&) = delete;
    Engines& operator=(const Engines&) = delete;
};

// Marks the calling thread as inside a mutating entry point
class ActiveThreadGuard {
public:
    explicit ActiveThreadGuard(std::atomic<std::thread::id>& slot) : slot_(slot) {
        slot_.store(std::this_thread::get_id());
    }
    ~ActiveThreadGuard() { slot_.store(std::thread::id{}); }

    ActiveThreadGuard(const ActiveThreadGuard&) = delete;
    ActiveThreadGuard& operator=(const ActiveThreadGuard&) = delete;

private:
    std::atomic<std::thread::id>& slot_;
};

using LastAction = Table<Address, BlockHeight, AddressHash>;

int32_t check_permission(const ProtocolState& state, const Address& caller, size_t function) {
    if (!state.params.function_permissions[function]) return errors::OK;
    return state.permitted_callers.contains(caller) ? errors::OK : errors::UNAUTHORIZED;
}

int32_t check_cooldown(const LastAction& last, const Address& caller, BlockHeight now,
                       uint64_t cooldown) {
    if (cooldown == 0) return errors::OK;
    const BlockHeight* previous = last.find(caller);
    if (previous == nullptr) return errors::OK;
    return now >= *previous + cooldown ? errors::OK : errors::RATE_LIMITED;
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

Protocol::Protocol(StakingGateway& gateway, const Address& owner, const ProtocolParams& params)
    : gateway_(gateway) {
    if (is_zero(owner)) {
        throw std::invalid_argument("Protocol owner must be a nonzero address");
    }
    int32_t rc = validation::all(params);
    if (rc != errors::OK) {
        throw std::invalid_argument(std::string("Invalid protocol parameters: ") + error_name(rc));
    }
    state_.params = params;
    state_.owner = owner;
}

void Protocol::set_event_callback(EventCallback callback) {
    std::unique_lock lock(mutex_);
    on_event_ = std::move(callback);
}

// =============================================================================
// Transaction Runner
// =============================================================================

template <typename Result, typename Fn>
Result Protocol::transact(const char* operation, Fn&& fn) {
    if (active_thread_.load() == std::this_thread::get_id()) {
        log::warn(COMPONENT, std::string(operation) + " rejected: REENTRANCY");
        return Result{.status = errors::REENTRANCY};
    }

    Result result{};
    std::vector<Event> events;
    EventCallback callback;
    {
        std::unique_lock lock(mutex_);
        ActiveThreadGuard guard(active_thread_);

        LedgerTotals saved = state_.checkpoint();
        try {
            Engines engines(state_, gateway_);
            result = fn(state_, engines);
            if (result.status == errors::OK) {
                engines.pool.circuit_breaker_check();
            }
        } catch (const MathError& e) {
            log::error(COMPONENT, std::string(operation) + ": " + e.what());
            result = Result{.status = e.code()};
        } catch (...) {
            state_.rollback(saved);
            throw;
        }

        if (result.status == errors::OK) {
            events = std::move(state_.pending_events);
            state_.pending_events.clear();
            state_.commit();
            callback = on_event_;
        } else {
            state_.rollback(saved);
        }
    }

    if (result.status != errors::OK) {
        log::warn(COMPONENT, std::string(operation) + " rejected: " + error_name(result.status));
        return result;
    }

    for (const auto& event : events) {
        if (log::enabled(log::Level::DEBUG)) {
            log::debug(COMPONENT, event_to_json(event));
        }
        if (callback) callback(event);
    }
    return result;
}

template <typename Fn>
int32_t Protocol::administer(const char* operation, const Address& caller, Fn&& fn) {
    if (active_thread_.load() == std::this_thread::get_id()) {
        log::warn(COMPONENT, std::string(operation) + " rejected: REENTRANCY");
        return errors::REENTRANCY;
    }

    int32_t rc = errors::OK;
    std::vector<Event> events;
    EventCallback callback;
    {
        std::unique_lock lock(mutex_);
        ActiveThreadGuard guard(active_thread_);

        if (caller != state_.owner) {
            rc = errors::UNAUTHORIZED;
        } else {
            LedgerTotals saved = state_.checkpoint();
            try {
                rc = fn(state_);
            } catch (const MathError& e) {
                log::error(COMPONENT, std::string(operation) + ": " + e.what());
                rc = e.code();
            } catch (...) {
                state_.rollback(saved);
                throw;
            }

            if (rc == errors::OK) {
                events = std::move(state_.pending_events);
                state_.pending_events.clear();
                state_.commit();
                callback = on_event_;
            } else {
                state_.rollback(saved);
            }
        }
    }

    if (rc != errors::OK) {
        log::warn(COMPONENT, std::string(operation) + " rejected: " + error_name(rc));
        return rc;
    }

    log::info(COMPONENT, std::string(operation) + " applied");
    for (const auto& event : events) {
        if (log::enabled(log::Level::DEBUG)) {
            log::debug(COMPONENT, event_to_json(event));
        }
        if (callback) callback(event);
    }
    return rc;
}

std::shared_lock<std::shared_mutex> Protocol::read_lock() const {
    // A gateway callback runs on the thread that already holds the exclusive
    // lock; it reads the operation's in-progress state without locking again.
    if (active_thread_.load() == std::this_thread::get_id()) {
        return std::shared_lock<std::shared_mutex>();
    }
    return std::shared_lock<std::shared_mutex>(mutex_);
}

// =============================================================================
// Trading
// =============================================================================

OpenResult Protocol::open_position(const Address& caller, Netuid netuid, FixedPoint leverage,
                                   FixedPoint max_slippage, Amount collateral,
                                   const Hotkey& validator) {
    return transact<OpenResult>("open_position", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return OpenResult{.status = errors::PAUSED};
        if (s.circuit_breaker) return OpenResult{.status = errors::CIRCUIT_BREAKER};

        int32_t rc = check_permission(s, caller, functions::OPEN_POSITION);
        if (rc == errors::OK) {
            rc = check_cooldown(s.last_user_action, caller, s.current_block,
                                s.params.user_cooldown_blocks);
        }
        if (rc != errors::OK) return OpenResult{.status = rc};

        OpenResult result = e.positions.open(caller, netuid, leverage, max_slippage,
                                             collateral, validator);
        if (result.status == errors::OK) s.last_user_action.touch(caller) = s.current_block;
        return result;
    });
}

CloseResult Protocol::close_position(const Address& caller, Netuid netuid, Amount amount,
                                     FixedPoint max_slippage) {
    return transact<CloseResult>("close_position", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return CloseResult{.status = errors::PAUSED};

        int32_t rc = check_cooldown(s.last_user_action, caller, s.current_block,
                                    s.params.user_cooldown_blocks);
        if (rc != errors::OK) return CloseResult{.status = rc};

        CloseResult result = e.positions.close(caller, netuid, amount, max_slippage);
        if (result.status == errors::OK) s.last_user_action.touch(caller) = s.current_block;
        return result;
    });
}

AddCollateralResult Protocol::add_collateral(const Address& caller, Netuid netuid,
                                             Amount amount) {
    return transact<AddCollateralResult>("add_collateral", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return AddCollateralResult{.status = errors::PAUSED};

        int32_t rc = check_cooldown(s.last_user_action, caller, s.current_block,
                                    s.params.user_cooldown_blocks);
        if (rc != errors::OK) return AddCollateralResult{.status = rc};

        AddCollateralResult result = e.positions.add_collateral(caller, netuid, amount);
        if (result.status == errors::OK) s.last_user_action.touch(caller) = s.current_block;
        return result;
    });
}

LiquidationResult Protocol::liquidate_position(const Address& caller, const Address& user,
                                               Netuid netuid, const std::string& justification,
                                               const ContentHash& content_hash) {
    return transact<LiquidationResult>("liquidate_position", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return LiquidationResult{.status = errors::PAUSED};

        int32_t rc = check_permission(s, caller, functions::LIQUIDATE_POSITION);
        if (rc != errors::OK) return LiquidationResult{.status = rc};

        return e.positions.liquidate(caller, user, netuid, justification, content_hash);
    });
}

// =============================================================================
// Liquidity and Rewards
// =============================================================================

LiquidityResult Protocol::add_liquidity(const Address& caller, Amount amount) {
    return transact<LiquidityResult>("add_liquidity", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return LiquidityResult{.status = errors::PAUSED};

        int32_t rc = check_permission(s, caller, functions::ADD_LIQUIDITY);
        if (rc == errors::OK) {
            rc = check_cooldown(s.last_lp_action, caller, s.current_block,
                                s.params.lp_cooldown_blocks);
        }
        if (rc != errors::OK) return LiquidityResult{.status = rc};

        LiquidityResult result = e.pool.deposit(caller, amount);
        if (result.status == errors::OK) s.last_lp_action.touch(caller) = s.current_block;
        return result;
    });
}

LiquidityResult Protocol::remove_liquidity(const Address& caller, Amount amount) {
    return transact<LiquidityResult>("remove_liquidity", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return LiquidityResult{.status = errors::PAUSED};

        int32_t rc = check_cooldown(s.last_lp_action, caller, s.current_block,
                                    s.params.lp_cooldown_blocks);
        if (rc != errors::OK) return LiquidityResult{.status = rc};

        LiquidityResult result = e.pool.withdraw(caller, amount);
        if (result.status == errors::OK) s.last_lp_action.touch(caller) = s.current_block;
        return result;
    });
}

ClaimResult Protocol::claim_lp_rewards(const Address& caller) {
    return transact<ClaimResult>("claim_lp_rewards", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return ClaimResult{.status = errors::PAUSED};
        return e.fees.claim_lp_rewards(caller);
    });
}

ClaimResult Protocol::claim_liquidator_rewards(const Address& caller) {
    return transact<ClaimResult>("claim_liquidator_rewards", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return ClaimResult{.status = errors::PAUSED};
        return e.fees.claim_liquidator_rewards(caller);
    });
}

// =============================================================================
// Buyback and Vesting
// =============================================================================

BuybackResult Protocol::execute_buyback(const Address& caller) {
    (void)caller;  // permissionless
    return transact<BuybackResult>("execute_buyback", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return BuybackResult{.status = errors::PAUSED};
        return e.buyback.execute();
    });
}

ClaimResult Protocol::claim_vested(const Address& caller, const Address& destination) {
    return transact<ClaimResult>("claim_vested", [&](ProtocolState& s, Engines& e) {
        if (s.paused) return ClaimResult{.status = errors::PAUSED};
        return e.buyback.claim_vested(caller, destination);
    });
}

// =============================================================================
// Administration
// =============================================================================

int32_t Protocol::emergency_pause(const Address& caller) {
    return administer("emergency_pause", caller, [](ProtocolState& s) {
        s.paused = !s.paused;
        log::warn(COMPONENT, s.paused ? "protocol paused" : "protocol unpaused");
        return errors::OK;
    });
}

int32_t Protocol::reset_liquidity_circuit_breaker(const Address& caller, bool engaged) {
    return administer("reset_liquidity_circuit_breaker", caller, [engaged](ProtocolState& s) {
        if (s.circuit_breaker != engaged) {
            s.circuit_breaker = engaged;
            s.pending_events.emplace_back(CircuitBreakerChanged{
                .engaged = engaged,
                .total_lp_stakes = s.total_lp_stakes,
                .utilization = LiquidityPool::utilization(s),
                .block = s.current_block
            });
        }
        return errors::OK;
    });
}

int32_t Protocol::transfer_ownership(const Address& caller, const Address& new_owner) {
    return administer("transfer_ownership", caller, [&new_owner](ProtocolState& s) {
        if (is_zero(new_owner)) return errors::INVALID_PARAMETER;
        s.owner = new_owner;
        return errors::OK;
    });
}

int32_t Protocol::set_block_number(BlockHeight block) {
    if (active_thread_.load() == std::this_thread::get_id()) return errors::REENTRANCY;

    std::unique_lock lock(mutex_);
    if (block < state_.current_block) return errors::INVALID_PARAMETER;
    state_.current_block = block;
    return errors::OK;
}

int32_t Protocol::update_risk_parameters(const Address& caller, FixedPoint max_leverage,
                                         FixedPoint liquidation_threshold) {
    return administer("update_risk_parameters", caller, [&](ProtocolState& s) {
        int32_t rc = validation::risk_parameters(max_leverage, liquidation_threshold);
        if (rc != errors::OK) return rc;
        s.params.max_leverage = max_leverage;
        s.params.liquidation_threshold = liquidation_threshold;
        return errors::OK;
    });
}

int32_t Protocol::update_liquidity_guardrails(const Address& caller, Amount min_liquidity_threshold,
                                              FixedPoint max_utilization_rate,
                                              FixedPoint liquidity_buffer_ratio) {
    return administer("update_liquidity_guardrails", caller, [&](ProtocolState& s) {
        int32_t rc = validation::liquidity_guardrails(min_liquidity_threshold,
                                                      max_utilization_rate,
                                                      liquidity_buffer_ratio);
        if (rc != errors::OK) return rc;
        s.params.min_liquidity_threshold = min_liquidity_threshold;
        s.params.max_utilization_rate = max_utilization_rate;
        s.params.liquidity_buffer_ratio = liquidity_buffer_ratio;

        Engines engines(s, gateway_);
        engines.pool.circuit_breaker_check();
        return errors::OK;
    });
}

int32_t Protocol::update_action_cooldowns(const Address& caller, uint64_t user_blocks,
                                          uint64_t lp_blocks) {
    return administer("update_action_cooldowns", caller, [&](ProtocolState& s) {
        int32_t rc = validation::action_cooldowns(user_blocks, lp_blocks);
        if (rc != errors::OK) return rc;
        s.params.user_cooldown_blocks = user_blocks;
        s.params.lp_cooldown_blocks = lp_blocks;
        return errors::OK;
    });
}

int32_t Protocol::update_buyback_parameters(const Address& caller, FixedPoint rate,
                                            uint64_t interval_blocks, Amount threshold) {
    return administer("update_buyback_parameters", caller, [&](ProtocolState& s) {
        int32_t rc = validation::buyback_parameters(rate, interval_blocks, threshold);
        if (rc != errors::OK) return rc;
        s.params.buyback_rate = rate;
        s.params.buyback_interval_blocks = interval_blocks;
        s.params.buyback_execution_threshold = threshold;
        return errors::OK;
    });
}

int32_t Protocol::update_vesting_parameters(const Address& caller, uint64_t duration_blocks,
                                            uint64_t cliff_blocks) {
    return administer("update_vesting_parameters", caller, [&](ProtocolState& s) {
        int32_t rc = validation::vesting_parameters(duration_blocks, cliff_blocks);
        if (rc != errors::OK) return rc;
        s.params.vesting_duration_blocks = duration_blocks;
        s.params.cliff_duration_blocks = cliff_blocks;
        return errors::OK;
    });
}

int32_t Protocol::update_fee_parameters(const Address& caller, FixedPoint trading,
                                        FixedPoint borrowing, FixedPoint liquidation) {
    return administer("update_fee_parameters", caller, [&](ProtocolState& s) {
        int32_t rc = validation::fee_parameters(trading, borrowing, liquidation);
        if (rc != errors::OK) return rc;
        s.params.trading_fee_rate = trading;
        s.params.borrowing_fee_rate = borrowing;
        s.params.liquidation_fee_rate = liquidation;

        Engines engines(s, gateway_);
        engines.pool.refresh_all_pairs();
        return errors::OK;
    });
}

int32_t Protocol::update_rate_model(const Address& caller, FixedPoint kink, FixedPoint slope1,
                                    FixedPoint slope2) {
    return administer("update_rate_model", caller, [&](ProtocolState& s) {
        int32_t rc = validation::rate_model(kink, slope1, slope2);
        if (rc != errors::OK) return rc;
        s.params.rate_kink = kink;
        s.params.rate_slope1 = slope1;
        s.params.rate_slope2 = slope2;

        Engines engines(s, gateway_);
        engines.pool.refresh_all_pairs();
        return errors::OK;
    });
}

int32_t Protocol::update_fee_distributions(const Address& caller, const FeeDistribution& trading,
                                           const FeeDistribution& borrowing,
                                           const FeeDistribution& liquidation) {
    return administer("update_fee_distributions", caller, [&](ProtocolState& s) {
        for (const auto* dist : {&trading, &borrowing, &liquidation}) {
            int32_t rc = validation::fee_distribution(*dist);
            if (rc != errors::OK) return rc;
        }
        s.params.trading_distribution = trading;
        s.params.borrowing_distribution = borrowing;
        s.params.liquidation_distribution = liquidation;
        return errors::OK;
    });
}

int32_t Protocol::update_tier_parameters(
    const Address& caller, const std::array<Amount, limits::NUM_TIERS - 1>& thresholds,
    const std::array<FixedPoint, limits::NUM_TIERS>& discounts,
    const std::array<FixedPoint, limits::NUM_TIERS>& leverages) {
    return administer("update_tier_parameters", caller, [&](ProtocolState& s) {
        int32_t rc = validation::tier_parameters(thresholds, discounts, leverages,
                                                 s.params.max_leverage);
        if (rc != errors::OK) return rc;
        s.params.tier_thresholds = thresholds;
        s.params.tier_fee_discounts = discounts;
        s.params.tier_max_leverages = leverages;
        return errors::OK;
    });
}

int32_t Protocol::update_protocol_validator_hotkey(const Address& caller, const Hotkey& hotkey) {
    return administer("update_protocol_validator_hotkey", caller, [&](ProtocolState& s) {
        if (is_zero(hotkey)) return errors::INVALID_PARAMETER;
        s.params.protocol_validator_hotkey = hotkey;
        return errors::OK;
    });
}

int32_t Protocol::update_treasury(const Address& caller, const Address& treasury) {
    return administer("update_treasury", caller, [&](ProtocolState& s) {
        if (is_zero(treasury)) return errors::INVALID_PARAMETER;
        s.params.treasury = treasury;
        return errors::OK;
    });
}

int32_t Protocol::update_pair(const Address& caller, Netuid netuid, FixedPoint max_leverage,
                              bool active) {
    return administer("update_pair", caller, [&](ProtocolState& s) {
        if (max_leverage < PRECISION || max_leverage > s.params.max_leverage) {
            return errors::INVALID_PARAMETER;
        }
        Pair& pair = s.pairs.touch(netuid);
        pair.max_leverage = max_leverage;
        pair.is_active = active;

        Engines engines(s, gateway_);
        engines.pool.refresh_pair(netuid);
        return errors::OK;
    });
}

int32_t Protocol::update_function_permissions(const Address& caller,
                                              const std::array<bool, functions::COUNT>& flags) {
    return administer("update_function_permissions", caller, [&](ProtocolState& s) {
        s.params.function_permissions = flags;
        return errors::OK;
    });
}

int32_t Protocol::set_caller_permission(const Address& caller, const Address& account,
                                        bool permitted) {
    return administer("set_caller_permission", caller, [&](ProtocolState& s) {
        if (is_zero(account)) return errors::INVALID_PARAMETER;
        if (permitted) {
            s.permitted_callers.touch(account) = true;
        } else {
            s.permitted_callers.erase(account);
        }
        return errors::OK;
    });
}

int32_t Protocol::revoke_vesting_schedule(const Address& caller, const Address& beneficiary,
                                          size_t index) {
    return administer("revoke_vesting_schedule", caller, [&](ProtocolState& s) {
        const std::vector<VestingSchedule>* schedules = s.vesting.find(beneficiary);
        if (schedules == nullptr || schedules->empty()) return errors::NO_VESTING_SCHEDULES;
        if (index >= schedules->size() || (*schedules)[index].revoked) {
            return errors::INVALID_PARAMETER;
        }
        (*s.vesting.find_mut(beneficiary))[index].revoked = true;
        return errors::OK;
    });
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Position> Protocol::get_position(const Address& user, Netuid netuid) const {
    auto lock = read_lock();
    const Position* position = state_.positions.find(PositionKey{user, netuid});
    if (position == nullptr) return std::nullopt;
    return *position;
}

std::optional<Pair> Protocol::get_pair(Netuid netuid) const {
    auto lock = read_lock();
    const Pair* pair = state_.pairs.find(netuid);
    if (pair == nullptr) return std::nullopt;
    return *pair;
}

std::optional<LiquidityProvider> Protocol::get_liquidity_provider(const Address& provider) const {
    auto lock = read_lock();
    const LiquidityProvider* lp = state_.liquidity_providers.find(provider);
    if (lp == nullptr) return std::nullopt;
    return *lp;
}

Amount Protocol::pending_lp_rewards(const Address& provider) const {
    auto lock = read_lock();
    return FeeAccounting::pending_lp_rewards(state_, provider);
}

Amount Protocol::pending_liquidator_rewards(const Address& liquidator) const {
    auto lock = read_lock();
    return FeeAccounting::pending_liquidator_rewards(state_, liquidator);
}

std::vector<VestingSchedule> Protocol::get_vesting_schedules(const Address& beneficiary) const {
    auto lock = read_lock();
    const std::vector<VestingSchedule>* schedules = state_.vesting.find(beneficiary);
    if (schedules == nullptr) return {};
    return *schedules;
}

Amount Protocol::vested_amount(const Address& beneficiary) const {
    auto lock = read_lock();
    return BuybackEngine::claimable(state_, beneficiary);
}

ProtocolStats Protocol::get_protocol_stats() const {
    auto lock = read_lock();
    return ProtocolStats{
        .total_collateral = state_.total_collateral,
        .total_borrowed = state_.total_borrowed,
        .total_volume = state_.total_volume,
        .total_trades = state_.total_trades,
        .protocol_fees = state_.protocol_fees,
        .total_lp_stakes = state_.total_lp_stakes,
        .buyback_pool = state_.buyback_pool,
        .total_bad_debt = state_.total_bad_debt,
        .total_lp_losses = state_.total_lp_losses,
        .total_liquidations = state_.total_liquidations,
        .unallocated_fees = state_.unallocated_fees,
        .buyback_count = state_.buyback_count,
        .paused = state_.paused,
        .circuit_breaker = state_.circuit_breaker
    };
}

UserStats Protocol::get_user_stats(const Address& user) const {
    auto lock = read_lock();
    UserStats stats{};
    if (const UserAggregate* agg = state_.users.find(user)) {
        stats.total_collateral = agg->total_collateral;
        stats.total_borrowed = agg->total_borrowed;
        stats.total_volume = agg->total_volume;
        stats.trade_count = agg->trade_count;
    }
    stats.tier = FeeAccounting::user_tier(state_, gateway_, user);
    const LiquidityProvider* lp = state_.liquidity_providers.find(user);
    stats.is_liquidity_provider = lp != nullptr && lp->is_active;
    return stats;
}

LiquidityStats Protocol::get_liquidity_stats() const {
    auto lock = read_lock();
    return LiquidityStats{
        .total_lp_stakes = state_.total_lp_stakes,
        .total_lp_shares = state_.total_lp_shares,
        .utilization = LiquidityPool::utilization(state_),
        .available_liquidity = LiquidityPool::available_liquidity(state_)
    };
}

uint8_t Protocol::user_tier(const Address& user) const {
    auto lock = read_lock();
    return FeeAccounting::user_tier(state_, gateway_, user);
}

std::optional<FixedPoint> Protocol::health_ratio(const Address& user, Netuid netuid) const {
    auto lock = read_lock();
    return PositionEngine::health_ratio(state_, gateway_, user, netuid);
}

std::optional<Amount> Protocol::liquidation_price(const Address& user, Netuid netuid) const {
    auto lock = read_lock();
    return PositionEngine::liquidation_price(state_, user, netuid);
}

bool Protocol::is_liquidatable(const Address& user, Netuid netuid) const {
    auto lock = read_lock();
    return PositionEngine::is_liquidatable(state_, gateway_, user, netuid);
}

bool Protocol::can_execute_buyback() const {
    auto lock = read_lock();
    return !state_.paused && BuybackEngine::can_execute(state_);
}

ProtocolParams Protocol::params() const {
    auto lock = read_lock();
    return state_.params;
}

Address Protocol::owner() const {
    auto lock = read_lock();
    return state_.owner;
}

BlockHeight Protocol::block_number() const {
    auto lock = read_lock();
    return state_.current_block;
}

Amount Protocol::native_balance() const {
    auto lock = read_lock();
    return state_.native_balance;
}

} // namespace tenex
