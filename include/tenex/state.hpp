#ifndef TENEX_STATE_HPP
#define TENEX_STATE_HPP

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"
#include "math.hpp"
#include "params.hpp"
#include "events.hpp"

namespace tenex {

// =============================================================================
// Position (keyed by user + netuid)
// =============================================================================

struct Position {
    Amount collateral;        // macro
    Amount borrowed;          // macro
    Amount token_amount;      // alpha, micro
    FixedPoint leverage;
    Amount entry_price;       // macro per alpha
    BlockHeight last_update_block;
    Amount accrued_fees;      // macro, settled up to last_update_block
    bool is_active;
    Hotkey validator;
};

// =============================================================================
// Pair (one per subnet)
// =============================================================================

struct Pair {
    Amount total_collateral;
    Amount total_borrowed;
    FixedPoint utilization_rate;
    FixedPoint borrowing_rate;  // per 360 blocks
    FixedPoint max_leverage;
    bool is_active;
};

// =============================================================================
// Reward Participants
// =============================================================================

struct LiquidityProvider {
    Amount stake;
    Amount shares;
    Amount reward_debt;       // shares * acc_lp_fees_per_share / ACC_PRECISION
    BlockHeight last_reward_block;
    bool is_active;
    Amount rewards;           // settled, claimable
};

struct LiquidatorAccount {
    Amount score;             // cumulative liquidated value
    Amount reward_debt;
    Amount rewards;
};

// Amounts are alpha (micro) bought by a buyback
struct VestingSchedule {
    Amount total_amount;
    Amount claimed_amount;
    BlockHeight start_block;
    BlockHeight cliff_block;
    BlockHeight end_block;
    bool revoked;
};

struct UserAggregate {
    Amount total_collateral;
    Amount total_borrowed;
    Amount total_volume;
    uint64_t trade_count;
};

// =============================================================================
// Table - journaled entity table
// =============================================================================
//
// Writes go through touch()/find_mut()/erase(), which save the entry's prior
// value the first time it is written. rollback() restores those entries,
// commit() forgets them, so undoing an operation costs only what it touched.

template <typename K, typename V, typename Hash = std::hash<K>>
class Table {
public:
    using Map = std::unordered_map<K, V, Hash>;
    using const_iterator = typename Map::const_iterator;

    // nullptr when absent
    const V* find(const K& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() ? &it->second : nullptr;
    }

    // Throws std::out_of_range when absent
    const V& at(const K& key) const { return entries_.at(key); }

    bool contains(const K& key) const { return entries_.count(key) > 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Entry for writing, value-initialized when absent
    V& touch(const K& key) {
        save(key);
        return entries_[key];
    }

    // Existing entry for writing, nullptr when absent
    V* find_mut(const K& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) return nullptr;
        save(key);
        return &it->second;
    }

    void erase(const K& key) {
        if (!contains(key)) return;
        save(key);
        entries_.erase(key);
    }

    void commit() { undo_.clear(); }

    void rollback() {
        for (auto& [key, prior] : undo_) {
            if (prior) {
                entries_[key] = std::move(*prior);
            } else {
                entries_.erase(key);
            }
        }
        undo_.clear();
    }

private:
    Map entries_;
    std::unordered_map<K, std::optional<V>, Hash> undo_;

    void save(const K& key) {
        if (undo_.count(key) > 0) return;
        auto it = entries_.find(key);
        undo_.emplace(key, it != entries_.end() ? std::optional<V>(it->second) : std::nullopt);
    }
};

// =============================================================================
// LedgerTotals - scalar part of the ledger
// =============================================================================
//
// Small enough to snapshot whole at the start of every operation.

struct LedgerTotals {
    ProtocolParams params;

    Address owner{};
    BlockHeight current_block = 0;
    bool paused = false;
    bool circuit_breaker = false;

    // Pool totals
    Amount total_lp_stakes = 0;     // LP claim on the pool, net of absorbed bad debt
    Amount total_lp_shares = 0;
    Amount total_borrowed = 0;
    Amount total_collateral = 0;

    // Reward accumulators (scaled by ACC_PRECISION)
    U128 acc_lp_fees_per_share = 0;
    U128 acc_liquidator_fees_per_score = 0;
    Amount total_liquidator_score = 0;

    // Fee sinks
    Amount buyback_pool = 0;
    Amount protocol_fees = 0;       // cumulative protocol share
    Amount unallocated_fees = 0;    // shares dropped for lack of recipients
    BlockHeight last_buyback_block = 0;

    // Native token held by the protocol (macro)
    Amount native_balance = 0;

    // Statistics
    Amount total_volume = 0;
    uint64_t total_trades = 0;
    uint64_t total_liquidations = 0;
    Amount total_bad_debt = 0;
    Amount total_lp_losses = 0;     // bad debt written off against LP stakes
    Amount total_buyback_spent = 0;
    Amount total_tokens_bought = 0;
    uint64_t buyback_count = 0;
};

// =============================================================================
// ProtocolState - the single shared ledger
// =============================================================================
//
// Owned by Protocol. Service classes mutate it through a reference; the
// orchestrator takes a checkpoint before every entry point and either
// commits or rolls back to it.

struct ProtocolState : LedgerTotals {
    // Entity tables
    Table<PositionKey, Position, PositionKeyHash> positions;
    Table<Netuid, Pair> pairs;
    Table<Address, LiquidityProvider, AddressHash> liquidity_providers;
    Table<Address, LiquidatorAccount, AddressHash> liquidators;
    Table<Address, std::vector<VestingSchedule>, AddressHash> vesting;
    Table<Address, UserAggregate, AddressHash> users;

    // Admission bookkeeping
    Table<Address, BlockHeight, AddressHash> last_user_action;
    Table<Address, BlockHeight, AddressHash> last_lp_action;
    Table<Address, bool, AddressHash> permitted_callers;

    // Cumulative native transfers out, per recipient
    Table<Address, Amount, AddressHash> paid_out;

    // Events of the running operation, published on commit
    std::vector<Event> pending_events;

    LedgerTotals checkpoint() const { return *this; }

    void commit() {
        for_each_table([](auto& table) { table.commit(); });
    }

    void rollback(const LedgerTotals& saved) {
        static_cast<LedgerTotals&>(*this) = saved;
        for_each_table([](auto& table) { table.rollback(); });
        pending_events.clear();
    }

private:
    template <typename Fn>
    void for_each_table(Fn&& fn) {
        fn(positions);
        fn(pairs);
        fn(liquidity_providers);
        fn(liquidators);
        fn(vesting);
        fn(users);
        fn(last_user_action);
        fn(last_lp_action);
        fn(permitted_callers);
        fn(paid_out);
    }
};

// =============================================================================
// Native Balance Movements
// =============================================================================

inline void receive_native(ProtocolState& state, Amount amount) {
    state.native_balance = fp::add(state.native_balance, amount);
}

// Transfer out of the protocol balance
inline int32_t pay_out(ProtocolState& state, const Address& to, Amount amount) {
    if (amount == 0) return errors::OK;
    if (is_zero(to) || state.native_balance < amount) return errors::TRANSFER_FAILED;
    state.native_balance -= amount;
    Amount& total = state.paid_out.touch(to);
    total = fp::add(total, amount);
    return errors::OK;
}

} // namespace tenex

#endif // TENEX_STATE_HPP
