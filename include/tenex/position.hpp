#ifndef TENEX_POSITION_HPP
#define TENEX_POSITION_HPP

#include <string>
#include <optional>

#include "types.hpp"
#include "state.hpp"
#include "gateway.hpp"
#include "fees.hpp"
#include "pool.hpp"

namespace tenex {

// =============================================================================
// Operation Results
// =============================================================================

struct OpenResult {
    int32_t status;
    Amount borrowed;
    Amount token_amount;
    Amount trading_fee;
    Amount entry_price;
};

struct CloseResult {
    int32_t status;
    Amount token_amount_closed;
    Amount proceeds;
    Amount borrowed_repaid;
    Amount borrowing_fees_paid;
    Amount trading_fee;
    Amount net_return;
    I128 pnl;
    bool fully_closed;
};

struct AddCollateralResult {
    int32_t status;
    Amount token_amount_added;
};

struct LiquidationResult {
    int32_t status;
    Amount position_value;
    Amount proceeds;
    Amount debt_repaid;
    Amount bad_debt;
    Amount lp_loss;           // part of bad_debt written off against LP stakes
    Amount liquidation_fee;
    Amount liquidator_bonus;
    Amount user_return;
};

// =============================================================================
// PositionEngine - open / close / add collateral / liquidate
// =============================================================================
//
// States per (user, netuid): Absent -> Active -> Absent. A partial close
// shrinks the position in place. Any failed step returns its status; the
// caller discards the working state, and external stakes already moved are
// reversed here before returning.

class PositionEngine {
public:
    PositionEngine(ProtocolState& state, StakingGateway& gateway,
                   FeeAccounting& fees, LiquidityPool& pool);

    // validator: hotkey to stake through, zero selects the protocol validator
    OpenResult open(const Address& user, Netuid netuid, FixedPoint leverage,
                    FixedPoint max_slippage, Amount collateral, const Hotkey& validator);

    // amount: alpha to unwind, 0 closes the whole position
    CloseResult close(const Address& user, Netuid netuid, Amount amount, FixedPoint max_slippage);

    AddCollateralResult add_collateral(const Address& user, Netuid netuid, Amount amount);

    LiquidationResult liquidate(const Address& liquidator, const Address& user, Netuid netuid,
                                const std::string& justification, const ContentHash& content_hash);

    // =========================================================================
    // Queries
    // =========================================================================

    static const Position* find_active(const ProtocolState& state, const Address& user,
                                       Netuid netuid);

    // Fees accrued since the last update at the pair's current rate, plus settled fees
    static Amount live_accrued_fees(const ProtocolState& state, const Position& position,
                                    Netuid netuid);

    // Simulated macro value of the position's tokens
    static Amount position_value(const StakingGateway& gateway, const Position& position,
                                 Netuid netuid);

    static std::optional<FixedPoint> health_ratio(const ProtocolState& state,
                                                  const StakingGateway& gateway,
                                                  const Address& user, Netuid netuid);
    static std::optional<Amount> liquidation_price(const ProtocolState& state,
                                                   const Address& user, Netuid netuid);
    static bool is_liquidatable(const ProtocolState& state, const StakingGateway& gateway,
                                const Address& user, Netuid netuid);

private:
    ProtocolState& state_;
    StakingGateway& gateway_;
    FeeAccounting& fees_;
    LiquidityPool& pool_;

    Pair& pair_for_open(Netuid netuid);
    void accrue(Position& position, Netuid netuid);

    // min_acceptable = expected * (PRECISION - slippage) / PRECISION
    static Amount min_acceptable(Amount expected, FixedPoint max_slippage);

    void record_trade(const Address& user, Amount volume);
};

} // namespace tenex

#endif // TENEX_POSITION_HPP
