// Tenex - Position lifecycle tests

#include <catch2/catch.hpp>
#include <tenex/protocol.hpp>
#include <tenex/risk.hpp>

#include "mock_gateway.hpp"

using namespace tenex;
using namespace tenex::testing;

namespace {

constexpr Netuid NETUID = 1;

const Address OWNER = addr(0xFF);
const Address LP = addr(1);
const Address TRADER = addr(2);
const Address KEEPER = addr(3);

const FixedPoint SLIPPAGE = PRECISION / 100;

struct Market {
    MockGateway gateway;
    Protocol protocol;

    explicit Market(const ProtocolParams& params, uint64_t pool_tokens = 500)
        : protocol(gateway, OWNER, params) {
        LiquidityResult seeded = protocol.add_liquidity(LP, tokens(pool_tokens));
        REQUIRE(seeded.status == errors::OK);
    }
};

} // namespace

TEST_CASE("Open and close round trip", "[position]") {
    Market m(test_params());

    OpenResult opened = m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE,
                                                 tokens(10));
    REQUIRE(opened.status == errors::OK);
    REQUIRE(opened.borrowed == tokens(10));
    REQUIRE(opened.trading_fee == ONE_TOKEN * 6 / 100);
    REQUIRE(opened.token_amount == 1994 * PRECISION / 100);
    REQUIRE(opened.entry_price == ONE_TOKEN);

    auto position = m.protocol.get_position(TRADER, NETUID);
    REQUIRE(position.has_value());
    REQUIRE(position->is_active);
    REQUIRE(position->collateral == tokens(10));
    REQUIRE(m.protocol.get_pair(NETUID)->total_borrowed == tokens(10));

    SECTION("Full close at the same price") {
        CloseResult closed = m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE);
        REQUIRE(closed.status == errors::OK);
        REQUIRE(closed.fully_closed);
        REQUIRE(closed.proceeds == tokens(1994) / 100);
        REQUIRE(closed.borrowed_repaid == tokens(10));
        REQUIRE(closed.borrowing_fees_paid == 0);
        REQUIRE(closed.trading_fee == tokens(5982) / 100000);
        REQUIRE(closed.net_return == tokens(988018) / 100000);
        REQUIRE(closed.pnl == -static_cast<I128>(ONE_TOKEN * 6 / 100));

        REQUIRE_FALSE(m.protocol.get_position(TRADER, NETUID)->is_active);
        REQUIRE(m.protocol.get_pair(NETUID)->total_borrowed == 0);

        ProtocolStats stats = m.protocol.get_protocol_stats();
        REQUIRE(stats.total_trades == 2);
        REQUIRE(stats.total_borrowed == 0);
        REQUIRE(stats.total_collateral == 0);

        // 30% of both trading fees
        REQUIRE(m.protocol.pending_lp_rewards(LP) == 35946000000000000);
    }

    SECTION("Partial close shrinks the position") {
        CloseResult closed = m.protocol.close_position(TRADER, NETUID, 997 * PRECISION / 100,
                                                       SLIPPAGE);
        REQUIRE(closed.status == errors::OK);
        REQUIRE_FALSE(closed.fully_closed);
        REQUIRE(closed.borrowed_repaid == tokens(5));

        auto left = m.protocol.get_position(TRADER, NETUID);
        REQUIRE(left->is_active);
        REQUIRE(left->borrowed == tokens(5));
        REQUIRE(left->collateral == tokens(5));
        REQUIRE(left->token_amount == 997 * PRECISION / 100);
    }

    SECTION("Profit after a price rise") {
        m.gateway.set_price(NETUID, ratio(11, 10));
        CloseResult closed = m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE);
        REQUIRE(closed.status == errors::OK);
        REQUIRE(closed.pnl > 0);
    }

    SECTION("Borrowing fees accrue per block") {
        REQUIRE(m.protocol.set_block_number(360) == errors::OK);
        // 2% utilization: base 0.005% plus 0.02 * slope1
        REQUIRE(m.protocol.get_pair(NETUID)->borrowing_rate == 51000);

        CloseResult closed = m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE);
        REQUIRE(closed.status == errors::OK);
        REQUIRE(closed.borrowing_fees_paid == 510000000000000);
    }

    SECTION("Second open on the same subnet is rejected") {
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, tokens(1))
                    .status == errors::POSITION_EXISTS);
    }

    SECTION("Adding collateral stakes more tokens") {
        AddCollateralResult added = m.protocol.add_collateral(TRADER, NETUID, tokens(5));
        REQUIRE(added.status == errors::OK);
        REQUIRE(added.token_amount_added == 5 * PRECISION);
        REQUIRE(m.protocol.get_position(TRADER, NETUID)->collateral == tokens(15));
    }
}

TEST_CASE("Open validation", "[position]") {
    ProtocolParams params = test_params();
    params.tier_max_leverages = ProtocolParams::mainnet_defaults().tier_max_leverages;
    Market m(params, 100);

    SECTION("Amounts") {
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, 0).status ==
                errors::AMOUNT_ZERO);
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE,
                                         limits::MIN_COLLATERAL - 1).status ==
                errors::AMOUNT_TOO_SMALL);
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, PRECISION + 1,
                                         tokens(1)).status == errors::INVALID_SLIPPAGE);
    }

    SECTION("Leverage is capped by tier") {
        REQUIRE(m.protocol.open_position(TRADER, NETUID, PRECISION - 1, SLIPPAGE, tokens(1))
                    .status == errors::INVALID_LEVERAGE);
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 3 * PRECISION, SLIPPAGE, tokens(1))
                    .status == errors::INVALID_LEVERAGE);

        const ProtocolParams p = m.protocol.params();
        m.gateway.set_owner_balance(p.protocol_validator_hotkey, TRADER, p.protocol_netuid,
                                    to_micro(tokens(1000)));
        REQUIRE(m.protocol.user_tier(TRADER) == 2);
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 3 * PRECISION, SLIPPAGE, tokens(1))
                    .status == errors::OK);
    }

    SECTION("Inactive pair") {
        REQUIRE(m.protocol.update_pair(OWNER, NETUID, 2 * PRECISION, false) == errors::OK);
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, tokens(1))
                    .status == errors::PAIR_INACTIVE);
    }
}

TEST_CASE("Borrow limits", "[position]") {
    ProtocolParams params = test_params();

    SECTION("Buffer reserve") {
        Market m(params, 100);
        // 95 borrowed needs 114 with the 20% buffer
        OpenResult r = m.protocol.open_position(TRADER, NETUID, 6 * PRECISION, SLIPPAGE,
                                                tokens(19));
        REQUIRE(r.status == errors::INSUFFICIENT_LIQUIDITY);
        REQUIRE(error_kind(r.status) == ErrorKind::RESOURCE_EXHAUSTION);
    }

    SECTION("Utilization cap") {
        params.liquidity_buffer_ratio = 0;
        Market m(params, 100);
        OpenResult r = m.protocol.open_position(TRADER, NETUID, 6 * PRECISION, SLIPPAGE,
                                                tokens(19));
        REQUIRE(r.status == errors::UTILIZATION_EXCEEDED);
        REQUIRE(error_kind(r.status) == ErrorKind::RESOURCE_EXHAUSTION);
        REQUIRE(m.protocol.get_protocol_stats().total_borrowed == 0);
    }
}

TEST_CASE("Failed operations roll back", "[position]") {
    Market m(test_params());
    const Amount native_before = m.protocol.native_balance();

    SECTION("Open beyond slippage tolerance") {
        m.gateway.stake_haircut = ratio(5, 100);
        OpenResult r = m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE,
                                                tokens(10));
        REQUIRE(r.status == errors::SLIPPAGE_TOO_HIGH);
        REQUIRE(m.gateway.unstake_calls == 1);
        REQUIRE_FALSE(m.protocol.get_position(TRADER, NETUID).has_value());
        REQUIRE_FALSE(m.protocol.get_pair(NETUID).has_value());
        REQUIRE(m.protocol.get_user_stats(TRADER).trade_count == 0);
        REQUIRE(m.protocol.native_balance() == native_before);
        REQUIRE(m.protocol.get_protocol_stats().protocol_fees == 0);
    }

    SECTION("Open whose unstake reversal fails") {
        m.gateway.stake_haircut = ratio(5, 100);
        m.gateway.fail_unstake = true;
        OpenResult r = m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE,
                                                tokens(10));
        REQUIRE(r.status == errors::COMPENSATION_FAILED);
        REQUIRE(error_kind(r.status) == ErrorKind::EXTERNAL_CALL_FAILURE);
        REQUIRE(m.gateway.unstake_calls == 1);
        REQUIRE_FALSE(m.protocol.get_position(TRADER, NETUID).has_value());
        REQUIRE(m.protocol.native_balance() == native_before);
    }

    SECTION("Stake failure") {
        m.gateway.fail_stake = true;
        OpenResult r = m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE,
                                                tokens(10));
        REQUIRE(r.status == errors::STAKE_FAILED);
        REQUIRE(m.protocol.get_protocol_stats().total_trades == 0);
    }

    SECTION("Close that cannot repay its debt") {
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, tokens(10))
                    .status == errors::OK);
        const Position before = *m.protocol.get_position(TRADER, NETUID);
        const Amount native_open = m.protocol.native_balance();

        m.gateway.set_price(NETUID, ratio(4, 10));
        CloseResult r = m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE);
        REQUIRE(r.status == errors::INSUFFICIENT_PROCEEDS);
        REQUIRE(error_kind(r.status) == ErrorKind::INVARIANT_BREACH);

        const Position after = *m.protocol.get_position(TRADER, NETUID);
        REQUIRE(after.is_active);
        REQUIRE(after.token_amount == before.token_amount);
        REQUIRE(after.borrowed == before.borrowed);
        REQUIRE(m.protocol.native_balance() == native_open);

        const ProtocolParams p = m.protocol.params();
        REQUIRE(m.gateway.protocol_stake(p.protocol_validator_hotkey, NETUID) ==
                before.token_amount);
    }

    SECTION("Close whose restake reversal fails") {
        REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, tokens(10))
                    .status == errors::OK);
        const Position before = *m.protocol.get_position(TRADER, NETUID);

        m.gateway.set_price(NETUID, ratio(4, 10));
        m.gateway.fail_stake = true;
        CloseResult r = m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE);
        REQUIRE(r.status == errors::COMPENSATION_FAILED);
        REQUIRE(error_kind(r.status) == ErrorKind::EXTERNAL_CALL_FAILURE);

        const Position after = *m.protocol.get_position(TRADER, NETUID);
        REQUIRE(after.is_active);
        REQUIRE(after.borrowed == before.borrowed);
    }

    SECTION("Close with unknown position") {
        REQUIRE(m.protocol.close_position(TRADER, NETUID, 0, SLIPPAGE).status ==
                errors::POSITION_NOT_FOUND);
    }
}

TEST_CASE("Liquidation waterfall", "[position][liquidation]") {
    ProtocolParams params = test_params();
    params.trading_fee_rate = 0;
    params.liquidation_threshold = 1500000000;  // 150%
    Market m(params);

    // 10 collateral at 2.5x: 15 borrowed, 25 alpha at 1:1
    REQUIRE(m.protocol.open_position(TRADER, NETUID, 5 * PRECISION / 2, SLIPPAGE, tokens(10))
                .status == errors::OK);

    SECTION("Healthy position cannot be liquidated") {
        REQUIRE_FALSE(m.protocol.is_liquidatable(TRADER, NETUID));
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID, "check", evidence())
                    .status == errors::NOT_LIQUIDATABLE);
    }

    SECTION("Evidence is required") {
        m.gateway.set_price(NETUID, ratio(8, 10));
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID, "", evidence()).status ==
                errors::INVALID_JUSTIFICATION);
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID,
                                              std::string(limits::MAX_JUSTIFICATION_LENGTH + 1,
                                                          'x'),
                                              evidence()).status ==
                errors::INVALID_JUSTIFICATION);
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID, "price", ContentHash{})
                    .status == errors::INVALID_CONTENT_HASH);
    }

    SECTION("Proceeds cover the debt") {
        m.gateway.set_price(NETUID, ratio(8, 10));
        REQUIRE(m.protocol.is_liquidatable(TRADER, NETUID));
        REQUIRE(*m.protocol.health_ratio(TRADER, NETUID) == 1333333333);

        LiquidationResult r = m.protocol.liquidate_position(KEEPER, TRADER, NETUID,
                                                            "health below 150%", evidence());
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.proceeds == tokens(20));
        REQUIRE(r.debt_repaid == tokens(15));
        REQUIRE(r.bad_debt == 0);
        REQUIRE(r.liquidation_fee == ONE_TOKEN / 10);
        REQUIRE(r.liquidator_bonus == ONE_TOKEN * 4 / 100);
        REQUIRE(r.user_return == ONE_TOKEN * 49 / 10);

        ProtocolStats stats = m.protocol.get_protocol_stats();
        REQUIRE(stats.total_liquidations == 1);
        REQUIRE(stats.buyback_pool == ONE_TOKEN * 6 / 100);
        REQUIRE(stats.total_borrowed == 0);
        REQUIRE_FALSE(m.protocol.get_position(TRADER, NETUID)->is_active);
    }

    SECTION("Shortfall is recorded as bad debt") {
        m.gateway.set_price(NETUID, ratio(1, 2));
        LiquidationResult r = m.protocol.liquidate_position(KEEPER, TRADER, NETUID,
                                                            "underwater", evidence());
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.proceeds == ONE_TOKEN * 25 / 2);
        REQUIRE(r.bad_debt == ONE_TOKEN * 5 / 2);
        REQUIRE(r.user_return == 0);
        REQUIRE(r.liquidation_fee == 0);
        REQUIRE(r.lp_loss == ONE_TOKEN * 5 / 2);
        REQUIRE(m.protocol.get_protocol_stats().total_bad_debt == ONE_TOKEN * 5 / 2);
    }

    SECTION("Last LP exits after bad debt is written off") {
        m.gateway.set_price(NETUID, ratio(1, 2));
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID, "underwater", evidence())
                    .status == errors::OK);

        ProtocolStats stats = m.protocol.get_protocol_stats();
        REQUIRE(stats.total_lp_losses == ONE_TOKEN * 5 / 2);
        REQUIRE(stats.total_lp_stakes == tokens(500) - ONE_TOKEN * 5 / 2);
        REQUIRE(m.protocol.native_balance() == stats.total_lp_stakes);

        LiquidityResult exit = m.protocol.remove_liquidity(LP, 0);
        REQUIRE(exit.status == errors::OK);
        REQUIRE(exit.amount == stats.total_lp_stakes);
        REQUIRE(exit.shares == tokens(500));
        REQUIRE(m.protocol.native_balance() == 0);
        REQUIRE(m.protocol.get_liquidity_stats().total_lp_shares == 0);
    }

    SECTION("Keeper earns score-weighted fees later") {
        m.gateway.set_price(NETUID, ratio(8, 10));
        REQUIRE(m.protocol.liquidate_position(KEEPER, TRADER, NETUID, "below", evidence())
                    .status == errors::OK);

        FeeDistribution with_keepers{300000000, 100000000, 600000000};
        REQUIRE(m.protocol.update_fee_distributions(OWNER, with_keepers, with_keepers,
                                                    params.liquidation_distribution) ==
                errors::OK);
        REQUIRE(m.protocol.update_fee_parameters(OWNER, PRECISION / 100, params.borrowing_fee_rate,
                                                 params.liquidation_fee_rate) == errors::OK);

        m.gateway.set_price(NETUID, PRECISION);
        REQUIRE(m.protocol.open_position(addr(9), NETUID, 2 * PRECISION, SLIPPAGE, tokens(10))
                    .status == errors::OK);
        // 1% of 20 gross, 10% of that to keepers
        REQUIRE(m.protocol.pending_liquidator_rewards(KEEPER) == ONE_TOKEN * 2 / 100);

        ClaimResult claim = m.protocol.claim_liquidator_rewards(KEEPER);
        REQUIRE(claim.status == errors::OK);
        REQUIRE(claim.amount == ONE_TOKEN * 2 / 100);
    }
}

TEST_CASE("Totals match the sum of positions", "[position]") {
    Market m(test_params());
    const Address OTHER = addr(4);

    auto check_totals = [&]() {
        const Position a = m.protocol.get_position(TRADER, NETUID).value_or(Position{});
        const Position b = m.protocol.get_position(OTHER, NETUID).value_or(Position{});
        const Amount collateral = a.collateral + b.collateral;
        const Amount borrowed = a.borrowed + b.borrowed;

        ProtocolStats stats = m.protocol.get_protocol_stats();
        REQUIRE(stats.total_collateral == collateral);
        REQUIRE(stats.total_borrowed == borrowed);

        const Pair pair = *m.protocol.get_pair(NETUID);
        REQUIRE(pair.total_collateral == collateral);
        REQUIRE(pair.total_borrowed == borrowed);

        UserStats user_a = m.protocol.get_user_stats(TRADER);
        UserStats user_b = m.protocol.get_user_stats(OTHER);
        REQUIRE(user_a.total_collateral == a.collateral);
        REQUIRE(user_a.total_borrowed == a.borrowed);
        REQUIRE(user_b.total_collateral == b.collateral);
        REQUIRE(user_b.total_borrowed == b.borrowed);
    };

    REQUIRE(m.protocol.open_position(TRADER, NETUID, 2 * PRECISION, SLIPPAGE, tokens(10))
                .status == errors::OK);
    REQUIRE(m.protocol.open_position(OTHER, NETUID, 3 * PRECISION, SLIPPAGE, tokens(20))
                .status == errors::OK);
    check_totals();

    const Amount half = m.protocol.get_position(TRADER, NETUID)->token_amount / 2;
    REQUIRE(m.protocol.close_position(TRADER, NETUID, half, SLIPPAGE).status == errors::OK);
    check_totals();

    REQUIRE(m.protocol.add_collateral(OTHER, NETUID, tokens(5)).status == errors::OK);
    check_totals();

    // 2x position keeps ~120% health, the 3x one drops under 100%
    m.gateway.set_price(NETUID, ratio(6, 10));
    REQUIRE_FALSE(m.protocol.is_liquidatable(TRADER, NETUID));
    REQUIRE(m.protocol.is_liquidatable(OTHER, NETUID));

    LiquidationResult r = m.protocol.liquidate_position(KEEPER, OTHER, NETUID, "underwater",
                                                        evidence());
    REQUIRE(r.status == errors::OK);
    REQUIRE(r.bad_debt > 0);
    check_totals();

    ProtocolStats stats = m.protocol.get_protocol_stats();
    REQUIRE(stats.total_collateral == tokens(5));
    REQUIRE(stats.total_borrowed == tokens(5));
    REQUIRE(stats.total_bad_debt == r.bad_debt);
    REQUIRE(stats.total_lp_stakes == tokens(500) - r.lp_loss);
    REQUIRE(m.protocol.get_user_stats(TRADER).trade_count == 2);
    REQUIRE(m.protocol.get_user_stats(OTHER).trade_count == 1);
}
