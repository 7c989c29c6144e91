// Tenex - Buyback and vesting tests

#include <catch2/catch.hpp>
#include <tenex/buyback.hpp>

#include "mock_gateway.hpp"

using namespace tenex;
using namespace tenex::testing;

namespace {

struct BuybackFixture {
    MockGateway gateway;
    ProtocolState state;
    BuybackEngine engine;

    BuybackFixture() : engine(state, gateway) {
        state.params = test_params();
        state.buyback_pool = tokens(10);
        state.native_balance = tokens(10);
    }

    Amount treasury_stake(const Address& owner) const {
        return gateway.stake_balance(state.params.protocol_validator_hotkey, owner,
                                     state.params.protocol_netuid);
    }
};

} // namespace

TEST_CASE("Buyback spend fraction", "[buyback]") {
    ProtocolState state;
    state.params = test_params();
    const uint64_t interval = state.params.buyback_interval_blocks;

    SECTION("Base rate for one interval") {
        state.current_block = interval;
        REQUIRE(BuybackEngine::spend_fraction(state) == 500000000);
    }

    SECTION("Ramps per missed interval") {
        state.current_block = 3 * interval;
        REQUIRE(BuybackEngine::spend_fraction(state) == 600000000);
    }

    SECTION("Boost is capped") {
        state.current_block = 20 * interval;
        REQUIRE(BuybackEngine::spend_fraction(state) == 750000000);
    }

    SECTION("Never spends more than the pool") {
        state.params.buyback_rate = 900000000;
        state.current_block = 20 * interval;
        REQUIRE(BuybackEngine::spend_fraction(state) == PRECISION);
    }
}

TEST_CASE("Buyback execution", "[buyback]") {
    BuybackFixture f;
    const ProtocolParams& p = f.state.params;

    SECTION("Waits for the interval") {
        f.state.current_block = p.buyback_interval_blocks - 1;
        REQUIRE_FALSE(BuybackEngine::can_execute(f.state));
        REQUIRE(f.engine.execute().status == errors::BUYBACK_NOT_READY);
    }

    SECTION("Waits for the pool threshold") {
        f.state.current_block = p.buyback_interval_blocks;
        f.state.buyback_pool = p.buyback_execution_threshold - 1;
        REQUIRE(f.engine.execute().status == errors::BUYBACK_NOT_READY);
    }

    SECTION("Buys and vests to the treasury") {
        f.state.current_block = p.buyback_interval_blocks;
        BuybackResult r = f.engine.execute();
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.spent == tokens(5));
        REQUIRE(r.tokens_received == 5 * PRECISION);
        REQUIRE(r.slippage == 0);
        REQUIRE(r.schedule_index == 0);

        REQUIRE(f.state.buyback_pool == tokens(5));
        REQUIRE(f.state.native_balance == tokens(5));
        REQUIRE(f.state.buyback_count == 1);
        REQUIRE(f.state.last_buyback_block == p.buyback_interval_blocks);
        REQUIRE(f.gateway.protocol_stake(p.protocol_validator_hotkey, p.protocol_netuid) ==
                5 * PRECISION);

        const VestingSchedule& s = f.state.vesting.at(p.treasury).at(0);
        REQUIRE(s.total_amount == 5 * PRECISION);
        REQUIRE(s.cliff_block == s.start_block + p.cliff_duration_blocks);
        REQUIRE(s.end_block == s.start_block + p.vesting_duration_blocks);

        REQUIRE(f.engine.execute().status == errors::BUYBACK_NOT_READY);
    }

    SECTION("Reports execution slippage") {
        f.gateway.stake_haircut = ratio(1, 10);
        f.state.current_block = p.buyback_interval_blocks;
        BuybackResult r = f.engine.execute();
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.slippage == PRECISION / 10);
    }

    SECTION("Stake failure leaves the pool intact") {
        f.gateway.fail_stake = true;
        f.state.current_block = p.buyback_interval_blocks;
        REQUIRE(f.engine.execute().status == errors::STAKE_FAILED);
        REQUIRE(f.state.buyback_pool == tokens(10));
    }
}

TEST_CASE("Vested amount schedule", "[buyback][vesting]") {
    VestingSchedule s{
        .total_amount = 1000,
        .claimed_amount = 0,
        .start_block = 100,
        .cliff_block = 200,
        .end_block = 1100,
        .revoked = false
    };

    REQUIRE(BuybackEngine::vested_amount(s, 199) == 0);
    REQUIRE(BuybackEngine::vested_amount(s, 200) == 100);
    REQUIRE(BuybackEngine::vested_amount(s, 600) == 500);
    REQUIRE(BuybackEngine::vested_amount(s, 1100) == 1000);
    REQUIRE(BuybackEngine::vested_amount(s, 5000) == 1000);

    Amount prev = 0;
    for (BlockHeight b = 0; b <= 1200; b += 10) {
        Amount v = BuybackEngine::vested_amount(s, b);
        REQUIRE(v >= prev);
        REQUIRE(v <= s.total_amount);
        prev = v;
    }

    s.claimed_amount = 300;
    s.revoked = true;
    REQUIRE(BuybackEngine::vested_amount(s, 5000) == 300);
}

TEST_CASE("Vesting claims", "[buyback][vesting]") {
    BuybackFixture f;
    const ProtocolParams& p = f.state.params;
    const Address destination = addr(0x42);

    f.state.current_block = p.buyback_interval_blocks;
    REQUIRE(f.engine.execute().status == errors::OK);
    const VestingSchedule& s = f.state.vesting.at(p.treasury).at(0);

    SECTION("Nothing before the cliff") {
        f.state.current_block = s.cliff_block - 1;
        ClaimResult r = f.engine.claim_vested(p.treasury, destination);
        REQUIRE(r.status == errors::OK);
        REQUIRE(r.amount == 0);
    }

    SECTION("Linear release, then the remainder") {
        f.state.current_block = s.start_block + p.vesting_duration_blocks / 2;
        ClaimResult half = f.engine.claim_vested(p.treasury, destination);
        REQUIRE(half.status == errors::OK);
        REQUIRE(half.amount == 5 * PRECISION / 2);
        REQUIRE(f.treasury_stake(destination) == 5 * PRECISION / 2);

        f.state.current_block = s.end_block;
        ClaimResult rest = f.engine.claim_vested(p.treasury, destination);
        REQUIRE(rest.amount == 5 * PRECISION / 2);
        REQUIRE(f.treasury_stake(destination) == 5 * PRECISION);

        REQUIRE(f.engine.claim_vested(p.treasury, destination).amount == 0);
    }

    SECTION("Rejections") {
        f.state.current_block = s.end_block;
        REQUIRE(f.engine.claim_vested(addr(9), destination).status ==
                errors::NO_VESTING_SCHEDULES);
        REQUIRE(f.engine.claim_vested(p.treasury, Address{}).status ==
                errors::INVALID_PARAMETER);

        f.gateway.fail_transfer = true;
        REQUIRE(f.engine.claim_vested(p.treasury, destination).status ==
                errors::TRANSFER_FAILED);
        REQUIRE(f.state.vesting.at(p.treasury).at(0).claimed_amount == 0);
    }
}
