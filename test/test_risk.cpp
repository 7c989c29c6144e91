// Tenex - Risk function tests

#include <catch2/catch.hpp>
#include <tenex/risk.hpp>
#include <tenex/math.hpp>

using namespace tenex;

TEST_CASE("Health ratio", "[risk]") {
    SECTION("No debt is maximally healthy") {
        REQUIRE(risk::health_ratio(tokens(5), 0) == MAX_HEALTH_RATIO);
        REQUIRE_FALSE(risk::is_liquidatable(0, 0, 1100000000));
    }

    SECTION("Ratio of value to debt") {
        REQUIRE(risk::health_ratio(tokens(20), tokens(15)) == 1333333333);
    }

    SECTION("Threshold is strict") {
        const FixedPoint threshold = 1100000000;
        REQUIRE_FALSE(risk::is_liquidatable(tokens(11), tokens(10), threshold));
        REQUIRE(risk::is_liquidatable(tokens(11) - 1, tokens(10), threshold));
    }
}

TEST_CASE("Liquidation price", "[risk]") {
    // 10 borrowed + 0.5 fees over 20 alpha at 110%
    Amount price = risk::liquidation_price(tokens(10), ONE_TOKEN / 2, 20 * PRECISION,
                                           1100000000);
    REQUIRE(price == fp::mul_div(tokens(21) / 2, 1100000000, 20 * PRECISION));
    REQUIRE(risk::liquidation_price(tokens(10), 0, 0, 1100000000) == 0);
}

TEST_CASE("Utilization and borrow curve", "[risk]") {
    RateModel model{
        .base_rate = 50000,
        .kink = 800000000,
        .slope1 = 50000,
        .slope2 = 500000
    };

    SECTION("Utilization") {
        REQUIRE(risk::utilization(tokens(1), 0) == 0);
        REQUIRE(risk::utilization(tokens(45), tokens(100)) == 450000000);
    }

    SECTION("Below the kink") {
        REQUIRE(risk::borrow_rate_per_360_blocks(0, model) == 50000);
        REQUIRE(risk::borrow_rate_per_360_blocks(400000000, model) == 50000 + 20000);
        REQUIRE(risk::borrow_rate_per_360_blocks(800000000, model) == 50000 + 40000);
    }

    SECTION("Above the kink") {
        // 90%: 0.1 * slope2 on top of the kink rate
        REQUIRE(risk::borrow_rate_per_360_blocks(900000000, model) == 90000 + 50000);
    }

    SECTION("Clamped at full utilization") {
        REQUIRE(risk::borrow_rate_per_360_blocks(2 * PRECISION, model) ==
                risk::borrow_rate_per_360_blocks(PRECISION, model));
    }

    SECTION("Monotone in utilization") {
        FixedPoint prev = 0;
        for (FixedPoint u = 0; u <= PRECISION; u += PRECISION / 20) {
            FixedPoint rate = risk::borrow_rate_per_360_blocks(u, model);
            REQUIRE(rate >= prev);
            prev = rate;
        }
    }
}

TEST_CASE("Accrued borrowing fee", "[risk]") {
    // 0.005% per 360 blocks on 100 tokens
    REQUIRE(risk::accrued_borrowing_fee(tokens(100), 50000, 360) == ONE_TOKEN / 200);
    REQUIRE(risk::accrued_borrowing_fee(tokens(100), 50000, 720) == ONE_TOKEN / 100);
    REQUIRE(risk::accrued_borrowing_fee(tokens(100), 50000, 0) == 0);
    REQUIRE(risk::accrued_borrowing_fee(0, 50000, 360) == 0);
}
