// Tenex - Fixed-point math tests

#include <catch2/catch.hpp>
#include <tenex/math.hpp>

using namespace tenex;

TEST_CASE("Checked arithmetic", "[math]") {
    SECTION("Addition overflow throws") {
        U128 max = ~U128(0);
        REQUIRE(fp::add(max - 1, 1) == max);
        REQUIRE_THROWS_AS(fp::add(max, 1), MathError);
    }

    SECTION("Subtraction underflow carries its code") {
        try {
            fp::sub(1, 2);
            FAIL("expected MathError");
        } catch (const MathError& e) {
            REQUIRE(e.code() == errors::MATH_UNDERFLOW);
        }
        REQUIRE(fp::sub_or_zero(1, 2) == 0);
    }

    SECTION("Multiplication overflow throws") {
        U128 half = U128(1) << 64;
        REQUIRE_THROWS_AS(fp::mul(half, half), MathError);
        REQUIRE(fp::mul(0, ~U128(0)) == 0);
    }

    SECTION("Division by zero") {
        try {
            fp::mul_div(10, 10, 0);
            FAIL("expected MathError");
        } catch (const MathError& e) {
            REQUIRE(e.code() == errors::DIVISION_BY_ZERO);
        }
    }

    SECTION("Rates") {
        REQUIRE(fp::apply_rate(tokens(20), 3000000) == ONE_TOKEN * 6 / 100);
        REQUIRE(fp::diff(3, 5) == -2);
        REQUIRE(fp::diff(5, 3) == 2);
    }
}

TEST_CASE("Unit conversion", "[math]") {
    REQUIRE(to_micro(ONE_TOKEN) == PRECISION);
    REQUIRE(to_micro(MICRO_PER_MACRO - 1) == 0);
    REQUIRE(to_macro(PRECISION) == ONE_TOKEN);
    REQUIRE(tokens(3) == 3 * ONE_TOKEN);
}

TEST_CASE("Decimal formatting and parsing", "[math]") {
    SECTION("to_string") {
        REQUIRE(to_string(U128(0)) == "0");
        REQUIRE(to_string(ONE_TOKEN) == "1000000000000000000");
        REQUIRE(to_string(I128(-42)) == "-42");
    }

    SECTION("format_units") {
        REQUIRE(format_units(ONE_TOKEN * 3 / 2, 18) == "1.5");
        REQUIRE(format_units(5, 9) == "0.000000005");
        REQUIRE(format_units(7 * PRECISION, 9) == "7");
    }

    SECTION("parse_u128") {
        REQUIRE(parse_u128("1000000000000000000") == ONE_TOKEN);
        REQUIRE_FALSE(parse_u128("").has_value());
        REQUIRE_FALSE(parse_u128("12a").has_value());
        REQUIRE_FALSE(parse_u128("-1").has_value());
        // 2^128 does not fit
        REQUIRE_FALSE(parse_u128("340282366920938463463374607431768211456").has_value());
        REQUIRE(parse_u128("340282366920938463463374607431768211455") == ~U128(0));
    }
}

TEST_CASE("Error classification", "[math]") {
    REQUIRE(error_kind(errors::OK) == ErrorKind::NONE);
    REQUIRE(error_kind(errors::INVALID_LEVERAGE) == ErrorKind::VALIDATION);
    REQUIRE(error_kind(errors::UTILIZATION_EXCEEDED) == ErrorKind::RESOURCE_EXHAUSTION);
    REQUIRE(error_kind(errors::STAKE_FAILED) == ErrorKind::EXTERNAL_CALL_FAILURE);
    REQUIRE(error_kind(errors::COMPENSATION_FAILED) == ErrorKind::EXTERNAL_CALL_FAILURE);
    REQUIRE(error_kind(errors::SLIPPAGE_TOO_HIGH) == ErrorKind::SLIPPAGE_VIOLATION);
    REQUIRE(error_kind(errors::INSUFFICIENT_PROCEEDS) == ErrorKind::INVARIANT_BREACH);
    REQUIRE(error_kind(errors::REENTRANCY) == ErrorKind::ADMISSION);
    REQUIRE(error_kind(errors::MATH_OVERFLOW) == ErrorKind::ARITHMETIC);

    REQUIRE(std::string(error_name(errors::CIRCUIT_BREAKER)) == "CIRCUIT_BREAKER");
    REQUIRE(std::string(error_name(errors::COMPENSATION_FAILED)) == "COMPENSATION_FAILED");
    REQUIRE(std::string(error_name(12345)) == "UNKNOWN");
}
