// Tenex - Configuration tests

#include <catch2/catch.hpp>
#include <tenex/config.hpp>
#include <tenex/log.hpp>
#include <tenex/math.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace tenex;

TEST_CASE("Config defaults", "[config]") {
    ProtocolConfig config;
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.params.max_leverage == ProtocolParams::mainnet_defaults().max_leverage);

    // Owner has to be supplied
    REQUIRE(config.validate() == errors::INVALID_PARAMETER);

    Address owner{};
    owner[19] = 0x07;
    config.with_owner(owner);
    REQUIRE(config.validate() == errors::OK);
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Overrides selected sections") {
        auto config = ProtocolConfig::from_json(R"({
            "general": { "log_level": "debug" },
            "risk": { "max_leverage": "5000000000", "liquidation_threshold": 1200000000 },
            "cooldowns": { "user_blocks": 3 },
            "distributions": {
                "trading": { "lp": "500000000", "liquidator": "0", "protocol": "500000000" }
            },
            "protocol": {
                "owner": "0x00000000000000000000000000000000000000aa",
                "netuid": 12,
                "function_permissions": [true, false, true]
            }
        })");

        REQUIRE(config.general.log_level == "debug");
        REQUIRE(config.params.max_leverage == 5 * PRECISION);
        REQUIRE(config.params.liquidation_threshold == 1200000000);
        REQUIRE(config.params.user_cooldown_blocks == 3);
        REQUIRE(config.params.lp_cooldown_blocks ==
                ProtocolParams::mainnet_defaults().lp_cooldown_blocks);
        REQUIRE(config.params.trading_distribution.lp_share == 500000000);
        REQUIRE(config.owner[19] == 0xaa);
        REQUIRE(config.params.protocol_netuid == 12);
        REQUIRE(config.params.function_permissions[0]);
        REQUIRE_FALSE(config.params.function_permissions[1]);
    }

    SECTION("Amounts beyond 64 bits") {
        auto config = ProtocolConfig::from_json(R"({
            "liquidity": { "min_liquidity_threshold": "100000000000000000000000" }
        })");
        REQUIRE(config.params.min_liquidity_threshold == tokens(100000));
    }

    SECTION("Loaded values still go through validation") {
        auto config = ProtocolConfig::from_json(R"({
            "fees": { "trading": "50000000" },
            "protocol": { "owner": "0x00000000000000000000000000000000000000aa" }
        })");
        REQUIRE(config.validate() == errors::INVALID_PARAMETER);
    }

    SECTION("Unknown log level") {
        auto config = ProtocolConfig::from_json(R"({
            "general": { "log_level": "chatty" },
            "protocol": { "owner": "0x00000000000000000000000000000000000000aa" }
        })");
        REQUIRE(config.validate() == errors::INVALID_PARAMETER);
        REQUIRE_THROWS_AS(config.apply_logging(), std::runtime_error);
    }
}

TEST_CASE("Malformed config", "[config]") {
    REQUIRE_THROWS_AS(ProtocolConfig::from_json("{ not json"), std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json("[1, 2]"), std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"risk": 5})"), std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"risk": {"max_leverage": "1.5"}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"risk": {"max_leverage": -3}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"protocol": {"treasury": "0x12"}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"protocol": {"netuid": 70000}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ProtocolConfig::from_json(R"({"tiers": {"discounts": ["0"]}})"),
                      std::runtime_error);

    try {
        ProtocolConfig::from_json(R"({"cooldowns": {"lp_blocks": "ten"}})");
        FAIL("expected std::runtime_error");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("cooldowns.lp_blocks") != std::string::npos);
    }
}

TEST_CASE("Config from file", "[config]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ProtocolConfig::from_file("/nonexistent/tenex.json"),
                          std::runtime_error);
    }

    SECTION("Round trip through disk") {
        auto path = std::filesystem::temp_directory_path() / "tenex_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"buyback": {"rate": "250000000", "interval_blocks": 100}})";
        }
        auto config = ProtocolConfig::from_file(path.string());
        std::filesystem::remove(path);

        REQUIRE(config.params.buyback_rate == PRECISION / 4);
        REQUIRE(config.params.buyback_interval_blocks == 100);
    }
}

TEST_CASE("Logging level", "[config][log]") {
    std::ostringstream sink;
    log::set_stream(sink);

    ProtocolConfig config;
    config.with_log_level("warn").apply_logging();
    REQUIRE(log::level() == log::Level::WARN);

    log::info("test", "hidden");
    log::warn("test", "shown");
    REQUIRE(sink.str() == "[warn] test: shown\n");

    log::reset_stream();
    log::set_level(log::Level::INFO);
}
