// Tenex protocol simulator
//
// Loads a JSON configuration, wires the protocol to an in-memory staking
// gateway and replays a scripted session: liquidity, a profitable round
// trip, a liquidation, reward claims, a buyback and a vesting claim.

#include "tenex/protocol.hpp"
#include "tenex/config.hpp"
#include "tenex/log.hpp"
#include "tenex/math.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

using namespace tenex;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "Tenex protocol simulator\n\n"
              << "Usage: " << prog << " [options]\n\n"
              << "Options:\n"
              << "  -c, --config <path>  JSON configuration (default: mainnet parameters)\n"
              << "  -v, --verbose        Log every committed event\n"
              << "  -h, --help           Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
    }
    return options;
}

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

Address account(uint8_t tag) {
    Address a{};
    a[0] = 0xAA;
    a[19] = tag;
    return a;
}

std::string tok(Amount macro) {
    return format_units(macro, 18);
}

std::string pct(FixedPoint value) {
    return format_units(value * 100, 9) + "%";
}

bool report(const char* step, int32_t status) {
    std::cout << "  " << step << ": " << error_name(status) << "\n";
    return status == errors::OK;
}

class Session {
public:
    Session(Protocol& protocol, InMemoryGateway& gateway, const ProtocolParams& params)
        : protocol_(protocol), gateway_(gateway), params_(params) {}

    void advance(uint64_t blocks) {
        BlockHeight next = protocol_.block_number() + blocks;
        if (protocol_.set_block_number(next) != errors::OK) {
            std::cerr << "Block clock rejected height " << next << "\n";
        }
    }

    // Gap that satisfies both action cooldowns
    uint64_t cooldown() const {
        return std::max(params_.user_cooldown_blocks, params_.lp_cooldown_blocks) + 1;
    }

    void run() {
        const Address lp = account(1);
        const Address trader = account(2);
        const Address whale = account(3);
        const Address keeper = account(4);
        const Netuid netuid = 1;

        std::cout << "== Liquidity\n";
        Amount seed = std::max(fp::mul(params_.min_liquidity_threshold, 2), tokens(2000));
        LiquidityResult added = protocol_.add_liquidity(lp, seed);
        if (report("add_liquidity", added.status)) {
            std::cout << "    deposited " << tok(added.amount) << ", shares " << tok(added.shares)
                      << "\n";
        }
        advance(cooldown());

        std::cout << "== Round trip (2x, price +10%)\n";
        OpenResult opened = protocol_.open_position(trader, netuid, 2 * PRECISION,
                                                    PRECISION / 100, tokens(100));
        if (report("open_position", opened.status)) {
            std::cout << "    borrowed " << tok(opened.borrowed) << ", fee "
                      << tok(opened.trading_fee) << "\n";
        }
        advance(cooldown());
        gateway_.set_price(netuid, PRECISION + PRECISION / 10);

        CloseResult closed = protocol_.close_position(trader, netuid, 0, PRECISION / 100);
        if (report("close_position", closed.status)) {
            std::cout << "    proceeds " << tok(closed.proceeds) << ", net return "
                      << tok(closed.net_return) << ", pnl "
                      << (closed.pnl < 0 ? "-" : "")
                      << tok(static_cast<Amount>(closed.pnl < 0 ? -closed.pnl : closed.pnl))
                      << "\n";
        }

        std::cout << "== Liquidation (tier-boosted 4x, price -40%)\n";
        gateway_.set_price(netuid, PRECISION);
        gateway_.set_owner_balance(params_.protocol_validator_hotkey, whale,
                                   params_.protocol_netuid, to_micro(tokens(1000)));
        std::cout << "  whale tier: " << static_cast<int>(protocol_.user_tier(whale)) << "\n";

        OpenResult levered = protocol_.open_position(whale, netuid, 4 * PRECISION,
                                                     PRECISION / 100, tokens(50));
        report("open_position", levered.status);
        advance(cooldown());
        gateway_.set_price(netuid, PRECISION * 6 / 10);

        if (auto health = protocol_.health_ratio(whale, netuid)) {
            std::cout << "  health ratio: " << pct(*health) << "\n";
        }

        ContentHash evidence{};
        evidence[0] = 0x01;
        LiquidationResult liquidated = protocol_.liquidate_position(
            keeper, whale, netuid, "price fell below maintenance", evidence);
        if (report("liquidate_position", liquidated.status)) {
            std::cout << "    proceeds " << tok(liquidated.proceeds) << ", bad debt "
                      << tok(liquidated.bad_debt) << ", keeper bonus "
                      << tok(liquidated.liquidator_bonus) << ", owner return "
                      << tok(liquidated.user_return) << "\n";
        }

        std::cout << "== Rewards\n";
        ClaimResult lp_claim = protocol_.claim_lp_rewards(lp);
        if (report("claim_lp_rewards", lp_claim.status)) {
            std::cout << "    claimed " << tok(lp_claim.amount) << "\n";
        }

        std::cout << "== Buyback and vesting\n";
        advance(params_.buyback_interval_blocks);
        BuybackResult bought = protocol_.execute_buyback(keeper);
        if (report("execute_buyback", bought.status)) {
            std::cout << "    spent " << tok(bought.spent) << " at fraction "
                      << pct(bought.spend_fraction) << "\n";
        }

        advance(params_.vesting_duration_blocks);
        ClaimResult vested = protocol_.claim_vested(params_.treasury, params_.treasury);
        if (report("claim_vested", vested.status)) {
            std::cout << "    released " << format_units(vested.amount, 9) << " alpha\n";
        }
    }

private:
    Protocol& protocol_;
    InMemoryGateway& gateway_;
    ProtocolParams params_;
};

void print_stats(const Protocol& protocol, const std::map<std::string, int>& event_counts) {
    ProtocolStats stats = protocol.get_protocol_stats();
    LiquidityStats liquidity = protocol.get_liquidity_stats();

    std::cout << "== Protocol stats\n"
              << "  block:            " << protocol.block_number() << "\n"
              << "  volume:           " << tok(stats.total_volume) << "\n"
              << "  trades:           " << stats.total_trades << "\n"
              << "  liquidations:     " << stats.total_liquidations << "\n"
              << "  protocol fees:    " << tok(stats.protocol_fees) << "\n"
              << "  buyback pool:     " << tok(stats.buyback_pool) << "\n"
              << "  bad debt:         " << tok(stats.total_bad_debt) << "\n"
              << "  LP losses:        " << tok(stats.total_lp_losses) << "\n"
              << "  lp stakes:        " << tok(liquidity.total_lp_stakes) << "\n"
              << "  utilization:      " << pct(liquidity.utilization) << "\n"
              << "  circuit breaker:  " << (stats.circuit_breaker ? "engaged" : "clear") << "\n";

    std::cout << "== Events\n";
    for (const auto& [name, count] : event_counts) {
        std::cout << "  " << name << ": " << count << "\n";
    }
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    ProtocolConfig config;
    try {
        if (!options.config_path.empty()) {
            config = ProtocolConfig::from_file(options.config_path);
        }
        if (is_zero(config.owner)) {
            config.with_owner(account(0xFF));
        }
        if (options.verbose) {
            config.with_log_level("debug");
        }
        config.apply_logging();
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    int32_t rc = config.validate();
    if (rc != errors::OK) {
        std::cerr << "Invalid configuration: " << error_name(rc) << "\n";
        return 1;
    }

    InMemoryGateway gateway;
    Protocol protocol(gateway, config.owner, config.params);

    std::map<std::string, int> event_counts;
    protocol.set_event_callback([&event_counts](const Event& event) {
        event_counts[event_name(event)]++;
    });

    Session session(protocol, gateway, config.params);
    session.run();
    print_stats(protocol, event_counts);

    return 0;
}
