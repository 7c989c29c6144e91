// =============================================================================
// config.cpp - JSON Configuration Loading
// =============================================================================

#include "tenex/config.hpp"
#include "tenex/math.hpp"
#include "tenex/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tenex {

namespace {

using nlohmann::json;

[[noreturn]] void invalid(const std::string& key) {
    throw std::runtime_error("Invalid config value: " + key);
}

U128 to_u128(const json& value, const std::string& key) {
    if (value.is_string()) {
        auto parsed = parse_u128(value.get<std::string>());
        if (!parsed) invalid(key);
        return *parsed;
    }
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    invalid(key);
}

void read_u128(const json& section, const char* name, const std::string& prefix, U128& out) {
    auto it = section.find(name);
    if (it == section.end()) return;
    out = to_u128(*it, prefix + "." + name);
}

void read_u64(const json& section, const char* name, const std::string& prefix, uint64_t& out) {
    auto it = section.find(name);
    if (it == section.end()) return;
    if (!it->is_number_unsigned()) invalid(prefix + "." + name);
    out = it->get<uint64_t>();
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <size_t N>
void read_bytes(const json& section, const char* name, const std::string& prefix,
                std::array<uint8_t, N>& out) {
    auto it = section.find(name);
    if (it == section.end()) return;

    std::string key = prefix + "." + name;
    if (!it->is_string()) invalid(key);
    std::string text = it->get<std::string>();
    if (text.rfind("0x", 0) == 0) text = text.substr(2);
    if (text.size() != N * 2) invalid(key);

    for (size_t i = 0; i < N; ++i) {
        int hi = hex_digit(text[2 * i]);
        int lo = hex_digit(text[2 * i + 1]);
        if (hi < 0 || lo < 0) invalid(key);
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
}

template <size_t N>
void read_u128_array(const json& section, const char* name, const std::string& prefix,
                     std::array<U128, N>& out) {
    auto it = section.find(name);
    if (it == section.end()) return;

    std::string key = prefix + "." + name;
    if (!it->is_array() || it->size() != N) invalid(key);
    for (size_t i = 0; i < N; ++i) {
        out[i] = to_u128((*it)[i], key + "[" + std::to_string(i) + "]");
    }
}

void read_distribution(const json& section, const char* name, FeeDistribution& out) {
    auto it = section.find(name);
    if (it == section.end()) return;

    std::string prefix = std::string("distributions.") + name;
    if (!it->is_object()) invalid(prefix);
    read_u128(*it, "lp", prefix, out.lp_share);
    read_u128(*it, "liquidator", prefix, out.liquidator_share);
    read_u128(*it, "protocol", prefix, out.protocol_share);
}

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) invalid(name);
    return &*it;
}

} // namespace

ProtocolConfig ProtocolConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

ProtocolConfig ProtocolConfig::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(std::string(content));
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed config: ") + e.what());
    }
    if (!root.is_object()) invalid("<root>");

    ProtocolConfig config;
    ProtocolParams& p = config.params;

    if (const json* s = section(root, "general")) {
        auto it = s->find("log_level");
        if (it != s->end()) {
            if (!it->is_string()) invalid("general.log_level");
            config.general.log_level = it->get<std::string>();
        }
    }
    if (const json* s = section(root, "risk")) {
        read_u128(*s, "max_leverage", "risk", p.max_leverage);
        read_u128(*s, "liquidation_threshold", "risk", p.liquidation_threshold);
    }
    if (const json* s = section(root, "liquidity")) {
        read_u128(*s, "min_liquidity_threshold", "liquidity", p.min_liquidity_threshold);
        read_u128(*s, "max_utilization_rate", "liquidity", p.max_utilization_rate);
        read_u128(*s, "liquidity_buffer_ratio", "liquidity", p.liquidity_buffer_ratio);
    }
    if (const json* s = section(root, "cooldowns")) {
        read_u64(*s, "user_blocks", "cooldowns", p.user_cooldown_blocks);
        read_u64(*s, "lp_blocks", "cooldowns", p.lp_cooldown_blocks);
    }
    if (const json* s = section(root, "buyback")) {
        read_u128(*s, "rate", "buyback", p.buyback_rate);
        read_u64(*s, "interval_blocks", "buyback", p.buyback_interval_blocks);
        read_u128(*s, "execution_threshold", "buyback", p.buyback_execution_threshold);
    }
    if (const json* s = section(root, "vesting")) {
        read_u64(*s, "duration_blocks", "vesting", p.vesting_duration_blocks);
        read_u64(*s, "cliff_blocks", "vesting", p.cliff_duration_blocks);
    }
    if (const json* s = section(root, "fees")) {
        read_u128(*s, "trading", "fees", p.trading_fee_rate);
        read_u128(*s, "borrowing", "fees", p.borrowing_fee_rate);
        read_u128(*s, "liquidation", "fees", p.liquidation_fee_rate);
    }
    if (const json* s = section(root, "rate_model")) {
        read_u128(*s, "kink", "rate_model", p.rate_kink);
        read_u128(*s, "slope1", "rate_model", p.rate_slope1);
        read_u128(*s, "slope2", "rate_model", p.rate_slope2);
    }
    if (const json* s = section(root, "distributions")) {
        read_distribution(*s, "trading", p.trading_distribution);
        read_distribution(*s, "borrowing", p.borrowing_distribution);
        read_distribution(*s, "liquidation", p.liquidation_distribution);
    }
    if (const json* s = section(root, "tiers")) {
        read_u128_array(*s, "thresholds", "tiers", p.tier_thresholds);
        read_u128_array(*s, "discounts", "tiers", p.tier_fee_discounts);
        read_u128_array(*s, "max_leverages", "tiers", p.tier_max_leverages);
    }
    if (const json* s = section(root, "protocol")) {
        read_bytes(*s, "owner", "protocol", config.owner);
        read_bytes(*s, "validator_hotkey", "protocol", p.protocol_validator_hotkey);
        read_bytes(*s, "treasury", "protocol", p.treasury);

        auto netuid = s->find("netuid");
        if (netuid != s->end()) {
            if (!netuid->is_number_unsigned() || netuid->get<uint64_t>() > UINT16_MAX) {
                invalid("protocol.netuid");
            }
            p.protocol_netuid = static_cast<Netuid>(netuid->get<uint64_t>());
        }

        auto flags = s->find("function_permissions");
        if (flags != s->end()) {
            if (!flags->is_array() || flags->size() != functions::COUNT) {
                invalid("protocol.function_permissions");
            }
            for (size_t i = 0; i < functions::COUNT; ++i) {
                if (!(*flags)[i].is_boolean()) invalid("protocol.function_permissions");
                p.function_permissions[i] = (*flags)[i].get<bool>();
            }
        }
    }

    return config;
}

int32_t ProtocolConfig::validate() const {
    if (!log::parse_level(general.log_level)) return errors::INVALID_PARAMETER;
    if (is_zero(owner)) return errors::INVALID_PARAMETER;
    return validation::all(params);
}

void ProtocolConfig::apply_logging() const {
    auto lvl = log::parse_level(general.log_level);
    if (!lvl) invalid("general.log_level");
    log::set_level(*lvl);
}

} // namespace tenex
