// =============================================================================
// gateway.cpp - In-Memory Staking Gateway
// =============================================================================

#include "tenex/gateway.hpp"
#include "tenex/math.hpp"

namespace tenex {

namespace {

// Owner slot used for stake held by the protocol itself
constexpr Address PROTOCOL_OWNER{};

} // namespace

void InMemoryGateway::set_price(Netuid netuid, Amount price) {
    prices_[netuid] = price;
}

void InMemoryGateway::set_owner_balance(const Hotkey& hotkey, const Address& owner,
                                        Netuid netuid, Amount alpha) {
    stakes_[StakeKey{hotkey, owner, netuid}] = alpha;
}

Amount InMemoryGateway::price_of(Netuid netuid) const {
    auto it = prices_.find(netuid);
    return it != prices_.end() ? it->second : PRECISION;
}

std::optional<Amount> InMemoryGateway::stake(const Hotkey& hotkey, Amount tao, Netuid netuid) {
    Amount price = price_of(netuid);
    if (tao == 0 || price == 0) return std::nullopt;

    Amount alpha = fp::mul_div(tao, PRECISION, price);
    Amount& held = stakes_[StakeKey{hotkey, PROTOCOL_OWNER, netuid}];
    held = fp::add(held, alpha);
    return alpha;
}

std::optional<Amount> InMemoryGateway::unstake(const Hotkey& hotkey, Amount alpha, Netuid netuid) {
    auto it = stakes_.find(StakeKey{hotkey, PROTOCOL_OWNER, netuid});
    if (alpha == 0 || it == stakes_.end() || it->second < alpha) return std::nullopt;

    it->second -= alpha;
    return fp::mul_div(alpha, price_of(netuid), PRECISION);
}

bool InMemoryGateway::transfer_stake(const Hotkey& hotkey, const Address& destination,
                                     Netuid netuid, Amount alpha) {
    auto it = stakes_.find(StakeKey{hotkey, PROTOCOL_OWNER, netuid});
    if (it == stakes_.end() || it->second < alpha) return false;

    it->second -= alpha;
    Amount& dest = stakes_[StakeKey{hotkey, destination, netuid}];
    dest = fp::add(dest, alpha);
    return true;
}

Amount InMemoryGateway::price_simulate_buy(Netuid netuid, Amount tao) const {
    Amount price = price_of(netuid);
    if (price == 0) return 0;
    return fp::mul_div(tao, PRECISION, price);
}

Amount InMemoryGateway::price_simulate_sell(Netuid netuid, Amount alpha) const {
    return fp::mul_div(alpha, price_of(netuid), PRECISION);
}

Amount InMemoryGateway::current_price(Netuid netuid) const {
    return price_of(netuid);
}

Amount InMemoryGateway::stake_balance(const Hotkey& hotkey, const Address& owner,
                                      Netuid netuid) const {
    auto it = stakes_.find(StakeKey{hotkey, owner, netuid});
    return it != stakes_.end() ? it->second : 0;
}

Amount InMemoryGateway::protocol_stake(const Hotkey& hotkey, Netuid netuid) const {
    return stake_balance(hotkey, PROTOCOL_OWNER, netuid);
}

} // namespace tenex
