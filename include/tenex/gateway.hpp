#ifndef TENEX_GATEWAY_HPP
#define TENEX_GATEWAY_HPP

#include <map>
#include <optional>
#include <unordered_map>

#include "types.hpp"

namespace tenex {

// =============================================================================
// StakingGateway - external validator-keyed stake ledger and price quotes
// =============================================================================
//
// All amounts are micro units (9 decimals). Mutating calls report the amount
// actually received; an empty optional means the external call failed.

class StakingGateway {
public:
    virtual ~StakingGateway() = default;

    // Stake TAO to a validator on a subnet, returns alpha received
    virtual std::optional<Amount> stake(const Hotkey& hotkey, Amount tao, Netuid netuid) = 0;

    // Unstake alpha, returns TAO received
    virtual std::optional<Amount> unstake(const Hotkey& hotkey, Amount alpha, Netuid netuid) = 0;

    // Move staked alpha to another owner, keeping the validator
    virtual bool transfer_stake(const Hotkey& hotkey, const Address& destination,
                                Netuid netuid, Amount alpha) = 0;

    // Read-only quotes
    virtual Amount price_simulate_buy(Netuid netuid, Amount tao) const = 0;
    virtual Amount price_simulate_sell(Netuid netuid, Amount alpha) const = 0;
    virtual Amount current_price(Netuid netuid) const = 0;

    // Alpha held by an owner under a validator (tier lookup)
    virtual Amount stake_balance(const Hotkey& hotkey, const Address& owner, Netuid netuid) const = 0;
};

// =============================================================================
// InMemoryGateway - constant-price gateway for simulation
// =============================================================================

class InMemoryGateway : public StakingGateway {
public:
    InMemoryGateway() = default;

    // price: TAO micro units per 1 alpha (1e9 == 1:1)
    void set_price(Netuid netuid, Amount price);
    void set_owner_balance(const Hotkey& hotkey, const Address& owner, Netuid netuid, Amount alpha);

    std::optional<Amount> stake(const Hotkey& hotkey, Amount tao, Netuid netuid) override;
    std::optional<Amount> unstake(const Hotkey& hotkey, Amount alpha, Netuid netuid) override;
    bool transfer_stake(const Hotkey& hotkey, const Address& destination,
                        Netuid netuid, Amount alpha) override;

    Amount price_simulate_buy(Netuid netuid, Amount tao) const override;
    Amount price_simulate_sell(Netuid netuid, Amount alpha) const override;
    Amount current_price(Netuid netuid) const override;
    Amount stake_balance(const Hotkey& hotkey, const Address& owner, Netuid netuid) const override;

    // Alpha staked by the protocol itself under a validator
    Amount protocol_stake(const Hotkey& hotkey, Netuid netuid) const;

private:
    struct StakeKey {
        Hotkey hotkey;
        Address owner;
        Netuid netuid;

        bool operator<(const StakeKey& other) const {
            if (netuid != other.netuid) return netuid < other.netuid;
            if (hotkey != other.hotkey) return hotkey < other.hotkey;
            return owner < other.owner;
        }
    };

    std::unordered_map<Netuid, Amount> prices_;
    std::map<StakeKey, Amount> stakes_;

    Amount price_of(Netuid netuid) const;
};

} // namespace tenex

#endif // TENEX_GATEWAY_HPP
