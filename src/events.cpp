// =============================================================================
// events.cpp - Event Names and JSON Rendering
// =============================================================================

#include "tenex/events.hpp"
#include "tenex/math.hpp"

#include <nlohmann/json.hpp>
#include <iterator>

namespace tenex {

namespace {

using nlohmann::json;

std::string amount(U128 v) { return to_string(v); }

json to_json_fields(const PositionOpened& e) {
    return json{{"user", to_hex(e.user)}, {"netuid", e.netuid},
                {"collateral", amount(e.collateral)}, {"borrowed", amount(e.borrowed)},
                {"token_amount", amount(e.token_amount)}, {"leverage", amount(e.leverage)},
                {"entry_price", amount(e.entry_price)}, {"trading_fee", amount(e.trading_fee)},
                {"validator", to_hex(e.validator)}, {"block", e.block}};
}

json to_json_fields(const PositionClosed& e) {
    return json{{"user", to_hex(e.user)}, {"netuid", e.netuid},
                {"token_amount_closed", amount(e.token_amount_closed)},
                {"proceeds", amount(e.proceeds)}, {"borrowed_repaid", amount(e.borrowed_repaid)},
                {"borrowing_fees_paid", amount(e.borrowing_fees_paid)},
                {"trading_fee", amount(e.trading_fee)}, {"net_return", amount(e.net_return)},
                {"pnl", to_string(e.pnl)}, {"fully_closed", e.fully_closed}, {"block", e.block}};
}

json to_json_fields(const CollateralAdded& e) {
    return json{{"user", to_hex(e.user)}, {"netuid", e.netuid}, {"amount", amount(e.amount)},
                {"token_amount_added", amount(e.token_amount_added)}, {"block", e.block}};
}

json to_json_fields(const PositionLiquidated& e) {
    return json{{"user", to_hex(e.user)}, {"liquidator", to_hex(e.liquidator)},
                {"netuid", e.netuid}, {"position_value", amount(e.position_value)},
                {"proceeds", amount(e.proceeds)}, {"debt_repaid", amount(e.debt_repaid)},
                {"bad_debt", amount(e.bad_debt)}, {"lp_loss", amount(e.lp_loss)},
                {"liquidation_fee", amount(e.liquidation_fee)},
                {"liquidator_bonus", amount(e.liquidator_bonus)},
                {"user_return", amount(e.user_return)}, {"justification", e.justification},
                {"content_hash", to_hex(e.content_hash)}, {"block", e.block}};
}

json to_json_fields(const LiquidityAdded& e) {
    return json{{"provider", to_hex(e.provider)}, {"amount", amount(e.amount)},
                {"shares", amount(e.shares)}, {"block", e.block}};
}

json to_json_fields(const LiquidityRemoved& e) {
    return json{{"provider", to_hex(e.provider)}, {"amount", amount(e.amount)},
                {"shares", amount(e.shares)}, {"block", e.block}};
}

json to_json_fields(const RewardsClaimed& e) {
    return json{{"account", to_hex(e.account)}, {"amount", amount(e.amount)},
                {"kind", e.liquidator ? "liquidator" : "lp"}, {"block", e.block}};
}

json to_json_fields(const BuybackExecuted& e) {
    return json{{"spent", amount(e.spent)}, {"tokens_received", amount(e.tokens_received)},
                {"slippage", amount(e.slippage)}, {"spend_fraction", amount(e.spend_fraction)},
                {"schedule_index", e.schedule_index}, {"block", e.block}};
}

json to_json_fields(const VestedClaimed& e) {
    return json{{"beneficiary", to_hex(e.beneficiary)}, {"destination", to_hex(e.destination)},
                {"amount", amount(e.amount)}, {"block", e.block}};
}

json to_json_fields(const CircuitBreakerChanged& e) {
    return json{{"engaged", e.engaged}, {"total_lp_stakes", amount(e.total_lp_stakes)},
                {"utilization", amount(e.utilization)}, {"block", e.block}};
}

} // namespace

const char* event_name(const Event& event) {
    static constexpr const char* names[] = {
        "PositionOpened", "PositionClosed", "CollateralAdded", "PositionLiquidated",
        "LiquidityAdded", "LiquidityRemoved", "RewardsClaimed", "BuybackExecuted",
        "VestedClaimed", "CircuitBreakerChanged"
    };
    static_assert(std::size(names) == std::variant_size_v<Event>);
    return names[event.index()];
}

std::string event_to_json(const Event& event) {
    json body = std::visit([](const auto& e) { return to_json_fields(e); }, event);
    json out{{"event", event_name(event)}, {"data", std::move(body)}};
    return out.dump();
}

} // namespace tenex
