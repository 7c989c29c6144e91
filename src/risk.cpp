// =============================================================================
// risk.cpp - Health Ratio, Liquidation Price and Borrow Rate Curve
// =============================================================================

#include "tenex/risk.hpp"
#include "tenex/math.hpp"

namespace tenex {
namespace risk {

FixedPoint health_ratio(Amount position_value, Amount total_debt) {
    if (total_debt == 0) {
        return MAX_HEALTH_RATIO;
    }
    return fp::mul_div(position_value, PRECISION, total_debt);
}

FixedPoint liquidation_price(Amount borrowed, Amount accrued_fees,
                             Amount token_amount, FixedPoint threshold) {
    if (token_amount == 0) {
        return 0;
    }
    Amount debt = fp::add(borrowed, accrued_fees);
    return fp::mul_div(debt, threshold, token_amount);
}

FixedPoint utilization(Amount total_borrowed, Amount total_stakes) {
    if (total_stakes == 0) {
        return 0;
    }
    return fp::mul_div(total_borrowed, PRECISION, total_stakes);
}

FixedPoint borrow_rate_per_360_blocks(FixedPoint utilization, const RateModel& model) {
    FixedPoint u = fp::min(utilization, PRECISION);

    if (u <= model.kink) {
        return fp::add(model.base_rate, fp::apply_rate(u, model.slope1));
    }

    FixedPoint at_kink = fp::add(model.base_rate, fp::apply_rate(model.kink, model.slope1));
    FixedPoint excess = fp::sub(u, model.kink);
    return fp::add(at_kink, fp::apply_rate(excess, model.slope2));
}

Amount accrued_borrowing_fee(Amount borrowed, FixedPoint rate_per_360_blocks,
                             uint64_t blocks_elapsed) {
    if (borrowed == 0 || blocks_elapsed == 0 || rate_per_360_blocks == 0) {
        return 0;
    }
    Amount per_period = fp::apply_rate(borrowed, rate_per_360_blocks);
    return fp::mul_div(per_period, blocks_elapsed, limits::RATE_PERIOD_BLOCKS);
}

bool is_liquidatable(Amount position_value, Amount total_debt, FixedPoint threshold) {
    return health_ratio(position_value, total_debt) < threshold;
}

} // namespace risk
} // namespace tenex
