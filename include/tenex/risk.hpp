#ifndef TENEX_RISK_HPP
#define TENEX_RISK_HPP

#include "types.hpp"

namespace tenex {

// =============================================================================
// Interest Rate Model (kinked utilization curve)
// =============================================================================

struct RateModel {
    FixedPoint base_rate;  // rate per 360 blocks at zero utilization
    FixedPoint kink;       // utilization where slope2 takes over
    FixedPoint slope1;     // added rate at utilization == kink, scaled to 100%
    FixedPoint slope2;     // added rate per unit utilization beyond the kink
};

// =============================================================================
// Risk Functions
// =============================================================================
//
// Pure functions over fixed-point values. A position is liquidatable when its
// health ratio falls strictly below the liquidation threshold; there is no
// separate warning band.

namespace risk {

// position_value * PRECISION / total_debt, MAX_HEALTH_RATIO when debt is zero
FixedPoint health_ratio(Amount position_value, Amount total_debt);

// (borrowed + accrued_fees) * threshold / token_amount, 0 without tokens
FixedPoint liquidation_price(Amount borrowed, Amount accrued_fees,
                             Amount token_amount, FixedPoint threshold);

// borrowed * PRECISION / total_stakes, 0 for an empty pool
FixedPoint utilization(Amount total_borrowed, Amount total_stakes);

// Borrow rate per 360 blocks for a utilization level.
//   u <= kink: base + u * slope1 / PRECISION
//   u >  kink: base + kink * slope1 / PRECISION + (u - kink) * slope2 / PRECISION
// Utilization above 100% is clamped.
FixedPoint borrow_rate_per_360_blocks(FixedPoint utilization, const RateModel& model);

// borrowed * rate * blocks / (360 * PRECISION)
Amount accrued_borrowing_fee(Amount borrowed, FixedPoint rate_per_360_blocks,
                             uint64_t blocks_elapsed);

bool is_liquidatable(Amount position_value, Amount total_debt, FixedPoint threshold);

} // namespace risk

} // namespace tenex

#endif // TENEX_RISK_HPP
