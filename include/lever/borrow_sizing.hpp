#ifndef LEVER_BORROW_SIZING_HPP
#define LEVER_BORROW_SIZING_HPP

#include "types.hpp"
#include "collaborators.hpp"

namespace lever {

struct BorrowSizingInputs {
    I128 debt;                      // D, reference currency
    I128 available_borrow;          // A, reference currency
    I128 health_factor;             // WAD
    I128 liquidation_threshold;     // WAD
    I128 target_health_factor;      // WAD
    I128 buffer;                    // WAD fraction withheld from A
};

// Borrow amount that, re-supplied as collateral, brings the health factor to
// the target:
//   0                                   if hf < target or A == 0
//   min(A*(1-buffer), (hf-target)*D/(target-lt))   if D > 0
//   A*(1-buffer)                        otherwise
I128 compute_borrow_amount(const BorrowSizingInputs& in);

// Same, reading D, A, hf and lt from the market's view of a position
I128 compute_borrow_amount(const PositionData& position, I128 target_health_factor,
                           I128 buffer);

} // namespace lever

#endif // LEVER_BORROW_SIZING_HPP
