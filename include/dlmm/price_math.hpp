#ifndef DLMM_PRICE_MATH_HPP
#define DLMM_PRICE_MATH_HPP

#include "types.hpp"

namespace dlmm {

// =============================================================================
// Bin Price Math (Q64.64)
// =============================================================================
//
// price(id) = (1 + bin_step / 10000)^id, the amount of Y one unit of X is
// worth inside bin `id`. Computed by repeated squaring so every platform
// produces the same bits.
//
// The usable id range for a bin step is |id| <= max_bin_id(bin_step): the
// positive power must stay below 2^112 raw so the inverted negative-side
// prices keep at least 2^16 raw units and adjacent bins never collide.

namespace price_math {

// Raw Q64.64 bound for price(|id|)
constexpr int PRICE_CAP_LOG2 = 112;

// 1 + bin_step / 10000 in Q64.64
U128 base_for_step(uint16_t bin_step);

// Throws InvalidConfig for a zero or oversized bin step, Overflow when
// |id| is outside the usable range.
U128 price_from_bin_id(int32_t id, uint16_t bin_step);

// Largest id with price_from_bin_id(id) <= price. Throws Overflow when the
// price lies outside [price(min_bin_id), price(max_bin_id)].
int32_t bin_id_from_price(U128 price, uint16_t bin_step);

int32_t max_bin_id(uint16_t bin_step);
int32_t min_bin_id(uint16_t bin_step);
bool is_valid_bin_id(int32_t id, uint16_t bin_step);

// Amount conversions at a bin price
U128 x_to_y(U128 amount_x, U128 price);     // floor(x * p)
U128 x_to_y_up(U128 amount_x, U128 price);  // ceil(x * p)
U128 y_to_x(U128 amount_y, U128 price);     // floor(y / p)
U128 y_to_x_up(U128 amount_y, U128 price);  // ceil(y / p)

// Value of a bin's reserves in Y units: floor(x * p) + y
U128 bin_value(uint64_t reserve_x, uint64_t reserve_y, U128 price);

} // namespace price_math

} // namespace dlmm

#endif // DLMM_PRICE_MATH_HPP
