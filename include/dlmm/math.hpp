#ifndef DLMM_MATH_HPP
#define DLMM_MATH_HPP

#include "types.hpp"

namespace dlmm {

// =============================================================================
// 256-bit Intermediate (two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// =============================================================================
// Checked Wide Arithmetic
// =============================================================================
//
// All helpers throw EngineError(Overflow) when a result does not fit its
// return type and EngineError(Underflow) when a subtraction would go
// negative. Division by zero is reported as Overflow.

namespace math {

U256 mul_wide(U128 a, U128 b);

// Quotient and remainder of a 256-bit numerator by a 128-bit denominator
U256 divmod(const U256& num, U128 denom, U128& remainder);

U256 shr(const U256& v, int shift);
U256 shl(U128 v, int shift);

// floor(a * b / denom)
U128 mul_div(U128 a, U128 b, U128 denom);
// ceil(a * b / denom)
U128 mul_div_up(U128 a, U128 b, U128 denom);

// floor(a * b / 2^shift)
U128 mul_shr(U128 a, U128 b, int shift);
// ceil(a * b / 2^shift)
U128 mul_shr_up(U128 a, U128 b, int shift);

// floor(a * 2^shift / denom)
U128 shl_div(U128 a, int shift, U128 denom);
// ceil(a * 2^shift / denom)
U128 shl_div_up(U128 a, int shift, U128 denom);

uint64_t to_u64(U128 v);

uint64_t add_u64(uint64_t a, uint64_t b);
uint64_t sub_u64(uint64_t a, uint64_t b);
U128 add_u128(U128 a, U128 b);
U128 sub_u128(U128 a, U128 b);

// Decimal rendering, __int128 has no stream operator
std::string to_string(U128 v);

} // namespace math

} // namespace dlmm

#endif // DLMM_MATH_HPP
