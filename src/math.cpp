// =============================================================================
// math.cpp - Checked 128/256-bit arithmetic for fixed-point price math
// =============================================================================

#include "dlmm/math.hpp"

#include <algorithm>
#include <limits>

namespace dlmm {
namespace math {

namespace {

constexpr U128 U128_MAX = ~U128(0);
constexpr U128 MASK64 = (U128(1) << 64) - 1;

[[noreturn]] void overflow(const char* what) {
    throw EngineError(ErrorCode::Overflow, what);
}

U128 narrow(const U256& v, const char* what) {
    if (v.hi != 0) overflow(what);
    return v.lo;
}

U256 add_one(const U256& v) {
    U256 r = v;
    r.lo += 1;
    if (r.lo == 0) r.hi += 1;
    return r;
}

} // anonymous namespace

U256 mul_wide(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U256 divmod(const U256& num, U128 denom, U128& remainder) {
    if (denom == 0) overflow("division by zero");

    if (num.hi == 0) {
        remainder = num.lo % denom;
        return U256(num.lo / denom);
    }

    // Restoring long division, one numerator bit per iteration. The
    // running remainder can reach 129 bits, the carry holds the top bit.
    U256 quot;
    U128 rem = 0;
    for (int i = 255; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        U128 bit = i >= 128 ? (num.hi >> (i - 128)) & 1 : (num.lo >> i) & 1;
        rem = (rem << 1) | bit;
        if (carry || rem >= denom) {
            rem -= denom;
            if (i >= 128) {
                quot.hi |= U128(1) << (i - 128);
            } else {
                quot.lo |= U128(1) << i;
            }
        }
    }
    remainder = rem;
    return quot;
}

U256 shr(const U256& v, int shift) {
    if (shift == 0) return v;
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(v.hi >> (shift - 128), 0);
    return U256((v.lo >> shift) | (v.hi << (128 - shift)), v.hi >> shift);
}

U256 shl(U128 v, int shift) {
    if (shift == 0) return U256(v);
    if (shift >= 256) return U256();
    if (shift >= 128) return U256(0, v << (shift - 128));
    return U256(v << shift, v >> (128 - shift));
}

U128 mul_div(U128 a, U128 b, U128 denom) {
    U128 rem = 0;
    return narrow(divmod(mul_wide(a, b), denom, rem), "mul_div");
}

U128 mul_div_up(U128 a, U128 b, U128 denom) {
    U128 rem = 0;
    U256 q = divmod(mul_wide(a, b), denom, rem);
    if (rem != 0) q = add_one(q);
    return narrow(q, "mul_div_up");
}

U128 mul_shr(U128 a, U128 b, int shift) {
    return narrow(shr(mul_wide(a, b), shift), "mul_shr");
}

U128 mul_shr_up(U128 a, U128 b, int shift) {
    U256 product = mul_wide(a, b);
    U256 q = shr(product, shift);
    // Any bit shifted out means the floor lost a fraction
    bool inexact;
    if (shift == 0) {
        inexact = false;
    } else if (shift < 128) {
        inexact = (product.lo & ((U128(1) << shift) - 1)) != 0;
    } else {
        U128 hi_mask = shift == 128 ? 0 : (U128(1) << (shift - 128)) - 1;
        inexact = product.lo != 0 || (product.hi & hi_mask) != 0;
    }
    if (inexact) q = add_one(q);
    return narrow(q, "mul_shr_up");
}

U128 shl_div(U128 a, int shift, U128 denom) {
    U128 rem = 0;
    return narrow(divmod(shl(a, shift), denom, rem), "shl_div");
}

U128 shl_div_up(U128 a, int shift, U128 denom) {
    U128 rem = 0;
    U256 q = divmod(shl(a, shift), denom, rem);
    if (rem != 0) q = add_one(q);
    return narrow(q, "shl_div_up");
}

uint64_t to_u64(U128 v) {
    if (v > std::numeric_limits<uint64_t>::max()) overflow("value exceeds 64 bits");
    return static_cast<uint64_t>(v);
}

uint64_t add_u64(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) overflow("u64 addition");
    return a + b;
}

uint64_t sub_u64(uint64_t a, uint64_t b) {
    if (b > a) throw EngineError(ErrorCode::Underflow, "u64 subtraction");
    return a - b;
}

U128 add_u128(U128 a, U128 b) {
    if (a > U128_MAX - b) overflow("u128 addition");
    return a + b;
}

U128 sub_u128(U128 a, U128 b) {
    if (b > a) throw EngineError(ErrorCode::Underflow, "u128 subtraction");
    return a - b;
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace math
} // namespace dlmm
