// =============================================================================
// price_math.cpp - Deterministic bin id <-> Q64.64 price conversion
// =============================================================================

#include "dlmm/price_math.hpp"
#include "dlmm/math.hpp"

namespace dlmm {
namespace price_math {

namespace {

const U128 PRICE_CAP = U128(1) << PRICE_CAP_LOG2;

void check_step(uint16_t bin_step) {
    if (bin_step == 0 || bin_step > MAX_BIN_STEP) {
        throw EngineError(ErrorCode::InvalidConfig,
                          "bin step out of range: " + std::to_string(bin_step));
    }
}

U128 abs_id(int32_t id) {
    return id < 0 ? U128(-static_cast<int64_t>(id)) : U128(id);
}

// base^n in Q64.64 with every product floored. Returns false when the
// power reaches PRICE_CAP.
bool try_pow(uint32_t n, uint16_t bin_step, U128& out) {
    U128 result = Q64_ONE;
    U128 base = base_for_step(bin_step);
    const U256 cap(PRICE_CAP);

    while (n != 0) {
        if (n & 1) {
            U256 product = math::shr(math::mul_wide(result, base), Q64_SHIFT);
            if (!(product < cap)) return false;
            result = product.lo;
        }
        n >>= 1;
        if (n == 0) break;
        // base^(2^k) <= base^n whenever a higher bit remains, so a square
        // past the cap means the final result would be too
        U256 square = math::shr(math::mul_wide(base, base), Q64_SHIFT);
        if (!(square < cap)) return false;
        base = square.lo;
    }
    out = result;
    return true;
}

bool try_price(int32_t id, uint16_t bin_step, U128& out) {
    if (id > MAX_BIN_ID || id < MIN_BIN_ID) return false;
    U128 magnitude = 0;
    if (!try_pow(static_cast<uint32_t>(abs_id(id)), bin_step, magnitude)) return false;
    if (id >= 0) {
        out = magnitude;
    } else {
        // 2^128 / p(|id|), p(|id|) >= 2^64 so the quotient fits
        U128 rem = 0;
        out = math::divmod(U256(0, 1), magnitude, rem).lo;
    }
    return true;
}

} // anonymous namespace

U128 base_for_step(uint16_t bin_step) {
    return Q64_ONE + (Q64_ONE * bin_step) / BASIS_POINT_MAX;
}

U128 price_from_bin_id(int32_t id, uint16_t bin_step) {
    check_step(bin_step);
    U128 price = 0;
    if (!try_price(id, bin_step, price)) {
        throw EngineError(ErrorCode::Overflow,
                          "bin id " + std::to_string(id) + " outside price range for step " +
                          std::to_string(bin_step));
    }
    return price;
}

int32_t max_bin_id(uint16_t bin_step) {
    check_step(bin_step);
    // Largest n in [0, MAX_BIN_ID] whose power stays under the cap
    int32_t lo = 0;
    int32_t hi = MAX_BIN_ID;
    U128 scratch = 0;
    while (lo < hi) {
        int32_t mid = lo + (hi - lo + 1) / 2;
        if (try_pow(static_cast<uint32_t>(mid), bin_step, scratch)) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return lo;
}

int32_t min_bin_id(uint16_t bin_step) {
    return -max_bin_id(bin_step);
}

bool is_valid_bin_id(int32_t id, uint16_t bin_step) {
    check_step(bin_step);
    U128 scratch = 0;
    return try_price(id, bin_step, scratch);
}

int32_t bin_id_from_price(U128 price, uint16_t bin_step) {
    int32_t hi = max_bin_id(bin_step);
    int32_t lo = -hi;

    if (price < price_from_bin_id(lo, bin_step) || price > price_from_bin_id(hi, bin_step)) {
        throw EngineError(ErrorCode::Overflow,
                          "price " + math::to_string(price) + " outside bin range");
    }

    // Invariant: price(lo) <= price, answer in [lo, hi]
    while (lo < hi) {
        int32_t mid = lo + (hi - lo + 1) / 2;
        if (price_from_bin_id(mid, bin_step) <= price) {
            lo = mid;
        } else {
            hi = mid - 1;
        }
    }
    return lo;
}

U128 x_to_y(U128 amount_x, U128 price) {
    return math::mul_shr(amount_x, price, Q64_SHIFT);
}

U128 x_to_y_up(U128 amount_x, U128 price) {
    return math::mul_shr_up(amount_x, price, Q64_SHIFT);
}

U128 y_to_x(U128 amount_y, U128 price) {
    return math::shl_div(amount_y, Q64_SHIFT, price);
}

U128 y_to_x_up(U128 amount_y, U128 price) {
    return math::shl_div_up(amount_y, Q64_SHIFT, price);
}

U128 bin_value(uint64_t reserve_x, uint64_t reserve_y, U128 price) {
    return math::add_u128(x_to_y(reserve_x, price), reserve_y);
}

} // namespace price_math
} // namespace dlmm
