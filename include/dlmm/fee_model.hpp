#ifndef DLMM_FEE_MODEL_HPP
#define DLMM_FEE_MODEL_HPP

#include "types.hpp"

namespace dlmm {

// =============================================================================
// Fee Parameters
// =============================================================================

struct FeeParameters {
    uint64_t base_fee_rate = 2000000;                // 0.2%
    uint64_t protocol_fee_rate = 100000000;          // 10% of each fee
    uint64_t filter_period = 30;                     // seconds
    uint64_t decay_period = 600;                     // seconds
    uint64_t variable_fee_control = 40000;
    uint64_t max_volatility_accumulator = 350000;    // 35 bins
};

// =============================================================================
// Volatility State
// =============================================================================

struct VolatilityState {
    uint64_t volatility_accumulator = 0;  // 10000 per bin of distance
    uint64_t volatility_reference = 0;    // Decayed accumulator at swap start
    int32_t reference_bin_id = 0;
    uint64_t last_update_timestamp = 0;
};

struct FeeSplit {
    uint64_t lp_fee;
    uint64_t protocol_fee;
    uint64_t referral_fee;
};

// =============================================================================
// Fee Model
// =============================================================================
//
// Decay policy: once `filter_period` seconds have passed since the last
// swap, the reference bin moves to the active bin and the accumulator is
// decayed linearly, reaching zero after `decay_period` seconds. Swaps
// inside the filter window keep accumulating from the same reference.

namespace fee_model {

// Each bin of distance from the reference adds this much volatility
constexpr uint64_t VOLATILITY_PER_BIN = BASIS_POINT_MAX;
// (va * bin_step)^2 * control / VARIABLE_FEE_DIVISOR is a 1e9-scaled rate
constexpr uint64_t VARIABLE_FEE_DIVISOR = 100000000000ULL;  // 1e11

void validate(const FeeParameters& params);

// Linear decay of an accumulator after `elapsed` seconds
uint64_t decay(uint64_t accumulator, uint64_t elapsed, const FeeParameters& params);

// State at the start of a swap beginning in `active_bin_id`
VolatilityState begin_swap(const VolatilityState& state, int32_t active_bin_id,
                           uint64_t timestamp, const FeeParameters& params);

// State while the swap is consuming `bin_id`
VolatilityState at_bin(const VolatilityState& state, int32_t bin_id,
                       const FeeParameters& params);

VolatilityState end_swap(const VolatilityState& state, uint64_t timestamp);

uint64_t variable_fee_rate(const VolatilityState& state, uint16_t bin_step,
                           const FeeParameters& params);

// min(base + variable, MAX_FEE_RATE)
uint64_t total_fee_rate(const VolatilityState& state, uint16_t bin_step,
                        const FeeParameters& params);

// Fee rate a swap starting now would pay in the active bin
uint64_t compute_fee(const FeeParameters& params, const VolatilityState& state,
                     int32_t active_bin_id, uint16_t bin_step, uint64_t timestamp);

// ceil(amount * rate / 1e9), fee carved out of a gross amount
uint64_t fee_on_amount(uint64_t amount, uint64_t rate);

// ceil(net * rate / (1e9 - rate)), fee added on top of a net amount
uint64_t fee_for_net(uint64_t net, uint64_t rate);

// Throws FeeRateOutOfRange when protocol_rate > MAX_PROTOCOL_FEE_RATE or
// protocol_rate + referral_rate > FEE_PRECISION
FeeSplit split_fee(uint64_t total_fee, uint64_t protocol_rate, uint64_t referral_rate);

} // namespace fee_model

} // namespace dlmm

#endif // DLMM_FEE_MODEL_HPP
