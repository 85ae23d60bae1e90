// =============================================================================
// fee_model.cpp - Base + volatility fee, decay and fee splitting
// =============================================================================

#include "dlmm/fee_model.hpp"
#include "dlmm/math.hpp"

#include <algorithm>
#include <limits>

namespace dlmm {
namespace fee_model {

namespace {

constexpr uint64_t U32_MAX = std::numeric_limits<uint32_t>::max();

uint64_t bin_distance(int32_t a, int32_t b) {
    int64_t d = static_cast<int64_t>(a) - static_cast<int64_t>(b);
    return static_cast<uint64_t>(d < 0 ? -d : d);
}

} // anonymous namespace

void validate(const FeeParameters& params) {
    if (params.base_fee_rate > MAX_FEE_RATE) {
        throw EngineError(ErrorCode::FeeRateOutOfRange,
                          "base fee rate " + std::to_string(params.base_fee_rate) +
                          " exceeds " + std::to_string(MAX_FEE_RATE));
    }
    if (params.protocol_fee_rate > MAX_PROTOCOL_FEE_RATE) {
        throw EngineError(ErrorCode::FeeRateOutOfRange,
                          "protocol fee rate " + std::to_string(params.protocol_fee_rate) +
                          " exceeds " + std::to_string(MAX_PROTOCOL_FEE_RATE));
    }
    if (params.decay_period == 0 || params.decay_period < params.filter_period) {
        throw EngineError(ErrorCode::InvalidConfig, "decay period must cover the filter period");
    }
    if (params.variable_fee_control > U32_MAX || params.max_volatility_accumulator > U32_MAX) {
        throw EngineError(ErrorCode::InvalidConfig, "variable fee parameters exceed 32 bits");
    }
}

uint64_t decay(uint64_t accumulator, uint64_t elapsed, const FeeParameters& params) {
    if (elapsed >= params.decay_period) return 0;
    return static_cast<uint64_t>(
        math::mul_div(accumulator, params.decay_period - elapsed, params.decay_period));
}

VolatilityState begin_swap(const VolatilityState& state, int32_t active_bin_id,
                           uint64_t timestamp, const FeeParameters& params) {
    VolatilityState next = state;
    uint64_t elapsed = timestamp > state.last_update_timestamp
        ? timestamp - state.last_update_timestamp : 0;

    if (elapsed >= params.filter_period) {
        next.reference_bin_id = active_bin_id;
        next.volatility_reference = decay(state.volatility_accumulator, elapsed, params);
    }
    return next;
}

VolatilityState at_bin(const VolatilityState& state, int32_t bin_id,
                       const FeeParameters& params) {
    VolatilityState next = state;
    U128 va = U128(state.volatility_reference) +
              U128(bin_distance(state.reference_bin_id, bin_id)) * VOLATILITY_PER_BIN;
    next.volatility_accumulator = static_cast<uint64_t>(
        std::min<U128>(va, params.max_volatility_accumulator));
    return next;
}

VolatilityState end_swap(const VolatilityState& state, uint64_t timestamp) {
    VolatilityState next = state;
    next.last_update_timestamp = std::max(state.last_update_timestamp, timestamp);
    return next;
}

uint64_t variable_fee_rate(const VolatilityState& state, uint16_t bin_step,
                           const FeeParameters& params) {
    if (params.variable_fee_control == 0 || state.volatility_accumulator == 0) return 0;
    U128 v = U128(state.volatility_accumulator) * bin_step;
    U128 rate = math::mul_div_up(v * v, params.variable_fee_control, VARIABLE_FEE_DIVISOR);
    return static_cast<uint64_t>(std::min<U128>(rate, MAX_FEE_RATE));
}

uint64_t total_fee_rate(const VolatilityState& state, uint16_t bin_step,
                        const FeeParameters& params) {
    uint64_t rate = params.base_fee_rate + variable_fee_rate(state, bin_step, params);
    return std::min(rate, MAX_FEE_RATE);
}

uint64_t compute_fee(const FeeParameters& params, const VolatilityState& state,
                     int32_t active_bin_id, uint16_t bin_step, uint64_t timestamp) {
    VolatilityState started = begin_swap(state, active_bin_id, timestamp, params);
    return total_fee_rate(at_bin(started, active_bin_id, params), bin_step, params);
}

uint64_t fee_on_amount(uint64_t amount, uint64_t rate) {
    return static_cast<uint64_t>(math::mul_div_up(amount, rate, FEE_PRECISION));
}

uint64_t fee_for_net(uint64_t net, uint64_t rate) {
    // rate <= MAX_FEE_RATE keeps the denominator positive
    return math::to_u64(math::mul_div_up(net, rate, FEE_PRECISION - rate));
}

FeeSplit split_fee(uint64_t total_fee, uint64_t protocol_rate, uint64_t referral_rate) {
    if (protocol_rate > MAX_PROTOCOL_FEE_RATE) {
        throw EngineError(ErrorCode::FeeRateOutOfRange,
                          "protocol fee rate " + std::to_string(protocol_rate));
    }
    if (referral_rate > FEE_PRECISION - protocol_rate) {
        throw EngineError(ErrorCode::FeeRateOutOfRange,
                          "referral fee rate " + std::to_string(referral_rate));
    }

    FeeSplit split{};
    split.protocol_fee = static_cast<uint64_t>(math::mul_div(total_fee, protocol_rate, FEE_PRECISION));
    split.referral_fee = static_cast<uint64_t>(math::mul_div(total_fee, referral_rate, FEE_PRECISION));
    split.lp_fee = total_fee - split.protocol_fee - split.referral_fee;
    return split;
}

} // namespace fee_model
} // namespace dlmm
