// =============================================================================
// swap_engine.cpp - Multi-bin exact-in / exact-out traversal
// =============================================================================

#include "dlmm/swap_engine.hpp"
#include "dlmm/math.hpp"
#include "dlmm/price_math.hpp"

#include <algorithm>

namespace dlmm {
namespace swap_engine {

namespace {

struct StepInput {
    Direction direction;
    SwapMode mode;
    uint64_t remaining;
    U128 price;
    uint64_t fee_rate;
    uint64_t reserve_out;
};

struct StepAmounts {
    uint64_t amount_in;
    uint64_t amount_in_net;
    uint64_t amount_out;
    uint64_t fee;
};

// Net input that buys `amount_out` inside the bin, rounded up
U128 net_in_for_out(Direction direction, U128 amount_out, U128 price) {
    return direction == Direction::XtoY
        ? price_math::y_to_x_up(amount_out, price)
        : price_math::x_to_y_up(amount_out, price);
}

// Output a net input buys inside the bin, rounded down
U128 out_for_net_in(Direction direction, U128 amount_in, U128 price) {
    return direction == Direction::XtoY
        ? price_math::x_to_y(amount_in, price)
        : price_math::y_to_x(amount_in, price);
}

// Amounts for one bin. The bin is drained when the remaining request
// covers its whole output reserve.
StepAmounts compute_swap_step(const StepInput& in) {
    StepAmounts s{};

    if (in.mode == SwapMode::ExactIn) {
        U128 max_net = net_in_for_out(in.direction, in.reserve_out, in.price);
        U128 max_fee = math::mul_div_up(max_net, in.fee_rate, FEE_PRECISION - in.fee_rate);
        U128 max_gross = math::add_u128(max_net, max_fee);

        if (U128(in.remaining) >= max_gross) {
            // Full step: take everything the bin holds
            s.amount_in = static_cast<uint64_t>(max_gross);
            s.amount_in_net = static_cast<uint64_t>(max_net);
            s.fee = static_cast<uint64_t>(max_fee);
            s.amount_out = in.reserve_out;
        } else {
            // Partial step: fee carved out of the remaining input
            s.amount_in = in.remaining;
            s.fee = fee_model::fee_on_amount(in.remaining, in.fee_rate);
            s.amount_in_net = in.remaining - s.fee;
            U128 out = out_for_net_in(in.direction, s.amount_in_net, in.price);
            s.amount_out = static_cast<uint64_t>(std::min<U128>(out, in.reserve_out));
        }
    } else {
        s.amount_out = std::min(in.remaining, in.reserve_out);
        s.amount_in_net = math::to_u64(net_in_for_out(in.direction, s.amount_out, in.price));
        s.fee = fee_model::fee_for_net(s.amount_in_net, in.fee_rate);
        s.amount_in = math::add_u64(s.amount_in_net, s.fee);
    }
    return s;
}

SwapMode checked_mode(SwapMode mode) {
    if (mode != SwapMode::ExactIn && mode != SwapMode::ExactOut) {
        throw EngineError(ErrorCode::InvalidDirection,
                          "unknown swap mode tag " + std::to_string(static_cast<int>(mode)));
    }
    return mode;
}

} // anonymous namespace

// =============================================================================
// Planning
// =============================================================================

SwapPlan plan_swap(const PoolState& state, const SwapRequest& request, uint64_t timestamp) {
    const Direction direction = checked_direction(static_cast<uint8_t>(request.direction));
    const SwapMode mode = checked_mode(request.mode);
    const FeeParameters& params = state.fee_params;
    const Token in_token = input_token(direction);
    const Token out_token = output_token(direction);

    // Rejects a bad referral rate before any work
    fee_model::split_fee(0, params.protocol_fee_rate, request.referral_fee_rate);

    SwapPlan plan;
    plan.active_bin_id = state.active_bin_id;
    SwapResult& result = plan.result;
    result.direction = direction;
    result.mode = mode;
    result.start_bin_id = state.active_bin_id;

    VolatilityState volatility = fee_model::begin_swap(
        state.volatility, state.active_bin_id, timestamp, params);

    uint64_t remaining = request.amount;
    std::optional<int32_t> cursor;
    if (remaining > 0) {
        if (state.ledger.reserves(state.active_bin_id).of(out_token) > 0) {
            cursor = state.active_bin_id;
        } else {
            cursor = state.ledger.next_bin_with_liquidity(state.active_bin_id, direction);
        }
    }

    while (remaining > 0 && cursor) {
        const int32_t bin_id = *cursor;
        const Bin* bin = state.ledger.find(bin_id);  // Bitmaps only index stored bins
        const U128 price = price_math::price_from_bin_id(bin_id, state.bin_step);

        volatility = fee_model::at_bin(volatility, bin_id, params);
        const uint64_t fee_rate = fee_model::total_fee_rate(volatility, state.bin_step, params);

        StepAmounts amounts = compute_swap_step(StepInput{
            direction, mode, remaining, price, fee_rate, bin->reserve_of(out_token)});

        FeeSplit split = fee_model::split_fee(amounts.fee, params.protocol_fee_rate,
                                              request.referral_fee_rate);

        // LP share becomes fee growth for the bin's shareholders; with no
        // shares outstanding the protocol keeps it
        U128 fee_growth_delta = 0;
        if (bin->liquidity_supply == 0) {
            split.protocol_fee += split.lp_fee;
            split.lp_fee = 0;
        } else if (split.lp_fee != 0) {
            fee_growth_delta = math::shl_div(split.lp_fee, Q64_SHIFT, bin->liquidity_supply);
        }

        // Commit must not overflow
        math::add_u64(bin->reserve_of(in_token), amounts.amount_in_net);
        math::add_u128(in_token == Token::X ? bin->fee_growth_x : bin->fee_growth_y,
                       fee_growth_delta);

        result.steps.push_back(SwapStep{
            bin_id, price, fee_rate,
            amounts.amount_in, amounts.amount_in_net, amounts.amount_out,
            amounts.fee, split.protocol_fee, split.referral_fee, fee_growth_delta});

        result.amount_in = math::add_u64(result.amount_in, amounts.amount_in);
        result.amount_out = math::add_u64(result.amount_out, amounts.amount_out);
        result.fee = math::add_u64(result.fee, amounts.fee);
        result.protocol_fee = math::add_u64(result.protocol_fee, split.protocol_fee);
        result.referral_fee = math::add_u64(result.referral_fee, split.referral_fee);

        remaining -= mode == SwapMode::ExactIn ? amounts.amount_in : amounts.amount_out;
        plan.active_bin_id = bin_id;

        if (remaining == 0) break;
        // Bin drained, move on in the swap direction
        cursor = state.ledger.next_bin_with_liquidity(bin_id, direction);
    }

    result.is_exceed = remaining > 0;
    result.end_bin_id = plan.active_bin_id;
    plan.volatility = fee_model::end_swap(volatility, timestamp);

    math::add_u64(state.balances.of(in_token), result.amount_in - result.referral_fee);
    math::sub_u64(state.balances.of(out_token), result.amount_out);
    math::add_u64(state.protocol_fees.of(in_token), result.protocol_fee);

    if (mode == SwapMode::ExactIn && result.amount_out < request.min_amount_out) {
        throw EngineError(ErrorCode::SlippageExceeded,
                          "amount out " + std::to_string(result.amount_out) + " below minimum " +
                          std::to_string(request.min_amount_out));
    }
    if (mode == SwapMode::ExactOut && request.max_amount_in &&
        result.amount_in > *request.max_amount_in) {
        throw EngineError(ErrorCode::SlippageExceeded,
                          "amount in " + std::to_string(result.amount_in) + " above maximum " +
                          std::to_string(*request.max_amount_in));
    }

    return plan;
}

// =============================================================================
// Commit
// =============================================================================

void apply_swap(PoolState& state, const SwapPlan& plan) {
    const SwapResult& result = plan.result;
    const Token in_token = input_token(result.direction);
    const Token out_token = output_token(result.direction);

    for (const SwapStep& step : result.steps) {
        state.ledger.apply_swap_step(step.bin_id, result.direction, step.amount_in_net,
                                     step.amount_out, step.fee_growth_delta);
    }

    // Referral share leaves the pool with the referrer
    state.balances.of(in_token) += result.amount_in - result.referral_fee;
    state.balances.of(out_token) -= result.amount_out;
    state.protocol_fees.of(in_token) += result.protocol_fee;

    state.active_bin_id = plan.active_bin_id;
    state.volatility = plan.volatility;
}

} // namespace swap_engine
} // namespace dlmm
