#ifndef DLMM_SWAP_ENGINE_HPP
#define DLMM_SWAP_ENGINE_HPP

#include <optional>
#include <vector>

#include "pool_state.hpp"

namespace dlmm {

// =============================================================================
// Swap Request / Result
// =============================================================================

struct SwapRequest {
    Direction direction = Direction::XtoY;
    SwapMode mode = SwapMode::ExactIn;
    uint64_t amount = 0;                     // Input for ExactIn, output for ExactOut
    uint64_t min_amount_out = 0;             // ExactIn slippage guard
    std::optional<uint64_t> max_amount_in;   // ExactOut slippage guard
    uint64_t referral_fee_rate = 0;          // Share of each fee paid to the referrer
    Address referrer{};
};

// One bin consumed by a swap
struct SwapStep {
    int32_t bin_id;
    U128 price;                  // Q64.64
    uint64_t fee_rate;           // 1e9 scale, base + variable
    uint64_t amount_in;          // Paid by the taker, fee included
    uint64_t amount_in_net;      // Credited to the bin reserve
    uint64_t amount_out;         // Taken from the bin reserve
    uint64_t fee;
    uint64_t protocol_fee;
    uint64_t referral_fee;
    U128 fee_growth_delta;       // Added to the bin's input-side fee growth
};

struct SwapResult {
    Direction direction = Direction::XtoY;
    SwapMode mode = SwapMode::ExactIn;
    uint64_t amount_in = 0;      // Consumed, fee included
    uint64_t amount_out = 0;
    uint64_t fee = 0;
    uint64_t protocol_fee = 0;
    uint64_t referral_fee = 0;
    std::vector<SwapStep> steps;
    bool is_exceed = false;      // Request could not be fully satisfied
    int32_t start_bin_id = 0;
    int32_t end_bin_id = 0;
};

// Read-only outcome of a swap, committed by apply_swap
struct SwapPlan {
    SwapResult result;
    VolatilityState volatility;
    int32_t active_bin_id;
};

// =============================================================================
// Swap Engine
// =============================================================================
//
// Bin traversal for exact-in and exact-out swaps. Planning never mutates
// the pool, so quotes are exact and a failure while planning leaves the
// pool untouched. Rounding favors the pool: fees and the input a taker
// owes round up, the output a taker receives rounds down.

namespace swap_engine {

// Throws InvalidDirection, Overflow, FeeRateOutOfRange and
// SlippageExceeded. Running out of liquidity is reported through
// SwapResult::is_exceed.
SwapPlan plan_swap(const PoolState& state, const SwapRequest& request, uint64_t timestamp);

// Commits a plan made against the current state
void apply_swap(PoolState& state, const SwapPlan& plan);

} // namespace swap_engine

} // namespace dlmm

#endif // DLMM_SWAP_ENGINE_HPP
