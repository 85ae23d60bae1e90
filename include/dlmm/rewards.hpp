#ifndef DLMM_REWARDS_HPP
#define DLMM_REWARDS_HPP

#include "pool_state.hpp"

namespace dlmm {

// =============================================================================
// Reward Emission
// =============================================================================
//
// Each reward streams linearly over REWARD_PERIOD seconds. Emission for the
// elapsed time is credited to the active bin's reward growth, per share,
// before any operation changes the active bin or its shares.

namespace rewards {

struct RewardAccrual {
    std::vector<RewardInfo> rewards;  // Emission bookkeeping after accrual
    int32_t bin_id = 0;               // Bin credited
    std::vector<U128> bin_growth;     // New reward_growth for bin_id, empty if untouched
};

// Read-only: what accruing up to `timestamp` would change
RewardAccrual plan_accrual(const PoolState& state, uint64_t timestamp);

void apply_accrual(PoolState& state, const RewardAccrual& accrual);

// The bin as it reads once the accrual is applied
Bin staged_bin(const PoolState& state, const RewardAccrual& accrual, int32_t bin_id);

// Schedule `amount` over a fresh period starting at max(start, now). The
// unemitted remainder of a running period and the undistributed emission
// are rolled into the new one.
RewardInfo schedule(const RewardInfo& current, uint64_t amount, uint64_t start, uint64_t now);

// Q64.64 tokens `info` emits between `from` and `to`
U128 emitted_between(const RewardInfo& info, uint64_t from, uint64_t to);

} // namespace rewards

} // namespace dlmm

#endif // DLMM_REWARDS_HPP
