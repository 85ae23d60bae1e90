// =============================================================================
// rewards.cpp - Time-weighted reward emission into the active bin
// =============================================================================

#include "dlmm/rewards.hpp"
#include "dlmm/math.hpp"

#include <algorithm>

namespace dlmm {
namespace rewards {

U128 emitted_between(const RewardInfo& info, uint64_t from, uint64_t to) {
    uint64_t begin = std::max(from, info.period_start);
    uint64_t end = std::min(to, info.period_end);
    if (end <= begin || info.emission_rate == 0) return 0;
    return math::mul_div(info.emission_rate, end - begin, 1);  // checked product
}

RewardAccrual plan_accrual(const PoolState& state, uint64_t timestamp) {
    RewardAccrual accrual;
    accrual.rewards = state.rewards;
    accrual.bin_id = state.active_bin_id;

    const Bin* bin = state.ledger.find(state.active_bin_id);
    U128 supply = bin ? bin->liquidity_supply : 0;
    bool touched = false;
    std::vector<U128> growth(state.rewards.size(), 0);

    for (size_t i = 0; i < accrual.rewards.size(); ++i) {
        RewardInfo& info = accrual.rewards[i];
        growth[i] = bin ? bin->reward_growth_at(i) : 0;
        if (timestamp <= info.last_update) continue;

        U128 emitted = emitted_between(info, info.last_update, timestamp);
        info.last_update = timestamp;
        if (emitted == 0) continue;

        if (supply == 0) {
            info.undistributed = math::add_u128(info.undistributed, emitted);
        } else {
            // emitted is Q64.64 tokens, growth is tokens * 2^64 per share
            growth[i] = math::add_u128(growth[i], emitted / supply);
            touched = true;
        }
    }

    if (touched) accrual.bin_growth = std::move(growth);
    return accrual;
}

void apply_accrual(PoolState& state, const RewardAccrual& accrual) {
    state.rewards = accrual.rewards;
    if (accrual.bin_growth.empty()) return;
    state.ledger.put_bin(staged_bin(state, accrual, accrual.bin_id));
}

Bin staged_bin(const PoolState& state, const RewardAccrual& accrual, int32_t bin_id) {
    Bin bin = state.ledger.get_bin(bin_id);
    if (bin_id == accrual.bin_id && !accrual.bin_growth.empty()) {
        bin.reward_growth = accrual.bin_growth;
    }
    return bin;
}

RewardInfo schedule(const RewardInfo& current, uint64_t amount, uint64_t start, uint64_t now) {
    RewardInfo next = current;
    uint64_t begin = std::max(start, now);

    // What the running period has not emitted yet, plus emission nobody
    // could earn while the active bin had no shares
    U128 leftover = emitted_between(current, now, current.period_end);
    U128 total = math::add_u128(math::add_u128(leftover, current.undistributed),
                                U128(amount) << Q64_SHIFT);

    next.emission_rate = total / REWARD_PERIOD;
    next.period_start = begin;
    next.period_end = math::add_u64(begin, REWARD_PERIOD);
    next.undistributed = 0;
    next.last_update = std::max(current.last_update, now);
    next.total_added = math::add_u64(current.total_added, amount);
    return next;
}

} // namespace rewards
} // namespace dlmm
