#ifndef DLMM_POSITION_ACCOUNTING_HPP
#define DLMM_POSITION_ACCOUNTING_HPP

#include <vector>

#include "pool_state.hpp"
#include "rewards.hpp"

namespace dlmm {

// =============================================================================
// Liquidity Plan (staged position operation)
// =============================================================================

struct LiquidityPlan {
    rewards::RewardAccrual accrual;   // Emission credited before the operation
    Position position;                // Position as it reads afterwards
    bool erase_position = false;      // Close: drop it instead of storing
    std::vector<Bin> bins;            // Touched bins, post-operation
    Amounts deposited;                // Taken into the pool
    Amounts released;                 // Paid out of the pool (liquidity + fees)
    std::vector<uint64_t> rewards_out;  // Paid out per reward index
    std::vector<U128> shares;         // Minted or burned, parallel to the request
};

// =============================================================================
// Position Accounting
// =============================================================================
//
// Every operation realizes what a position is owed in each bin it touches
// before changing its share there, then advances the bin snapshot to the
// bin's current growth. A growth interval is therefore paid exactly once.

namespace position_accounting {

// Throws InvalidBinRange when upper < lower, the width exceeds
// MAX_BIN_PER_POSITION or either end falls outside the step's id range
LiquidityPlan open_position(const PoolState& state, const Address& owner,
                            int32_t lower_bin_id, int32_t upper_bin_id, uint64_t timestamp);

// Mints shares per bin. The first deposit into a bin mints its value in Y
// terms, floor(x * p) + y. A bin that already holds reserves takes only the
// part of a deposit matching its X:Y ratio; `deposited` reports what was
// taken. Throws Underflow when a bin would mint nothing.
LiquidityPlan add_liquidity(const PoolState& state, PositionId id,
                            const std::vector<BinAmount>& amounts, uint64_t timestamp);

// Burns shares per bin for reserve * shares / supply, rounded down
LiquidityPlan remove_liquidity(const PoolState& state, PositionId id,
                               const std::vector<BinShares>& shares, uint64_t timestamp);

LiquidityPlan collect_fee(const PoolState& state, PositionId id, uint64_t timestamp);

LiquidityPlan collect_reward(const PoolState& state, PositionId id, size_t reward_index,
                             uint64_t timestamp);

// Burns every share and pays out liquidity, fees and rewards
LiquidityPlan close_position(const PoolState& state, PositionId id, uint64_t timestamp);

void apply_plan(PoolState& state, const LiquidityPlan& plan);

// Owed amounts including growth not yet realized. Never mutates.
PositionInfo position_info(const PoolState& state, PositionId id, uint64_t timestamp);

// Throws PositionNotFound
const Position& find_position(const PoolState& state, PositionId id);

} // namespace position_accounting

} // namespace dlmm

#endif // DLMM_POSITION_ACCOUNTING_HPP
