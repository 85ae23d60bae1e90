#ifndef DLMM_POSITION_HPP
#define DLMM_POSITION_HPP

#include <vector>

#include "types.hpp"

namespace dlmm {

// =============================================================================
// Growth Snapshot (per bin, per position)
// =============================================================================

struct GrowthSnapshot {
    U128 fee_growth_x = 0;
    U128 fee_growth_y = 0;
    std::vector<U128> reward_growth;

    U128 reward_growth_at(size_t index) const {
        return index < reward_growth.size() ? reward_growth[index] : 0;
    }
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    PositionId id = 0;
    uint64_t pool_id = 0;
    Address owner{};
    int32_t lower_bin_id = 0;
    int32_t upper_bin_id = 0;                // Inclusive
    std::vector<U128> liquidity_shares;      // Indexed by bin_id - lower_bin_id
    std::vector<GrowthSnapshot> snapshots;   // Parallel to liquidity_shares
    uint64_t fee_owed_x = 0;
    uint64_t fee_owed_y = 0;
    std::vector<uint64_t> rewards_owed;      // One entry per reward type
    uint64_t flash_count = 0;                // Deposits inside an open flash group

    uint32_t width() const {
        return static_cast<uint32_t>(static_cast<int64_t>(upper_bin_id) - lower_bin_id + 1);
    }

    bool contains(int32_t bin_id) const {
        return bin_id >= lower_bin_id && bin_id <= upper_bin_id;
    }

    size_t offset(int32_t bin_id) const {
        return static_cast<size_t>(static_cast<int64_t>(bin_id) - lower_bin_id);
    }

    U128 share_at(int32_t bin_id) const {
        return contains(bin_id) ? liquidity_shares[offset(bin_id)] : 0;
    }

    bool has_liquidity() const {
        for (U128 s : liquidity_shares) {
            if (s != 0) return true;
        }
        return false;
    }

    uint64_t reward_owed_at(size_t index) const {
        return index < rewards_owed.size() ? rewards_owed[index] : 0;
    }
};

// =============================================================================
// Position Info (derived view, pending growth included)
// =============================================================================

struct BinCheckpoint {
    int32_t bin_id;
    U128 liquidity_share;
    U128 fee_growth_x_snapshot;
    U128 fee_growth_y_snapshot;
    std::vector<U128> reward_growth_snapshot;
};

struct PositionInfo {
    PositionId id;
    int32_t lower_bin_id;
    int32_t upper_bin_id;
    uint64_t fee_owed_x;
    uint64_t fee_owed_y;
    std::vector<uint64_t> rewards_owed;
    std::vector<BinCheckpoint> bins;    // Only bins holding shares
    Amounts liquidity;                  // Reserves the shares currently redeem for
};

} // namespace dlmm

#endif // DLMM_POSITION_HPP
