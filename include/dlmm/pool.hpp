#ifndef DLMM_POOL_HPP
#define DLMM_POOL_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "pool_state.hpp"
#include "swap_engine.hpp"
#include "position_accounting.hpp"

namespace dlmm {

// =============================================================================
// Collaborator Interfaces
// =============================================================================

class IAccessControl {
public:
    virtual ~IAccessControl() = default;

    virtual bool is_user_blocked(const Address& user, Operation op) const { return false; }
    virtual bool is_position_blocked(PositionId position, Operation op) const { return false; }
};

// Moves value for the pool. The engine computes amounts and never holds
// funds itself. A throwing custody call aborts the operation before commit.
// Custody runs while the pool is locked and must not call back into it.
class ICustody {
public:
    virtual ~ICustody() = default;

    // Pull `amount` of `coin` from `from` into the pool
    virtual void lock_funds(const Address& from, const Currency& coin, uint64_t amount) {}
    // Pay `amount` of `coin` out of the pool to `to`
    virtual void release_funds(const Address& to, const Currency& coin, uint64_t amount) {}
};

// Everything an operation needs from its caller
struct TxContext {
    Address sender{};
    uint64_t version = PROTOCOL_VERSION;   // Expected protocol version
    uint64_t timestamp = 0;                // Seconds
    const IAccessControl* access = nullptr;  // nullptr: nothing blocked
    ICustody* custody = nullptr;             // nullptr: no transfers
};

// =============================================================================
// Operation Results
// =============================================================================

struct LiquidityResult {
    Amounts amounts;              // Deposited or released
    std::vector<U128> shares;     // Minted or burned per requested bin
};

struct CloseResult {
    Amounts amounts;              // Liquidity plus fees
    std::vector<uint64_t> rewards;
};

// =============================================================================
// Pool - one DLMM pair
// =============================================================================
//
// Operations run one at a time per pool and are all-or-nothing: every
// check and every computation happens on a staged plan, and state changes
// only after the plan is complete. Pools share no state.

class Pool {
public:
    explicit Pool(const PoolConfig& config);
    ~Pool() = default;

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    // =========================================================================
    // Swaps
    // =========================================================================

    SwapResult swap(const TxContext& ctx, const SwapRequest& request);

    SwapResult swap_exact_in(const TxContext& ctx, uint64_t amount_in, Direction direction,
                             uint64_t min_amount_out = 0);

    SwapResult swap_exact_out(const TxContext& ctx, uint64_t amount_out, Direction direction,
                              std::optional<uint64_t> max_amount_in = std::nullopt);

    // Read-only simulations, identical to what a swap at `timestamp` does
    SwapResult quote_amount_out(uint64_t amount_in, Direction direction, uint64_t timestamp) const;
    SwapResult quote_amount_in(uint64_t amount_out, Direction direction, uint64_t timestamp) const;

    // =========================================================================
    // Positions
    // =========================================================================

    PositionId open_position(const TxContext& ctx, int32_t lower_bin_id, int32_t upper_bin_id);

    LiquidityResult add_liquidity(const TxContext& ctx, PositionId id,
                                  const std::vector<BinAmount>& amounts);

    LiquidityResult remove_liquidity(const TxContext& ctx, PositionId id,
                                     const std::vector<BinShares>& shares);

    Amounts collect_fee(const TxContext& ctx, PositionId id);
    uint64_t collect_reward(const TxContext& ctx, PositionId id, size_t reward_index);
    CloseResult close_position(const TxContext& ctx, PositionId id);

    // =========================================================================
    // Rewards
    // =========================================================================

    // Admin only. Returns the reward index.
    size_t initialize_reward(const TxContext& ctx, const Currency& coin);

    // Funds `amount` to stream over one period starting at max(start, now)
    void add_reward(const TxContext& ctx, size_t reward_index, uint64_t amount,
                    uint64_t start_time);

    // =========================================================================
    // Flash Loans
    // =========================================================================

    // Opens a flash group. Loans must be repaid before the callback
    // returns; otherwise, or if the callback throws, every effect of the
    // group is rolled back.
    using LockCallback = std::function<void()>;
    void lock(LockCallback callback);

    // Must be called within lock()
    FlashReceipt borrow_flash(const TxContext& ctx, Token token, uint64_t amount);
    // Must be called within lock(). Surplus goes to protocol fees.
    void repay_flash(const TxContext& ctx, const FlashReceipt& receipt, uint64_t amount);

    // =========================================================================
    // Admin
    // =========================================================================

    void set_fee_parameters(const TxContext& ctx, const FeeParameters& params);
    Amounts collect_protocol_fee(const TxContext& ctx);

    // =========================================================================
    // Query Operations
    // =========================================================================

    uint64_t pool_id() const { return pool_id_; }
    uint16_t bin_step() const { return bin_step_; }

    int32_t active_bin_id() const;
    Amounts bin_reserves(int32_t bin_id) const;
    Bin get_bin(int32_t bin_id) const;
    std::optional<Position> get_position(PositionId id) const;
    std::optional<PositionInfo> position_info(PositionId id, uint64_t timestamp) const;
    VolatilityState volatility_state() const;
    FeeParameters fee_parameters() const;
    Amounts protocol_fees() const;
    Amounts balances() const;
    std::vector<RewardInfo> reward_infos() const;
    uint64_t current_fee_rate(uint64_t timestamp) const;
    bool in_flash_group() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
        uint64_t total_flash_loans;
        U128 total_volume_x;      // Input side, fee included
        U128 total_volume_y;
        size_t bin_count;
        size_t position_count;
    };
    Stats get_stats() const;

private:
    const uint64_t pool_id_;
    const uint16_t bin_step_;
    const Address admin_;

    PoolState state_;
    mutable std::shared_mutex state_mutex_;

    // Serializes mutations; held for the whole of a flash group so only
    // the group's own thread can act on the pool meanwhile
    std::recursive_mutex txn_mutex_;

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    std::atomic<uint64_t> total_flash_loans_{0};
    U128 total_volume_x_ = 0;   // Guarded by state_mutex_
    U128 total_volume_y_ = 0;

    // Version first, then access control. Throws StaleVersion / Blocked.
    // Callers hold state_mutex_.
    void check_tx(const TxContext& ctx, Operation op) const;
    // Owner and position block checks, after check_tx
    void check_position(const TxContext& ctx, Operation op, PositionId id) const;
    void check_admin(const TxContext& ctx) const;

    SwapResult quote(const SwapRequest& request, uint64_t timestamp) const;
};

} // namespace dlmm

#endif // DLMM_POOL_HPP
