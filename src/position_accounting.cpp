// =============================================================================
// position_accounting.cpp - Shares, fee and reward checkpoints per position
// =============================================================================

#include "dlmm/position_accounting.hpp"
#include "dlmm/math.hpp"
#include "dlmm/price_math.hpp"

#include <algorithm>
#include <map>
#include <optional>

namespace dlmm {
namespace position_accounting {

namespace {

// Bins touched by one operation, read through the reward accrual
class BinStage {
public:
    BinStage(const PoolState& state, const rewards::RewardAccrual& accrual)
        : state_(state), accrual_(accrual) {}

    Bin& at(int32_t bin_id) {
        auto it = bins_.find(bin_id);
        if (it == bins_.end()) {
            it = bins_.emplace(bin_id, rewards::staged_bin(state_, accrual_, bin_id)).first;
        }
        return it->second;
    }

    // Read-only view, staged copy if the bin was touched
    Bin view(int32_t bin_id) const {
        auto it = bins_.find(bin_id);
        return it != bins_.end() ? it->second : rewards::staged_bin(state_, accrual_, bin_id);
    }

    std::vector<Bin> take() {
        std::vector<Bin> out;
        out.reserve(bins_.size());
        for (auto& [id, bin] : bins_) out.push_back(std::move(bin));
        return out;
    }

private:
    const PoolState& state_;
    const rewards::RewardAccrual& accrual_;
    std::map<int32_t, Bin> bins_;
};

struct Mint {
    U128 shares;
    Amounts accepted;  // Part of the request the bin takes
};

// An unfunded bin takes the whole deposit at floor(x * p) + y. A funded bin
// only takes amounts in its own X:Y ratio: shares are the smallest
// amount * supply / reserve over the sides it holds, and the accepted
// amounts round up from those shares.
Mint mint_for(const Bin& bin, const BinAmount& req, U128 price) {
    if (bin.liquidity_supply == 0 || !bin.has_reserves()) {
        return Mint{price_math::bin_value(req.amount_x, req.amount_y, price),
                    Amounts{req.amount_x, req.amount_y}};
    }

    const U128 supply = bin.liquidity_supply;
    std::optional<U128> shares;
    if (bin.reserve_x != 0) shares = math::mul_div(req.amount_x, supply, bin.reserve_x);
    if (bin.reserve_y != 0) {
        U128 by_y = math::mul_div(req.amount_y, supply, bin.reserve_y);
        shares = shares ? std::min(*shares, by_y) : by_y;
    }

    Mint mint{*shares, Amounts{}};
    mint.accepted.amount_x = math::to_u64(math::mul_div_up(mint.shares, bin.reserve_x, supply));
    mint.accepted.amount_y = math::to_u64(math::mul_div_up(mint.shares, bin.reserve_y, supply));
    return mint;
}

uint64_t owed_for(U128 share, U128 growth, U128 snapshot) {
    if (share == 0 || growth == snapshot) return 0;
    return math::to_u64(math::mul_shr(share, math::sub_u128(growth, snapshot), Q64_SHIFT));
}

// Credits what `position` earned in `bin` since its snapshot and moves the
// snapshot up to the bin's growth
void realize(Position& position, const Bin& bin, size_t reward_count) {
    const size_t off = position.offset(bin.id);
    const U128 share = position.liquidity_shares[off];
    GrowthSnapshot& snap = position.snapshots[off];

    position.fee_owed_x = math::add_u64(position.fee_owed_x,
                                        owed_for(share, bin.fee_growth_x, snap.fee_growth_x));
    position.fee_owed_y = math::add_u64(position.fee_owed_y,
                                        owed_for(share, bin.fee_growth_y, snap.fee_growth_y));

    if (position.rewards_owed.size() < reward_count) position.rewards_owed.resize(reward_count, 0);
    for (size_t i = 0; i < reward_count; ++i) {
        position.rewards_owed[i] = math::add_u64(
            position.rewards_owed[i],
            owed_for(share, bin.reward_growth_at(i), snap.reward_growth_at(i)));
    }

    snap.fee_growth_x = bin.fee_growth_x;
    snap.fee_growth_y = bin.fee_growth_y;
    snap.reward_growth.assign(reward_count, 0);
    for (size_t i = 0; i < reward_count; ++i) snap.reward_growth[i] = bin.reward_growth_at(i);
}

void realize_all(Position& position, BinStage& stage, size_t reward_count) {
    for (int64_t id = position.lower_bin_id; id <= position.upper_bin_id; ++id) {
        const int32_t bin_id = static_cast<int32_t>(id);
        if (position.share_at(bin_id) == 0) continue;
        realize(position, stage.view(bin_id), reward_count);
    }
}

void check_in_range(const Position& position, int32_t bin_id) {
    if (!position.contains(bin_id)) {
        throw EngineError(ErrorCode::InvalidBinRange,
                          "bin " + std::to_string(bin_id) + " outside position [" +
                          std::to_string(position.lower_bin_id) + ", " +
                          std::to_string(position.upper_bin_id) + "]");
    }
}

// Shares and reserves leave the bin, reserves accumulate into `released`
Amounts burn(Position& position, Bin& bin, U128 shares) {
    const size_t off = position.offset(bin.id);
    if (shares > position.liquidity_shares[off]) {
        throw EngineError(ErrorCode::Underflow,
                          "burning " + math::to_string(shares) + " shares in bin " +
                          std::to_string(bin.id) + ", position holds " +
                          math::to_string(position.liquidity_shares[off]));
    }
    Amounts out;
    out.amount_x = math::to_u64(math::mul_div(bin.reserve_x, shares, bin.liquidity_supply));
    out.amount_y = math::to_u64(math::mul_div(bin.reserve_y, shares, bin.liquidity_supply));

    bin.reserve_x -= out.amount_x;
    bin.reserve_y -= out.amount_y;
    bin.liquidity_supply -= shares;
    position.liquidity_shares[off] -= shares;
    return out;
}

void accumulate(Amounts& total, const Amounts& more) {
    total.amount_x = math::add_u64(total.amount_x, more.amount_x);
    total.amount_y = math::add_u64(total.amount_y, more.amount_y);
}

// Pays out fees and clears them from the position
Amounts take_fees(Position& position) {
    Amounts fees{position.fee_owed_x, position.fee_owed_y};
    position.fee_owed_x = 0;
    position.fee_owed_y = 0;
    return fees;
}

uint64_t take_reward(LiquidityPlan& plan, size_t index) {
    uint64_t amount = plan.position.reward_owed_at(index);
    if (index < plan.position.rewards_owed.size()) plan.position.rewards_owed[index] = 0;

    RewardInfo& info = plan.accrual.rewards[index];
    info.total_claimed = math::add_u64(info.total_claimed, amount);
    return amount;
}

// The pool must be able to pay out what the plan releases
void check_balances(const PoolState& state, const LiquidityPlan& plan) {
    math::sub_u64(math::add_u64(state.balances.amount_x, plan.deposited.amount_x),
                  plan.released.amount_x);
    math::sub_u64(math::add_u64(state.balances.amount_y, plan.deposited.amount_y),
                  plan.released.amount_y);
}

LiquidityPlan begin(const PoolState& state, PositionId id, uint64_t timestamp) {
    LiquidityPlan plan;
    plan.position = find_position(state, id);
    plan.accrual = rewards::plan_accrual(state, timestamp);
    return plan;
}

} // anonymous namespace

const Position& find_position(const PoolState& state, PositionId id) {
    auto it = state.positions.find(id);
    if (it == state.positions.end()) {
        throw EngineError(ErrorCode::PositionNotFound, "position " + std::to_string(id));
    }
    return it->second;
}

// =============================================================================
// Open
// =============================================================================

LiquidityPlan open_position(const PoolState& state, const Address& owner,
                            int32_t lower_bin_id, int32_t upper_bin_id, uint64_t timestamp) {
    if (upper_bin_id < lower_bin_id) {
        throw EngineError(ErrorCode::InvalidBinRange,
                          "upper bin " + std::to_string(upper_bin_id) + " below lower bin " +
                          std::to_string(lower_bin_id));
    }
    const int64_t width = static_cast<int64_t>(upper_bin_id) - lower_bin_id + 1;
    if (width > MAX_BIN_PER_POSITION) {
        throw EngineError(ErrorCode::InvalidBinRange,
                          "position spans " + std::to_string(width) + " bins, limit " +
                          std::to_string(MAX_BIN_PER_POSITION));
    }
    if (!price_math::is_valid_bin_id(lower_bin_id, state.bin_step) ||
        !price_math::is_valid_bin_id(upper_bin_id, state.bin_step)) {
        throw EngineError(ErrorCode::InvalidBinRange, "position range outside priceable bins");
    }

    LiquidityPlan plan;
    plan.accrual = rewards::plan_accrual(state, timestamp);

    Position& p = plan.position;
    p.id = state.next_position_id;
    p.pool_id = state.pool_id;
    p.owner = owner;
    p.lower_bin_id = lower_bin_id;
    p.upper_bin_id = upper_bin_id;
    p.liquidity_shares.assign(static_cast<size_t>(width), 0);
    p.snapshots.assign(static_cast<size_t>(width), GrowthSnapshot{});
    p.rewards_owed.assign(state.rewards.size(), 0);
    return plan;
}

// =============================================================================
// Add / Remove
// =============================================================================

LiquidityPlan add_liquidity(const PoolState& state, PositionId id,
                            const std::vector<BinAmount>& amounts, uint64_t timestamp) {
    LiquidityPlan plan = begin(state, id, timestamp);
    BinStage stage(state, plan.accrual);
    Position& position = plan.position;
    const size_t reward_count = plan.accrual.rewards.size();

    for (const BinAmount& req : amounts) {
        check_in_range(position, req.bin_id);
        Bin& bin = stage.at(req.bin_id);
        realize(position, bin, reward_count);

        const U128 price = price_math::price_from_bin_id(req.bin_id, state.bin_step);
        const Mint mint = mint_for(bin, req, price);
        if (mint.shares == 0) {
            throw EngineError(ErrorCode::Underflow,
                              "deposit into bin " + std::to_string(req.bin_id) + " mints no shares");
        }

        bin.reserve_x = math::add_u64(bin.reserve_x, mint.accepted.amount_x);
        bin.reserve_y = math::add_u64(bin.reserve_y, mint.accepted.amount_y);
        bin.liquidity_supply = math::add_u128(bin.liquidity_supply, mint.shares);
        const size_t off = position.offset(req.bin_id);
        position.liquidity_shares[off] = math::add_u128(position.liquidity_shares[off], mint.shares);

        accumulate(plan.deposited, mint.accepted);
        plan.shares.push_back(mint.shares);
    }

    // Deposits inside an open flash group must settle with the group
    if (state.locked) position.flash_count += 1;

    plan.bins = stage.take();
    check_balances(state, plan);
    return plan;
}

LiquidityPlan remove_liquidity(const PoolState& state, PositionId id,
                               const std::vector<BinShares>& shares, uint64_t timestamp) {
    LiquidityPlan plan = begin(state, id, timestamp);
    BinStage stage(state, plan.accrual);
    Position& position = plan.position;
    const size_t reward_count = plan.accrual.rewards.size();

    for (const BinShares& req : shares) {
        check_in_range(position, req.bin_id);
        plan.shares.push_back(req.shares);
        if (req.shares == 0) continue;

        Bin& bin = stage.at(req.bin_id);
        realize(position, bin, reward_count);
        accumulate(plan.released, burn(position, bin, req.shares));
    }

    plan.bins = stage.take();
    check_balances(state, plan);
    return plan;
}

// =============================================================================
// Collect / Close
// =============================================================================

LiquidityPlan collect_fee(const PoolState& state, PositionId id, uint64_t timestamp) {
    LiquidityPlan plan = begin(state, id, timestamp);
    BinStage stage(state, plan.accrual);

    realize_all(plan.position, stage, plan.accrual.rewards.size());
    plan.released = take_fees(plan.position);

    check_balances(state, plan);
    return plan;
}

LiquidityPlan collect_reward(const PoolState& state, PositionId id, size_t reward_index,
                             uint64_t timestamp) {
    if (reward_index >= state.rewards.size()) {
        throw EngineError(ErrorCode::InvalidRewardIndex,
                          "reward " + std::to_string(reward_index) + " of " +
                          std::to_string(state.rewards.size()));
    }
    LiquidityPlan plan = begin(state, id, timestamp);
    BinStage stage(state, plan.accrual);

    realize_all(plan.position, stage, plan.accrual.rewards.size());
    plan.rewards_out.assign(plan.accrual.rewards.size(), 0);
    plan.rewards_out[reward_index] = take_reward(plan, reward_index);
    return plan;
}

LiquidityPlan close_position(const PoolState& state, PositionId id, uint64_t timestamp) {
    LiquidityPlan plan = begin(state, id, timestamp);
    Position& position = plan.position;
    if (position.flash_count != 0) {
        throw EngineError(ErrorCode::Reentrancy,
                          "position " + std::to_string(id) + " has deposits in an open flash group");
    }

    BinStage stage(state, plan.accrual);
    const size_t reward_count = plan.accrual.rewards.size();

    for (int64_t bin = position.lower_bin_id; bin <= position.upper_bin_id; ++bin) {
        const int32_t bin_id = static_cast<int32_t>(bin);
        const U128 share = position.share_at(bin_id);
        if (share == 0) continue;

        Bin& staged = stage.at(bin_id);
        realize(position, staged, reward_count);
        accumulate(plan.released, burn(position, staged, share));
    }
    accumulate(plan.released, take_fees(position));

    plan.rewards_out.assign(reward_count, 0);
    for (size_t i = 0; i < reward_count; ++i) plan.rewards_out[i] = take_reward(plan, i);

    plan.erase_position = true;
    plan.bins = stage.take();
    check_balances(state, plan);
    return plan;
}

// =============================================================================
// Commit
// =============================================================================

void apply_plan(PoolState& state, const LiquidityPlan& plan) {
    rewards::apply_accrual(state, plan.accrual);
    for (const Bin& bin : plan.bins) state.ledger.put_bin(bin);

    state.balances.amount_x = state.balances.amount_x + plan.deposited.amount_x -
                              plan.released.amount_x;
    state.balances.amount_y = state.balances.amount_y + plan.deposited.amount_y -
                              plan.released.amount_y;

    if (plan.erase_position) {
        state.positions.erase(plan.position.id);
        return;
    }
    state.positions[plan.position.id] = plan.position;
    if (plan.position.id >= state.next_position_id) {
        state.next_position_id = plan.position.id + 1;
    }
}

// =============================================================================
// Query
// =============================================================================

PositionInfo position_info(const PoolState& state, PositionId id, uint64_t timestamp) {
    const Position& stored = find_position(state, id);
    rewards::RewardAccrual accrual = rewards::plan_accrual(state, timestamp);
    BinStage stage(state, accrual);
    const size_t reward_count = accrual.rewards.size();

    Position pending = stored;
    realize_all(pending, stage, reward_count);

    PositionInfo info;
    info.id = stored.id;
    info.lower_bin_id = stored.lower_bin_id;
    info.upper_bin_id = stored.upper_bin_id;
    info.fee_owed_x = pending.fee_owed_x;
    info.fee_owed_y = pending.fee_owed_y;
    info.rewards_owed = pending.rewards_owed;
    info.rewards_owed.resize(reward_count, 0);
    info.liquidity = Amounts{};

    for (size_t off = 0; off < stored.liquidity_shares.size(); ++off) {
        const U128 share = stored.liquidity_shares[off];
        if (share == 0) continue;

        const GrowthSnapshot& snap = stored.snapshots[off];
        const int32_t bin_id = static_cast<int32_t>(stored.lower_bin_id + static_cast<int64_t>(off));
        info.bins.push_back(BinCheckpoint{bin_id, share, snap.fee_growth_x, snap.fee_growth_y,
                                          snap.reward_growth});

        const Bin bin = stage.view(bin_id);
        accumulate(info.liquidity,
                   Amounts{math::to_u64(math::mul_div(bin.reserve_x, share, bin.liquidity_supply)),
                           math::to_u64(math::mul_div(bin.reserve_y, share, bin.liquidity_supply))});
    }
    return info;
}

} // namespace position_accounting
} // namespace dlmm
