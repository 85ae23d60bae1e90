// =============================================================================
// pool.cpp - DLMM pool: transactional facade over the engine modules
// =============================================================================

#include "dlmm/pool.hpp"
#include "dlmm/math.hpp"
#include "dlmm/rewards.hpp"

#include <spdlog/spdlog.h>

namespace dlmm {

namespace {

void lock_funds(const TxContext& ctx, const Address& from, const Currency& coin, uint64_t amount) {
    if (ctx.custody && amount != 0) ctx.custody->lock_funds(from, coin, amount);
}

void release_funds(const TxContext& ctx, const Address& to, const Currency& coin, uint64_t amount) {
    if (ctx.custody && amount != 0) ctx.custody->release_funds(to, coin, amount);
}

PoolState initial_state(const PoolConfig& config) {
    config.validate();

    PoolState state;
    state.pool_id = config.pool_id;
    state.coin_x = config.coin_x;
    state.coin_y = config.coin_y;
    state.bin_step = config.bin_step;
    state.active_bin_id = config.active_bin_id;
    state.fee_params = config.fee_params;
    state.volatility.reference_bin_id = config.active_bin_id;
    return state;
}

} // anonymous namespace

Pool::Pool(const PoolConfig& config)
    : pool_id_(config.pool_id)
    , bin_step_(config.bin_step)
    , admin_(config.admin)
    , state_(initial_state(config)) {
    spdlog::debug("pool {} created: step {} active bin {}", pool_id_, bin_step_,
                  config.active_bin_id);
}

// =============================================================================
// Transaction Checks
// =============================================================================

void Pool::check_tx(const TxContext& ctx, Operation op) const {
    if (ctx.version != state_.version) {
        throw EngineError(ErrorCode::StaleVersion,
                          "pool version " + std::to_string(state_.version) + ", caller expects " +
                          std::to_string(ctx.version));
    }
    if (ctx.access && ctx.access->is_user_blocked(ctx.sender, op)) {
        throw EngineError(ErrorCode::Blocked,
                          std::string("sender blocked for ") + to_string(op));
    }
}

void Pool::check_position(const TxContext& ctx, Operation op, PositionId id) const {
    const Position& position = position_accounting::find_position(state_, id);
    if (position.owner != ctx.sender) {
        throw EngineError(ErrorCode::Unauthorized,
                          "position " + std::to_string(id) + " belongs to another owner");
    }
    if (ctx.access && ctx.access->is_position_blocked(id, op)) {
        throw EngineError(ErrorCode::Blocked,
                          "position " + std::to_string(id) + " blocked for " + to_string(op));
    }
}

void Pool::check_admin(const TxContext& ctx) const {
    // Zero admin: the pool has none
    if (ctx.sender == Address{} || ctx.sender != admin_) {
        throw EngineError(ErrorCode::Unauthorized, "admin operation by non-admin sender");
    }
}

// =============================================================================
// Swaps
// =============================================================================

SwapResult Pool::swap(const TxContext& ctx, const SwapRequest& request) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Swap);

    SwapPlan plan = swap_engine::plan_swap(state_, request, ctx.timestamp);
    rewards::RewardAccrual accrual = rewards::plan_accrual(state_, ctx.timestamp);

    const SwapResult& result = plan.result;
    const Token in = input_token(result.direction);
    const Token out = output_token(result.direction);

    lock_funds(ctx, ctx.sender, state_.coin(in), result.amount_in);
    release_funds(ctx, ctx.sender, state_.coin(out), result.amount_out);
    release_funds(ctx, request.referrer, state_.coin(in), result.referral_fee);

    // Emission up to now belongs to the bin that was active until now
    rewards::apply_accrual(state_, accrual);
    swap_engine::apply_swap(state_, plan);

    total_swaps_.fetch_add(1, std::memory_order_relaxed);
    U128& volume = in == Token::X ? total_volume_x_ : total_volume_y_;
    volume += result.amount_in;

    spdlog::debug("pool {} swap {} {}: in {} out {} fee {} bins {} -> {}{}", pool_id_,
                  to_string(result.direction), to_string(result.mode), result.amount_in,
                  result.amount_out, result.fee, result.start_bin_id, result.end_bin_id,
                  result.is_exceed ? " (exceeded)" : "");
    return result;
}

SwapResult Pool::swap_exact_in(const TxContext& ctx, uint64_t amount_in, Direction direction,
                               uint64_t min_amount_out) {
    SwapRequest request;
    request.direction = direction;
    request.mode = SwapMode::ExactIn;
    request.amount = amount_in;
    request.min_amount_out = min_amount_out;
    return swap(ctx, request);
}

SwapResult Pool::swap_exact_out(const TxContext& ctx, uint64_t amount_out, Direction direction,
                                std::optional<uint64_t> max_amount_in) {
    SwapRequest request;
    request.direction = direction;
    request.mode = SwapMode::ExactOut;
    request.amount = amount_out;
    request.max_amount_in = max_amount_in;
    return swap(ctx, request);
}

SwapResult Pool::quote(const SwapRequest& request, uint64_t timestamp) const {
    std::shared_lock lock(state_mutex_);
    return swap_engine::plan_swap(state_, request, timestamp).result;
}

SwapResult Pool::quote_amount_out(uint64_t amount_in, Direction direction,
                                  uint64_t timestamp) const {
    SwapRequest request;
    request.direction = direction;
    request.mode = SwapMode::ExactIn;
    request.amount = amount_in;
    return quote(request, timestamp);
}

SwapResult Pool::quote_amount_in(uint64_t amount_out, Direction direction,
                                 uint64_t timestamp) const {
    SwapRequest request;
    request.direction = direction;
    request.mode = SwapMode::ExactOut;
    request.amount = amount_out;
    return quote(request, timestamp);
}

// =============================================================================
// Positions
// =============================================================================

PositionId Pool::open_position(const TxContext& ctx, int32_t lower_bin_id, int32_t upper_bin_id) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::OpenPosition);

    LiquidityPlan plan = position_accounting::open_position(
        state_, ctx.sender, lower_bin_id, upper_bin_id, ctx.timestamp);
    position_accounting::apply_plan(state_, plan);

    spdlog::debug("pool {} opened position {} [{}, {}]", pool_id_, plan.position.id,
                  lower_bin_id, upper_bin_id);
    return plan.position.id;
}

LiquidityResult Pool::add_liquidity(const TxContext& ctx, PositionId id,
                                    const std::vector<BinAmount>& amounts) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::AddLiquidity);
    check_position(ctx, Operation::AddLiquidity, id);

    LiquidityPlan plan = position_accounting::add_liquidity(state_, id, amounts, ctx.timestamp);

    lock_funds(ctx, ctx.sender, state_.coin_x, plan.deposited.amount_x);
    lock_funds(ctx, ctx.sender, state_.coin_y, plan.deposited.amount_y);

    position_accounting::apply_plan(state_, plan);
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("pool {} position {} added x {} y {} across {} bins", pool_id_, id,
                  plan.deposited.amount_x, plan.deposited.amount_y, amounts.size());
    return LiquidityResult{plan.deposited, std::move(plan.shares)};
}

LiquidityResult Pool::remove_liquidity(const TxContext& ctx, PositionId id,
                                       const std::vector<BinShares>& shares) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::RemoveLiquidity);
    check_position(ctx, Operation::RemoveLiquidity, id);

    LiquidityPlan plan = position_accounting::remove_liquidity(state_, id, shares, ctx.timestamp);

    release_funds(ctx, ctx.sender, state_.coin_x, plan.released.amount_x);
    release_funds(ctx, ctx.sender, state_.coin_y, plan.released.amount_y);

    position_accounting::apply_plan(state_, plan);
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("pool {} position {} removed x {} y {}", pool_id_, id,
                  plan.released.amount_x, plan.released.amount_y);
    return LiquidityResult{plan.released, std::move(plan.shares)};
}

Amounts Pool::collect_fee(const TxContext& ctx, PositionId id) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::CollectFee);
    check_position(ctx, Operation::CollectFee, id);

    LiquidityPlan plan = position_accounting::collect_fee(state_, id, ctx.timestamp);

    release_funds(ctx, ctx.sender, state_.coin_x, plan.released.amount_x);
    release_funds(ctx, ctx.sender, state_.coin_y, plan.released.amount_y);

    position_accounting::apply_plan(state_, plan);
    return plan.released;
}

uint64_t Pool::collect_reward(const TxContext& ctx, PositionId id, size_t reward_index) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::CollectReward);
    check_position(ctx, Operation::CollectReward, id);

    LiquidityPlan plan = position_accounting::collect_reward(state_, id, reward_index,
                                                             ctx.timestamp);
    const uint64_t amount = plan.rewards_out[reward_index];

    release_funds(ctx, ctx.sender, state_.rewards[reward_index].coin, amount);

    position_accounting::apply_plan(state_, plan);
    return amount;
}

CloseResult Pool::close_position(const TxContext& ctx, PositionId id) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::ClosePosition);
    check_position(ctx, Operation::ClosePosition, id);

    LiquidityPlan plan = position_accounting::close_position(state_, id, ctx.timestamp);

    release_funds(ctx, ctx.sender, state_.coin_x, plan.released.amount_x);
    release_funds(ctx, ctx.sender, state_.coin_y, plan.released.amount_y);
    for (size_t i = 0; i < plan.rewards_out.size(); ++i) {
        release_funds(ctx, ctx.sender, state_.rewards[i].coin, plan.rewards_out[i]);
    }

    position_accounting::apply_plan(state_, plan);
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    spdlog::debug("pool {} closed position {}: x {} y {}", pool_id_, id,
                  plan.released.amount_x, plan.released.amount_y);
    return CloseResult{plan.released, std::move(plan.rewards_out)};
}

// =============================================================================
// Rewards
// =============================================================================

size_t Pool::initialize_reward(const TxContext& ctx, const Currency& coin) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Admin);
    check_admin(ctx);

    if (state_.rewards.size() >= MAX_REWARD_TYPES) {
        throw EngineError(ErrorCode::InvalidRewardIndex,
                          "pool already carries " + std::to_string(MAX_REWARD_TYPES) + " rewards");
    }
    for (const RewardInfo& info : state_.rewards) {
        if (info.coin == coin) {
            throw EngineError(ErrorCode::InvalidConfig, "reward coin already initialized");
        }
    }

    rewards::RewardAccrual accrual = rewards::plan_accrual(state_, ctx.timestamp);
    RewardInfo info;
    info.coin = coin;
    info.last_update = ctx.timestamp;
    accrual.rewards.push_back(info);

    rewards::apply_accrual(state_, accrual);
    spdlog::info("pool {} initialized reward {}", pool_id_, state_.rewards.size() - 1);
    return state_.rewards.size() - 1;
}

void Pool::add_reward(const TxContext& ctx, size_t reward_index, uint64_t amount,
                      uint64_t start_time) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::FundReward);

    if (reward_index >= state_.rewards.size()) {
        throw EngineError(ErrorCode::InvalidRewardIndex,
                          "reward " + std::to_string(reward_index) + " of " +
                          std::to_string(state_.rewards.size()));
    }
    if (amount == 0) return;

    rewards::RewardAccrual accrual = rewards::plan_accrual(state_, ctx.timestamp);
    accrual.rewards[reward_index] =
        rewards::schedule(accrual.rewards[reward_index], amount, start_time, ctx.timestamp);

    lock_funds(ctx, ctx.sender, accrual.rewards[reward_index].coin, amount);

    rewards::apply_accrual(state_, accrual);
    spdlog::debug("pool {} reward {} funded with {} from {}", pool_id_, reward_index, amount,
                  accrual.rewards[reward_index].period_start);
}

// =============================================================================
// Flash Loans
// =============================================================================

void Pool::lock(LockCallback callback) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);

    PoolState snapshot;
    {
        std::unique_lock lock(state_mutex_);
        if (state_.locked) {
            throw EngineError(ErrorCode::Reentrancy, "flash group already open");
        }
        snapshot = state_;
        state_.locked = true;
    }

    try {
        callback();
    } catch (...) {
        std::unique_lock lock(state_mutex_);
        state_ = std::move(snapshot);
        spdlog::warn("pool {} flash group aborted, state restored", pool_id_);
        throw;
    }

    std::unique_lock lock(state_mutex_);
    if (!state_.flash_loans.empty()) {
        const size_t outstanding = state_.flash_loans.size();
        state_ = std::move(snapshot);
        spdlog::warn("pool {} flash group left {} loans unpaid, state restored", pool_id_,
                     outstanding);
        throw EngineError(ErrorCode::FlashRepayMismatch,
                          std::to_string(outstanding) + " flash loans outstanding");
    }

    for (auto& [id, position] : state_.positions) position.flash_count = 0;
    state_.locked = false;
}

FlashReceipt Pool::borrow_flash(const TxContext& ctx, Token token, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Flash);

    if (!state_.locked) {
        throw EngineError(ErrorCode::NotLocked, "borrow_flash outside a flash group");
    }
    if (amount > state_.balances.of(token)) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          "flash borrow " + std::to_string(amount) + " exceeds pool balance " +
                          std::to_string(state_.balances.of(token)));
    }

    release_funds(ctx, ctx.sender, state_.coin(token), amount);

    const uint64_t loan_id = state_.next_flash_id++;
    state_.flash_loans.emplace(loan_id, FlashLoan{loan_id, token, amount});
    state_.balances.of(token) -= amount;
    total_flash_loans_.fetch_add(1, std::memory_order_relaxed);

    return FlashReceipt{pool_id_, loan_id, token, amount};
}

void Pool::repay_flash(const TxContext& ctx, const FlashReceipt& receipt, uint64_t amount) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Flash);

    if (!state_.locked) {
        throw EngineError(ErrorCode::NotLocked, "repay_flash outside a flash group");
    }
    auto it = state_.flash_loans.find(receipt.loan_id);
    if (receipt.pool_id != pool_id_ || it == state_.flash_loans.end() ||
        it->second.token != receipt.token) {
        throw EngineError(ErrorCode::FlashRepayMismatch,
                          "receipt " + std::to_string(receipt.loan_id) + " not issued by pool " +
                          std::to_string(pool_id_));
    }
    const FlashLoan& loan = it->second;
    if (amount < loan.amount) {
        throw EngineError(ErrorCode::FlashRepayMismatch,
                          "repaid " + std::to_string(amount) + " of " + std::to_string(loan.amount));
    }

    const uint64_t surplus = amount - loan.amount;
    const uint64_t balance = math::add_u64(state_.balances.of(loan.token), amount);
    const uint64_t fees = math::add_u64(state_.protocol_fees.of(loan.token), surplus);

    lock_funds(ctx, ctx.sender, state_.coin(loan.token), amount);

    state_.balances.of(loan.token) = balance;
    state_.protocol_fees.of(loan.token) = fees;
    state_.flash_loans.erase(it);
}

// =============================================================================
// Admin
// =============================================================================

void Pool::set_fee_parameters(const TxContext& ctx, const FeeParameters& params) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Admin);
    check_admin(ctx);
    fee_model::validate(params);

    state_.fee_params = params;
    spdlog::info("pool {} fee parameters: base {} protocol {}", pool_id_,
                 params.base_fee_rate, params.protocol_fee_rate);
}

Amounts Pool::collect_protocol_fee(const TxContext& ctx) {
    std::lock_guard<std::recursive_mutex> txn(txn_mutex_);
    std::unique_lock lock(state_mutex_);
    check_tx(ctx, Operation::Admin);
    check_admin(ctx);

    const Amounts fees = state_.protocol_fees;
    const uint64_t balance_x = math::sub_u64(state_.balances.amount_x, fees.amount_x);
    const uint64_t balance_y = math::sub_u64(state_.balances.amount_y, fees.amount_y);

    release_funds(ctx, ctx.sender, state_.coin_x, fees.amount_x);
    release_funds(ctx, ctx.sender, state_.coin_y, fees.amount_y);

    state_.balances.amount_x = balance_x;
    state_.balances.amount_y = balance_y;
    state_.protocol_fees = Amounts{};
    return fees;
}

// =============================================================================
// Query Operations
// =============================================================================

int32_t Pool::active_bin_id() const {
    std::shared_lock lock(state_mutex_);
    return state_.active_bin_id;
}

Amounts Pool::bin_reserves(int32_t bin_id) const {
    std::shared_lock lock(state_mutex_);
    return state_.ledger.reserves(bin_id);
}

Bin Pool::get_bin(int32_t bin_id) const {
    std::shared_lock lock(state_mutex_);
    return state_.ledger.get_bin(bin_id);
}

std::optional<Position> Pool::get_position(PositionId id) const {
    std::shared_lock lock(state_mutex_);
    auto it = state_.positions.find(id);
    if (it == state_.positions.end()) return std::nullopt;
    return it->second;
}

std::optional<PositionInfo> Pool::position_info(PositionId id, uint64_t timestamp) const {
    std::shared_lock lock(state_mutex_);
    if (state_.positions.find(id) == state_.positions.end()) return std::nullopt;
    return position_accounting::position_info(state_, id, timestamp);
}

VolatilityState Pool::volatility_state() const {
    std::shared_lock lock(state_mutex_);
    return state_.volatility;
}

FeeParameters Pool::fee_parameters() const {
    std::shared_lock lock(state_mutex_);
    return state_.fee_params;
}

Amounts Pool::protocol_fees() const {
    std::shared_lock lock(state_mutex_);
    return state_.protocol_fees;
}

Amounts Pool::balances() const {
    std::shared_lock lock(state_mutex_);
    return state_.balances;
}

std::vector<RewardInfo> Pool::reward_infos() const {
    std::shared_lock lock(state_mutex_);
    return state_.rewards;
}

uint64_t Pool::current_fee_rate(uint64_t timestamp) const {
    std::shared_lock lock(state_mutex_);
    return fee_model::compute_fee(state_.fee_params, state_.volatility, state_.active_bin_id,
                                  state_.bin_step, timestamp);
}

bool Pool::in_flash_group() const {
    std::shared_lock lock(state_mutex_);
    return state_.locked;
}

// =============================================================================
// Statistics
// =============================================================================

Pool::Stats Pool::get_stats() const {
    std::shared_lock lock(state_mutex_);
    return Stats{
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed),
        total_flash_loans_.load(std::memory_order_relaxed),
        total_volume_x_,
        total_volume_y_,
        state_.ledger.bin_count(),
        state_.positions.size()
    };
}

} // namespace dlmm
