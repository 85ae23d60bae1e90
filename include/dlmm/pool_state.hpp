#ifndef DLMM_POOL_STATE_HPP
#define DLMM_POOL_STATE_HPP

#include <map>
#include <vector>

#include "types.hpp"
#include "bin_ledger.hpp"
#include "fee_model.hpp"
#include "position.hpp"

namespace dlmm {

// =============================================================================
// Reward Emission
// =============================================================================

struct RewardInfo {
    Currency coin;
    U128 emission_rate = 0;         // Tokens per second, Q64.64
    uint64_t period_start = 0;
    uint64_t period_end = 0;
    uint64_t last_update = 0;
    U128 undistributed = 0;         // Q64.64 tokens emitted while the active bin had no shares
    uint64_t total_added = 0;
    uint64_t total_claimed = 0;
};

// =============================================================================
// Flash Loan Bookkeeping
// =============================================================================

struct FlashLoan {
    uint64_t id;
    Token token;
    uint64_t amount;
};

struct FlashReceipt {
    uint64_t pool_id;
    uint64_t loan_id;
    Token token;
    uint64_t amount;
};

// =============================================================================
// Pool State
// =============================================================================
//
// Everything one pool owns. Copyable so a flash group can snapshot and
// restore it wholesale.

struct PoolState {
    uint64_t pool_id = 0;
    uint64_t version = PROTOCOL_VERSION;
    Currency coin_x;
    Currency coin_y;
    uint16_t bin_step = 0;
    int32_t active_bin_id = 0;

    FeeParameters fee_params;
    VolatilityState volatility;
    BinLedger ledger;

    Amounts balances;          // Everything the pool custodies per token
    Amounts protocol_fees;     // Collectable by the protocol

    std::vector<RewardInfo> rewards;

    std::map<PositionId, Position> positions;
    PositionId next_position_id = 1;

    bool locked = false;                       // Flash group open
    std::map<uint64_t, FlashLoan> flash_loans;  // Outstanding loans
    uint64_t next_flash_id = 1;

    const Currency& coin(Token t) const { return t == Token::X ? coin_x : coin_y; }
};

} // namespace dlmm

#endif // DLMM_POOL_STATE_HPP
