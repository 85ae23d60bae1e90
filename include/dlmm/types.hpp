#ifndef DLMM_TYPES_HPP
#define DLMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <stdexcept>
#include <vector>

namespace dlmm {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Q64.64 fixed point: 64 integer bits, 64 fractional bits
constexpr int Q64_SHIFT = 64;
constexpr U128 Q64_ONE = U128(1) << Q64_SHIFT;

// Growth accumulators are scaled by 2^64 per unit of liquidity share
constexpr U128 GROWTH_PRECISION = Q64_ONE;

// =============================================================================
// Protocol Constants
// =============================================================================

constexpr uint64_t PROTOCOL_VERSION = 1;

// Rates are expressed in billionths (1e9 = 100%)
constexpr uint64_t FEE_PRECISION = 1000000000ULL;
constexpr uint64_t MAX_FEE_RATE = 100000000ULL;            // 10%
constexpr uint64_t MAX_PROTOCOL_FEE_RATE = 300000000ULL;   // 30%

constexpr uint16_t BASIS_POINT_MAX = 10000;
constexpr uint16_t MAX_BIN_STEP = 10000;

// Hard bound on bin ids, tighter per-step bounds come from price_math
constexpr int32_t MAX_BIN_ID = 443636;
constexpr int32_t MIN_BIN_ID = -443636;

constexpr uint32_t MAX_BIN_PER_POSITION = 1000;
constexpr size_t MAX_REWARD_TYPES = 5;
constexpr uint64_t REWARD_PERIOD = 604800;  // one week, seconds

// =============================================================================
// Addresses & Coins
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Helper to build a distinct test/demo coin from a small tag
inline Currency make_currency(uint16_t tag) {
    Address a{};
    a[18] = static_cast<uint8_t>((tag >> 8) & 0xFF);
    a[19] = static_cast<uint8_t>(tag & 0xFF);
    return Currency{a};
}

using PositionId = uint64_t;

// =============================================================================
// Closed Variants
// =============================================================================

// XtoY sells X for Y and walks toward higher bin ids,
// YtoX sells Y for X and walks toward lower bin ids.
enum class Direction : uint8_t {
    XtoY = 0,
    YtoX = 1
};

enum class SwapMode : uint8_t {
    ExactIn = 0,
    ExactOut = 1
};

enum class Token : uint8_t {
    X = 0,
    Y = 1
};

// Token the taker pays for a direction
constexpr Token input_token(Direction d) {
    return d == Direction::XtoY ? Token::X : Token::Y;
}

constexpr Token output_token(Direction d) {
    return d == Direction::XtoY ? Token::Y : Token::X;
}

// Throws InvalidDirection for tags outside the enum
Direction checked_direction(uint8_t raw);

const char* to_string(Direction d);
const char* to_string(SwapMode m);

// =============================================================================
// Operations (for access control)
// =============================================================================

enum class Operation : uint8_t {
    Swap = 0,
    OpenPosition = 1,
    AddLiquidity = 2,
    RemoveLiquidity = 3,
    CollectFee = 4,
    CollectReward = 5,
    ClosePosition = 6,
    Flash = 7,
    Admin = 8,
    FundReward = 9
};

const char* to_string(Operation op);

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    OK = 0,
    InsufficientLiquidity = -1,
    InvalidBinRange = -2,
    FlashRepayMismatch = -3,
    Blocked = -4,
    FeeRateOutOfRange = -5,
    Overflow = -6,
    Underflow = -7,
    StaleVersion = -8,
    InvalidDirection = -9,
    SlippageExceeded = -10,
    Unauthorized = -11,
    PositionNotFound = -12,
    InvalidRewardIndex = -13,
    NotLocked = -14,
    InvalidConfig = -15,
    Reentrancy = -16
};

const char* to_string(ErrorCode code);

// Every hard failure of the engine. The operation that throws leaves
// pool state untouched.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& msg)
        : std::runtime_error(std::string(to_string(code)) + ": " + msg), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// =============================================================================
// Value Types
// =============================================================================

struct Amounts {
    uint64_t amount_x = 0;
    uint64_t amount_y = 0;

    uint64_t& of(Token t) { return t == Token::X ? amount_x : amount_y; }
    uint64_t of(Token t) const { return t == Token::X ? amount_x : amount_y; }

    bool operator==(const Amounts& other) const {
        return amount_x == other.amount_x && amount_y == other.amount_y;
    }
};

// Per-bin deposit request
struct BinAmount {
    int32_t bin_id;
    uint64_t amount_x;
    uint64_t amount_y;
};

// Per-bin withdrawal request
struct BinShares {
    int32_t bin_id;
    U128 shares;
};

} // namespace dlmm

#endif // DLMM_TYPES_HPP
