#include "dlmm/types.hpp"

namespace dlmm {

Direction checked_direction(uint8_t raw) {
    switch (raw) {
        case static_cast<uint8_t>(Direction::XtoY): return Direction::XtoY;
        case static_cast<uint8_t>(Direction::YtoX): return Direction::YtoX;
        default:
            throw EngineError(ErrorCode::InvalidDirection,
                              "unknown direction tag " + std::to_string(raw));
    }
}

const char* to_string(Direction d) {
    switch (d) {
        case Direction::XtoY: return "x_to_y";
        case Direction::YtoX: return "y_to_x";
    }
    return "unknown";
}

const char* to_string(SwapMode m) {
    switch (m) {
        case SwapMode::ExactIn: return "exact_in";
        case SwapMode::ExactOut: return "exact_out";
    }
    return "unknown";
}

const char* to_string(Operation op) {
    switch (op) {
        case Operation::Swap: return "swap";
        case Operation::OpenPosition: return "open_position";
        case Operation::AddLiquidity: return "add_liquidity";
        case Operation::RemoveLiquidity: return "remove_liquidity";
        case Operation::CollectFee: return "collect_fee";
        case Operation::CollectReward: return "collect_reward";
        case Operation::ClosePosition: return "close_position";
        case Operation::Flash: return "flash";
        case Operation::Admin: return "admin";
        case Operation::FundReward: return "fund_reward";
    }
    return "unknown";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::InvalidBinRange: return "InvalidBinRange";
        case ErrorCode::FlashRepayMismatch: return "FlashRepayMismatch";
        case ErrorCode::Blocked: return "Blocked";
        case ErrorCode::FeeRateOutOfRange: return "FeeRateOutOfRange";
        case ErrorCode::Overflow: return "Overflow";
        case ErrorCode::Underflow: return "Underflow";
        case ErrorCode::StaleVersion: return "StaleVersion";
        case ErrorCode::InvalidDirection: return "InvalidDirection";
        case ErrorCode::SlippageExceeded: return "SlippageExceeded";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::PositionNotFound: return "PositionNotFound";
        case ErrorCode::InvalidRewardIndex: return "InvalidRewardIndex";
        case ErrorCode::NotLocked: return "NotLocked";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::Reentrancy: return "Reentrancy";
    }
    return "Unknown";
}

} // namespace dlmm
