// =============================================================================
// bin_ledger.cpp - Sparse bin storage with per-token liquidity bitmaps
// =============================================================================

#include "dlmm/bin_ledger.hpp"
#include "dlmm/math.hpp"

#include <bit>

namespace dlmm {

namespace {

// Floor division by 64 (arithmetic shift)
inline int32_t word_of(int32_t id) { return id >> 6; }
inline int bit_of(int32_t id) { return static_cast<int>(id - word_of(id) * 64); }

} // anonymous namespace

// =============================================================================
// Bin
// =============================================================================

bool Bin::is_blank() const {
    if (has_reserves() || liquidity_supply != 0 || fee_growth_x != 0 || fee_growth_y != 0) {
        return false;
    }
    for (U128 g : reward_growth) {
        if (g != 0) return false;
    }
    return true;
}

// =============================================================================
// BinBitmap
// =============================================================================

void BinBitmap::set(int32_t id) {
    words_[word_of(id)] |= uint64_t(1) << bit_of(id);
}

void BinBitmap::clear(int32_t id) {
    auto it = words_.find(word_of(id));
    if (it == words_.end()) return;
    it->second &= ~(uint64_t(1) << bit_of(id));
    if (it->second == 0) words_.erase(it);
}

bool BinBitmap::test(int32_t id) const {
    auto it = words_.find(word_of(id));
    return it != words_.end() && (it->second >> bit_of(id)) & 1;
}

std::optional<int32_t> BinBitmap::next_above(int32_t id) const {
    int32_t start = id + 1;
    int32_t w = word_of(start);
    auto it = words_.lower_bound(w);
    if (it != words_.end() && it->first == w) {
        uint64_t masked = it->second & (~uint64_t(0) << bit_of(start));
        if (masked != 0) return w * 64 + std::countr_zero(masked);
        ++it;
    }
    if (it == words_.end()) return std::nullopt;
    return it->first * 64 + std::countr_zero(it->second);
}

std::optional<int32_t> BinBitmap::next_below(int32_t id) const {
    int32_t start = id - 1;
    int32_t w = word_of(start);
    auto it = words_.upper_bound(w);
    if (it == words_.begin()) return std::nullopt;
    --it;
    if (it->first == w) {
        int b = bit_of(start);
        uint64_t mask = b == 63 ? ~uint64_t(0) : (uint64_t(1) << (b + 1)) - 1;
        uint64_t masked = it->second & mask;
        if (masked != 0) return w * 64 + 63 - std::countl_zero(masked);
        if (it == words_.begin()) return std::nullopt;
        --it;
    }
    return it->first * 64 + 63 - std::countl_zero(it->second);
}

// =============================================================================
// BinLedger
// =============================================================================

Bin BinLedger::get_bin(int32_t id) const {
    auto it = bins_.find(id);
    if (it != bins_.end()) return it->second;
    Bin empty;
    empty.id = id;
    return empty;
}

const Bin* BinLedger::find(int32_t id) const {
    auto it = bins_.find(id);
    return it != bins_.end() ? &it->second : nullptr;
}

Amounts BinLedger::reserves(int32_t id) const {
    const Bin* bin = find(id);
    return bin ? Amounts{bin->reserve_x, bin->reserve_y} : Amounts{};
}

Bin& BinLedger::slot(int32_t id) {
    auto [it, inserted] = bins_.try_emplace(id);
    if (inserted) it->second.id = id;
    return it->second;
}

void BinLedger::reindex(const Bin& bin) {
    if (bin.reserve_x != 0) x_bins_.set(bin.id); else x_bins_.clear(bin.id);
    if (bin.reserve_y != 0) y_bins_.set(bin.id); else y_bins_.clear(bin.id);
}

void BinLedger::apply_swap_step(int32_t id, Direction direction, uint64_t amount_in,
                                uint64_t amount_out, U128 fee_growth_delta) {
    Bin next = get_bin(id);
    uint64_t& reserve_in = direction == Direction::XtoY ? next.reserve_x : next.reserve_y;
    uint64_t& reserve_out = direction == Direction::XtoY ? next.reserve_y : next.reserve_x;
    U128& fee_growth = direction == Direction::XtoY ? next.fee_growth_x : next.fee_growth_y;

    if (amount_out > reserve_out) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          "bin " + std::to_string(id) + " holds " + std::to_string(reserve_out) +
                          ", step wants " + std::to_string(amount_out));
    }
    reserve_in = math::add_u64(reserve_in, amount_in);
    reserve_out -= amount_out;
    fee_growth = math::add_u128(fee_growth, fee_growth_delta);

    slot(id) = std::move(next);
    reindex(bins_.at(id));
}

void BinLedger::add_liquidity(int32_t id, uint64_t delta_x, uint64_t delta_y) {
    Bin current = get_bin(id);
    uint64_t x = math::add_u64(current.reserve_x, delta_x);
    uint64_t y = math::add_u64(current.reserve_y, delta_y);

    Bin& bin = slot(id);
    bin.reserve_x = x;
    bin.reserve_y = y;
    reindex(bin);
}

void BinLedger::remove_liquidity(int32_t id, uint64_t delta_x, uint64_t delta_y) {
    const Bin* current = find(id);
    uint64_t have_x = current ? current->reserve_x : 0;
    uint64_t have_y = current ? current->reserve_y : 0;
    if (delta_x > have_x || delta_y > have_y) {
        throw EngineError(ErrorCode::InsufficientLiquidity,
                          "bin " + std::to_string(id) + " cannot release requested reserves");
    }
    if (delta_x == 0 && delta_y == 0) return;

    Bin& bin = bins_.at(id);
    bin.reserve_x -= delta_x;
    bin.reserve_y -= delta_y;
    reindex(bin);
    if (bin.is_blank()) bins_.erase(id);
}

void BinLedger::put_bin(const Bin& bin) {
    if (bin.is_blank()) {
        bins_.erase(bin.id);
        x_bins_.clear(bin.id);
        y_bins_.clear(bin.id);
        return;
    }
    Bin& stored = slot(bin.id);
    stored = bin;
    reindex(stored);
}

std::optional<int32_t> BinLedger::next_bin_with_liquidity(int32_t from, Direction direction) const {
    // XtoY drains Y walking up, YtoX drains X walking down
    if (direction == Direction::XtoY) return y_bins_.next_above(from);
    return x_bins_.next_below(from);
}

bool BinLedger::has_liquidity(Direction direction) const {
    return direction == Direction::XtoY ? !y_bins_.empty() : !x_bins_.empty();
}

Amounts BinLedger::total_reserves() const {
    Amounts total;
    for (const auto& [id, bin] : bins_) {
        total.amount_x = math::add_u64(total.amount_x, bin.reserve_x);
        total.amount_y = math::add_u64(total.amount_y, bin.reserve_y);
    }
    return total;
}

} // namespace dlmm
