#ifndef DLMM_BIN_LEDGER_HPP
#define DLMM_BIN_LEDGER_HPP

#include <map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace dlmm {

// =============================================================================
// Bin
// =============================================================================

struct Bin {
    int32_t id = 0;
    uint64_t reserve_x = 0;
    uint64_t reserve_y = 0;
    U128 liquidity_supply = 0;        // Total shares minted against this bin
    U128 fee_growth_x = 0;            // Per share, scaled by GROWTH_PRECISION
    U128 fee_growth_y = 0;
    std::vector<U128> reward_growth;  // One entry per initialized reward

    bool has_reserves() const { return reserve_x != 0 || reserve_y != 0; }

    // True when dropping the bin from storage loses nothing
    bool is_blank() const;

    U128 reward_growth_at(size_t index) const {
        return index < reward_growth.size() ? reward_growth[index] : 0;
    }

    uint64_t reserve_of(Token t) const { return t == Token::X ? reserve_x : reserve_y; }
};

// =============================================================================
// Bin Bitmap (sparse 64-bit words keyed by id >> 6)
// =============================================================================

class BinBitmap {
public:
    void set(int32_t id);
    void clear(int32_t id);
    bool test(int32_t id) const;
    bool empty() const { return words_.empty(); }

    // Nearest set id strictly above / below `id`
    std::optional<int32_t> next_above(int32_t id) const;
    std::optional<int32_t> next_below(int32_t id) const;

private:
    std::map<int32_t, uint64_t> words_;  // Zero words are erased
};

// =============================================================================
// BinLedger - sparse reserves for one pool
// =============================================================================

class BinLedger {
public:
    BinLedger() = default;

    // Zero-valued bin when none is stored, never allocates
    Bin get_bin(int32_t id) const;
    const Bin* find(int32_t id) const;
    Amounts reserves(int32_t id) const;

    // One swap step: reserve of the input token grows by amount_in, the
    // output reserve shrinks by amount_out and the input-side fee growth
    // grows by fee_growth_delta. Throws InsufficientLiquidity when
    // amount_out exceeds the output reserve; nothing changes then.
    void apply_swap_step(int32_t id, Direction direction, uint64_t amount_in,
                         uint64_t amount_out, U128 fee_growth_delta);

    void add_liquidity(int32_t id, uint64_t delta_x, uint64_t delta_y);
    void remove_liquidity(int32_t id, uint64_t delta_x, uint64_t delta_y);

    // Replace a bin wholesale (staged commits from position accounting)
    void put_bin(const Bin& bin);

    // Nearest bin strictly past `from` in the swap direction whose output
    // reserve is non-zero
    std::optional<int32_t> next_bin_with_liquidity(int32_t from, Direction direction) const;

    // Any bin holding the output token of `direction`
    bool has_liquidity(Direction direction) const;

    size_t bin_count() const { return bins_.size(); }
    Amounts total_reserves() const;

private:
    std::map<int32_t, Bin> bins_;
    BinBitmap x_bins_;  // Bins with reserve_x > 0
    BinBitmap y_bins_;  // Bins with reserve_y > 0

    Bin& slot(int32_t id);
    void reindex(const Bin& bin);
};

} // namespace dlmm

#endif // DLMM_BIN_LEDGER_HPP
