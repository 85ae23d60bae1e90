#ifndef DLMM_CONFIG_HPP
#define DLMM_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "fee_model.hpp"

namespace dlmm {

// =============================================================================
// Pool Configuration (builder style)
// =============================================================================

class PoolConfig {
public:
    uint64_t pool_id = 1;
    Currency coin_x = make_currency(1);
    Currency coin_y = make_currency(2);
    uint16_t bin_step = 25;            // basis points
    int32_t active_bin_id = 0;
    FeeParameters fee_params;
    Address admin{};                   // Sender allowed to run admin operations, zero: none

    PoolConfig() = default;

    PoolConfig& with_pool_id(uint64_t id) {
        pool_id = id;
        return *this;
    }

    PoolConfig& with_coins(const Currency& x, const Currency& y) {
        coin_x = x;
        coin_y = y;
        return *this;
    }

    PoolConfig& with_bin_step(uint16_t step) {
        bin_step = step;
        return *this;
    }

    PoolConfig& with_active_bin(int32_t id) {
        active_bin_id = id;
        return *this;
    }

    PoolConfig& with_fee_parameters(const FeeParameters& params) {
        fee_params = params;
        return *this;
    }

    PoolConfig& with_base_fee_rate(uint64_t rate) {
        fee_params.base_fee_rate = rate;
        return *this;
    }

    PoolConfig& with_protocol_fee_rate(uint64_t rate) {
        fee_params.protocol_fee_rate = rate;
        return *this;
    }

    PoolConfig& with_admin(const Address& a) {
        admin = a;
        return *this;
    }

    // Throws InvalidConfig, InvalidBinRange or FeeRateOutOfRange
    void validate() const;
};

// =============================================================================
// Engine Configuration
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
};

class EngineConfig {
public:
    GeneralConfig general;
    std::vector<PoolConfig> pools;

    EngineConfig() = default;

    // Load from JSON file
    static EngineConfig from_file(std::string_view path);

    // Load from JSON string
    static EngineConfig from_string(std::string_view content);

    static EngineConfig from_json(const nlohmann::json& doc);

    EngineConfig& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    EngineConfig& with_pool(PoolConfig pool) {
        pools.push_back(std::move(pool));
        return *this;
    }

    void validate() const;
};

// "0x" followed by 40 hex digits. Throws InvalidConfig.
Address parse_address(std::string_view text);
std::string format_address(const Address& addr);

} // namespace dlmm

#endif // DLMM_CONFIG_HPP
