// =============================================================================
// config.cpp - JSON configuration loading and validation
// =============================================================================

#include "dlmm/config.hpp"
#include "dlmm/price_math.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace dlmm {

using json = nlohmann::json;

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

uint64_t read_u64(const json& obj, const char* key, uint64_t fallback) {
    if (!obj.contains(key)) return fallback;
    const json& v = obj.at(key);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw EngineError(ErrorCode::InvalidConfig,
                          std::string(key) + " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

FeeParameters parse_fees(const json& obj, FeeParameters params) {
    params.base_fee_rate = read_u64(obj, "base_fee_rate", params.base_fee_rate);
    params.protocol_fee_rate = read_u64(obj, "protocol_fee_rate", params.protocol_fee_rate);
    params.filter_period = read_u64(obj, "filter_period", params.filter_period);
    params.decay_period = read_u64(obj, "decay_period", params.decay_period);
    params.variable_fee_control = read_u64(obj, "variable_fee_control", params.variable_fee_control);
    params.max_volatility_accumulator =
        read_u64(obj, "max_volatility_accumulator", params.max_volatility_accumulator);
    return params;
}

PoolConfig parse_pool(const json& obj) {
    PoolConfig cfg;
    cfg.pool_id = read_u64(obj, "pool_id", cfg.pool_id);

    if (obj.contains("coin_x")) cfg.coin_x = Currency{parse_address(obj.at("coin_x").get<std::string>())};
    if (obj.contains("coin_y")) cfg.coin_y = Currency{parse_address(obj.at("coin_y").get<std::string>())};
    if (obj.contains("admin")) cfg.admin = parse_address(obj.at("admin").get<std::string>());

    uint64_t step = read_u64(obj, "bin_step", cfg.bin_step);
    if (step == 0 || step > MAX_BIN_STEP) {
        throw EngineError(ErrorCode::InvalidConfig,
                          "bin_step " + std::to_string(step) + " outside 1.." +
                          std::to_string(MAX_BIN_STEP));
    }
    cfg.bin_step = static_cast<uint16_t>(step);

    if (obj.contains("active_bin_id")) {
        int64_t active = obj.at("active_bin_id").get<int64_t>();
        if (active < MIN_BIN_ID || active > MAX_BIN_ID) {
            throw EngineError(ErrorCode::InvalidBinRange,
                              "active_bin_id " + std::to_string(active) + " out of range");
        }
        cfg.active_bin_id = static_cast<int32_t>(active);
    }

    if (obj.contains("fees")) cfg.fee_params = parse_fees(obj.at("fees"), cfg.fee_params);
    return cfg;
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

Address parse_address(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    Address addr{};
    if (text.size() != addr.size() * 2) {
        throw EngineError(ErrorCode::InvalidConfig,
                          "address must have 40 hex digits, got " + std::to_string(text.size()));
    }
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_digit(text[2 * i]);
        int lo = hex_digit(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw EngineError(ErrorCode::InvalidConfig, "address has a non-hex digit");
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string format_address(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// =============================================================================
// PoolConfig
// =============================================================================

void PoolConfig::validate() const {
    if (bin_step == 0 || bin_step > MAX_BIN_STEP) {
        throw EngineError(ErrorCode::InvalidConfig,
                          "bin_step " + std::to_string(bin_step) + " outside 1.." +
                          std::to_string(MAX_BIN_STEP));
    }
    if (coin_x == coin_y) {
        throw EngineError(ErrorCode::InvalidConfig, "pool coins must differ");
    }
    if (!price_math::is_valid_bin_id(active_bin_id, bin_step)) {
        throw EngineError(ErrorCode::InvalidBinRange,
                          "active bin " + std::to_string(active_bin_id) +
                          " has no price at step " + std::to_string(bin_step));
    }
    fee_model::validate(fee_params);
}

// =============================================================================
// EngineConfig
// =============================================================================

EngineConfig EngineConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw EngineError(ErrorCode::InvalidConfig, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

EngineConfig EngineConfig::from_string(std::string_view content) {
    json doc = json::parse(content.begin(), content.end(), nullptr, false);
    if (doc.is_discarded()) {
        throw EngineError(ErrorCode::InvalidConfig, "config is not valid JSON");
    }
    return from_json(doc);
}

EngineConfig EngineConfig::from_json(const json& doc) {
    if (!doc.is_object()) {
        throw EngineError(ErrorCode::InvalidConfig, "config root must be an object");
    }

    EngineConfig config;
    try {
        if (doc.contains("general")) {
            config.general.log_level =
                doc.at("general").value("log_level", config.general.log_level);
        }
        if (doc.contains("pools")) {
            for (const json& pool : doc.at("pools")) {
                config.pools.push_back(parse_pool(pool));
            }
        }
    } catch (const json::exception& e) {
        throw EngineError(ErrorCode::InvalidConfig, e.what());
    }

    config.validate();
    return config;
}

void EngineConfig::validate() const {
    static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    bool known = false;
    for (const char* level : levels) {
        if (general.log_level == level) known = true;
    }
    if (!known) {
        throw EngineError(ErrorCode::InvalidConfig, "unknown log level " + general.log_level);
    }

    for (size_t i = 0; i < pools.size(); ++i) {
        pools[i].validate();
        for (size_t j = 0; j < i; ++j) {
            if (pools[j].pool_id == pools[i].pool_id) {
                throw EngineError(ErrorCode::InvalidConfig,
                                  "duplicate pool_id " + std::to_string(pools[i].pool_id));
            }
        }
    }
}

} // namespace dlmm
