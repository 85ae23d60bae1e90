// =============================================================================
// log.cpp - spdlog setup
// =============================================================================

#include "dlmm/log.hpp"
#include "dlmm/types.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace dlmm {

void init_logging(std::string_view level) {
    const std::string name{level};
    spdlog::level::level_enum parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && name != "off") {
        throw EngineError(ErrorCode::InvalidConfig, "unknown log level " + name);
    }

    auto logger = spdlog::get("dlmm");
    if (!logger) logger = spdlog::stdout_color_mt("dlmm");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(parsed);
}

} // namespace dlmm
