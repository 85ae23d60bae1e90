#ifndef DLMM_LOG_HPP
#define DLMM_LOG_HPP

#include <string_view>

namespace dlmm {

// Installs a colored stdout logger named "dlmm" as the spdlog default and
// applies `level` ("trace" .. "off"). Throws InvalidConfig on an unknown
// level. The engine logs through the spdlog default logger, so it runs
// without calling this too.
void init_logging(std::string_view level);

} // namespace dlmm

#endif // DLMM_LOG_HPP
