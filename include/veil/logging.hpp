#pragma once

#include "types.hpp"
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace veil
{

    struct LoggingConfig
    {
        std::string level{"info"};
        std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] %v"};
    };

} // namespace veil

namespace veil::logging
{

    /**
     * Map "trace", "debug", "info", "warn", "error", "critical" or "off" to
     * the spdlog level. "warning" and "err" are accepted as aliases.
     */
    Result<spdlog::level::level_enum> parse_level(std::string_view name);

    /** Apply level and pattern to the default spdlog logger. */
    Result<void> configure(const LoggingConfig &cfg);

} // namespace veil::logging
