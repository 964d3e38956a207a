#include "veil/logging.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace veil::logging
{

    Result<spdlog::level::level_enum> parse_level(std::string_view name)
    {
        if (name == "trace")
            return spdlog::level::trace;
        if (name == "debug")
            return spdlog::level::debug;
        if (name == "info")
            return spdlog::level::info;
        if (name == "warn" || name == "warning")
            return spdlog::level::warn;
        if (name == "error" || name == "err")
            return spdlog::level::err;
        if (name == "critical")
            return spdlog::level::critical;
        if (name == "off")
            return spdlog::level::off;
        return std::unexpected(VeilError::config(std::format("Invalid log level: {}", name)));
    }

    Result<void> configure(const LoggingConfig &cfg)
    {
        auto level = parse_level(cfg.level);
        if (!level)
            return std::unexpected(level.error());

        spdlog::set_level(*level);
        if (!cfg.pattern.empty())
        {
            spdlog::set_pattern(cfg.pattern);
        }
        return {};
    }

} // namespace veil::logging
