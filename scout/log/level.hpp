/*
 * level.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Log level parsing for spdlog

**************************************************/

#ifndef SCOUT_LOG_LEVEL_HPP
#define SCOUT_LOG_LEVEL_HPP

#include <optional>
#include <string_view>

#include <spdlog/common.h>

namespace scout::log {

/**
 * @brief Convert string to log level.
 *
 * Accepts the spdlog names (trace, debug, info, warning, error, critical,
 * off) and the short forms warn and err, ignoring case and surrounding
 * whitespace.
 *
 * @return The level, or std::nullopt if @p levelStr names no level
 */
[[nodiscard]] auto stringToLogLevel(std::string_view levelStr)
    -> std::optional<spdlog::level::level_enum>;

}  // namespace scout::log

#endif  // SCOUT_LOG_LEVEL_HPP
