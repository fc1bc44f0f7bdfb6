/*
 * level.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: Log level parsing for spdlog

**************************************************/

#include "level.hpp"

#include <string>

#include "scout/utils/string.hpp"

namespace scout::log {

auto stringToLogLevel(std::string_view levelStr)
    -> std::optional<spdlog::level::level_enum> {
    const std::string name = utils::toLower(utils::trim(levelStr));
    // from_str maps every unknown name to off
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

}  // namespace scout::log
