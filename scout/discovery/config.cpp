/*
 * config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Discovery configuration

**************************************************/

#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

#include <spdlog/spdlog.h>

#include "scout/utils/string.hpp"

namespace scout::discovery {

namespace {
void readFlag(
    const std::function<std::optional<std::string>(const char*)>& getenv,
    const char* name, bool& target) {
    auto raw = getenv(name);
    if (!raw) {
        return;
    }
    if (auto value = utils::parseBool(*raw)) {
        target = *value;
    } else {
        spdlog::warn("Ignoring {}={}: expected a boolean", name, *raw);
    }
}
}  // namespace

DiscoveryConfig DiscoveryConfig::fromEnvironment() {
    return fromLookup([](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) {
            return std::string(value);
        }
        return std::nullopt;
    });
}

DiscoveryConfig DiscoveryConfig::fromLookup(
    const std::function<std::optional<std::string>(const char*)>& getenv) {
    DiscoveryConfig config;
    readFlag(getenv, "SCOUT_INCLUDE_SERIAL", config.include_serial);
    readFlag(getenv, "SCOUT_USE_UDEV", config.use_udev);
    readFlag(getenv, "SCOUT_USE_IOKIT", config.use_iokit);
    readFlag(getenv, "SCOUT_INCLUDE_USB_BUS", config.include_usb_bus);
    readFlag(getenv, "SCOUT_READ_STRINGS", config.read_string_descriptors);

    if (auto raw = getenv("SCOUT_STRING_TIMEOUT_MS")) {
        const auto text = utils::trim(*raw);
        long long ms = 0;
        auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), ms);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            config.string_descriptor_timeout = std::chrono::milliseconds(ms);
        } else {
            spdlog::warn("Ignoring SCOUT_STRING_TIMEOUT_MS={}: not a number",
                         *raw);
        }
    }

    if (!config.is_valid()) {
        spdlog::warn(
            "Invalid discovery configuration provided, using default values");
        config = DiscoveryConfig{};
    }
    return config;
}

}  // namespace scout::discovery
