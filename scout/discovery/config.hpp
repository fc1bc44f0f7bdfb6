/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Discovery configuration

**************************************************/

#ifndef SCOUT_DISCOVERY_CONFIG_HPP
#define SCOUT_DISCOVERY_CONFIG_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace scout::discovery {

/**
 * @brief Configuration options for a discovery backend
 */
struct DiscoveryConfig {
    bool include_serial{true};  ///< Scan USB-serial and ACM node namespaces
    bool use_udev{true};        ///< Enrich node candidates from udev (Linux)
    bool use_iokit{true};  ///< Enrich serial candidates from IOKit (macOS)
    bool include_usb_bus{true};  ///< Walk the USB bus (macOS)
    bool read_string_descriptors{
        true};  ///< Read manufacturer/product/serial strings over USB
    std::chrono::milliseconds string_descriptor_timeout{
        100};  ///< Per-read timeout for string descriptors

    [[nodiscard]] bool is_valid() const noexcept {
        return string_descriptor_timeout.count() > 0 &&
               string_descriptor_timeout.count() <= 5000;
    }

    /**
     * @brief Read overrides from SCOUT_* environment variables.
     *
     * SCOUT_INCLUDE_SERIAL, SCOUT_USE_UDEV, SCOUT_INCLUDE_USB_BUS,
     * SCOUT_READ_STRINGS take 1/0, true/false, yes/no or on/off;
     * SCOUT_STRING_TIMEOUT_MS takes milliseconds. Unparsable values are
     * logged and ignored; an invalid result falls back to the defaults.
     */
    static DiscoveryConfig fromEnvironment();

    /**
     * @brief Same as fromEnvironment() with an injectable lookup.
     */
    static DiscoveryConfig fromLookup(
        const std::function<std::optional<std::string>(const char*)>& getenv);
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_CONFIG_HPP
