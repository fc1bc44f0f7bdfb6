/*
 * node_scanner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-02

Description: Device-node namespace scanners (usblp and serial adapters)

**************************************************/

#ifndef SCOUT_DISCOVERY_NODE_SCANNER_HPP
#define SCOUT_DISCOVERY_NODE_SCANNER_HPP

#include <string>
#include <vector>

#include "scanner.hpp"

namespace scout::discovery {

inline constexpr int USB_CLASS_NODE_CONFIDENCE = 80;
inline constexpr int LINUX_SERIAL_NODE_CONFIDENCE = 40;
inline constexpr int MAC_SERIAL_NODE_CONFIDENCE = 35;

/**
 * @brief A glob pattern and the baseline evidence a match carries
 */
struct NodePattern {
    std::string pattern;  ///< e.g. "/dev/usb/lp*"
    NodeKind kind;
    int confidence;
    std::string note;  ///< Recorded on every candidate the pattern yields
};

/**
 * @brief Scans device-node namespaces by glob pattern.
 *
 * Patterns are scanned in order and matches inside one pattern are sorted by
 * path. A namespace directory that does not exist yields nothing; one that
 * exists but cannot be listed is an enumeration failure.
 */
class NodeScanner : public Scanner {
public:
    NodeScanner(std::string name, std::vector<NodePattern> patterns);

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] std::vector<Candidate> scan() override;

    [[nodiscard]] const std::vector<NodePattern>& patterns() const noexcept {
        return patterns_;
    }

private:
    std::string name_;
    std::vector<NodePattern> patterns_;
};

/**
 * @brief Printer-class namespace: every node there was classified as a USB
 * printer by the kernel driver.
 * @param pattern Override for tests, defaults to "/dev/usb/lp*"
 */
[[nodiscard]] NodeScanner makeUsbClassNodeScanner(
    std::string pattern = "/dev/usb/lp*");

/**
 * @brief Linux USB-serial and CDC-ACM namespaces, shared with many
 * non-printer peripherals.
 * @param root Prefix replacing "/dev" (tests point it at a temp dir)
 */
[[nodiscard]] NodeScanner makeLinuxSerialNodeScanner(
    const std::string& root = "/dev");

/**
 * @brief macOS callout nodes of USB-serial and CDC-ACM adapters.
 */
[[nodiscard]] NodeScanner makeMacSerialNodeScanner(
    const std::string& root = "/dev");

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_NODE_SCANNER_HPP
