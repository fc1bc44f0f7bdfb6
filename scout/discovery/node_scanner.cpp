/*
 * node_scanner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-02

Description: Device-node namespace scanners (usblp and serial adapters)

**************************************************/

#include "node_scanner.hpp"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "scout/io/glob.hpp"

namespace scout::discovery {

namespace {
NodePattern serialPattern(const std::string& root, const char* name,
                          int confidence) {
    std::string pattern = root + "/" + name;
    std::string note = "found serial device node (" + pattern + ")";
    return NodePattern{std::move(pattern), NodeKind::Serial, confidence,
                       std::move(note)};
}
}  // namespace

NodeScanner::NodeScanner(std::string name, std::vector<NodePattern> patterns)
    : name_(std::move(name)), patterns_(std::move(patterns)) {}

std::vector<Candidate> NodeScanner::scan() {
    std::vector<Candidate> candidates;

    for (const auto& pattern : patterns_) {
        std::vector<std::filesystem::path> matches;
        try {
            matches = io::glob(pattern.pattern);
        } catch (const std::filesystem::filesystem_error& e) {
            spdlog::error("{}: cannot enumerate {}: {}", name_,
                          pattern.pattern, e.what());
            THROW_ENUMERATION_ERROR("cannot enumerate ", pattern.pattern, ": ",
                                    e.what());
        }

        for (const auto& path : matches) {
            spdlog::debug("{}: found {}", name_, path.string());
            candidates.emplace_back(
                Transport::deviceNode(pattern.kind, path.string()),
                pattern.confidence, pattern.note);
        }
    }

    spdlog::info("{} found {} device node(s)", name_, candidates.size());
    return candidates;
}

NodeScanner makeUsbClassNodeScanner(std::string pattern) {
    std::string note =
        "found in USB printer-class device namespace (" + pattern + ")";
    std::vector<NodePattern> patterns;
    patterns.push_back(NodePattern{std::move(pattern),
                                   NodeKind::UsbPrinterClass,
                                   USB_CLASS_NODE_CONFIDENCE, std::move(note)});
    return NodeScanner("usb-class-node", std::move(patterns));
}

NodeScanner makeLinuxSerialNodeScanner(const std::string& root) {
    return NodeScanner(
        "serial-node",
        {serialPattern(root, "ttyUSB*", LINUX_SERIAL_NODE_CONFIDENCE),
         serialPattern(root, "ttyACM*", LINUX_SERIAL_NODE_CONFIDENCE)});
}

NodeScanner makeMacSerialNodeScanner(const std::string& root) {
    return NodeScanner(
        "serial-node",
        {serialPattern(root, "cu.usbserial*", MAC_SERIAL_NODE_CONFIDENCE),
         serialPattern(root, "cu.usbmodem*", MAC_SERIAL_NODE_CONFIDENCE)});
}

}  // namespace scout::discovery
