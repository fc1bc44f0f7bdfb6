/*
 * backend.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Platform discovery backends

**************************************************/

#include "backend.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "fusion.hpp"
#include "libusb_bus.hpp"
#include "node_scanner.hpp"
#include "usb_bus_scanner.hpp"

#ifdef __linux__
#include "udev_directory.hpp"
#endif

#ifdef __APPLE__
#include "iokit_directory.hpp"
#endif

namespace scout::discovery {

HostPlatform detectHostPlatform() noexcept {
#if defined(__linux__)
    return HostPlatform::Linux;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#else
    return HostPlatform::Unsupported;
#endif
}

const char* toString(HostPlatform platform) noexcept {
    switch (platform) {
        case HostPlatform::Linux:
            return "linux";
        case HostPlatform::MacOS:
            return "macos";
        case HostPlatform::Unsupported:
            return "unsupported";
    }
    return "unsupported";
}

ScannerBackend::ScannerBackend(std::string name,
                               std::vector<std::unique_ptr<Scanner>> scanners,
                               std::unique_ptr<Enricher> enricher)
    : name_(std::move(name)),
      scanners_(std::move(scanners)),
      enricher_(std::move(enricher)) {}

std::vector<Candidate> ScannerBackend::discover() {
    auto start = std::chrono::steady_clock::now();

    std::vector<Candidate> candidates;
    for (const auto& scanner : scanners_) {
        auto found = scanner->scan();
        candidates.insert(candidates.end(),
                          std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }

    if (enricher_) {
        enricher_->enrich(candidates);
    }

    auto ranked = fuse(std::move(candidates));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("{} discovery completed: {} candidate(s) in {} ms", name_,
                 ranked.size(), elapsed.count());
    return ranked;
}

std::unique_ptr<DiscoveryBackend> makeLinuxBackend(
    const DiscoveryConfig& config) {
    std::vector<std::unique_ptr<Scanner>> scanners;
    scanners.push_back(
        std::make_unique<NodeScanner>(makeUsbClassNodeScanner()));
    if (config.include_serial) {
        scanners.push_back(
            std::make_unique<NodeScanner>(makeLinuxSerialNodeScanner()));
    }

    std::unique_ptr<Enricher> enricher;
    if (config.use_udev) {
#ifdef __linux__
        enricher = std::make_unique<Enricher>(
            std::make_shared<UdevPropertyDirectory>());
#else
        spdlog::warn("udev enrichment is only available on Linux");
#endif
    }

    return std::make_unique<ScannerBackend>("linux", std::move(scanners),
                                            std::move(enricher));
}

std::unique_ptr<DiscoveryBackend> makeMacBackend(
    const DiscoveryConfig& config) {
    std::vector<std::unique_ptr<Scanner>> scanners;
    if (config.include_serial) {
        scanners.push_back(
            std::make_unique<NodeScanner>(makeMacSerialNodeScanner()));
    }
    if (config.include_usb_bus) {
        UsbBusScanner::Options options;
        options.read_strings = config.read_string_descriptors;
        options.string_timeout = config.string_descriptor_timeout;
        scanners.push_back(std::make_unique<UsbBusScanner>(
            std::make_shared<LibusbBus>(), options));
    }

    std::unique_ptr<Enricher> enricher;
    if (config.use_iokit) {
#ifdef __APPLE__
        enricher = std::make_unique<Enricher>(
            std::make_shared<IoKitPropertyDirectory>());
#else
        spdlog::warn("IOKit enrichment is only available on macOS");
#endif
    }

    return std::make_unique<ScannerBackend>("macos", std::move(scanners),
                                            std::move(enricher));
}

std::unique_ptr<DiscoveryBackend> makeBackend(HostPlatform platform,
                                              const DiscoveryConfig& config) {
    switch (platform) {
        case HostPlatform::Linux:
            return makeLinuxBackend(config);
        case HostPlatform::MacOS:
            return makeMacBackend(config);
        case HostPlatform::Unsupported:
            break;
    }
    spdlog::info("No discovery backend for this host, using the null backend");
    return std::make_unique<NullBackend>();
}

}  // namespace scout::discovery
