/*
 * backend.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Platform discovery backends

**************************************************/

#ifndef SCOUT_DISCOVERY_BACKEND_HPP
#define SCOUT_DISCOVERY_BACKEND_HPP

#include <memory>
#include <string>
#include <vector>

#include "candidate.hpp"
#include "config.hpp"
#include "enricher.hpp"
#include "scanner.hpp"

namespace scout::discovery {

enum class HostPlatform { Linux, MacOS, Unsupported };

/**
 * @return The platform this binary was built for
 */
[[nodiscard]] HostPlatform detectHostPlatform() noexcept;

[[nodiscard]] const char* toString(HostPlatform platform) noexcept;

/**
 * @brief One platform's way of finding printers.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Run one full, stateless discovery pass.
     * @return Candidates ranked by confidence, highest first
     * @throws EnumerationError if any scanner or the property directory
     * cannot enumerate
     */
    [[nodiscard]] virtual std::vector<Candidate> discover() = 0;
};

/**
 * @brief Runs its scanners in order, enriches, then merges and ranks.
 */
class ScannerBackend : public DiscoveryBackend {
public:
    /**
     * @param enricher May be null when the platform has no property service
     */
    ScannerBackend(std::string name,
                   std::vector<std::unique_ptr<Scanner>> scanners,
                   std::unique_ptr<Enricher> enricher);

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] std::vector<Candidate> discover() override;

    [[nodiscard]] size_t scannerCount() const noexcept {
        return scanners_.size();
    }
    [[nodiscard]] bool hasEnricher() const noexcept {
        return enricher_ != nullptr;
    }

private:
    std::string name_;
    std::vector<std::unique_ptr<Scanner>> scanners_;
    std::unique_ptr<Enricher> enricher_;
};

/**
 * @brief Backend for hosts without discovery support: finds nothing.
 */
class NullBackend : public DiscoveryBackend {
public:
    [[nodiscard]] std::string name() const override { return "null"; }
    [[nodiscard]] std::vector<Candidate> discover() override { return {}; }
};

/**
 * @brief usblp class nodes, optional serial nodes, udev enrichment.
 */
[[nodiscard]] std::unique_ptr<DiscoveryBackend> makeLinuxBackend(
    const DiscoveryConfig& config);

/**
 * @brief Serial callout nodes enriched from IOKit, and printer-class devices
 * on the USB bus.
 */
[[nodiscard]] std::unique_ptr<DiscoveryBackend> makeMacBackend(
    const DiscoveryConfig& config);

/**
 * @brief Pick exactly one backend for @p platform.
 *
 * Unsupported hosts get the NullBackend.
 */
[[nodiscard]] std::unique_ptr<DiscoveryBackend> makeBackend(
    HostPlatform platform, const DiscoveryConfig& config);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_BACKEND_HPP
