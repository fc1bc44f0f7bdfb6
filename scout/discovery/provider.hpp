/*
 * provider.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Entry point used by the print-serving layer

**************************************************/

#ifndef SCOUT_DISCOVERY_PROVIDER_HPP
#define SCOUT_DISCOVERY_PROVIDER_HPP

#include <future>
#include <memory>
#include <vector>

#include "backend.hpp"
#include "candidate.hpp"

namespace scout::discovery {

/**
 * @brief Lists printer candidates through a single backend.
 *
 * Every call is an independent pass with no shared mutable state, so
 * concurrent calls are safe; they are not coalesced.
 *
 * @example
 * ```cpp
 * auto& provider = scout::discovery::DiscoveryProvider::host();
 * for (const auto& candidate : provider.listPrinterCandidates()) {
 *     std::cout << candidate.transport().locator() << " "
 *               << candidate.confidence() << "\n";
 * }
 * ```
 */
class DiscoveryProvider {
public:
    explicit DiscoveryProvider(std::shared_ptr<DiscoveryBackend> backend);

    /**
     * @brief The provider for this host, created on first use.
     *
     * The backend is chosen once per process from detectHostPlatform() and
     * DiscoveryConfig::fromEnvironment().
     */
    static DiscoveryProvider& host();

    [[nodiscard]] const DiscoveryBackend& backend() const noexcept {
        return *backend_;
    }

    /**
     * @brief Run discovery. May block on hardware I/O.
     * @throws EnumerationError when enumeration fails
     */
    [[nodiscard]] std::vector<Candidate> listPrinterCandidates() const;

    /**
     * @brief Run discovery on a worker thread.
     *
     * The future rethrows EnumerationError from get().
     */
    [[nodiscard]] std::future<std::vector<Candidate>>
    listPrinterCandidatesAsync() const;

private:
    std::shared_ptr<DiscoveryBackend> backend_;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_PROVIDER_HPP
