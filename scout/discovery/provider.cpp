/*
 * provider.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-05

Description: Entry point used by the print-serving layer

**************************************************/

#include "provider.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "scout/error/exception.hpp"

namespace scout::discovery {

DiscoveryProvider::DiscoveryProvider(std::shared_ptr<DiscoveryBackend> backend)
    : backend_(std::move(backend)) {
    if (!backend_) {
        THROW_INVALID_ARGUMENT("DiscoveryProvider requires a backend");
    }
}

DiscoveryProvider& DiscoveryProvider::host() {
    static DiscoveryProvider provider = [] {
        auto platform = detectHostPlatform();
        auto backend = makeBackend(platform, DiscoveryConfig::fromEnvironment());
        spdlog::info("Discovery backend '{}' selected for {} host",
                     backend->name(), toString(platform));
        return DiscoveryProvider(std::move(backend));
    }();
    return provider;
}

std::vector<Candidate> DiscoveryProvider::listPrinterCandidates() const {
    return backend_->discover();
}

std::future<std::vector<Candidate>>
DiscoveryProvider::listPrinterCandidatesAsync() const {
    auto backend = backend_;
    return std::async(std::launch::async,
                      [backend] { return backend->discover(); });
}

}  // namespace scout::discovery
