#include "scout/discovery/report.hpp"
#include "scout/log/level.hpp"

#include <cstdlib>
#include <iostream>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

using namespace scout::discovery;

/**
 * Lists the printer candidates found on this host as JSON.
 *
 * SCOUT_LOG_LEVEL selects the spdlog level (trace, debug, info, warn, ...).
 * Logs go to stderr so stdout stays valid JSON. Exit status is 0 when
 * printers were found, 1 when none were, 2 when enumeration failed.
 */
int main() {
    spdlog::set_default_logger(spdlog::stderr_color_mt("scout"));
    if (const char* name = std::getenv("SCOUT_LOG_LEVEL")) {
        if (auto level = scout::log::stringToLogLevel(name)) {
            spdlog::set_level(*level);
        } else {
            spdlog::warn("Unknown SCOUT_LOG_LEVEL '{}', keeping level {}", name,
                         spdlog::level::to_string_view(spdlog::get_level()));
        }
    }

    auto report = runDiscovery(DiscoveryProvider::host());
    std::cout << toJson(report).dump(2) << std::endl;

    switch (report.status) {
        case DiscoveryReport::Status::Found:
            return 0;
        case DiscoveryReport::Status::Empty:
            std::cerr << NO_PRINTERS_MESSAGE << std::endl;
            return 1;
        case DiscoveryReport::Status::Failed:
            std::cerr << ENUMERATION_FAILED_MESSAGE << ": " << report.detail
                      << std::endl;
            return 2;
    }
    return 2;
}
