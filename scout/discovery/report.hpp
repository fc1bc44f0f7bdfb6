#ifndef SCOUT_DISCOVERY_REPORT_HPP
#define SCOUT_DISCOVERY_REPORT_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "candidate.hpp"
#include "provider.hpp"

namespace scout::discovery {

inline constexpr const char* ENUMERATION_FAILED_MESSAGE =
    "could not enumerate printers on this host";
inline constexpr const char* NO_PRINTERS_MESSAGE = "no printers found";

/**
 * @brief Outcome of one discovery call as shown to users.
 */
struct DiscoveryReport {
    enum class Status { Found, Empty, Failed };

    Status status{Status::Empty};
    std::vector<Candidate> candidates;
    std::string message;  ///< User-facing summary
    std::string detail;   ///< Underlying error text when Failed
};

/**
 * @brief Run discovery and turn the result or failure into a report.
 *
 * Only EnumerationError is translated into a Failed report; anything else
 * propagates.
 */
[[nodiscard]] DiscoveryReport runDiscovery(const DiscoveryProvider& provider);

[[nodiscard]] const char* toString(DiscoveryReport::Status status) noexcept;
[[nodiscard]] const char* toString(NodeKind kind) noexcept;

[[nodiscard]] nlohmann::json toJson(const Transport& transport);
[[nodiscard]] nlohmann::json toJson(const Candidate& candidate);
[[nodiscard]] nlohmann::json toJson(const DiscoveryReport& report);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_REPORT_HPP
