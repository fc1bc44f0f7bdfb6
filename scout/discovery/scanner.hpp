#ifndef SCOUT_DISCOVERY_SCANNER_HPP
#define SCOUT_DISCOVERY_SCANNER_HPP

#include <string>
#include <vector>

#include "candidate.hpp"

namespace scout::discovery {

/**
 * @brief One read-only enumeration strategy.
 *
 * scan() produces raw candidates. A single device's failure must not abort
 * the scan; a failure of the enumeration API itself is reported by throwing
 * EnumerationError.
 */
class Scanner {
public:
    virtual ~Scanner() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::vector<Candidate> scan() = 0;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_SCANNER_HPP
