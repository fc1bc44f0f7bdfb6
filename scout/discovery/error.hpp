#ifndef SCOUT_DISCOVERY_ERROR_HPP
#define SCOUT_DISCOVERY_ERROR_HPP

#include "scout/error/exception.hpp"

namespace scout::discovery {

/**
 * @brief A scanner's underlying bus or filesystem API failed.
 *
 * Fatal for the whole discovery pass and never retried. Per-device failures
 * are not reported through this type.
 */
class EnumerationError : public scout::error::Exception {
public:
    using scout::error::Exception::Exception;
};

}  // namespace scout::discovery

#define THROW_ENUMERATION_ERROR(...)                                     \
    throw scout::discovery::EnumerationError(SCOUT_FILE_NAME, SCOUT_FILE_LINE, \
                                             SCOUT_FUNC_NAME, __VA_ARGS__)

#endif  // SCOUT_DISCOVERY_ERROR_HPP
