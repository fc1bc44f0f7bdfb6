#ifndef SCOUT_DISCOVERY_PROPERTY_DIRECTORY_HPP
#define SCOUT_DISCOVERY_PROPERTY_DIRECTORY_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace scout::discovery {

/**
 * @brief Properties the platform reports for one device node
 *
 * Keys follow the udev naming (ID_VENDOR, ID_MODEL_FROM_DATABASE,
 * ID_USB_INTERFACES, ...).
 */
using PropertyRecord = std::unordered_map<std::string, std::string>;

/**
 * @brief Device node path -> property record
 */
using PropertyIndex = std::unordered_map<std::string, PropertyRecord>;

/**
 * @brief Platform property service, queried once per discovery pass.
 */
class PropertyDirectory {
public:
    virtual ~PropertyDirectory() = default;

    /**
     * @brief Short service name ("udev", "iokit") used to prefix notes
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Enumerate the service and index its records by device node.
     * @throws EnumerationError if the service cannot be queried at all
     */
    [[nodiscard]] virtual PropertyIndex index() = 0;
};

/**
 * @return The value of @p key when present and non-empty
 */
[[nodiscard]] std::optional<std::string> lookup(const PropertyRecord& record,
                                                std::string_view key);

/**
 * @return The first non-empty value among @p preferred then @p fallback
 */
[[nodiscard]] std::optional<std::string> lookupPreferred(
    const PropertyRecord& record, std::string_view preferred,
    std::string_view fallback);

/**
 * @brief Whether a record says anything about the device behind a node.
 *
 * Records without vendor, model or interface information are not indexed.
 */
[[nodiscard]] bool hasDeviceIdentity(const PropertyRecord& record);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_PROPERTY_DIRECTORY_HPP
