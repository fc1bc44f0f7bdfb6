#include "property_directory.hpp"

namespace scout::discovery {

namespace {
constexpr const char* IDENTITY_KEYS[] = {"ID_MODEL", "ID_MODEL_FROM_DATABASE",
                                         "ID_VENDOR", "ID_VENDOR_FROM_DATABASE",
                                         "ID_USB_INTERFACES"};
}  // namespace

std::optional<std::string> lookup(const PropertyRecord& record,
                                  std::string_view key) {
    auto it = record.find(std::string(key));
    if (it == record.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> lookupPreferred(const PropertyRecord& record,
                                           std::string_view preferred,
                                           std::string_view fallback) {
    if (auto value = lookup(record, preferred)) {
        return value;
    }
    return lookup(record, fallback);
}

bool hasDeviceIdentity(const PropertyRecord& record) {
    for (const char* key : IDENTITY_KEYS) {
        if (lookup(record, key)) {
            return true;
        }
    }
    return false;
}

}  // namespace scout::discovery
