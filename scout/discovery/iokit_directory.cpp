/*
 * iokit_directory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: IOKit-backed property directory for serial ports (macOS)

**************************************************/

#include "iokit_directory.hpp"

#include <format>
#include <utility>

#ifdef __APPLE__
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <IOKit/serial/IOSerialKeys.h>

#include <memory>

#include <spdlog/spdlog.h>

#include "error.hpp"
#endif

namespace scout::discovery {

PropertyRecord makeSerialPortRecord(const SerialPortProperties& properties) {
    PropertyRecord record;
    if (properties.vendor_id) {
        record["ID_BUS"] = "usb";
        record["ID_VENDOR_ID"] = std::format("{:04x}", *properties.vendor_id);
    }
    if (properties.product_id) {
        record["ID_MODEL_ID"] = std::format("{:04x}", *properties.product_id);
    }
    if (properties.vendor_name) {
        record["ID_VENDOR"] = *properties.vendor_name;
    }
    if (properties.product_name) {
        record["ID_MODEL"] = *properties.product_name;
    }
    if (properties.serial_number) {
        record["ID_SERIAL_SHORT"] = *properties.serial_number;
    }
    return record;
}

#ifdef __APPLE__
namespace {
struct CfReleaser {
    void operator()(const void* ref) const { CFRelease(ref); }
};

using CfPtr = std::unique_ptr<const void, CfReleaser>;

class IoObject {
public:
    explicit IoObject(io_object_t object = IO_OBJECT_NULL) : object_(object) {}
    ~IoObject() {
        if (object_ != IO_OBJECT_NULL) {
            IOObjectRelease(object_);
        }
    }

    IoObject(const IoObject&) = delete;
    IoObject& operator=(const IoObject&) = delete;

    [[nodiscard]] io_object_t get() const noexcept { return object_; }
    io_object_t* out() noexcept { return &object_; }

private:
    io_object_t object_;
};

// Searches the service itself, then its parents up to the USB device.
CfPtr searchProperty(io_object_t service, const char* key) {
    CfPtr cfKey(
        CFStringCreateWithCString(kCFAllocatorDefault, key, kCFStringEncodingUTF8));
    if (!cfKey) {
        return nullptr;
    }
    return CfPtr(IORegistryEntrySearchCFProperty(
        service, kIOServicePlane, static_cast<CFStringRef>(cfKey.get()),
        kCFAllocatorDefault,
        kIORegistryIterateRecursively | kIORegistryIterateParents));
}

std::optional<std::string> stringProperty(io_object_t service,
                                          const char* key) {
    auto ref = searchProperty(service, key);
    if (!ref || CFGetTypeID(ref.get()) != CFStringGetTypeID()) {
        return std::nullopt;
    }
    char buffer[256];
    if (!CFStringGetCString(static_cast<CFStringRef>(ref.get()), buffer,
                            sizeof(buffer), kCFStringEncodingUTF8)) {
        return std::nullopt;
    }
    return std::string(buffer);
}

std::optional<uint16_t> numberProperty(io_object_t service, const char* key) {
    auto ref = searchProperty(service, key);
    if (!ref || CFGetTypeID(ref.get()) != CFNumberGetTypeID()) {
        return std::nullopt;
    }
    int32_t value = 0;
    if (!CFNumberGetValue(static_cast<CFNumberRef>(ref.get()),
                          kCFNumberSInt32Type, &value)) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}
}  // namespace

PropertyIndex IoKitPropertyDirectory::index() {
    CFMutableDictionaryRef matching = IOServiceMatching(kIOSerialBSDServiceValue);
    if (!matching) {
        spdlog::error("iokit: cannot create serial matching dictionary");
        THROW_ENUMERATION_ERROR("Failed to create IOKit serial matching");
    }

    // The matching dictionary is consumed by IOServiceGetMatchingServices
    IoObject iterator;
    kern_return_t result = IOServiceGetMatchingServices(
        kIOMasterPortDefault, matching, iterator.out());
    if (result != KERN_SUCCESS) {
        spdlog::error("iokit: serial service lookup failed: {:#x}", result);
        THROW_ENUMERATION_ERROR("IOKit serial service lookup failed: ", result);
    }

    PropertyIndex index;
    while (io_object_t next = IOIteratorNext(iterator.get())) {
        IoObject service(next);

        SerialPortProperties properties;
        auto callout = stringProperty(service.get(), kIOCalloutDeviceKey);
        if (!callout) {
            continue;
        }
        properties.callout_path = std::move(*callout);
        properties.vendor_id = numberProperty(service.get(), "idVendor");
        properties.product_id = numberProperty(service.get(), "idProduct");
        properties.vendor_name = stringProperty(service.get(), "USB Vendor Name");
        properties.product_name =
            stringProperty(service.get(), "USB Product Name");
        properties.serial_number =
            stringProperty(service.get(), "USB Serial Number");

        auto record = makeSerialPortRecord(properties);
        if (hasDeviceIdentity(record)) {
            index.insert_or_assign(properties.callout_path, std::move(record));
        }
    }

    spdlog::debug("iokit: indexed {} serial port(s)", index.size());
    return index;
}
#endif

}  // namespace scout::discovery
