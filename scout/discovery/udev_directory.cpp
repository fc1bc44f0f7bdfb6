/*
 * udev_directory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-04

Description: udev-backed property directory (Linux)

**************************************************/

#include "udev_directory.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <utility>

#include <libudev.h>
#include <spdlog/spdlog.h>

#include "error.hpp"

namespace scout::discovery {

namespace {
struct UdevDeleter {
    void operator()(udev* ctx) const { udev_unref(ctx); }
    void operator()(udev_enumerate* en) const { udev_enumerate_unref(en); }
    void operator()(udev_device* dev) const { udev_device_unref(dev); }
};

using UdevPtr = std::unique_ptr<udev, UdevDeleter>;
using UdevEnumeratePtr = std::unique_ptr<udev_enumerate, UdevDeleter>;
using UdevDevicePtr = std::unique_ptr<udev_device, UdevDeleter>;
}  // namespace

UdevPropertyDirectory::UdevPropertyDirectory()
    : subsystems_{"usb", "tty", "usbmisc", "printer", "lp"} {}

UdevPropertyDirectory::UdevPropertyDirectory(std::vector<std::string> subsystems)
    : subsystems_(std::move(subsystems)) {}

PropertyIndex UdevPropertyDirectory::index() {
    UdevPtr context(udev_new());
    if (!context) {
        spdlog::error("udev: failed to create context: {}",
                      std::strerror(errno));
        THROW_ENUMERATION_ERROR("Failed to create udev context");
    }

    UdevEnumeratePtr enumerate(udev_enumerate_new(context.get()));
    if (!enumerate) {
        spdlog::error("udev: failed to create enumerator");
        THROW_ENUMERATION_ERROR("Failed to create udev enumerator");
    }

    for (const auto& subsystem : subsystems_) {
        if (udev_enumerate_add_match_subsystem(enumerate.get(),
                                               subsystem.c_str()) < 0) {
            spdlog::warn("udev: cannot match subsystem {}", subsystem);
        }
    }

    int result = udev_enumerate_scan_devices(enumerate.get());
    if (result < 0) {
        spdlog::error("udev: scan failed: {}", std::strerror(-result));
        THROW_ENUMERATION_ERROR("udev scan failed: ", std::strerror(-result));
    }

    PropertyIndex index;
    udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry,
                            udev_enumerate_get_list_entry(enumerate.get())) {
        const char* syspath = udev_list_entry_get_name(entry);
        UdevDevicePtr device(
            udev_device_new_from_syspath(context.get(), syspath));
        if (!device) {
            continue;
        }

        const char* devnode = udev_device_get_devnode(device.get());
        if (!devnode) {
            continue;
        }

        PropertyRecord record;
        udev_list_entry* property = nullptr;
        udev_list_entry_foreach(
            property, udev_device_get_properties_list_entry(device.get())) {
            const char* name = udev_list_entry_get_name(property);
            const char* value = udev_list_entry_get_value(property);
            if (name) {
                record.emplace(name, value ? value : "");
            }
        }

        if (hasDeviceIdentity(record)) {
            index.insert_or_assign(devnode, std::move(record));
        }
    }

    spdlog::debug("udev: indexed {} device node(s)", index.size());
    return index;
}

}  // namespace scout::discovery
