/*
 * udev_directory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-04

Description: udev-backed property directory (Linux)

**************************************************/

#ifndef SCOUT_DISCOVERY_UDEV_DIRECTORY_HPP
#define SCOUT_DISCOVERY_UDEV_DIRECTORY_HPP

#include <string>
#include <vector>

#include "property_directory.hpp"

namespace scout::discovery {

/**
 * @brief Indexes the udev database by device node.
 *
 * Several subsystems are matched because distributions differ in where
 * printer and tty nodes appear. Only records carrying vendor, model or
 * interface information are kept.
 */
class UdevPropertyDirectory : public PropertyDirectory {
public:
    UdevPropertyDirectory();
    explicit UdevPropertyDirectory(std::vector<std::string> subsystems);

    /**
     * @throws EnumerationError if the udev context or enumerator cannot be
     * created, or the scan fails
     */
    [[nodiscard]] std::string name() const override { return "udev"; }

    [[nodiscard]] PropertyIndex index() override;

private:
    std::vector<std::string> subsystems_;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_UDEV_DIRECTORY_HPP
