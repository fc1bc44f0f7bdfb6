/*
 * iokit_directory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-12

Description: IOKit-backed property directory for serial ports (macOS)

**************************************************/

#ifndef SCOUT_DISCOVERY_IOKIT_DIRECTORY_HPP
#define SCOUT_DISCOVERY_IOKIT_DIRECTORY_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "property_directory.hpp"

namespace scout::discovery {

/**
 * @brief What the IORegistry reports for one serial port and the USB device
 * above it.
 */
struct SerialPortProperties {
    std::string callout_path;  ///< IOCalloutDevice, e.g. /dev/cu.usbserial-1410
    std::optional<uint16_t> vendor_id;   ///< idVendor of the USB parent
    std::optional<uint16_t> product_id;  ///< idProduct of the USB parent
    std::optional<std::string> vendor_name;    ///< "USB Vendor Name"
    std::optional<std::string> product_name;   ///< "USB Product Name"
    std::optional<std::string> serial_number;  ///< "USB Serial Number"
};

/**
 * @brief Map IORegistry serial port properties onto the ID_* keys the
 * enricher reads.
 *
 * A port with a USB vendor id is marked ID_BUS=usb. Ids are rendered as
 * four lowercase hex digits.
 */
[[nodiscard]] PropertyRecord makeSerialPortRecord(
    const SerialPortProperties& properties);

#ifdef __APPLE__
/**
 * @brief Indexes IOSerialBSDClient services by callout device path.
 */
class IoKitPropertyDirectory : public PropertyDirectory {
public:
    [[nodiscard]] std::string name() const override { return "iokit"; }

    /**
     * @throws EnumerationError if the serial services cannot be matched
     */
    [[nodiscard]] PropertyIndex index() override;
};
#endif

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_IOKIT_DIRECTORY_HPP
