/*
 * usb_bus_scanner.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-03

Description: Scanner recognising printers by USB interface class

**************************************************/

#ifndef SCOUT_DISCOVERY_USB_BUS_SCANNER_HPP
#define SCOUT_DISCOVERY_USB_BUS_SCANNER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "scanner.hpp"
#include "usb_bus.hpp"

namespace scout::discovery {

inline constexpr int USB_CLASS_INTERFACE_CONFIDENCE = 80;
inline constexpr int USB_NAMED_DEVICE_CONFIDENCE = 85;

/**
 * @brief Walks the USB bus and keeps devices exposing a printer-class
 * interface.
 *
 * Used where the OS has no discrete printer-class node namespace. String
 * descriptors are read best-effort with a bounded timeout; a failed read
 * leaves the candidate at its class-based confidence.
 */
class UsbBusScanner : public Scanner {
public:
    struct Options {
        bool read_strings{true};
        std::chrono::milliseconds string_timeout{100};
    };

    explicit UsbBusScanner(std::shared_ptr<UsbBus> bus);

    /**
     * @throws scout::error::InvalidArgument if the string timeout is not
     * positive
     */
    UsbBusScanner(std::shared_ptr<UsbBus> bus, Options options);

    [[nodiscard]] std::string name() const override { return "usb-bus"; }

    /**
     * @throws EnumerationError if the bus cannot be enumerated
     */
    [[nodiscard]] std::vector<Candidate> scan() override;

private:
    std::shared_ptr<UsbBus> bus_;
    Options options_;

    [[nodiscard]] Candidate inspect(UsbDevice& device,
                                    const UsbDeviceDescriptor& desc) const;
};

/**
 * @return true if any of @p classes is the printer class
 */
[[nodiscard]] bool hasPrinterInterface(const std::vector<uint8_t>& classes);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_USB_BUS_SCANNER_HPP
