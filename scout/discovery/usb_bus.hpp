/*
 * usb_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-03

Description: USB bus access seam used by the bus descriptor scanner

**************************************************/

#ifndef SCOUT_DISCOVERY_USB_BUS_HPP
#define SCOUT_DISCOVERY_USB_BUS_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace scout::discovery {

/// USB device-class code of printer interfaces.
inline constexpr uint8_t USB_CLASS_PRINTER = 0x07;

/**
 * @brief Outcome of a best-effort, bounded-time string descriptor read.
 *
 * A read either yields a value, runs out of time, or fails at the device.
 * Callers that never issued the read hold no DescriptorRead at all.
 */
class DescriptorRead {
public:
    enum class Status { Value, TimedOut, DeviceError };

    static DescriptorRead value(std::string text) {
        return DescriptorRead(Status::Value, std::move(text));
    }
    static DescriptorRead timedOut() {
        return DescriptorRead(Status::TimedOut, {});
    }
    static DescriptorRead deviceError(std::string reason) {
        return DescriptorRead(Status::DeviceError, std::move(reason));
    }

    [[nodiscard]] Status status() const noexcept { return status_; }
    [[nodiscard]] bool hasValue() const noexcept {
        return status_ == Status::Value;
    }
    [[nodiscard]] bool isTimedOut() const noexcept {
        return status_ == Status::TimedOut;
    }
    [[nodiscard]] bool isDeviceError() const noexcept {
        return status_ == Status::DeviceError;
    }

    /**
     * @return The descriptor text; empty unless hasValue()
     */
    [[nodiscard]] const std::string& text() const noexcept {
        static const std::string EMPTY;
        return hasValue() ? payload_ : EMPTY;
    }

    /**
     * @return Device error description; empty unless isDeviceError()
     */
    [[nodiscard]] const std::string& reason() const noexcept {
        static const std::string EMPTY;
        return isDeviceError() ? payload_ : EMPTY;
    }

private:
    DescriptorRead(Status status, std::string payload)
        : status_(status), payload_(std::move(payload)) {}

    Status status_;
    std::string payload_;
};

/**
 * @brief Device descriptor fields the scanner needs
 */
struct UsbDeviceDescriptor {
    uint16_t vendor_id{0};
    uint16_t product_id{0};
    uint8_t manufacturer_index{0};  ///< 0 when the device has no string
    uint8_t product_index{0};
    uint8_t serial_number_index{0};
    uint8_t bus_number{0};
    uint8_t device_address{0};
};

/**
 * @brief A device on the USB bus
 */
class UsbDevice {
public:
    virtual ~UsbDevice() = default;

    [[nodiscard]] virtual UsbDeviceDescriptor descriptor() const = 0;

    /**
     * @brief Interface class codes of every interface and alternate setting
     * of the active configuration.
     * @return Empty when the configuration descriptor cannot be read
     */
    [[nodiscard]] virtual std::vector<uint8_t> interfaceClasses() = 0;

    /**
     * @brief Read a string descriptor, giving up after @p timeout.
     * @param index Non-zero string descriptor index
     */
    [[nodiscard]] virtual DescriptorRead readString(
        uint8_t index, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Enumerates the devices on the USB bus.
 *
 * devices() throws when the bus access layer itself cannot be opened or
 * listed. Devices whose descriptor cannot be read are left out.
 */
class UsbBus {
public:
    virtual ~UsbBus() = default;

    [[nodiscard]] virtual std::vector<std::shared_ptr<UsbDevice>> devices() = 0;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_USB_BUS_HPP
