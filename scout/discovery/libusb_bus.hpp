/**
 * @file libusb_bus.hpp
 * @brief USB bus access using libusb
 *
 * Wraps libusb-1.0 device enumeration and bounded-timeout string descriptor
 * reads behind the UsbBus and UsbDevice interfaces.
 */

#ifndef SCOUT_DISCOVERY_LIBUSB_BUS_HPP
#define SCOUT_DISCOVERY_LIBUSB_BUS_HPP

#include <libusb-1.0/libusb.h>

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "usb_bus.hpp"

namespace scout::discovery {

/**
 * @brief Exception class for USB-related errors
 *
 * Wraps libusb error codes with descriptive messages and integrates
 * with the C++ standard error system.
 */
class UsbException : public std::system_error {
public:
    /**
     * @brief Construct with libusb error code
     * @param error_code The libusb error code
     */
    explicit UsbException(int error_code)
        : std::system_error(error_code, std::system_category(),
                            libusb_error_name(error_code)) {}

    /**
     * @brief Construct with error code and custom message
     * @param error_code The libusb error code
     * @param what_arg Custom error description
     */
    explicit UsbException(int error_code, const std::string& what_arg)
        : std::system_error(error_code, std::system_category(),
                            what_arg + ": " + libusb_error_name(error_code)) {}
};

/**
 * @brief Map a failed libusb transfer onto a descriptor read outcome.
 *
 * LIBUSB_ERROR_TIMEOUT becomes TimedOut, every other code a DeviceError
 * whose reason names @p what and the libusb error.
 */
[[nodiscard]] DescriptorRead descriptorReadFailure(int result, const char* what);

/**
 * @brief Decode a UTF-16LE string descriptor to ASCII.
 *
 * Reads at most min(@p length, bLength, buffer size) bytes. Characters
 * outside ASCII become '?', and a trailing odd byte is dropped.
 */
[[nodiscard]] std::string decodeStringDescriptor(
    std::span<const unsigned char> buffer, int length);

/**
 * @brief Owns a libusb context for the lifetime of one discovery pass
 */
class UsbContext {
public:
    /**
     * @throws UsbException if libusb cannot be initialized
     */
    UsbContext();
    ~UsbContext();

    UsbContext(const UsbContext&) = delete;
    UsbContext& operator=(const UsbContext&) = delete;

    [[nodiscard]] libusb_context* native() const noexcept { return context_; }

private:
    libusb_context* context_{nullptr};
};

/**
 * @brief A libusb device, opened lazily on the first string read
 */
class LibusbDevice : public UsbDevice {
public:
    /**
     * @param context Keeps the libusb context alive while the device exists
     * @param device Referenced for the lifetime of this object
     * @param descriptor Descriptor already read during enumeration
     */
    LibusbDevice(std::shared_ptr<UsbContext> context, libusb_device* device,
                 const libusb_device_descriptor& descriptor);
    ~LibusbDevice() override;

    LibusbDevice(const LibusbDevice&) = delete;
    LibusbDevice& operator=(const LibusbDevice&) = delete;

    [[nodiscard]] UsbDeviceDescriptor descriptor() const override;
    [[nodiscard]] std::vector<uint8_t> interfaceClasses() override;
    [[nodiscard]] DescriptorRead readString(
        uint8_t index, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<UsbContext> context_;
    libusb_device* device_;
    libusb_device_handle* handle_{nullptr};
    UsbDeviceDescriptor descriptor_;
    std::optional<uint16_t> language_id_;

    /**
     * @return Empty on success, otherwise the failed outcome to report
     */
    std::optional<DescriptorRead> ensureOpen();
    std::optional<DescriptorRead> ensureLanguage(unsigned int timeout_ms);
};

/**
 * @brief Enumerates devices through a fresh libusb context per call
 */
class LibusbBus : public UsbBus {
public:
    /**
     * @throws UsbException if libusb cannot be initialized or the device
     * list cannot be read
     */
    [[nodiscard]] std::vector<std::shared_ptr<UsbDevice>> devices() override;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_LIBUSB_BUS_HPP
