#include "libusb_bus.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

namespace scout::discovery {

namespace {
constexpr size_t STRING_DESC_SIZE = 256;

// Issues GET_DESCRIPTOR(STRING) with the caller's timeout. libusb's own
// string helpers use a fixed one-second timeout.
int getStringDescriptor(libusb_device_handle* handle, uint8_t index,
                        uint16_t language_id,
                        std::array<unsigned char, STRING_DESC_SIZE>& buffer,
                        unsigned int timeout_ms) {
    return libusb_control_transfer(
        handle, LIBUSB_ENDPOINT_IN, LIBUSB_REQUEST_GET_DESCRIPTOR,
        static_cast<uint16_t>((LIBUSB_DT_STRING << 8) | index), language_id,
        buffer.data(), static_cast<uint16_t>(buffer.size()), timeout_ms);
}
}  // namespace

DescriptorRead descriptorReadFailure(int result, const char* what) {
    if (result == LIBUSB_ERROR_TIMEOUT) {
        return DescriptorRead::timedOut();
    }
    return DescriptorRead::deviceError(std::string(what) + ": " +
                                       libusb_error_name(result));
}

std::string decodeStringDescriptor(std::span<const unsigned char> buffer,
                                   int length) {
    std::string text;
    if (buffer.empty()) {
        return text;
    }
    const int declared = std::min({length, static_cast<int>(buffer[0]),
                                   static_cast<int>(buffer.size())});
    for (int i = 2; i + 1 < declared; i += 2) {
        if (buffer[i + 1] != 0 || buffer[i] > 0x7f) {
            text.push_back('?');
        } else {
            text.push_back(static_cast<char>(buffer[i]));
        }
    }
    return text;
}

UsbContext::UsbContext() {
    int result = libusb_init(&context_);
    if (result != LIBUSB_SUCCESS) {
        throw UsbException(result, "Failed to initialize libusb context");
    }
    spdlog::debug("USB context initialized successfully");
}

UsbContext::~UsbContext() {
    libusb_exit(context_);
    spdlog::debug("USB context destroyed");
}

LibusbDevice::LibusbDevice(std::shared_ptr<UsbContext> context,
                           libusb_device* device,
                           const libusb_device_descriptor& descriptor)
    : context_(std::move(context)), device_(device) {
    libusb_ref_device(device_);
    descriptor_.vendor_id = descriptor.idVendor;
    descriptor_.product_id = descriptor.idProduct;
    descriptor_.manufacturer_index = descriptor.iManufacturer;
    descriptor_.product_index = descriptor.iProduct;
    descriptor_.serial_number_index = descriptor.iSerialNumber;
    descriptor_.bus_number = libusb_get_bus_number(device_);
    descriptor_.device_address = libusb_get_device_address(device_);
}

LibusbDevice::~LibusbDevice() {
    if (handle_) {
        libusb_close(handle_);
        spdlog::debug("USB device closed");
    }
    libusb_unref_device(device_);
}

UsbDeviceDescriptor LibusbDevice::descriptor() const { return descriptor_; }

std::vector<uint8_t> LibusbDevice::interfaceClasses() {
    std::vector<uint8_t> classes;

    libusb_config_descriptor* config = nullptr;
    int result = libusb_get_active_config_descriptor(device_, &config);
    if (result != LIBUSB_SUCCESS) {
        spdlog::debug("USB device {:03d}:{:03d}: no active configuration: {}",
                      descriptor_.bus_number, descriptor_.device_address,
                      libusb_error_name(result));
        return classes;
    }

    for (uint8_t i = 0; i < config->bNumInterfaces; ++i) {
        const libusb_interface& iface = config->interface[i];
        for (int alt = 0; alt < iface.num_altsetting; ++alt) {
            classes.push_back(iface.altsetting[alt].bInterfaceClass);
        }
    }

    libusb_free_config_descriptor(config);
    return classes;
}

DescriptorRead LibusbDevice::readString(uint8_t index,
                                        std::chrono::milliseconds timeout) {
    if (index == 0) {
        return DescriptorRead::deviceError("string index 0 is reserved");
    }
    if (auto failed = ensureOpen()) {
        return *failed;
    }

    // libusb treats a zero timeout as unlimited
    const auto timeout_ms =
        static_cast<unsigned int>(std::max<std::chrono::milliseconds::rep>(
            timeout.count(), 1));
    if (auto failed = ensureLanguage(timeout_ms)) {
        return *failed;
    }

    std::array<unsigned char, STRING_DESC_SIZE> buffer{};
    int result =
        getStringDescriptor(handle_, index, *language_id_, buffer, timeout_ms);
    if (result < 0) {
        return descriptorReadFailure(result, "string descriptor");
    }
    if (result < 2 || buffer[1] != LIBUSB_DT_STRING) {
        return DescriptorRead::deviceError("malformed string descriptor");
    }
    return DescriptorRead::value(decodeStringDescriptor(buffer, result));
}

std::optional<DescriptorRead> LibusbDevice::ensureOpen() {
    if (handle_) {
        return std::nullopt;
    }
    int result = libusb_open(device_, &handle_);
    if (result != LIBUSB_SUCCESS) {
        handle_ = nullptr;
        return DescriptorRead::deviceError(std::string("open: ") +
                                           libusb_error_name(result));
    }
    spdlog::debug("USB device opened successfully");
    return std::nullopt;
}

std::optional<DescriptorRead> LibusbDevice::ensureLanguage(
    unsigned int timeout_ms) {
    if (language_id_) {
        return std::nullopt;
    }
    std::array<unsigned char, STRING_DESC_SIZE> buffer{};
    int result = getStringDescriptor(handle_, 0, 0, buffer, timeout_ms);
    if (result < 0) {
        return descriptorReadFailure(result, "language table");
    }
    if (result < 4 || buffer[1] != LIBUSB_DT_STRING) {
        return DescriptorRead::deviceError("malformed language table");
    }
    language_id_ = static_cast<uint16_t>(buffer[2] | (buffer[3] << 8));
    return std::nullopt;
}

std::vector<std::shared_ptr<UsbDevice>> LibusbBus::devices() {
    auto context = std::make_shared<UsbContext>();

    libusb_device** device_list = nullptr;
    ssize_t count = libusb_get_device_list(context->native(), &device_list);
    if (count < 0) {
        throw UsbException(static_cast<int>(count),
                           "Failed to get device list");
    }

    std::vector<std::shared_ptr<UsbDevice>> devices;
    devices.reserve(static_cast<size_t>(count));

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device_descriptor desc{};
        int result = libusb_get_device_descriptor(device_list[i], &desc);
        if (result != LIBUSB_SUCCESS) {
            spdlog::warn("Failed to get device descriptor: {}",
                         libusb_error_name(result));
            continue;
        }
        devices.push_back(
            std::make_shared<LibusbDevice>(context, device_list[i], desc));
    }

    libusb_free_device_list(device_list, 1);
    spdlog::debug("Found {} USB devices", devices.size());
    return devices;
}

}  // namespace scout::discovery
