/*
 * usb_bus_scanner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-03

Description: Scanner recognising printers by USB interface class

**************************************************/

#include "usb_bus_scanner.hpp"

#include <algorithm>
#include <format>
#include <optional>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "error.hpp"
#include "scout/error/exception.hpp"
#include "scout/utils/string.hpp"

namespace scout::discovery {

namespace {
const char* describe(const DescriptorRead& read) {
    switch (read.status()) {
        case DescriptorRead::Status::Value:
            return "ok";
        case DescriptorRead::Status::TimedOut:
            return "timed out";
        case DescriptorRead::Status::DeviceError:
            return "device error";
    }
    return "unknown";
}
}  // namespace

bool hasPrinterInterface(const std::vector<uint8_t>& classes) {
    return std::find(classes.begin(), classes.end(), USB_CLASS_PRINTER) !=
           classes.end();
}

UsbBusScanner::UsbBusScanner(std::shared_ptr<UsbBus> bus)
    : UsbBusScanner(std::move(bus), Options{}) {}

UsbBusScanner::UsbBusScanner(std::shared_ptr<UsbBus> bus, Options options)
    : bus_(std::move(bus)), options_(options) {
    if (options_.string_timeout.count() <= 0) {
        THROW_INVALID_ARGUMENT("string descriptor timeout must be positive: ",
                               options_.string_timeout.count(), " ms");
    }
}

std::vector<Candidate> UsbBusScanner::scan() {
    std::vector<std::shared_ptr<UsbDevice>> devices;
    try {
        devices = bus_->devices();
    } catch (const std::system_error& e) {
        spdlog::error("usb-bus: enumeration failed: {}", e.what());
        THROW_ENUMERATION_ERROR("USB bus enumeration failed: ", e.what());
    }

    std::vector<Candidate> candidates;
    for (const auto& device : devices) {
        const auto desc = device->descriptor();
        if (!hasPrinterInterface(device->interfaceClasses())) {
            continue;
        }
        spdlog::debug("usb-bus: {:04x}:{:04x} at {:03d}:{:03d} exposes a "
                      "printer interface",
                      desc.vendor_id, desc.product_id, desc.bus_number,
                      desc.device_address);
        candidates.push_back(inspect(*device, desc));
    }

    spdlog::info("usb-bus found {} printer-class device(s) among {}",
                 candidates.size(), devices.size());
    return candidates;
}

Candidate UsbBusScanner::inspect(UsbDevice& device,
                                 const UsbDeviceDescriptor& desc) const {
    bool unresponsive = false;
    auto read = [&](uint8_t index,
                    const char* field) -> std::optional<DescriptorRead> {
        if (!options_.read_strings || index == 0 || unresponsive) {
            return std::nullopt;
        }
        auto result = device.readString(index, options_.string_timeout);
        if (!result.hasValue()) {
            spdlog::debug("usb-bus: {:04x}:{:04x} {} string: {} {}",
                          desc.vendor_id, desc.product_id, field,
                          describe(result), result.reason());
        }
        // One timeout marks the device unresponsive for the rest of the pass
        unresponsive = result.isTimedOut();
        return result;
    };

    auto serialRead = read(desc.serial_number_index, "serial");
    std::optional<std::string> serial;
    if (serialRead && serialRead->hasValue()) {
        auto trimmed = utils::trim(serialRead->text());
        if (!trimmed.empty()) {
            serial = std::move(trimmed);
        }
    }

    Candidate candidate(
        Transport::usbDevice(desc.vendor_id, desc.product_id, serial),
        USB_CLASS_INTERFACE_CONFIDENCE,
        "exposes USB printer-class interface (0x07)");
    candidate.fillVendorId(std::format("{:04x}", desc.vendor_id));
    candidate.fillProductId(std::format("{:04x}", desc.product_id));
    if (serial) {
        candidate.fillSerial(*serial);
    }

    auto manufacturer = read(desc.manufacturer_index, "manufacturer");
    auto product = read(desc.product_index, "product");
    std::string name = utils::trim(
        (manufacturer && manufacturer->hasValue() ? manufacturer->text() : "") +
        " " + (product && product->hasValue() ? product->text() : ""));
    if (!name.empty()) {
        candidate.fillDisplayName(name);
        candidate.raiseConfidence(
            USB_NAMED_DEVICE_CONFIDENCE,
            "usb: manufacturer/product strings read (" + name + ")");
    }
    return candidate;
}

}  // namespace scout::discovery
