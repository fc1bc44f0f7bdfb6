/*
 * candidate.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-02

Description: Transport identity and printer candidate model

**************************************************/

#include "candidate.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "scout/error/exception.hpp"

namespace scout::discovery {

namespace {
bool fillOnce(std::optional<std::string>& field, std::string value) {
    if (field.has_value() || value.empty()) {
        return false;
    }
    field = std::move(value);
    return true;
}
}  // namespace

Transport::Transport(std::variant<DeviceNode, UsbAddress> value)
    : value_(std::move(value)) {}

auto Transport::deviceNode(NodeKind kind, std::string path) -> Transport {
    return Transport(DeviceNode{kind, std::move(path)});
}

auto Transport::usbDevice(uint16_t vendor_id, uint16_t product_id,
                          std::optional<std::string> serial) -> Transport {
    return Transport(UsbAddress{vendor_id, product_id, std::move(serial)});
}

bool Transport::isDeviceNode() const noexcept {
    return std::holds_alternative<DeviceNode>(value_);
}

bool Transport::isUsbDevice() const noexcept {
    return std::holds_alternative<UsbAddress>(value_);
}

const DeviceNode* Transport::node() const noexcept {
    return std::get_if<DeviceNode>(&value_);
}

const UsbAddress* Transport::usbAddress() const noexcept {
    return std::get_if<UsbAddress>(&value_);
}

std::optional<std::string_view> Transport::devicePath() const noexcept {
    if (const auto* n = node()) {
        return std::string_view(n->path);
    }
    return std::nullopt;
}

DedupKey Transport::dedupKey() const {
    if (const auto* n = node()) {
        return DedupKey{n->path};
    }
    const auto& usb = std::get<UsbAddress>(value_);
    return DedupKey{UsbKey{usb.vendor_id, usb.product_id, usb.serial}};
}

std::string Transport::locator() const {
    if (const auto* n = node()) {
        return n->kind == NodeKind::UsbPrinterClass ? "file:" + n->path
                                                    : "serial:" + n->path;
    }
    const auto& usb = std::get<UsbAddress>(value_);
    auto locator =
        std::format("usb:{:04x}:{:04x}", usb.vendor_id, usb.product_id);
    if (usb.serial) {
        locator += ":" + *usb.serial;
    }
    return locator;
}

auto combine(const Evidence& a, const Evidence& b) -> Evidence {
    Evidence merged;
    merged.confidence = std::max(a.confidence, b.confidence);
    merged.notes.reserve(a.notes.size() + b.notes.size());
    merged.notes.insert(merged.notes.end(), a.notes.begin(), a.notes.end());
    merged.notes.insert(merged.notes.end(), b.notes.begin(), b.notes.end());
    return merged;
}

Candidate::Candidate(Transport transport, int confidence, std::string note)
    : transport_(std::move(transport)) {
    if (confidence < MIN_CONFIDENCE || confidence > MAX_CONFIDENCE) {
        THROW_INVALID_ARGUMENT("confidence out of range [0, 100]: ",
                               confidence);
    }
    evidence_.confidence = confidence;
    evidence_.notes.push_back(std::move(note));
}

bool Candidate::fillDisplayName(std::string value) {
    return fillOnce(display_name_, std::move(value));
}

bool Candidate::fillSerial(std::string value) {
    return fillOnce(serial_, std::move(value));
}

bool Candidate::fillVendorId(std::string value) {
    return fillOnce(vendor_id_, std::move(value));
}

bool Candidate::fillProductId(std::string value) {
    return fillOnce(product_id_, std::move(value));
}

void Candidate::raiseConfidence(int floor, std::string note) {
    Evidence proposed;
    proposed.confidence = std::clamp(floor, MIN_CONFIDENCE, MAX_CONFIDENCE);
    proposed.notes.push_back(std::move(note));
    evidence_ = combine(evidence_, proposed);
}

void Candidate::absorb(const Candidate& other) {
    evidence_ = combine(evidence_, other.evidence_);
    if (other.display_name_) {
        fillDisplayName(*other.display_name_);
    }
    if (other.serial_) {
        fillSerial(*other.serial_);
    }
    if (other.vendor_id_) {
        fillVendorId(*other.vendor_id_);
    }
    if (other.product_id_) {
        fillProductId(*other.product_id_);
    }
}

}  // namespace scout::discovery
