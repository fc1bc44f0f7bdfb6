/*
 * candidate.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-02

Description: Transport identity and printer candidate model

**************************************************/

#ifndef SCOUT_DISCOVERY_CANDIDATE_HPP
#define SCOUT_DISCOVERY_CANDIDATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

namespace scout::discovery {

inline constexpr int MIN_CONFIDENCE = 0;
inline constexpr int MAX_CONFIDENCE = 100;

/**
 * @brief Which device namespace a node was found in
 */
enum class NodeKind {
    UsbPrinterClass,  ///< Created by the USB printer-class driver (usblp)
    Serial            ///< Generic USB-serial or ACM adapter node
};

/**
 * @brief A device node in the filesystem namespace
 */
struct DeviceNode {
    NodeKind kind;
    std::string path;
};

/**
 * @brief A device reached through USB bus enumeration only
 */
struct UsbAddress {
    uint16_t vendor_id{0};
    uint16_t product_id{0};
    std::optional<std::string> serial;
};

/**
 * @brief Canonical identity used to merge duplicate discoveries.
 *
 * Holds the node path for device nodes and the (vid, pid, serial) tuple for
 * bus addresses. A path key never compares equal to a tuple key.
 */
using UsbKey = std::tuple<uint16_t, uint16_t, std::optional<std::string>>;
using DedupKey = std::variant<std::string, UsbKey>;

/**
 * @brief Discriminated locator of a hardware endpoint.
 *
 * Immutable after construction: there are factories but no mutators.
 */
class Transport {
public:
    static auto deviceNode(NodeKind kind, std::string path) -> Transport;
    static auto usbDevice(uint16_t vendor_id, uint16_t product_id,
                          std::optional<std::string> serial) -> Transport;

    [[nodiscard]] bool isDeviceNode() const noexcept;
    [[nodiscard]] bool isUsbDevice() const noexcept;

    /**
     * @return The node, or nullptr for bus-address transports
     */
    [[nodiscard]] const DeviceNode* node() const noexcept;

    /**
     * @return The bus address, or nullptr for device-node transports
     */
    [[nodiscard]] const UsbAddress* usbAddress() const noexcept;

    /**
     * @return The device-node path when there is one
     */
    [[nodiscard]] std::optional<std::string_view> devicePath() const noexcept;

    [[nodiscard]] DedupKey dedupKey() const;

    /**
     * @brief Locator string handed to the printer protocol layer.
     *
     * `file:/dev/usb/lp0`, `serial:/dev/ttyUSB0` or `usb:04b8:0202[:SERIAL]`.
     */
    [[nodiscard]] std::string locator() const;

private:
    explicit Transport(std::variant<DeviceNode, UsbAddress> value);

    std::variant<DeviceNode, UsbAddress> value_;
};

/**
 * @brief Confidence together with the notes that justify it.
 *
 * combine() keeps the larger confidence and concatenates notes in argument
 * order. It is associative, and idempotent on the confidence component.
 */
struct Evidence {
    int confidence{MIN_CONFIDENCE};
    std::vector<std::string> notes;
};

[[nodiscard]] auto combine(const Evidence& a, const Evidence& b) -> Evidence;

/**
 * @brief A device that might be an ESC/POS-class printer.
 */
class Candidate {
public:
    /**
     * @param transport Where the device was found
     * @param confidence Provisional confidence, must lie in [0, 100]
     * @param note Evidence note explaining the provisional confidence
     * @throws scout::error::InvalidArgument if confidence is out of range
     */
    Candidate(Transport transport, int confidence, std::string note);

    [[nodiscard]] const Transport& transport() const noexcept {
        return transport_;
    }
    [[nodiscard]] DedupKey dedupKey() const { return transport_.dedupKey(); }

    [[nodiscard]] const std::optional<std::string>& displayName() const noexcept {
        return display_name_;
    }
    [[nodiscard]] const std::optional<std::string>& serial() const noexcept {
        return serial_;
    }
    [[nodiscard]] const std::optional<std::string>& vendorId() const noexcept {
        return vendor_id_;
    }
    [[nodiscard]] const std::optional<std::string>& productId() const noexcept {
        return product_id_;
    }

    [[nodiscard]] int confidence() const noexcept {
        return evidence_.confidence;
    }
    [[nodiscard]] const std::vector<std::string>& notes() const noexcept {
        return evidence_.notes;
    }
    [[nodiscard]] const Evidence& evidence() const noexcept {
        return evidence_;
    }

    // The fill* setters only populate an absent field and ignore empty
    // values. They return whether the field was set.
    bool fillDisplayName(std::string value);
    bool fillSerial(std::string value);
    bool fillVendorId(std::string value);
    bool fillProductId(std::string value);

    /**
     * @brief Raise confidence to at least @p floor and record why.
     *
     * Never lowers the confidence. The floor is clamped into [0, 100] and the
     * note is appended even when the confidence was already higher.
     */
    void raiseConfidence(int floor, std::string note);

    /**
     * @brief Merge a duplicate discovery of the same endpoint into this one.
     *
     * Evidence is combined; optional fields already present here win.
     */
    void absorb(const Candidate& other);

private:
    Transport transport_;
    std::optional<std::string> display_name_;
    std::optional<std::string> serial_;
    std::optional<std::string> vendor_id_;
    std::optional<std::string> product_id_;
    Evidence evidence_;
};

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_CANDIDATE_HPP
