#include "report.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "error.hpp"

namespace scout::discovery {

namespace {
template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}  // namespace

DiscoveryReport runDiscovery(const DiscoveryProvider& provider) {
    DiscoveryReport report;
    try {
        report.candidates = provider.listPrinterCandidates();
    } catch (const EnumerationError& e) {
        spdlog::error("Discovery failed: {}", e.getMessage());
        report.status = DiscoveryReport::Status::Failed;
        report.message = ENUMERATION_FAILED_MESSAGE;
        report.detail = e.getMessage();
        return report;
    }

    if (report.candidates.empty()) {
        report.status = DiscoveryReport::Status::Empty;
        report.message = NO_PRINTERS_MESSAGE;
    } else {
        report.status = DiscoveryReport::Status::Found;
        report.message =
            std::format("found {} printer candidate(s)", report.candidates.size());
    }
    return report;
}

const char* toString(DiscoveryReport::Status status) noexcept {
    switch (status) {
        case DiscoveryReport::Status::Found:
            return "found";
        case DiscoveryReport::Status::Empty:
            return "empty";
        case DiscoveryReport::Status::Failed:
            return "failed";
    }
    return "failed";
}

const char* toString(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::UsbPrinterClass:
            return "usb_lp";
        case NodeKind::Serial:
            return "serial";
    }
    return "serial";
}

nlohmann::json toJson(const Transport& transport) {
    nlohmann::json json;
    if (const auto* node = transport.node()) {
        json["type"] = toString(node->kind);
        json["path"] = node->path;
    } else if (const auto* usb = transport.usbAddress()) {
        json["type"] = "usb_device";
        json["vid"] = std::format("{:04x}", usb->vendor_id);
        json["pid"] = std::format("{:04x}", usb->product_id);
        json["serial"] = optionalToJson(usb->serial);
    }
    json["locator"] = transport.locator();
    return json;
}

nlohmann::json toJson(const Candidate& candidate) {
    return nlohmann::json{
        {"transport", toJson(candidate.transport())},
        {"make_model", optionalToJson(candidate.displayName())},
        {"serial", optionalToJson(candidate.serial())},
        {"vid", optionalToJson(candidate.vendorId())},
        {"pid", optionalToJson(candidate.productId())},
        {"confidence", candidate.confidence()},
        {"notes", candidate.notes()},
    };
}

nlohmann::json toJson(const DiscoveryReport& report) {
    nlohmann::json candidates = nlohmann::json::array();
    for (const auto& candidate : report.candidates) {
        candidates.push_back(toJson(candidate));
    }

    nlohmann::json json{
        {"status", toString(report.status)},
        {"message", report.message},
        {"candidates", std::move(candidates)},
    };
    if (!report.detail.empty()) {
        json["detail"] = report.detail;
    }
    return json;
}

}  // namespace scout::discovery
