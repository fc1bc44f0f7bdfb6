/*
 * enricher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-04

Description: Cross-references candidates with the platform property
directory

**************************************************/

#include "enricher.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "scout/utils/string.hpp"

namespace scout::discovery {

namespace {
bool isUsbBacked(const PropertyRecord& record) {
    return lookup(record, "ID_BUS") == std::optional<std::string>("usb") ||
           lookup(record, "ID_VENDOR_ID").has_value();
}
}  // namespace

bool interfacesIncludePrinter(std::string_view interfaces) {
    for (const auto& entry : utils::splitString(interfaces, ':')) {
        if (entry.size() >= 2 && entry.compare(0, 2, "07") == 0) {
            return true;
        }
    }
    return false;
}

std::optional<std::string_view> matchPrinterKeyword(std::string_view name) {
    for (auto keyword : PRINTER_KEYWORDS) {
        if (utils::containsIgnoreCase(name, keyword)) {
            return keyword;
        }
    }
    return std::nullopt;
}

Enricher::Enricher(std::shared_ptr<PropertyDirectory> directory)
    : directory_(std::move(directory)) {}

void Enricher::enrich(std::vector<Candidate>& candidates) const {
    const auto source = directory_->name();
    const auto index = directory_->index();

    size_t enriched = 0;
    for (auto& candidate : candidates) {
        auto path = candidate.transport().devicePath();
        if (!path) {
            continue;
        }
        auto it = index.find(std::string(*path));
        if (it == index.end()) {
            spdlog::debug("enricher: no properties for {}", *path);
            continue;
        }
        apply(candidate, it->second, source);
        ++enriched;
    }

    spdlog::info("enricher: matched {} of {} candidate(s) against {}", enriched,
                 candidates.size(), source);
}

void Enricher::apply(Candidate& candidate, const PropertyRecord& record,
                     std::string_view source) {
    auto vendor =
        lookupPreferred(record, "ID_VENDOR_FROM_DATABASE", "ID_VENDOR");
    auto model = lookupPreferred(record, "ID_MODEL_FROM_DATABASE", "ID_MODEL");
    if (vendor || model) {
        candidate.fillDisplayName(
            utils::trim(vendor.value_or("") + " " + model.value_or("")));
    }

    if (auto serial = lookupPreferred(record, "ID_SERIAL_SHORT", "ID_SERIAL")) {
        candidate.fillSerial(std::move(*serial));
    }
    if (auto vid = lookup(record, "ID_VENDOR_ID")) {
        candidate.fillVendorId(std::move(*vid));
    }
    if (auto pid = lookup(record, "ID_MODEL_ID")) {
        candidate.fillProductId(std::move(*pid));
    }

    if (auto interfaces = lookup(record, "ID_USB_INTERFACES");
        interfaces && interfacesIncludePrinter(*interfaces)) {
        candidate.raiseConfidence(
            PRINTER_INTERFACE_FLOOR,
            std::string(source) +
                ": ID_USB_INTERFACES indicates USB printer class (07)");
    }

    const auto& name = candidate.displayName();
    if (name) {
        if (auto keyword = matchPrinterKeyword(*name)) {
            candidate.raiseConfidence(
                KEYWORD_FLOOR,
                "make/model contains keyword '" + std::string(*keyword) + "'");
        }
    }

    const auto* node = candidate.transport().node();
    if (node && node->kind == NodeKind::Serial && name && isUsbBacked(record)) {
        candidate.raiseConfidence(USB_SERIAL_NAMED_FLOOR,
                                  std::string(source) +
                                      ": USB-backed serial device");
    }
}

}  // namespace scout::discovery
