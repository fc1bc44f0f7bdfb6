/*
 * enricher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-05-04

Description: Cross-references candidates with the platform property
directory

**************************************************/

#ifndef SCOUT_DISCOVERY_ENRICHER_HPP
#define SCOUT_DISCOVERY_ENRICHER_HPP

#include <array>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "candidate.hpp"
#include "property_directory.hpp"

namespace scout::discovery {

inline constexpr int PRINTER_INTERFACE_FLOOR = 90;
inline constexpr int KEYWORD_FLOOR = 70;
inline constexpr int USB_SERIAL_NAMED_FLOOR = 60;

/// Brand and device words that hint at a receipt printer.
inline constexpr std::array<std::string_view, 10> PRINTER_KEYWORDS = {
    "epson",  "star",     "bixolon", "citizen", "sewoo",
    "zjiang", "xprinter", "pos",     "receipt", "thermal"};

/**
 * @brief Fills gaps in device-node candidates and raises their confidence.
 *
 * The directory is indexed once per call to enrich(). Fields a scanner
 * already set are never overwritten and confidence never drops. Candidates
 * without a device node, or without a record, are left untouched.
 */
class Enricher {
public:
    explicit Enricher(std::shared_ptr<PropertyDirectory> directory);

    /**
     * @throws EnumerationError if the property directory cannot be indexed
     */
    void enrich(std::vector<Candidate>& candidates) const;

    /**
     * @brief Apply one record to one candidate.
     * @param source Property service name, prefixed to the notes it causes
     */
    static void apply(Candidate& candidate, const PropertyRecord& record,
                      std::string_view source);

private:
    std::shared_ptr<PropertyDirectory> directory_;
};

/**
 * @return true if an ID_USB_INTERFACES value lists a printer-class interface
 *
 * The value looks like ":070102:ffff00:", one class/subclass/protocol triple
 * per interface.
 */
[[nodiscard]] bool interfacesIncludePrinter(std::string_view interfaces);

/**
 * @return The first keyword @p name contains, ignoring case
 */
[[nodiscard]] std::optional<std::string_view> matchPrinterKeyword(
    std::string_view name);

}  // namespace scout::discovery

#endif  // SCOUT_DISCOVERY_ENRICHER_HPP
