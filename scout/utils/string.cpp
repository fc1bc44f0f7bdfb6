/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers shared by the scanners and the enricher

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ranges>

namespace scout::utils {

auto trim(std::string_view line, std::string_view symbols) -> std::string {
    if (line.empty()) {
        return {};
    }

    const auto isSymbol = [&symbols](char c) {
        return symbols.find(c) != std::string_view::npos;
    };

    auto start = std::ranges::find_if_not(line, isSymbol);
    if (start == line.end()) {
        return {};
    }

    auto rbegin = std::make_reverse_iterator(line.end());
    auto rend = std::make_reverse_iterator(start);
    auto last = std::ranges::find_if_not(std::ranges::subrange(rbegin, rend),
                                         isSymbol);
    auto end = last.base();

    return std::string(start, end);
}

auto toLower(std::string_view str) -> std::string {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

auto containsIgnoreCase(std::string_view haystack, std::string_view needle)
    -> bool {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                          needle.end(), [](char ch1, char ch2) {
                              return std::tolower(
                                         static_cast<unsigned char>(ch1)) ==
                                     std::tolower(
                                         static_cast<unsigned char>(ch2));
                          });
    return it != haystack.end();
}

auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string> {
    if (str.empty()) {
        return {};
    }

    std::vector<std::string> tokens;
    tokens.reserve(std::ranges::count(str, delimiter) + 1);

    std::string_view::size_type begin = 0;
    while (true) {
        auto pos = str.find(delimiter, begin);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(str.substr(begin));
            break;
        }
        tokens.emplace_back(str.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return tokens;
}

auto parseBool(std::string_view str) -> std::optional<bool> {
    const auto value = toLower(trim(str));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return std::nullopt;
}

}  // namespace scout::utils
