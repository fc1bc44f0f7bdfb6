/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers shared by the scanners and the enricher

**************************************************/

#ifndef SCOUT_UTILS_STRING_HPP
#define SCOUT_UTILS_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout::utils {

/**
 * @brief Trims leading and trailing symbols from a string_view.
 *
 * @param line The string_view to trim.
 * @param symbols The symbols to trim.
 * @return The trimmed string.
 */
[[nodiscard("the result of trim is not used")]]
auto trim(std::string_view line,
          std::string_view symbols = " \n\r\t") -> std::string;

[[nodiscard]] auto toLower(std::string_view str) -> std::string;

/**
 * @brief Case-insensitive (ASCII) substring search.
 */
[[nodiscard]] auto containsIgnoreCase(std::string_view haystack,
                                      std::string_view needle) -> bool;

/**
 * @brief Splits a string by a delimiter, keeping empty fields.
 */
[[nodiscard]] auto splitString(std::string_view str, char delimiter)
    -> std::vector<std::string>;

/**
 * @brief Parses 1/0, true/false, yes/no, on/off (case-insensitive).
 * @return std::nullopt when the text is none of those
 */
[[nodiscard]] auto parseBool(std::string_view str) -> std::optional<bool>;

}  // namespace scout::utils

#endif  // SCOUT_UTILS_STRING_HPP
