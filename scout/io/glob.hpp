#ifndef SCOUT_IO_GLOB_HPP
#define SCOUT_IO_GLOB_HPP

#include <filesystem>
#include <string>
#include <vector>

/**
 * @namespace scout::io
 * @brief Filesystem helpers used by the node scanners
 */
namespace scout::io {

namespace fs = std::filesystem;

/**
 * @brief Translate a shell-style pattern to a regular expression
 * @param pattern The shell pattern to translate (e.g., "lp*", "ttyUSB[0-3]")
 * @return The equivalent ECMAScript regular expression
 * @details Converts glob patterns to regex:
 *          - * becomes .*
 *          - ? becomes .
 *          - [abc] and [!abc] become character classes
 *          - Other regex special characters are escaped
 */
[[nodiscard]] auto translate(const std::string &pattern) -> std::string;

/**
 * @brief Test whether a filename matches a shell-style pattern
 * @param name The file name (not a full path) to test
 * @param pattern The shell pattern to match against
 * @return true if the name matches the pattern
 */
[[nodiscard]] auto fnmatch(const std::string &name, const std::string &pattern)
    -> bool;

/**
 * @brief Check if a pathname contains glob magic characters
 * @param pathname The path string to check
 * @return true if the pathname contains *, ? or [
 */
[[nodiscard]] auto hasMagic(const std::string &pathname) -> bool;

/**
 * @brief Find all paths matching a shell-style pattern
 *
 * Only the last path component may carry magic characters, which is all the
 * device namespaces need (`/dev/usb/lp*`, `/dev/ttyACM*`). Hidden entries are
 * skipped.
 *
 * @param pathname The pattern to match
 * @return Matching paths, sorted lexicographically. A missing parent
 * directory yields an empty result.
 * @throws std::filesystem::filesystem_error if the parent directory exists
 * but cannot be listed, or if the pattern has magic in a directory component
 */
[[nodiscard]] auto glob(const std::string &pathname) -> std::vector<fs::path>;

}  // namespace scout::io

#endif  // SCOUT_IO_GLOB_HPP
