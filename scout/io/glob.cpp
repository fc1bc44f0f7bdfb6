#include "glob.hpp"

#include <algorithm>
#include <regex>
#include <system_error>

namespace scout::io {

namespace {
const std::string SPECIAL_CHARACTERS = "()[]{}?*+-|^$\\.&~# \t\n\r\v\f";
}  // namespace

auto translate(const std::string &pattern) -> std::string {
    std::string::size_type index = 0;
    const std::string::size_type patternSize = pattern.size();
    std::string result;

    while (index < patternSize) {
        const char currentChar = pattern[index];
        index += 1;

        if (currentChar == '*') {
            result.append(".*");
        } else if (currentChar == '?') {
            result.append(".");
        } else if (currentChar == '[') {
            auto innerIndex = index;
            if (innerIndex < patternSize && pattern[innerIndex] == '!') {
                innerIndex += 1;
            }
            if (innerIndex < patternSize && pattern[innerIndex] == ']') {
                innerIndex += 1;
            }
            while (innerIndex < patternSize && pattern[innerIndex] != ']') {
                innerIndex += 1;
            }

            if (innerIndex >= patternSize) {
                // Unterminated class, match the bracket literally
                result.append("\\[");
                continue;
            }

            const std::string stuff =
                pattern.substr(index, innerIndex - index);
            index = innerIndex + 1;

            std::string escaped;
            for (std::size_t i = 0; i < stuff.size(); ++i) {
                const char c = stuff[i];
                if (i == 0 && c == '!') {
                    escaped.push_back('^');
                } else if (c == '\\' || (i == 0 && c == '^')) {
                    escaped.append("\\").push_back(c);
                } else {
                    escaped.push_back(c);
                }
            }
            result.append("[").append(escaped).append("]");
        } else if (SPECIAL_CHARACTERS.find(currentChar) != std::string::npos) {
            result.append("\\").push_back(currentChar);
        } else {
            result.push_back(currentChar);
        }
    }
    return result;
}

auto fnmatch(const std::string &name, const std::string &pattern) -> bool {
    return std::regex_match(name,
                            std::regex(translate(pattern), std::regex::ECMAScript));
}

auto hasMagic(const std::string &pathname) -> bool {
    return pathname.find_first_of("*?[") != std::string::npos;
}

auto glob(const std::string &pathname) -> std::vector<fs::path> {
    std::vector<fs::path> result;
    const fs::path path(pathname);
    auto dirname = path.parent_path();
    const std::string basename = path.filename().string();

    if (hasMagic(dirname.string())) {
        throw fs::filesystem_error(
            "glob: magic characters are only supported in the last component",
            path, std::make_error_code(std::errc::invalid_argument));
    }

    if (!hasMagic(basename)) {
        if (fs::exists(path)) {
            result.push_back(path);
        }
        return result;
    }

    if (dirname.empty()) {
        dirname = fs::current_path();
    }

    std::error_code ec;
    if (!fs::is_directory(dirname, ec)) {
        return result;
    }

    const std::regex compiled(translate(basename), std::regex::ECMAScript);
    for (const auto &entry : fs::directory_iterator(dirname)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || name[0] == '.') {
            continue;
        }
        if (std::regex_match(name, compiled)) {
            result.push_back(path.parent_path().empty()
                                 ? fs::path(name)
                                 : path.parent_path() / name);
        }
    }

    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace scout::io
