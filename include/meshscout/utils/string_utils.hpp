/**
 * @file string_utils.hpp
 * @brief Small string helpers shared by the config builder and the CLI.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace meshscout::utils {

inline std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

inline std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

/**
 * @brief Trim whitespace from both ends of a string
 */
inline std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

inline bool is_blank(const std::string& str) {
    return str.find_first_not_of(" \t\r\n") == std::string::npos;
}

/**
 * @brief Split "key=value" at the first delimiter.
 * @return Both halves, or nullopt when the delimiter is missing.
 */
inline std::optional<std::pair<std::string, std::string>>
split_pair(const std::string& str, char delimiter = '=') {
    auto pos = str.find(delimiter);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(str.substr(0, pos), str.substr(pos + 1));
}

} // namespace meshscout::utils
