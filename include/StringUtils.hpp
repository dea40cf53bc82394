#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace utils {
/**
 * ASCII lowercase copy of a string
 */
inline std::string toLower(std::string_view text) {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * Split on every occurrence of a single delimiter, keeping empty fields
 * ("a  b" split on ' ' gives "a", "", "b")
 */
inline std::vector<std::string_view> split(std::string_view text, char delimiter) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

/**
 * Parse a decimal TCP port (1-65535). Rejects signs, spaces and empty input.
 * @return port, or -1 if the text is not a valid port
 */
inline int parsePort(std::string_view text) {
    if (text.empty() || text.size() > 5) {
        return -1;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return -1;
        }
        value = value * 10 + (c - '0');
    }
    if (value < 1 || value > 65535) {
        return -1;
    }
    return value;
}
} // namespace utils
