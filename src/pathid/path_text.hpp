// =========================================================
// FILE: src/pathid/path_text.hpp
// PURPOSE: Dot-separated textual form of path vectors
// =========================================================

#pragma once

#include "path_constants.hpp"
#include "path_errors.hpp"
#include <charconv>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace pathid {

namespace detail {

/// @brief Parse one component; returns an error message on failure
inline std::optional<std::string> parse_component(std::string_view text, PathElement& out) {
    if (text.empty()) {
        return "empty path component";
    }
    for (char ch : text) {
        if (ch < '0' || ch > '9') {
            return "non-digit character in path component";
        }
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec == std::errc::result_out_of_range) {
        return "path component out of range";
    }
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return "malformed path component";
    }
    return std::nullopt;
}

} // namespace detail

/// @brief Parse "3.12.5" into {3, 12, 5}; the empty string is the root
/// @throws PathParseError on an empty, non-numeric or out-of-range component
[[nodiscard]] inline PathVector parse_path_vector(std::string_view text) {
    PathVector path;
    if (text.empty()) return path;

    size_t index = 0;
    while (true) {
        size_t end = text.find(PATH_DELIMITER);
        std::string_view component = text.substr(0, end);

        PathElement value = 0;
        if (auto error = detail::parse_component(component, value)) {
            throw PathParseError(*error, index);
        }
        path.push_back(value);

        if (end == std::string_view::npos) break;
        text.remove_prefix(end + 1);
        ++index;
    }
    return path;
}

/// @brief Non-throwing variant of parse_path_vector
[[nodiscard]] inline std::optional<PathVector> try_parse_path_vector(std::string_view text) {
    PathVector path;
    if (text.empty()) return path;

    while (true) {
        size_t end = text.find(PATH_DELIMITER);
        PathElement value = 0;
        if (detail::parse_component(text.substr(0, end), value)) {
            return std::nullopt;
        }
        path.push_back(value);

        if (end == std::string_view::npos) return path;
        text.remove_prefix(end + 1);
    }
}

/// @brief Write elements separated by PATH_DELIMITER
template <typename Range>
void write_path(std::ostream& os, const Range& path) {
    bool first = true;
    for (PathElement element : path) {
        if (!first) os << PATH_DELIMITER;
        os << element;
        first = false;
    }
}

/// @brief Normalized text for a path vector (no leading zeros, "" for root)
template <typename Range>
[[nodiscard]] std::string format_path_vector(const Range& path) {
    std::ostringstream oss;
    write_path(oss, path);
    return oss.str();
}

} // namespace pathid
