// =========================================================
// FILE: src/pathid/path_errors.hpp
// PURPOSE: Exception taxonomy for encoding and parsing
// =========================================================

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pathid {

/// @brief Base class for every error raised by the library
class PathError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Textual path contained an invalid component
///
/// Raised for empty components (leading, trailing or doubled delimiter),
/// non-digit characters, and values that do not fit in a PathElement.
class PathParseError : public PathError {
private:
    size_t component_;

public:
    PathParseError(const std::string& what, size_t component)
        : PathError(what + " (component " + std::to_string(component) + ")"),
          component_(component) {}

    /// @brief Zero-based index of the offending component
    [[nodiscard]] size_t component() const noexcept { return component_; }
};

/// @brief Fixed-width arithmetic would have wrapped while building an identifier
class PathOverflowError : public PathError {
public:
    using PathError::PathError;
};

} // namespace pathid
