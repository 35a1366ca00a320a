// =========================================================
// FILE: src/pathid/path_serde.hpp
// PURPOSE: Fixed-size storage encoding for path identifiers
// =========================================================

#pragma once

#include "path_identifier.hpp"
#include "path_ratio.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace pathid {

using Bytes = std::vector<uint8_t>;

/// @brief Serialized size: four little-endian 64-bit components
inline constexpr size_t PATH_IDENTIFIER_SIZE = 4 * sizeof(PathElement);

/// @brief Serialized size of the rational form: numerator, denominator
inline constexpr size_t PATH_RATIO_SIZE = 2 * sizeof(PathElement);

namespace detail {

inline void put_le64(Bytes& buffer, PathElement value) {
    for (int i = 0; i < 8; ++i) {
        buffer.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

inline PathElement get_le64(const Bytes& bytes, size_t pos) {
    PathElement value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<PathElement>(bytes[pos + i]) << (i * 8);
    }
    return value;
}

} // namespace detail

/// @brief Serialize as a, b, c, d (8 bytes each, little-endian)
[[nodiscard]] inline Bytes serialize_identifier(const PathIdentifier& id) {
    Bytes buffer;
    buffer.reserve(PATH_IDENTIFIER_SIZE);
    for (PathElement component : id.components()) {
        detail::put_le64(buffer, component);
    }
    return buffer;
}

/// @brief Deserialize, rejecting anything the encoder could not have produced
///
/// Returns nullopt for a buffer that is not exactly PATH_IDENTIFIER_SIZE
/// bytes, or whose matrix is not a product of path-element factors.
[[nodiscard]] inline std::optional<PathIdentifier> deserialize_identifier(const Bytes& bytes) {
    if (bytes.size() != PATH_IDENTIFIER_SIZE) {
        return std::nullopt;
    }

    return PathIdentifier::from_components(
        detail::get_le64(bytes, 0), detail::get_le64(bytes, 8),
        detail::get_le64(bytes, 16), detail::get_le64(bytes, 24));
}

/// @brief Serialize as numerator, denominator (8 bytes each, little-endian)
[[nodiscard]] inline Bytes serialize_ratio(const PathRatio& ratio) {
    Bytes buffer;
    buffer.reserve(PATH_RATIO_SIZE);
    detail::put_le64(buffer, ratio.numerator());
    detail::put_le64(buffer, ratio.denominator());
    return buffer;
}

/// @brief Deserialize; nullopt unless exactly PATH_RATIO_SIZE bytes holding
/// a fraction the encoder could have produced
[[nodiscard]] inline std::optional<PathRatio> deserialize_ratio(const Bytes& bytes) {
    if (bytes.size() != PATH_RATIO_SIZE) {
        return std::nullopt;
    }
    return PathRatio::from_components(detail::get_le64(bytes, 0), detail::get_le64(bytes, 8));
}

} // namespace pathid
