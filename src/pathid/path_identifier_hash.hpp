// =========================================================
// FILE: src/pathid/path_identifier_hash.hpp
// PURPOSE: std::hash specializations for identifiers
// =========================================================

#pragma once

#include "path_identifier.hpp"
#include "path_ratio.hpp"
#include <functional>

namespace std {

template <>
struct hash<pathid::PathIdentifier> {
    size_t operator()(const pathid::PathIdentifier& id) const noexcept {
        // The first column alone is unique; b and d follow from it.
        size_t h1 = std::hash<uint64_t>{}(id.numerator());
        size_t h2 = std::hash<uint64_t>{}(id.denominator());
        return h1 ^ (h2 * 31 + (h2 << 1));
    }
};

template <>
struct hash<pathid::PathRatio> {
    size_t operator()(const pathid::PathRatio& ratio) const noexcept {
        size_t h1 = std::hash<uint64_t>{}(ratio.numerator());
        size_t h2 = std::hash<uint64_t>{}(ratio.denominator());
        return h1 ^ (h2 * 31 + (h2 << 1));
    }
};

} // namespace std
