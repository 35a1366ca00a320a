// =========================================================
// FILE: src/pathid/path_constants.hpp
// PURPOSE: Compile-time configuration for path identifiers
// =========================================================

#pragma once

#include <cstdint>
#include <vector>

namespace pathid {

/// @brief Width of a single path element (and of every identifier component)
using PathElement = uint64_t;

/// @brief Ordered sequence of element indexes; empty means the root
using PathVector = std::vector<PathElement>;

/// Each rational number has two continued-fraction expansions: one ending
/// in 1 and one that does not, so [3,5,1] and [3,6] would collide. Every
/// element is shifted by PATH_FUDGE before it becomes a term, which keeps
/// all terms >= 2 and makes 0-based indexes usable.
inline constexpr PathElement PATH_FUDGE = 2;

/// @brief Separator between components in the textual form ("3.12.5")
inline constexpr char PATH_DELIMITER = '.';

} // namespace pathid
