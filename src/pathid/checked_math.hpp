// =========================================================
// FILE: src/pathid/checked_math.hpp
// PURPOSE: Overflow-checked unsigned arithmetic for the encoders
// =========================================================

#pragma once

#include "path_constants.hpp"
#include "path_errors.hpp"
#include <limits>

namespace pathid::detail {

[[nodiscard]] inline PathElement checked_add(PathElement a, PathElement b) {
    if (a > std::numeric_limits<PathElement>::max() - b) {
        throw PathOverflowError("path identifier overflow in addition");
    }
    return a + b;
}

[[nodiscard]] inline PathElement checked_mul(PathElement a, PathElement b) {
    if (a == 0 || b == 0) return 0;
    if (a > std::numeric_limits<PathElement>::max() / b) {
        throw PathOverflowError("path identifier overflow in multiplication");
    }
    return a * b;
}

/// @brief a*b + c*d, throwing PathOverflowError instead of wrapping
[[nodiscard]] inline PathElement checked_dot(PathElement a, PathElement b,
                                             PathElement c, PathElement d) {
    return checked_add(checked_mul(a, b), checked_mul(c, d));
}

/// @brief Continued-fraction term for a path element (element + PATH_FUDGE)
[[nodiscard]] inline PathElement fudged(PathElement element) {
    return checked_add(element, PATH_FUDGE);
}

} // namespace pathid::detail
