// =========================================================
// FILE: src/pathid/path_ratio.hpp
// PURPOSE: Rational-form path identifier (Euclid decode)
// =========================================================

#pragma once

#include "checked_math.hpp"
#include "path_identifier.hpp"
#include <compare>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pathid {

/// @brief PathRatio - a path as the reduced fraction numerator/denominator
///
/// The fraction is the continued fraction [p0+2; p1+2, ..., pn+2]. It equals
/// the first column of the matching PathIdentifier, which is what makes the
/// two forms interchangeable. The root is the sentinel 1/0.
///
/// Encoding folds from the innermost (last) term outward:
///   x = 0/1;  for e in reversed(path): x = 1 / (x + e + 2);  result = 1/x
/// Consecutive convergents are coprime, so no gcd step is needed.
class PathRatio {
private:
    PathElement numerator_ = 1;
    PathElement denominator_ = 0;

    constexpr PathRatio(PathElement numerator, PathElement denominator) noexcept
        : numerator_(numerator), denominator_(denominator) {}

    /// @brief Euclid's algorithm; each quotient is one term
    struct Cursor {
        PathElement n = 1;
        PathElement d = 0;

        [[nodiscard]] bool done() const noexcept { return d == 0; }

        PathElement next_term() noexcept {
            PathElement q = n / d;
            PathElement r = n % d;
            n = d;
            d = r;
            return q;
        }
    };

public:
    using Walk = PathWalk<Cursor>;

    constexpr PathRatio() noexcept = default;

    [[nodiscard]] static constexpr PathRatio root() noexcept { return PathRatio(); }

    /// @throws PathOverflowError
    template <typename Range>
    [[nodiscard]] static PathRatio from_path(const Range& path) {
        PathVector elements;
        for (PathElement element : path) elements.push_back(element);

        // x = num/den, starting from 0/1
        PathElement num = 0;
        PathElement den = 1;
        for (auto it = elements.rbegin(); it != elements.rend(); ++it) {
            PathElement term = detail::fudged(*it);
            PathElement next_den = detail::checked_add(num, detail::checked_mul(term, den));
            num = den;
            den = next_den;
        }
        return PathRatio(den, num);
    }

    [[nodiscard]] static PathRatio from_path(std::initializer_list<PathElement> path) {
        return from_path<std::initializer_list<PathElement>>(path);
    }

    /// @throws PathParseError, PathOverflowError
    [[nodiscard]] static PathRatio parse(std::string_view text) {
        return from_path(parse_path_vector(text));
    }

    /// @brief Rebuild a fraction read back from storage
    ///
    /// Returns nullopt unless numerator/denominator is exactly the encoding
    /// of some path vector: 1/0 for the root, otherwise a reduced fraction
    /// whose every continued-fraction term is at least PATH_FUDGE.
    [[nodiscard]] static std::optional<PathRatio> from_components(
            PathElement numerator, PathElement denominator) {
        Cursor cursor{numerator, denominator};
        PathVector path;
        while (!cursor.done()) {
            if (cursor.n / cursor.d < PATH_FUDGE) return std::nullopt;
            path.push_back(cursor.next_term() - PATH_FUDGE);
        }
        // Euclid stops at gcd/0; anything but 1 means non-reduced input
        if (cursor.n != 1) return std::nullopt;

        PathRatio rebuilt;
        try {
            rebuilt = from_path(path);
        } catch (const PathOverflowError&) {
            return std::nullopt;
        }
        if (rebuilt != PathRatio(numerator, denominator)) return std::nullopt;
        return rebuilt;
    }

    /// @brief Rational value of a matrix identifier (its first column)
    [[nodiscard]] static PathRatio of(const PathIdentifier& id) noexcept {
        return PathRatio(id.numerator(), id.denominator());
    }

    /// @brief Matrix form of the same path
    [[nodiscard]] PathIdentifier identifier() const {
        return PathIdentifier::from_path(path());
    }

    [[nodiscard]] bool is_root() const noexcept { return denominator_ == 0; }

    [[nodiscard]] Walk path() const noexcept { return Walk(Cursor{numerator_, denominator_}); }
    [[nodiscard]] PathVector to_vector() const { return path().to_vector(); }
    [[nodiscard]] size_t depth() const noexcept { return path().size(); }

    [[nodiscard]] PathElement numerator() const noexcept { return numerator_; }
    [[nodiscard]] PathElement denominator() const noexcept { return denominator_; }

    bool operator==(const PathRatio& other) const = default;

    std::strong_ordering operator<=>(const PathRatio& other) const noexcept {
        if (*this == other) return std::strong_ordering::equal;
        return path().compare(other.path());
    }

    [[nodiscard]] std::string to_string() const { return format_path_vector(path()); }
};

inline std::ostream& operator<<(std::ostream& os, const PathRatio& ratio) {
    write_path(os, ratio.path());
    return os;
}

} // namespace pathid
