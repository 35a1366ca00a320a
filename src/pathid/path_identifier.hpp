// =========================================================
// FILE: src/pathid/path_identifier.hpp
// PURPOSE: Matrix-form path identifier (continued-fraction convergents)
// =========================================================

#pragma once

#include "checked_math.hpp"
#include "path_constants.hpp"
#include "path_errors.hpp"
#include "path_text.hpp"
#include "path_walk.hpp"
#include <array>
#include <compare>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace pathid {

/// @brief PathIdentifier - one fixed-size value for a whole tree path
///
/// Stores the path as a 2x2 matrix
///
///   | a  b |
///   | c  d |
///
/// equal to the product E(p0+2) * E(p1+2) * ... where E(k) = [[k, 1], [1, 0]].
/// The root is the identity. The first column a/c is the value of the
/// continued fraction [p0+2; p1+2, ...] and the second column is the previous
/// convergent, so appending an element is a single matrix product and two
/// identifiers concatenate by multiplication.
///
/// Example:
///   [3, 12]  ->  E(5) * E(14)  =  | 71  5 |
///                                 | 14  1 |
///
/// Identifiers are only built by the encoder (or by from_components, which
/// validates). Decoding a matrix that is not a product of E(k >= 2) factors
/// is undefined.
class PathIdentifier {
private:
    PathElement a_ = 1;
    PathElement b_ = 0;
    PathElement c_ = 0;
    PathElement d_ = 1;

    constexpr PathIdentifier(PathElement a, PathElement b, PathElement c, PathElement d) noexcept
        : a_(a), b_(b), c_(c), d_(d) {}

    /// @brief Decode state for PathWalk: one factor peeled per step
    struct Cursor {
        PathElement a = 1;
        PathElement b = 0;
        PathElement c = 0;
        PathElement d = 1;

        [[nodiscard]] bool done() const noexcept {
            return a == 1 && b == 0 && c == 0 && d == 1;
        }

        // M = E(q) * M'  =>  M' = | c        d      |
        //                         | a - q*c  b - q*d |
        PathElement next_term() noexcept {
            PathElement q = a / c;
            PathElement na = c;
            PathElement nb = d;
            PathElement nc = a - q * c;
            PathElement nd = b - q * d;
            a = na;
            b = nb;
            c = nc;
            d = nd;
            return q;
        }
    };

public:
    using Walk = PathWalk<Cursor>;

    constexpr PathIdentifier() noexcept = default;

    [[nodiscard]] static constexpr PathIdentifier root() noexcept { return PathIdentifier(); }

    /// @brief Identifier of the single-element path [element]
    /// @throws PathOverflowError if element + PATH_FUDGE does not fit
    [[nodiscard]] static PathIdentifier from_element(PathElement element) {
        return PathIdentifier(detail::fudged(element), 1, 1, 0);
    }

    /// @brief Encode a path vector (any range of PathElement)
    /// @throws PathOverflowError if a component of the matrix would wrap
    template <typename Range>
    [[nodiscard]] static PathIdentifier from_path(const Range& path) {
        PathIdentifier id;
        for (PathElement element : path) {
            id.append(element);
        }
        return id;
    }

    [[nodiscard]] static PathIdentifier from_path(std::initializer_list<PathElement> path) {
        return from_path<std::initializer_list<PathElement>>(path);
    }

    /// @brief Parse the dot-separated form ("3.12.5", "" for root)
    /// @throws PathParseError, PathOverflowError
    [[nodiscard]] static PathIdentifier parse(std::string_view text) {
        return from_path(parse_path_vector(text));
    }

    /// @brief Rebuild an identifier from stored components
    ///
    /// Returns nullopt unless (a, b, c, d) is exactly the encoding of some
    /// path vector. Each step is guarded, then the recovered path is encoded
    /// again and compared.
    [[nodiscard]] static std::optional<PathIdentifier> from_components(
            PathElement a, PathElement b, PathElement c, PathElement d) {
        Cursor cursor{a, b, c, d};
        PathVector path;
        while (!cursor.done()) {
            if (cursor.c == 0) return std::nullopt;
            PathElement q = cursor.a / cursor.c;
            if (q < PATH_FUDGE) return std::nullopt;
            if (cursor.d != 0 && q > cursor.b / cursor.d) return std::nullopt;
            path.push_back(cursor.next_term() - PATH_FUDGE);
        }

        PathIdentifier rebuilt;
        try {
            rebuilt = from_path(path);
        } catch (const PathOverflowError&) {
            return std::nullopt;
        }
        if (rebuilt != PathIdentifier(a, b, c, d)) return std::nullopt;
        return rebuilt;
    }

    /// @brief Append one element in place (O(1))
    void append(PathElement element) {
        *this *= from_element(element);
    }

    /// @brief Identifier of this path extended by one element
    [[nodiscard]] PathIdentifier child(PathElement element) const {
        PathIdentifier result = *this;
        result.append(element);
        return result;
    }

    /// @brief Concatenation: from_path(p) * from_path(q) == from_path(p ++ q)
    /// @throws PathOverflowError
    [[nodiscard]] PathIdentifier operator*(const PathIdentifier& other) const {
        // | a b |   | oa ob |   | a*oa + b*oc   a*ob + b*od |
        // | c d | x | oc od | = | c*oa + d*oc   c*ob + d*od |
        return PathIdentifier(
            detail::checked_dot(a_, other.a_, b_, other.c_),
            detail::checked_dot(a_, other.b_, b_, other.d_),
            detail::checked_dot(c_, other.a_, d_, other.c_),
            detail::checked_dot(c_, other.b_, d_, other.d_));
    }

    PathIdentifier& operator*=(const PathIdentifier& other) {
        *this = *this * other;
        return *this;
    }

    [[nodiscard]] bool is_root() const noexcept {
        return Cursor{a_, b_, c_, d_}.done();
    }

    /// @brief Lazily decoded elements; every traversal restarts from the top
    [[nodiscard]] Walk path() const noexcept { return Walk(Cursor{a_, b_, c_, d_}); }

    [[nodiscard]] PathVector to_vector() const { return path().to_vector(); }

    /// @brief Number of elements in the path (0 for root)
    [[nodiscard]] size_t depth() const noexcept { return path().size(); }

    /// @brief Continued-fraction value a/c; the root is 1/0
    [[nodiscard]] PathElement numerator() const noexcept { return a_; }
    [[nodiscard]] PathElement denominator() const noexcept { return c_; }

    /// @brief Raw matrix in row-major order (a, b, c, d)
    [[nodiscard]] std::array<PathElement, 4> components() const noexcept {
        return {a_, b_, c_, d_};
    }

    bool operator==(const PathIdentifier& other) const = default;

    /// @brief Tree pre-order: lexicographic order of the decoded paths
    std::strong_ordering operator<=>(const PathIdentifier& other) const noexcept {
        if (*this == other) return std::strong_ordering::equal;
        return path().compare(other.path());
    }

    /// @brief Dot-separated text ("" for root)
    [[nodiscard]] std::string to_string() const { return format_path_vector(path()); }
};

inline std::ostream& operator<<(std::ostream& os, const PathIdentifier& id) {
    write_path(os, id.path());
    return os;
}

} // namespace pathid
