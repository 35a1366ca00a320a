// =========================================================
// FILE: src/pathid/path_walk.hpp
// PURPOSE: Lazy, restartable decode of an identifier into path elements
// =========================================================

#pragma once

#include "path_constants.hpp"
#include <compare>
#include <cstddef>
#include <iterator>

namespace pathid {

class PathIdentifier;
class PathRatio;

/// @brief Input range over the elements encoded in an identifier
///
/// Cursor is a copy of the identifier's decode state. It provides
///   bool done() const noexcept         - no terms left
///   PathElement next_term() noexcept   - pop the next continued-fraction term
/// Every begin() starts from a fresh copy, so walking never touches the
/// identifier and the range can be traversed any number of times.
/// Only the identifier types can start a walk, so every walk decodes a
/// value the encoder produced.
template <typename Cursor>
class PathWalk {
private:
    Cursor origin_;

    friend class PathIdentifier;
    friend class PathRatio;

    explicit PathWalk(const Cursor& origin) noexcept : origin_(origin) {}

public:
    class iterator {
    private:
        Cursor cursor_{};
        PathElement value_ = 0;
        bool at_end_ = true;

        friend class PathWalk;

        explicit iterator(const Cursor& cursor) noexcept : cursor_(cursor) { advance(); }

        void advance() noexcept {
            if (cursor_.done()) {
                at_end_ = true;
                return;
            }
            value_ = cursor_.next_term() - PATH_FUDGE;
            at_end_ = false;
        }

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PathElement;
        using difference_type = std::ptrdiff_t;
        using pointer = const PathElement*;
        using reference = const PathElement&;

        iterator() = default;

        [[nodiscard]] reference operator*() const noexcept { return value_; }
        [[nodiscard]] pointer operator->() const noexcept { return &value_; }

        iterator& operator++() noexcept {
            advance();
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator copy = *this;
            advance();
            return copy;
        }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.at_end_;
        }
    };

    [[nodiscard]] iterator begin() const noexcept { return iterator(origin_); }
    [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    [[nodiscard]] bool empty() const noexcept { return origin_.done(); }

    /// @brief Number of elements (walks the whole path)
    [[nodiscard]] size_t size() const noexcept {
        size_t count = 0;
        for (auto it = begin(); it != end(); ++it) ++count;
        return count;
    }

    /// @brief Lexicographic comparison of two walks, decoded in lockstep
    template <typename OtherCursor>
    [[nodiscard]] std::strong_ordering compare(const PathWalk<OtherCursor>& other) const noexcept {
        auto it = begin();
        auto jt = other.begin();
        for (;; ++it, ++jt) {
            bool lhs_done = it == end();
            bool rhs_done = jt == other.end();
            if (lhs_done || rhs_done) {
                if (lhs_done && rhs_done) return std::strong_ordering::equal;
                return lhs_done ? std::strong_ordering::less : std::strong_ordering::greater;
            }
            if (auto cmp = *it <=> *jt; cmp != 0) return cmp;
        }
    }

    [[nodiscard]] PathVector to_vector() const {
        PathVector path;
        for (PathElement element : *this) path.push_back(element);
        return path;
    }
};

} // namespace pathid
