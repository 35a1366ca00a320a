// =========================================================
// FILE: tests/test_path_identifier.cpp
// PURPOSE: Unit tests for matrix-form PathIdentifier
// =========================================================

#include "../src/pathid/path_identifier.hpp"
#include "../src/pathid/path_ratio.hpp"
#include <iostream>
#include <cassert>
#include <array>
#include <limits>
#include <set>
#include <sstream>
#include <type_traits>
#include <vector>

using namespace pathid;

// A decode walk can only be obtained from an identifier's path()
static_assert(!std::is_default_constructible_v<PathIdentifier::Walk>);
static_assert(!std::is_constructible_v<PathIdentifier::Walk, PathRatio::Walk>);
static_assert(!std::is_constructible_v<PathIdentifier::Walk, PathElement, PathElement,
                                       PathElement, PathElement>);
static_assert(std::is_copy_constructible_v<PathIdentifier::Walk>);

static bool has_components(const PathIdentifier& id,
                           PathElement a, PathElement b, PathElement c, PathElement d) {
    auto m = id.components();
    return m[0] == a && m[1] == b && m[2] == c && m[3] == d;
}

static bool decodes_to(const PathIdentifier& id, const PathVector& expected) {
    return id.to_vector() == expected;
}

void test_encode_known_vectors() {
    std::cout << "Testing known encodings..." << std::endl;

    assert(has_components(PathIdentifier::from_path(PathVector{}), 1, 0, 0, 1));
    assert(has_components(PathIdentifier::from_path({3}), 5, 1, 1, 0));
    assert(has_components(PathIdentifier::from_path({3, 12}), 71, 5, 14, 1));
    assert(has_components(PathIdentifier::from_path({3, 12, 5}), 502, 71, 99, 14));
    assert(has_components(PathIdentifier::from_path({3, 12, 5, 1}), 1577, 502, 311, 99));
    assert(has_components(PathIdentifier::from_path({3, 12, 5, 1, 21}), 36773, 1577, 7252, 311));

    // Parsed text goes through the same encoder
    assert(has_components(PathIdentifier::parse(""), 1, 0, 0, 1));
    assert(has_components(PathIdentifier::parse("3"), 5, 1, 1, 0));
    assert(has_components(PathIdentifier::parse("3.12.5.1.21"), 36773, 1577, 7252, 311));

    std::cout << "✅ Known encodings PASS" << std::endl;
}

void test_decode_known_vectors() {
    std::cout << "Testing path generation..." << std::endl;

    assert(decodes_to(PathIdentifier::parse(""), {}));
    assert(decodes_to(PathIdentifier::parse("3"), {3}));
    assert(decodes_to(PathIdentifier::parse("3.12"), {3, 12}));
    assert(decodes_to(PathIdentifier::parse("3.12.5"), {3, 12, 5}));
    assert(decodes_to(PathIdentifier::parse("3.12.5.1"), {3, 12, 5, 1}));
    assert(decodes_to(PathIdentifier::parse("3.12.5.1.21"), {3, 12, 5, 1, 21}));

    // Zeros and trailing small values are where the offset matters
    assert(decodes_to(PathIdentifier::from_path({0}), {0}));
    assert(decodes_to(PathIdentifier::from_path({3, 5, 1}), {3, 5, 1}));
    assert(decodes_to(PathIdentifier::from_path({3, 6}), {3, 6}));
    assert(PathIdentifier::from_path({3, 5, 1}) != PathIdentifier::from_path({3, 6}));
    assert(PathIdentifier::from_path({4, 0}) != PathIdentifier::from_path({5}));

    std::cout << "✅ Path generation PASS" << std::endl;
}

void test_root() {
    std::cout << "Testing root identifier..." << std::endl;

    PathIdentifier root;
    assert(root.is_root());
    assert(root == PathIdentifier::root());
    assert(root.path().empty());
    assert(root.depth() == 0);
    assert(root.to_string().empty());
    assert(root.numerator() == 1 && root.denominator() == 0);

    assert(!PathIdentifier::from_path({0}).is_root());
    assert(!PathIdentifier::from_path({0, 0, 0}).is_root());

    std::cout << "✅ Root identifier PASS" << std::endl;
}

void test_exhaustive_bijection() {
    std::cout << "Testing bijection over small paths..." << std::endl;

    std::vector<PathVector> paths(1);  // the root
    for (size_t len = 1; len <= 3; ++len) {
        std::vector<PathVector> next;
        for (const auto& p : paths) {
            if (p.size() != len - 1) continue;
            for (PathElement e = 0; e <= 6; ++e) {
                PathVector q = p;
                q.push_back(e);
                next.push_back(q);
            }
        }
        paths.insert(paths.end(), next.begin(), next.end());
    }
    assert(paths.size() == 1 + 7 + 49 + 343);

    std::set<std::array<PathElement, 4>> seen;
    size_t roots = 0;
    for (const auto& p : paths) {
        PathIdentifier id = PathIdentifier::from_path(p);
        assert(decodes_to(id, p));
        assert(id.depth() == p.size());
        if (id.path().empty()) ++roots;
        seen.insert(id.components());
    }
    assert(seen.size() == paths.size());
    assert(roots == 1);

    std::cout << "✅ Bijection PASS (" << paths.size() << " paths)" << std::endl;
}

void test_order_sensitivity() {
    std::cout << "Testing order sensitivity..." << std::endl;

    assert(PathIdentifier::from_path({3, 12}) != PathIdentifier::from_path({12, 3}));
    assert(PathIdentifier::from_path({0, 1, 2}) != PathIdentifier::from_path({2, 1, 0}));
    assert(PathIdentifier::from_path({7, 7}) == PathIdentifier::from_path({7, 7}));

    std::cout << "✅ Order sensitivity PASS" << std::endl;
}

void test_append_and_concat() {
    std::cout << "Testing append and concatenation..." << std::endl;

    PathIdentifier id;
    id.append(3);
    id.append(12);
    assert(id == PathIdentifier::from_path({3, 12}));
    assert(id.child(5) == PathIdentifier::from_path({3, 12, 5}));
    assert(id == PathIdentifier::from_path({3, 12}));  // child() leaves id alone

    PathIdentifier head = PathIdentifier::from_path({3, 12});
    PathIdentifier tail = PathIdentifier::from_path({5, 1, 21});
    assert(head * tail == PathIdentifier::from_path({3, 12, 5, 1, 21}));
    assert(tail * head == PathIdentifier::from_path({5, 1, 21, 3, 12}));
    assert(PathIdentifier::root() * tail == tail);
    assert(head * PathIdentifier::root() == head);

    PathIdentifier acc;
    acc *= PathIdentifier::from_element(3);
    acc *= PathIdentifier::from_path({12, 5});
    assert(decodes_to(acc, {3, 12, 5}));

    std::cout << "✅ Append and concatenation PASS" << std::endl;
}

void test_restartable_walk() {
    std::cout << "Testing restartable lazy decode..." << std::endl;

    PathIdentifier id = PathIdentifier::from_path({3, 12, 5});
    auto walk = id.path();

    auto it = walk.begin();
    assert(*it == 3);
    ++it;
    assert(*it == 12);

    // A fresh begin() starts over; the identifier is untouched
    auto again = walk.begin();
    assert(*again == 3);
    assert(has_components(id, 502, 71, 99, 14));

    PathVector first;
    PathVector second;
    for (PathElement e : walk) first.push_back(e);
    for (PathElement e : walk) second.push_back(e);
    assert(first == second);
    assert(walk.size() == 3);

    std::cout << "✅ Restartable decode PASS" << std::endl;
}

void test_ordering() {
    std::cout << "Testing tree ordering..." << std::endl;

    std::vector<PathIdentifier> sorted = {
        PathIdentifier::parse(""),
        PathIdentifier::parse("0"),
        PathIdentifier::parse("0.5"),
        PathIdentifier::parse("1"),
        PathIdentifier::parse("3.12"),
        PathIdentifier::parse("3.12.5"),
        PathIdentifier::parse("12"),
    };
    for (size_t i = 0; i + 1 < sorted.size(); ++i) {
        assert(sorted[i] < sorted[i + 1]);
        assert(!(sorted[i + 1] < sorted[i]));
    }
    assert((PathIdentifier::parse("3.12") <=> PathIdentifier::parse("3.12")) == 0);

    std::cout << "✅ Tree ordering PASS" << std::endl;
}

void test_ordering_matches_decoded_vectors() {
    std::cout << "Testing ordering against decoded vectors..." << std::endl;

    std::vector<PathVector> paths(1);  // the root
    for (PathElement x = 0; x < 5; ++x) {
        paths.push_back({x});
        for (PathElement y = 0; y < 5; ++y) {
            paths.push_back({x, y});
            paths.push_back({x, y, x + y});
        }
    }

    for (const auto& p : paths) {
        for (const auto& q : paths) {
            auto expected = p <=> q;
            PathIdentifier lhs = PathIdentifier::from_path(p);
            PathIdentifier rhs = PathIdentifier::from_path(q);
            assert((lhs <=> rhs) == expected);
            assert((PathRatio::of(lhs) <=> PathRatio::of(rhs)) == expected);
            assert(lhs.path().compare(PathRatio::of(rhs).path()) == expected);
        }
    }

    std::cout << "✅ Ordering against decoded vectors PASS" << std::endl;
}

void test_text_form() {
    std::cout << "Testing text form..." << std::endl;

    PathIdentifier id = PathIdentifier::parse("3.12.5");
    assert(id.to_string() == "3.12.5");
    assert(PathIdentifier::parse(id.to_string()) == id);
    assert(PathIdentifier::parse("03.012").to_string() == "3.12");

    std::ostringstream oss;
    oss << id;
    assert(oss.str() == "3.12.5");

    std::cout << "✅ Text form PASS" << std::endl;
}

void test_overflow() {
    std::cout << "Testing overflow detection..." << std::endl;

    const PathElement max = std::numeric_limits<PathElement>::max();

    // Largest single element that still fits after the offset
    PathIdentifier big = PathIdentifier::from_element(max - PATH_FUDGE);
    assert(decodes_to(big, {max - PATH_FUDGE}));

    bool threw = false;
    try {
        (void)PathIdentifier::from_element(max - 1);
    } catch (const PathOverflowError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)big.child(0);
    } catch (const PathOverflowError&) {
        threw = true;
    }
    assert(threw);

    // Deep paths of zeros grow like (1 + sqrt 2)^n
    threw = false;
    try {
        (void)PathIdentifier::from_path(PathVector(100, 0));
    } catch (const PathError&) {
        threw = true;
    }
    assert(threw);

    // Failed append leaves the identifier unchanged
    PathIdentifier id = PathIdentifier::from_path({3});
    threw = false;
    try {
        id.append(max);
    } catch (const PathOverflowError&) {
        threw = true;
    }
    assert(threw);
    assert(decodes_to(id, {3}));

    std::cout << "✅ Overflow detection PASS" << std::endl;
}

int main() {
    std::cout << "=== PathIdentifier Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_encode_known_vectors();
        test_decode_known_vectors();
        test_root();
        test_exhaustive_bijection();
        test_order_sensitivity();
        test_append_and_concat();
        test_restartable_walk();
        test_ordering();
        test_ordering_matches_decoded_vectors();
        test_text_form();
        test_overflow();

        std::cout << std::endl;
        std::cout << "=== All PathIdentifier Tests PASSED ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cout << "❌ Test failed: " << e.what() << std::endl;
        return 1;
    }
}
