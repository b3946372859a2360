/**
 * Unit tests for the lattice merge
 */

#include <catch2/catch_test_macros.hpp>
#include <bassline/types/error_type.h>
#include <bassline/types/merge.h>
#include <limits>
#include <optional>
#include <vector>

using namespace bassline;

// ============================================================================
// Identity and idempotence
// ============================================================================

TEST_CASE("merge - none is the identity", "[merge]") {
    auto set{LatticeValue::grow_set({1})};
    REQUIRE(merge(LatticeValue::none(), set) == set);
    REQUIRE(merge(set, LatticeValue::none()) == set);
    REQUIRE(merge_into(std::nullopt, LatticeValue{5}) == LatticeValue{5});
}

TEST_CASE("merge - equal operands are idempotent", "[merge]") {
    REQUIRE(merge(LatticeValue{3}, LatticeValue{3}) == LatticeValue{3});
    REQUIRE(merge(LatticeValue{"a"}, LatticeValue{"a"}) == LatticeValue{"a"});
    auto map{LatticeValue::grow_map({{"k", LatticeValue::grow_set({1})}})};
    REQUIRE(merge(map, map) == map);
}

TEST_CASE("merge - unequal scalars contradict", "[merge]") {
    REQUIRE_THROWS_AS(merge(LatticeValue{1}, LatticeValue{2}), Contradiction);
    try {
        (void)merge(LatticeValue{true}, LatticeValue{"x"});
        FAIL("expected a contradiction");
    } catch (const Contradiction &e) {
        REQUIRE(e.reason == "Values cannot be merged");
        REQUIRE(e.left == LatticeValue{true});
        REQUIRE(e.right == LatticeValue{"x"});
    }
}

TEST_CASE("merge - NaN contradicts every other number", "[merge]") {
    auto nan{LatticeValue{std::numeric_limits<double>::quiet_NaN()}};
    REQUIRE_THROWS_AS(merge(LatticeValue{5}, nan), Contradiction);
    REQUIRE_THROWS_AS(merge(nan, LatticeValue{5}), Contradiction);
    REQUIRE(merge(nan, nan) == nan);
    REQUIRE(merge(LatticeValue::grow_set({nan}), LatticeValue::grow_set({1})) == LatticeValue::grow_set({1, nan}));
}

// ============================================================================
// Tagged sets
// ============================================================================

TEST_CASE("merge - GrowSet unions", "[merge][set]") {
    REQUIRE(merge(LatticeValue::grow_set({1, 2}), LatticeValue::grow_set({2, 3})) == LatticeValue::grow_set({1, 2, 3}));
}

TEST_CASE("merge - ShrinkSet intersects", "[merge][set]") {
    REQUIRE(merge(LatticeValue::shrink_set({1, 2, 3}), LatticeValue::shrink_set({2, 3, 4})) ==
            LatticeValue::shrink_set({2, 3}));
}

TEST_CASE("merge - disjoint ShrinkSets contradict", "[merge][set]") {
    try {
        (void)merge(LatticeValue::shrink_set({1}), LatticeValue::shrink_set({2}));
        FAIL("expected a contradiction");
    } catch (const Contradiction &e) {
        REQUIRE(e.reason == "Empty set intersection");
    }
}

TEST_CASE("merge - tagged collections are commutative", "[merge][set]") {
    std::vector<std::pair<LatticeValue, LatticeValue>> cases{
        {LatticeValue::grow_set({1, 2}), LatticeValue::grow_set({3})},
        {LatticeValue::shrink_set({1, 2, 3}), LatticeValue::shrink_set({3, 2})},
        {LatticeValue::grow_array({1, 1, 2}), LatticeValue::grow_array({2, 2, 3})},
        {LatticeValue::shrink_array({1, 1, 2}), LatticeValue::shrink_array({1, 2, 2})},
        {LatticeValue::grow_map({{"a", 1}}), LatticeValue::grow_map({{"b", 2}})},
        {LatticeValue::shrink_map({{"a", 1}, {"b", 2}}), LatticeValue::shrink_map({{"b", 2}, {"c", 3}})},
    };
    for (const auto &[lhs, rhs] : cases) { REQUIRE(merge(lhs, rhs) == merge(rhs, lhs)); }
}

TEST_CASE("merge - chained merges are associative", "[merge][set]") {
    auto a{LatticeValue::grow_set({1})};
    auto b{LatticeValue::grow_set({2})};
    auto c{LatticeValue::grow_set({1, 3})};
    REQUIRE(merge(merge(a, b), c) == merge(a, merge(b, c)));
}

TEST_CASE("merge - different tags contradict", "[merge][set]") {
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_set({1}), LatticeValue::shrink_set({1, 2})), Contradiction);
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_set({1}), LatticeValue::grow_array({1})), Contradiction);
}

// ============================================================================
// Tagged arrays
// ============================================================================

TEST_CASE("merge - GrowArray keeps the larger multiplicity", "[merge][array]") {
    REQUIRE(merge(LatticeValue::grow_array({2, 1, 1}), LatticeValue::grow_array({1, 3})) ==
            LatticeValue::grow_array({1, 1, 2, 3}));
}

TEST_CASE("merge - ShrinkArray keeps the smaller multiplicity", "[merge][array]") {
    REQUIRE(merge(LatticeValue::shrink_array({1, 1, 2}), LatticeValue::shrink_array({1, 1, 1, 3})) ==
            LatticeValue::shrink_array({1, 1}));
}

TEST_CASE("merge - empty ShrinkArray intersection contradicts", "[merge][array]") {
    try {
        (void)merge(LatticeValue::shrink_array({1}), LatticeValue::shrink_array({2}));
        FAIL("expected a contradiction");
    } catch (const Contradiction &e) {
        REQUIRE(e.reason == "Empty array intersection");
    }
}

// ============================================================================
// Tagged maps
// ============================================================================

TEST_CASE("merge - GrowMap unions keys and merges shared values", "[merge][map]") {
    auto lhs{LatticeValue::grow_map({{"a", LatticeValue::grow_set({1})}, {"b", 1}})};
    auto rhs{LatticeValue::grow_map({{"a", LatticeValue::grow_set({2})}, {"c", 3}})};
    auto expected{LatticeValue::grow_map({{"a", LatticeValue::grow_set({1, 2})}, {"b", 1}, {"c", 3}})};
    REQUIRE(merge(lhs, rhs) == expected);
}

TEST_CASE("merge - GrowMap conflicting values contradict", "[merge][map]") {
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_map({{"a", 1}}), LatticeValue::grow_map({{"a", 2}})), Contradiction);
}

TEST_CASE("merge - ShrinkMap keeps common keys", "[merge][map]") {
    auto lhs{LatticeValue::shrink_map({{"a", 1}, {"b", 2}})};
    auto rhs{LatticeValue::shrink_map({{"b", 2}, {"c", 3}})};
    REQUIRE(merge(lhs, rhs) == LatticeValue::shrink_map({{"b", 2}}));
}

TEST_CASE("merge - disjoint ShrinkMaps contradict", "[merge][map]") {
    try {
        (void)merge(LatticeValue::shrink_map({{"a", 1}}), LatticeValue::shrink_map({{"b", 1}}));
        FAIL("expected a contradiction");
    } catch (const Contradiction &e) {
        REQUIRE(e.reason == "Empty map intersection");
    }
}

// ============================================================================
// Plain collections
// ============================================================================

TEST_CASE("merge - plain value is read as the tagged kind it meets", "[merge][plain]") {
    REQUIRE(merge(LatticeValue::grow_set({1}), LatticeValue::set({2})) == LatticeValue::grow_set({1, 2}));
    REQUIRE(merge(LatticeValue::set({2, 3}), LatticeValue::shrink_set({1, 2})) == LatticeValue::shrink_set({2}));
    REQUIRE(merge(LatticeValue::array({1}), LatticeValue::grow_array({2})) == LatticeValue::grow_array({1, 2}));
    REQUIRE(merge(LatticeValue::dict({{"a", 1}}), LatticeValue::grow_map({{"b", 2}})) ==
            LatticeValue::grow_map({{"a", 1}, {"b", 2}}));
}

TEST_CASE("merge - tagged value against a plain value of another shape contradicts", "[merge][plain]") {
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_set({1}), LatticeValue::array({1})), Contradiction);
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_map({{"a", 1}}), LatticeValue::set({1})), Contradiction);
    REQUIRE_THROWS_AS(merge(LatticeValue::grow_set({1}), LatticeValue{1}), Contradiction);
}

TEST_CASE("merge - plain sets union", "[merge][plain]") {
    REQUIRE(merge(LatticeValue::set({1}), LatticeValue::set({2})) == LatticeValue::set({1, 2}));
}

TEST_CASE("merge - plain arrays concatenate and never contradict", "[merge][plain]") {
    REQUIRE(merge(LatticeValue::array({1, 2}), LatticeValue::array({2, 3})) == LatticeValue::array({1, 2, 2, 3}));
    // Concatenation depends on operand order.
    REQUIRE_FALSE(merge(LatticeValue::array({1}), LatticeValue::array({2})) ==
                  merge(LatticeValue::array({2}), LatticeValue::array({1})));
}

TEST_CASE("merge - plain dicts merge recursively and nested conflicts contradict", "[merge][plain]") {
    auto lhs{LatticeValue::dict({{"a", LatticeValue::set({1})}, {"b", "x"}})};
    auto rhs{LatticeValue::dict({{"a", LatticeValue::set({2})}})};
    REQUIRE(merge(lhs, rhs) == LatticeValue::dict({{"a", LatticeValue::set({1, 2})}, {"b", "x"}}));

    REQUIRE_THROWS_AS(merge(LatticeValue::dict({{"b", "x"}}), LatticeValue::dict({{"b", "y"}})), Contradiction);
}

TEST_CASE("merge - mixed plain shapes contradict", "[merge][plain]") {
    REQUIRE_THROWS_AS(merge(LatticeValue::set({1}), LatticeValue::array({1})), Contradiction);
    REQUIRE_THROWS_AS(merge(LatticeValue::dict({}), LatticeValue::array({})), Contradiction);
}
