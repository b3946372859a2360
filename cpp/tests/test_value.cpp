/**
 * Unit tests for bassline::LatticeValue
 *
 * Construction, canonical storage, ordering and formatting.
 */

#include <catch2/catch_test_macros.hpp>
#include <bassline/types/value.h>
#include <limits>
#include <stdexcept>
#include <string>

using namespace bassline;

// ============================================================================
// Scalars
// ============================================================================

TEST_CASE("LatticeValue - default is none", "[value][scalar]") {
    LatticeValue value;
    REQUIRE(value.is_none());
    REQUIRE(value.kind() == ValueKind::None);
    REQUIRE(value.is_scalar());
    REQUIRE(value == LatticeValue::none());
}

TEST_CASE("LatticeValue - scalar kinds", "[value][scalar]") {
    REQUIRE(LatticeValue{true}.is_bool());
    REQUIRE(LatticeValue{42}.is_number());
    REQUIRE(LatticeValue{2.5}.as_number() == 2.5);
    REQUIRE(LatticeValue{"text"}.is_string());
    REQUIRE(LatticeValue{std::string{"text"}}.as_string() == "text");
}

TEST_CASE("LatticeValue - integers and doubles are the same number", "[value][scalar]") {
    REQUIRE(LatticeValue{1} == LatticeValue{1.0});
    REQUIRE_FALSE(LatticeValue{1} == LatticeValue{"1"});
}

TEST_CASE("LatticeValue - accessors reject the wrong kind", "[value][scalar]") {
    REQUIRE_THROWS_AS(LatticeValue{1}.as_string(), std::invalid_argument);
    REQUIRE_THROWS_AS(LatticeValue{"x"}.as_bool(), std::invalid_argument);
    REQUIRE_THROWS_AS(LatticeValue{}.as_number(), std::invalid_argument);
}

// ============================================================================
// Collections
// ============================================================================

TEST_CASE("LatticeValue - sets are sorted and unique", "[value][collection]") {
    auto set{LatticeValue::grow_set({3, 1, 2, 1})};
    REQUIRE(set.size() == 3);
    REQUIRE(set.elements()[0] == LatticeValue{1});
    REQUIRE(set.elements()[2] == LatticeValue{3});
    REQUIRE(set == LatticeValue::grow_set({1, 2, 3}));
    REQUIRE(set.contains(2));
    REQUIRE_FALSE(set.contains(4));
}

TEST_CASE("LatticeValue - arrays keep order and duplicates", "[value][collection]") {
    auto array{LatticeValue::array({2, 1, 2})};
    REQUIRE(array.size() == 3);
    REQUIRE(array.elements()[0] == LatticeValue{2});
    REQUIRE_FALSE(array == LatticeValue::array({1, 2, 2}));
}

TEST_CASE("LatticeValue - maps sort keys and the last duplicate wins", "[value][collection]") {
    auto map{LatticeValue::dict({{"b", 2}, {"a", 1}, {"b", 3}})};
    REQUIRE(map.size() == 2);
    REQUIRE(map.keys()[0] == "a");
    REQUIRE(map.keys()[1] == "b");
    REQUIRE(*map.find("b") == LatticeValue{3});
    REQUIRE(map.find("c") == nullptr);
}

TEST_CASE("LatticeValue - same content with different tags differs", "[value][collection]") {
    REQUIRE_FALSE(LatticeValue::grow_set({1}) == LatticeValue::shrink_set({1}));
    REQUIRE_FALSE(LatticeValue::set({1}) == LatticeValue::grow_set({1}));
}

TEST_CASE("LatticeValue - with_kind relabels within a shape", "[value][collection]") {
    auto plain{LatticeValue::set({1, 2})};
    REQUIRE(plain.with_kind(ValueKind::GrowSet) == LatticeValue::grow_set({1, 2}));
    REQUIRE_THROWS_AS(plain.with_kind(ValueKind::GrowArray), std::invalid_argument);
}

TEST_CASE("LatticeValue - factories check the shape", "[value][collection]") {
    REQUIRE_THROWS_AS(LatticeValue::collection(ValueKind::GrowMap, {1}), std::invalid_argument);
    REQUIRE_THROWS_AS(LatticeValue::map(ValueKind::GrowSet, LatticeValue::entries_type{}), std::invalid_argument);
}

TEST_CASE("LatticeValue - nested values compare structurally", "[value][collection]") {
    auto lhs{LatticeValue::dict({{"xs", LatticeValue::grow_set({1, 2})}})};
    auto rhs{LatticeValue::dict({{"xs", LatticeValue::grow_set({2, 1})}})};
    REQUIRE(lhs == rhs);
}

// ============================================================================
// Ordering and formatting
// ============================================================================

TEST_CASE("LatticeValue - ordering is by kind then content", "[value][order]") {
    REQUIRE(LatticeValue{} < LatticeValue{false});
    REQUIRE(LatticeValue{false} < LatticeValue{true});
    REQUIRE(LatticeValue{1} < LatticeValue{2});
    REQUIRE(LatticeValue{100} < LatticeValue{"a"});
    REQUIRE(LatticeValue::array({1}) < LatticeValue::array({1, 0}));
    REQUIRE(LatticeValue{"a"}.compare(LatticeValue{"a"}) == 0);
}

TEST_CASE("LatticeValue - sets of mixed kinds are well defined", "[value][order]") {
    auto set{LatticeValue::grow_set({"b", 1, true, "a", 1})};
    REQUIRE(set.size() == 4);
    REQUIRE(set.elements()[0] == LatticeValue{true});
    REQUIRE(set.elements()[1] == LatticeValue{1});
    REQUIRE(set.elements()[2] == LatticeValue{"a"});
}

TEST_CASE("LatticeValue - NaN equals only NaN and sorts after other numbers", "[value][order]") {
    auto nan{LatticeValue{std::numeric_limits<double>::quiet_NaN()}};
    auto inf{LatticeValue{std::numeric_limits<double>::infinity()}};
    REQUIRE(nan == nan);
    REQUIRE_FALSE(nan == LatticeValue{5});
    REQUIRE(LatticeValue{5} < nan);
    REQUIRE(inf < nan);
    REQUIRE(nan < LatticeValue{"a"});

    auto set{LatticeValue::grow_set({nan, 1, nan, -1})};
    REQUIRE(set.size() == 3);
    REQUIRE(set.elements()[0] == LatticeValue{-1});
    REQUIRE(set.elements()[2] == nan);
}

TEST_CASE("LatticeValue - to_string", "[value][format]") {
    REQUIRE(LatticeValue{}.to_string() == "none");
    REQUIRE(LatticeValue{true}.to_string() == "true");
    REQUIRE(LatticeValue{1}.to_string() == "1");
    REQUIRE(LatticeValue{"x"}.to_string() == "\"x\"");
    REQUIRE(LatticeValue::grow_set({2, 1}).to_string() == "GrowSet{1, 2}");
    REQUIRE(LatticeValue::array({1, 2}).to_string() == "[1, 2]");
    REQUIRE(LatticeValue::dict({{"a", 1}}).to_string() == "{a: 1}");
    REQUIRE(fmt::format("{}", LatticeValue::shrink_array({1})) == "ShrinkArray[1]");
}
