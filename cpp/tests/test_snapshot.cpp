/**
 * Flatten / import and the JSON snapshot codec
 */

#include <catch2/catch_test_macros.hpp>
#include <bassline/gadgets/primitive_gadgets.h>
#include <bassline/runtime/network.h>
#include <bassline/serialization/snapshot_json.h>
#include <bassline/types/error_type.h>

using namespace bassline;

namespace {
    /**
     * calc: lhs, rhs -> sum (math/add) -> total
     */
    GroupId build_calculator(PropagationNetwork &network) {
        auto calc{network.add_group(std::nullopt, "calculator", "calc")};
        network.add_contact(calc, ContactSpec{.id = "lhs", .blend_mode = BlendMode::AcceptLast});
        network.add_contact(calc, ContactSpec{.id = "rhs", .blend_mode = BlendMode::AcceptLast});
        network.add_contact(calc, ContactSpec{.id = "total", .blend_mode = BlendMode::AcceptLast});
        network.add_contact(calc, ContactSpec{.id = "tags"});
        network.create_primitive_gadget(calc, "math/add", "sum");
        network.connect("lhs", "sum.a");
        network.connect("rhs", "sum.b");
        network.connect("sum.result", "total");
        network.update_contact("lhs", LatticeValue{2});
        network.update_contact("rhs", LatticeValue{5});
        network.update_contact("tags", LatticeValue::grow_set({"draft"}));
        return calc;
    }

    nlohmann::json to_json_value(const LatticeValue &value) {
        nlohmann::json j;
        to_json(j, value);
        return j;
    }

    LatticeValue from_json_value(const nlohmann::json &j) {
        LatticeValue value;
        from_json(j, value);
        return value;
    }

    Group linked_group(const GroupId &id, std::optional<GroupId> parent, std::vector<GroupId> subgroups) {
        return Group{.id = id, .name = id, .parent_id = std::move(parent), .subgroup_ids = std::move(subgroups)};
    }
} // namespace

// ============================================================================
// Value codec
// ============================================================================

TEST_CASE("snapshot_json - scalars map onto JSON scalars", "[json]") {
    REQUIRE(to_json_value(LatticeValue{}).is_null());
    REQUIRE(to_json_value(LatticeValue{true}) == nlohmann::json(true));
    REQUIRE(to_json_value(LatticeValue{1.5}) == nlohmann::json(1.5));
    REQUIRE(to_json_value(LatticeValue{"s"}) == nlohmann::json("s"));
    REQUIRE(from_json_value(nlohmann::json(3)) == LatticeValue{3});
}

TEST_CASE("snapshot_json - tagged collections carry their tag", "[json]") {
    auto grow_set{to_json_value(LatticeValue::grow_set({2, 1}))};
    REQUIRE(grow_set["_tag"] == "GrowSet");
    REQUIRE(grow_set["values"] == nlohmann::json::parse("[1, 2]"));

    auto shrink_array{to_json_value(LatticeValue::shrink_array({1}))};
    REQUIRE(shrink_array["_tag"] == "ShrinkArray");
    REQUIRE(shrink_array.contains("items"));

    auto grow_map{to_json_value(LatticeValue::grow_map({{"k", 1}}))};
    REQUIRE(grow_map["_tag"] == "GrowMap");
    REQUIRE(grow_map["entries"]["k"] == 1);

    REQUIRE(to_json_value(LatticeValue::set({1}))["_tag"] == "Set");
    REQUIRE(to_json_value(LatticeValue::array({1})).is_array());
    REQUIRE(to_json_value(LatticeValue::dict({{"k", 1}})) == nlohmann::json::parse(R"({"k": 1})"));
}

TEST_CASE("snapshot_json - tagged values read back", "[json]") {
    auto value{LatticeValue::grow_map(
        {{"members", LatticeValue::shrink_set({"a", "b"})}, {"log", LatticeValue::grow_array({1, 1})}})};
    REQUIRE(from_json_value(to_json_value(value)) == value);
    REQUIRE(from_json_value(nlohmann::json::parse(R"({"_tag": "ShrinkSet", "values": [3, 1]})")) ==
            LatticeValue::shrink_set({1, 3}));
}

TEST_CASE("snapshot_json - a dict holding a _tag key is wrapped", "[json]") {
    auto value{LatticeValue::dict({{"_tag", "user data"}, {"n", 1}})};
    auto j{to_json_value(value)};
    REQUIRE(j["_tag"] == "Dict");
    REQUIRE(j["entries"]["_tag"] == "user data");
    REQUIRE(from_json_value(j) == value);
}

TEST_CASE("snapshot_json - an unknown tag reads as a plain dict", "[json]") {
    auto value{from_json_value(nlohmann::json::parse(R"({"_tag": "Mystery", "values": [1]})"))};
    REQUIRE(value.kind() == ValueKind::Dict);
    REQUIRE(*value.find("_tag") == LatticeValue{"Mystery"});
}

// ============================================================================
// Flatten and import
// ============================================================================

TEST_CASE("Snapshot - flatten captures the subtree and contents", "[snapshot]") {
    PropagationNetwork network{make_primitive_registry()};
    auto               calc{build_calculator(network)};
    REQUIRE(network.get_contact("total").content == LatticeValue{7});

    auto snapshot{network.flatten(calc)};
    REQUIRE(snapshot.root_id == "calc");
    REQUIRE(snapshot.groups.size() == 2);
    REQUIRE(snapshot.groups.at("sum").primitive_id == "math/add");
    REQUIRE(snapshot.root().contacts.at("total").content == LatticeValue{7});
    REQUIRE(snapshot.root().wires.size() == 3);
}

TEST_CASE("Snapshot - import into a fresh network restores state and behaviour", "[snapshot]") {
    PropagationNetwork source{make_primitive_registry()};
    auto               snapshot{source.flatten(build_calculator(source))};

    PropagationNetwork target{make_primitive_registry()};
    auto               root{target.import_snapshot(snapshot)};
    REQUIRE(root == "calc");
    REQUIRE(target.flatten(root) == snapshot);
    REQUIRE(target.get_contact("tags").content == LatticeValue::grow_set({"draft"}));
    REQUIRE(target.last_result().steps == 0);

    // The imported gadget is live.
    target.update_contact("rhs", LatticeValue{10});
    REQUIRE(target.get_contact("total").content == LatticeValue{12});
}

TEST_CASE("Snapshot - round trip through JSON text", "[snapshot][json]") {
    PropagationNetwork source{make_primitive_registry()};
    auto               snapshot{source.flatten(build_calculator(source))};

    auto text{dump_snapshot(snapshot, 2)};
    auto parsed{parse_snapshot(text)};
    REQUIRE(parsed == snapshot);

    PropagationNetwork target{make_primitive_registry()};
    target.import_snapshot(parsed);
    REQUIRE(target.flatten("calc") == snapshot);
    REQUIRE(dump_snapshot(target.flatten("calc")) == dump_snapshot(snapshot));
}

TEST_CASE("Snapshot - import under a parent group", "[snapshot]") {
    PropagationNetwork source{make_primitive_registry()};
    auto               snapshot{source.flatten(build_calculator(source))};

    PropagationNetwork  target{make_primitive_registry()};
    auto                host{target.add_group(std::nullopt, "host", "host")};
    std::vector<Change> changes;
    target.subscribe(host, [&changes](const Change &change) { changes.push_back(change); });

    target.import_snapshot(snapshot, host);
    REQUIRE(target.get_state("calc").parent_id == host);
    REQUIRE(target.get_state(host).subgroup_ids == std::vector<GroupId>{"calc"});
    REQUIRE(changes.back().type == ChangeType::StateImported);
}

TEST_CASE("Snapshot - import rejects bad snapshots and leaves the network untouched", "[snapshot]") {
    PropagationNetwork source{make_primitive_registry()};
    auto               snapshot{source.flatten(build_calculator(source))};

    SECTION("ids already in use") {
        REQUIRE_THROWS_AS(source.import_snapshot(snapshot), StructuralError);
    }
    SECTION("unknown primitive") {
        snapshot.groups.at("sum").primitive_id = "math/unknown";
        PropagationNetwork target{make_primitive_registry()};
        REQUIRE_THROWS_AS(target.import_snapshot(snapshot), StructuralError);
        REQUIRE_FALSE(target.has_group("calc"));
        REQUIRE_FALSE(target.has_contact("lhs"));
    }
    SECTION("wire endpoint that does not resolve") {
        snapshot.groups.at("calc").wires.begin()->second.to_id = "elsewhere";
        PropagationNetwork target{make_primitive_registry()};
        REQUIRE_THROWS_AS(target.import_snapshot(snapshot), StructuralError);
        REQUIRE(target.root_groups().empty());
    }
    SECTION("missing subgroup record") {
        snapshot.groups.erase("sum");
        PropagationNetwork target{make_primitive_registry()};
        REQUIRE_THROWS_AS(target.import_snapshot(snapshot), StructuralError);
    }
}

TEST_CASE("Snapshot - import rejects inconsistent parent and subgroup links", "[snapshot]") {
    PropagationNetwork target{make_primitive_registry()};
    GroupSnapshot      snapshot{.root_id = "a"};

    SECTION("subgroup listing the root") {
        snapshot.groups = {{"a", linked_group("a", std::nullopt, {"b"})}, {"b", linked_group("b", "a", {"a"})}};
    }
    SECTION("group listed by two parents") {
        snapshot.groups = {{"a", linked_group("a", std::nullopt, {"b", "c"})},
                           {"b", linked_group("b", "a", {"c"})},
                           {"c", linked_group("c", "b", {})}};
    }
    SECTION("cycle detached from the root") {
        snapshot.groups = {{"a", linked_group("a", std::nullopt, {})},
                           {"x", linked_group("x", "y", {"y"})},
                           {"y", linked_group("y", "x", {"x"})}};
    }
    SECTION("subgroup listed twice") {
        snapshot.groups = {{"a", linked_group("a", std::nullopt, {"b", "b"})}, {"b", linked_group("b", "a", {})}};
    }

    REQUIRE_THROWS_AS(target.import_snapshot(snapshot), StructuralError);
    REQUIRE(target.root_groups().empty());
    REQUIRE_FALSE(target.has_group("a"));
    REQUIRE_FALSE(target.has_group("b"));
    REQUIRE_FALSE(target.has_group("c"));
}

TEST_CASE("Snapshot - values JSON cannot hold fail to dump", "[snapshot][json]") {
    PropagationNetwork network{make_primitive_registry()};
    auto               root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "bytes", .content = LatticeValue{std::string{"\xff\xfe"}}});
    REQUIRE_THROWS_AS(dump_snapshot(network.flatten(root)), StructuralError);
}

TEST_CASE("Snapshot - malformed JSON is a structural error", "[snapshot][json]") {
    REQUIRE_THROWS_AS(parse_snapshot("{not json"), StructuralError);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"groups": {}})"), StructuralError);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"rootId": "r", "groups": {}})"), StructuralError);
}
