/**
 * Step cap, rollback, re-entrancy and propagation observers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <bassline/gadgets/primitive_gadgets.h>
#include <bassline/runtime/network.h>
#include <bassline/runtime/observers/propagation_trace.h>
#include <bassline/types/error_type.h>

#include <memory>
#include <sstream>
#include <stdexcept>

using namespace bassline;
using Catch::Matchers::ContainsSubstring;

namespace {
    /**
     * c -> not.a, not.result -> c with c AcceptLast: every pass flips c.
     */
    struct Oscillator {
        explicit Oscillator(std::size_t cap = 50)
            : network{make_primitive_registry(), NetworkConfig{.max_propagation_steps = cap}} {
            network.create_primitive_gadget(root, "logic/not", "not");
            network.add_contact(root, ContactSpec{.id = "c", .blend_mode = BlendMode::AcceptLast});
            network.add_contact(root, ContactSpec{.id = "stable"});
            network.connect("c", "not.a", WireKind::Directed);
            network.connect("not.result", "c", WireKind::Directed);
        }

        PropagationNetwork network;
        GroupId            root{network.add_group(std::nullopt, "root", "root")};
    };

    struct CountingObserver : PropagationObserver {
        std::size_t passes{0};
        std::size_t updates{0};
        std::size_t suppressed{0};
        std::size_t gadget_runs{0};
        std::size_t faults{0};
        std::size_t non_convergence{0};

        void on_after_propagation(const PropagationResult &) override { ++passes; }
        void on_contact_updated(const Contact &, const std::optional<LatticeValue> &) override { ++updates; }
        void on_delivery_suppressed(const ContactId &, const ContactId &) override { ++suppressed; }
        void on_after_gadget_evaluation(const GroupId &, const GadgetSpec &, const PortValues &) override {
            ++gadget_runs;
        }
        void on_gadget_fault(const GadgetFault &) override { ++faults; }
        void on_non_convergence(const NonConvergenceError &) override { ++non_convergence; }
    };

    struct ThrowingObserver : PropagationObserver {
        void on_contact_updated(const Contact &, const std::optional<LatticeValue> &) override {
            throw std::runtime_error("observer failure");
        }
    };
} // namespace

// ============================================================================
// Step cap and rollback
// ============================================================================

TEST_CASE("Scheduler - an AcceptLast cycle hits the step cap", "[scheduler][convergence]") {
    Oscillator t;
    try {
        t.network.update_contact("c", LatticeValue{true});
        FAIL("expected NonConvergenceError");
    } catch (const NonConvergenceError &e) {
        REQUIRE(e.limit == 50);
        REQUIRE(e.steps == 50);
        REQUIRE_THAT(std::string{e.what()}, ContainsSubstring("did not converge"));
    }
}

TEST_CASE("Scheduler - a non-convergent pass is rolled back", "[scheduler][convergence]") {
    Oscillator t;
    t.network.update_contact("stable", LatticeValue::grow_set({1}));

    REQUIRE_THROWS_AS(t.network.update_contact("c", LatticeValue{true}), NonConvergenceError);
    REQUIRE_FALSE(t.network.get_contact("c").has_content());
    REQUIRE_FALSE(t.network.get_contact("not.a").has_content());
    REQUIRE_FALSE(t.network.get_contact("not.result").has_content());
    REQUIRE(t.network.get_contact("stable").content == LatticeValue::grow_set({1}));

    // The network is usable afterwards.
    auto result{t.network.update_contact("stable", LatticeValue::grow_set({2}))};
    REQUIRE(result.ok());
    REQUIRE(t.network.get_contact("stable").content == LatticeValue::grow_set({1, 2}));
}

TEST_CASE("Scheduler - structural changes survive a rolled back pass", "[scheduler][convergence]") {
    Oscillator t;
    t.network.add_contact(t.root, ContactSpec{.id = "seed", .blend_mode = BlendMode::AcceptLast,
                                              .content = LatticeValue{false}});
    REQUIRE_THROWS_AS(t.network.connect("seed", "c", WireKind::Directed), NonConvergenceError);
    REQUIRE(t.network.get_state(t.root).wires.size() == 3);
    REQUIRE_FALSE(t.network.get_contact("c").has_content());
}

TEST_CASE("Scheduler - the default cap lets large acyclic networks settle", "[scheduler][convergence]") {
    PropagationNetwork network{make_primitive_registry()};
    auto               root{network.add_group(std::nullopt, "root", "root")};
    ContactId          previous{network.add_contact(root, ContactSpec{.id = "n0"})};
    for (int i = 1; i < 200; ++i) {
        auto next{network.add_contact(root, ContactSpec{.id = fmt::format("n{}", i)})};
        network.connect(previous, next);
        previous = next;
    }
    auto result{network.update_contact("n0", LatticeValue::grow_set({"x"}))};
    REQUIRE(result.updated_contacts.size() == 200);
    REQUIRE(network.get_contact("n199").content == LatticeValue::grow_set({"x"}));
}

// ============================================================================
// Idempotence and re-entrancy
// ============================================================================

TEST_CASE("Scheduler - writing the current value does no work", "[scheduler]") {
    PropagationNetwork network{make_primitive_registry()};
    auto               root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "a"});
    network.add_contact(root, ContactSpec{.id = "b"});
    network.connect("a", "b");
    network.update_contact("a", LatticeValue::grow_set({1, 2}));

    auto result{network.update_contact("a", LatticeValue::grow_set({1}))};
    REQUIRE(result.steps == 0);
    REQUIRE(result.updated_contacts.empty());
}

TEST_CASE("Scheduler - propagate is not re-entrant", "[scheduler]") {
    auto registry{std::make_shared<GadgetRegistry>()};
    PropagationNetwork *network_ptr{nullptr};
    registry->register_gadget(GadgetSpec{
        .qualified_name = "test/reenter",
        .inputs = {"a"},
        .outputs = {"result"},
        .body = SyncBody{[&network_ptr](const PortValues &) -> PortValues {
            network_ptr->propagate();
            return {};
        }},
    });

    PropagationNetwork network{registry};
    network_ptr = &network;
    auto root{network.add_group(std::nullopt, "root", "root")};
    network.create_primitive_gadget(root, "test/reenter", "g");
    network.add_contact(root, ContactSpec{.id = "in"});
    network.connect("in", "g.a");

    auto result{network.update_contact("in", LatticeValue{1})};
    REQUIRE(result.gadget_faults.size() == 1);
    REQUIRE_THAT(result.gadget_faults[0].error_msg, ContainsSubstring("propagation pass is running"));
}

// ============================================================================
// Observers
// ============================================================================

TEST_CASE("Observers - hooks are called for each event", "[observer]") {
    PropagationNetwork network{make_primitive_registry()};
    auto               observer{std::make_shared<CountingObserver>()};
    network.add_observer(observer);

    auto root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "x", .blend_mode = BlendMode::AcceptLast});
    network.add_contact(root, ContactSpec{.id = "y", .blend_mode = BlendMode::AcceptLast});
    network.create_primitive_gadget(root, "math/divide", "div");
    network.connect("x", "div.a");
    network.connect("y", "div.b");

    network.update_contact("x", LatticeValue{4});
    network.update_contact("y", LatticeValue{2});
    REQUIRE(observer->gadget_runs == 1);
    REQUIRE(observer->suppressed > 0);

    network.update_contact("y", LatticeValue{0});
    REQUIRE(observer->faults == 1);
    REQUIRE(observer->passes >= 3);
    REQUIRE(observer->updates > 0);

    network.remove_observer(observer);
    auto updates{observer->updates};
    network.update_contact("x", LatticeValue{8});
    REQUIRE(observer->updates == updates);
}

TEST_CASE("Observers - non-convergence is reported", "[observer]") {
    Oscillator t;
    auto       observer{std::make_shared<CountingObserver>()};
    t.network.add_observer(observer);
    REQUIRE_THROWS_AS(t.network.update_contact("c", LatticeValue{true}), NonConvergenceError);
    REQUIRE(observer->non_convergence == 1);
    REQUIRE(observer->passes == 0);
}

TEST_CASE("Observers - a throwing observer does not break propagation", "[observer]") {
    PropagationNetwork network{make_primitive_registry()};
    network.add_observer(std::make_shared<ThrowingObserver>());
    REQUIRE_THROWS_AS(network.add_observer(nullptr), std::invalid_argument);

    auto root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "a"});
    network.add_contact(root, ContactSpec{.id = "b"});
    network.connect("a", "b");
    REQUIRE_NOTHROW(network.update_contact("a", LatticeValue{1}));
    REQUIRE(network.get_contact("b").content == LatticeValue{1});
}

TEST_CASE("PropagationTrace - writes pass, contact and gadget events", "[observer][trace]") {
    std::ostringstream out;
    PropagationNetwork network{make_primitive_registry()};
    network.add_observer(std::make_shared<PropagationTrace>(std::nullopt, true, true, true, true, &out));

    auto root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "x", .blend_mode = BlendMode::AcceptLast});
    network.create_primitive_gadget(root, "math/negate", "neg");
    network.connect("x", "neg.a");
    network.update_contact("x", LatticeValue{3});

    auto text{out.str()};
    REQUIRE_THAT(text, ContainsSubstring("Propagation Start"));
    REQUIRE_THAT(text, ContainsSubstring("Propagation Done"));
    REQUIRE_THAT(text, ContainsSubstring("x (AcceptLast) <unset> -> 3"));
    REQUIRE_THAT(text, ContainsSubstring("math/negate<neg>(a=3) [IN]"));
    REQUIRE_THAT(text, ContainsSubstring("math/negate<neg> -> (result=-3) [OUT]"));
}

TEST_CASE("PropagationTrace - filter and categories restrict the output", "[observer][trace]") {
    std::ostringstream out;
    PropagationNetwork network{make_primitive_registry()};
    network.add_observer(std::make_shared<PropagationTrace>(std::string{"keep"}, false, true, false, true, &out));

    auto root{network.add_group(std::nullopt, "root", "root")};
    network.add_contact(root, ContactSpec{.id = "keep-me"});
    network.add_contact(root, ContactSpec{.id = "drop-me"});
    network.update_contact("keep-me", LatticeValue{1});
    network.update_contact("drop-me", LatticeValue{2});

    auto text{out.str()};
    REQUIRE_THAT(text, ContainsSubstring("keep-me"));
    REQUIRE_THAT(text, !ContainsSubstring("drop-me"));
    REQUIRE_THAT(text, !ContainsSubstring("Propagation Start"));
}
