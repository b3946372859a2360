#include <bassline/gadgets/primitive_gadgets.h>
#include <bassline/util/errors.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace bassline {

    namespace {
        const LatticeValue &port(const PortValues &inputs, const std::string &name) {
            auto it{inputs.find(name)};
            if (it == inputs.end()) { throw_error<std::invalid_argument>("Missing input '{}'", name); }
            return it->second;
        }

        GadgetSpec binary(std::string name, std::string category, std::string description,
                          std::function<LatticeValue(const LatticeValue &, const LatticeValue &)> fn) {
            return GadgetSpec{
                .qualified_name = std::move(name),
                .inputs = {"a", "b"},
                .outputs = {"result"},
                .activation = all_inputs_present({"a", "b"}),
                .body = SyncBody{[fn = std::move(fn)](const PortValues &inputs) {
                    return PortValues{{"result", fn(port(inputs, "a"), port(inputs, "b"))}};
                }},
                .is_pure = true,
                .category = std::move(category),
                .description = std::move(description),
            };
        }

        GadgetSpec unary(std::string name, std::string category, std::string description,
                         std::function<LatticeValue(const LatticeValue &)> fn) {
            return GadgetSpec{
                .qualified_name = std::move(name),
                .inputs = {"a"},
                .outputs = {"result"},
                .activation = all_inputs_present({"a"}),
                .body = SyncBody{[fn = std::move(fn)](const PortValues &inputs) {
                    return PortValues{{"result", fn(port(inputs, "a"))}};
                }},
                .is_pure = true,
                .category = std::move(category),
                .description = std::move(description),
            };
        }

        int compare_ordered(const LatticeValue &a, const LatticeValue &b) {
            if (a.is_number() && b.is_number()) {
                auto lhs{a.as_number()}, rhs{b.as_number()};
                return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
            }
            if (a.is_string() && b.is_string()) { return a.as_string().compare(b.as_string()); }
            throw_error<std::invalid_argument>("Cannot order {} and {}", a.kind(), b.kind());
        }
    } // namespace

    void register_primitive_gadgets(GadgetRegistry &registry) {
        // Math
        registry.register_gadget(binary("math/add", "math", "a + b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_number() + b.as_number()};
        }));
        registry.register_gadget(binary("math/subtract", "math", "a - b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_number() - b.as_number()};
        }));
        registry.register_gadget(binary("math/multiply", "math", "a * b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_number() * b.as_number()};
        }));
        registry.register_gadget(binary("math/divide", "math", "a / b", [](const auto &a, const auto &b) {
            auto divisor{b.as_number()};
            if (divisor == 0.0) { throw std::domain_error("Division by zero"); }
            return LatticeValue{a.as_number() / divisor};
        }));
        registry.register_gadget(unary("math/negate", "math", "-a", [](const auto &a) {
            return LatticeValue{-a.as_number()};
        }));
        registry.register_gadget(unary("math/abs", "math", "|a|", [](const auto &a) {
            return LatticeValue{std::fabs(a.as_number())};
        }));

        // Comparison
        registry.register_gadget(binary("compare/equals", "compare", "a == b", [](const auto &a, const auto &b) {
            return LatticeValue{a == b};
        }));
        registry.register_gadget(binary("compare/less-than", "compare", "a < b", [](const auto &a, const auto &b) {
            return LatticeValue{compare_ordered(a, b) < 0};
        }));
        registry.register_gadget(binary("compare/greater-than", "compare", "a > b", [](const auto &a, const auto &b) {
            return LatticeValue{compare_ordered(a, b) > 0};
        }));

        // Logic
        registry.register_gadget(binary("logic/and", "logic", "a && b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_bool() && b.as_bool()};
        }));
        registry.register_gadget(binary("logic/or", "logic", "a || b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_bool() || b.as_bool()};
        }));
        registry.register_gadget(unary("logic/not", "logic", "!a", [](const auto &a) {
            return LatticeValue{!a.as_bool()};
        }));

        // Strings
        registry.register_gadget(binary("string/concat", "string", "a followed by b", [](const auto &a, const auto &b) {
            return LatticeValue{a.as_string() + b.as_string()};
        }));
        registry.register_gadget(unary("string/uppercase", "string", "a in upper case", [](const auto &a) {
            auto text{a.as_string()};
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return LatticeValue{std::move(text)};
        }));

        // Control
        registry.register_gadget(unary("control/identity", "control", "a, unchanged", [](const auto &a) { return a; }));
        registry.register_gadget(GadgetSpec{
            .qualified_name = "control/gate",
            .inputs = {"value", "control"},
            .outputs = {"result"},
            .activation = any_input_present({"value", "control"}),
            .body = SyncBody{[](const PortValues &inputs) {
                auto control{inputs.find("control")};
                auto value{inputs.find("value")};
                if (control == inputs.end() || value == inputs.end() || !control->second.as_bool()) {
                    return PortValues{};
                }
                return PortValues{{"result", value->second}};
            }},
            .is_pure = true,
            .category = "control",
            .description = "value while control is true",
        });
        registry.register_gadget(GadgetSpec{
            .qualified_name = "control/sequence",
            .inputs = {"trigger"},
            .outputs = {"result"},
            .activation = all_inputs_present({"trigger"}),
            .body = StatefulBody{[](const PortValues &, PortValues &state) {
                auto count{state.contains("count") ? state.at("count").as_number() + 1 : 1.0};
                state.insert_or_assign("count", LatticeValue{count});
                return PortValues{{"result", LatticeValue{count}}};
            }},
            .is_pure = false,
            .category = "control",
            .description = "an increasing counter, one step per activation",
        });
    }

    gadget_registry_s_ptr make_primitive_registry() {
        auto registry{std::make_shared<GadgetRegistry>()};
        register_primitive_gadgets(*registry);
        return registry;
    }

} // namespace bassline
