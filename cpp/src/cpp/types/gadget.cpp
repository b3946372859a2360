#include <bassline/types/error_type.h>
#include <bassline/types/gadget.h>
#include <bassline/util/errors.h>

#include <algorithm>

namespace bassline {

    ActivationFn all_inputs_present(std::vector<std::string> inputs) {
        return [inputs = std::move(inputs)](const PortValues &available) {
            return std::all_of(inputs.begin(), inputs.end(),
                               [&available](const std::string &port) { return available.contains(port); });
        };
    }

    ActivationFn any_input_present(std::vector<std::string> inputs) {
        return [inputs = std::move(inputs)](const PortValues &available) {
            return std::any_of(inputs.begin(), inputs.end(),
                               [&available](const std::string &port) { return available.contains(port); });
        };
    }

    bool GadgetSpec::is_ready(const PortValues &available) const {
        if (activation) { return activation(available); }
        return std::all_of(inputs.begin(), inputs.end(),
                           [&available](const std::string &port) { return available.contains(port); });
    }

    bool GadgetSpec::has_input(const std::string &port) const {
        return std::find(inputs.begin(), inputs.end(), port) != inputs.end();
    }

    bool GadgetSpec::has_output(const std::string &port) const {
        return std::find(outputs.begin(), outputs.end(), port) != outputs.end();
    }

    PortValues GadgetSpec::invoke(const PortValues &inputs_) const {
        PortValues state;
        return invoke(inputs_, state);
    }

    PortValues GadgetSpec::invoke(const PortValues &inputs_, PortValues &state) const {
        auto produced{std::visit(
            [&inputs_, &state](const auto &body_) -> PortValues {
                using T = std::decay_t<decltype(body_)>;
                if constexpr (std::is_same_v<T, AsyncBody>) {
                    return body_(inputs_).get();
                } else if constexpr (std::is_same_v<T, StatefulBody>) {
                    return body_(inputs_, state);
                } else {
                    return body_(inputs_);
                }
            },
            body)};
        std::erase_if(produced, [this](const auto &entry) { return !has_output(entry.first); });
        return produced;
    }

    gadget_spec_s_ptr GadgetRegistry::register_gadget(GadgetSpec spec) {
        if (spec.qualified_name.empty()) { throw StructuralError("Gadget registered without a qualified name"); }
        if (_gadgets.contains(spec.qualified_name)) {
            throw_error<StructuralError>("Gadget '{}' is already registered", spec.qualified_name);
        }
        auto has_body{std::visit([](const auto &body_) { return static_cast<bool>(body_); }, spec.body)};
        if (!has_body) { throw_error<StructuralError>("Gadget '{}' has no body", spec.qualified_name); }

        auto name{spec.qualified_name};
        auto registered{std::make_shared<const GadgetSpec>(std::move(spec))};
        _gadgets.emplace(std::move(name), registered);
        return registered;
    }

    bool GadgetRegistry::contains(const std::string &qualified_name) const { return _gadgets.contains(qualified_name); }

    gadget_spec_s_ptr GadgetRegistry::find(const std::string &qualified_name) const {
        auto it{_gadgets.find(qualified_name)};
        return it == _gadgets.end() ? nullptr : it->second;
    }

    gadget_spec_s_ptr GadgetRegistry::get(const std::string &qualified_name) const {
        auto spec{find(qualified_name)};
        if (spec == nullptr) { throw_error<StructuralError>("Unknown gadget '{}'", qualified_name); }
        return spec;
    }

    std::vector<std::string> GadgetRegistry::names() const {
        std::vector<std::string> result;
        result.reserve(_gadgets.size());
        for (const auto &[name, _] : _gadgets) { result.push_back(name); }
        return result;
    }

} // namespace bassline
