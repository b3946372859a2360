#ifndef BASSLINE_TYPES_GADGET_H
#define BASSLINE_TYPES_GADGET_H

#include <bassline/bassline_base.h>
#include <bassline/types/value.h>

#include <functional>
#include <future>
#include <map>
#include <variant>

namespace bassline {

    // Port name -> value. Only ports that currently hold a value are present.
    using PortValues = std::map<std::string, LatticeValue>;

    using ActivationFn = std::function<bool(const PortValues &)>;
    using SyncBody = std::function<PortValues(const PortValues &)>;
    using AsyncBody = std::function<std::future<PortValues>(const PortValues &)>;
    // Second argument is state private to one primitive group, kept between activations.
    using StatefulBody = std::function<PortValues(const PortValues &, PortValues &)>;
    using GadgetBody = std::variant<SyncBody, AsyncBody, StatefulBody>;

    /**
     * Activation that requires every named input to be present.
     */
    [[nodiscard]] BASSLINE_EXPORT ActivationFn all_inputs_present(std::vector<std::string> inputs);

    /**
     * Activation that fires as soon as any of the named inputs is present.
     */
    [[nodiscard]] BASSLINE_EXPORT ActivationFn any_input_present(std::vector<std::string> inputs);

    /**
     * The closed description of a primitive computation. Resolved from the registry once, when a
     * primitive group is instantiated, and shared by every instance.
     */
    struct BASSLINE_EXPORT GadgetSpec {
        std::string              qualified_name;
        std::vector<std::string> inputs;
        std::vector<std::string> outputs;
        ActivationFn             activation{};
        GadgetBody               body{};
        bool                     is_pure{true};
        std::string              category{};
        std::string              description{};

        using ptr = gadget_spec_s_ptr;

        /**
         * Evaluate the activation predicate. With no predicate set every declared input must be present.
         */
        [[nodiscard]] bool is_ready(const PortValues &available) const;

        [[nodiscard]] bool is_async() const { return std::holds_alternative<AsyncBody>(body); }

        [[nodiscard]] bool has_input(const std::string &port) const;

        [[nodiscard]] bool has_output(const std::string &port) const;

        /**
         * Run the body and return the outputs it produced, restricted to the declared output ports.
         * Async bodies are waited on, so outputs are only ever seen complete.
         */
        [[nodiscard]] PortValues invoke(const PortValues &inputs) const;

        /**
         * As invoke, with state owned by the calling instance. Only StatefulBody reads or writes it.
         */
        [[nodiscard]] PortValues invoke(const PortValues &inputs, PortValues &state) const;
    };

    /**
     * Qualified name -> GadgetSpec. Passed explicitly to each network, there is no global instance.
     */
    struct BASSLINE_EXPORT GadgetRegistry {
        using ptr = gadget_registry_s_ptr;

        GadgetRegistry() = default;

        GadgetRegistry(const GadgetRegistry &) = delete;
        GadgetRegistry &operator=(const GadgetRegistry &) = delete;
        GadgetRegistry(GadgetRegistry &&) = default;
        GadgetRegistry &operator=(GadgetRegistry &&) = default;

        /**
         * Register a gadget; the name must be new and the body set. Throws StructuralError otherwise.
         */
        gadget_spec_s_ptr register_gadget(GadgetSpec spec);

        [[nodiscard]] bool contains(const std::string &qualified_name) const;

        [[nodiscard]] gadget_spec_s_ptr find(const std::string &qualified_name) const;

        /**
         * As find but throws StructuralError for unknown names.
         */
        [[nodiscard]] gadget_spec_s_ptr get(const std::string &qualified_name) const;

        [[nodiscard]] std::vector<std::string> names() const;

        [[nodiscard]] std::size_t size() const { return _gadgets.size(); }

    private:
        std::map<std::string, gadget_spec_s_ptr> _gadgets;
    };

} // namespace bassline

#endif  // BASSLINE_TYPES_GADGET_H
