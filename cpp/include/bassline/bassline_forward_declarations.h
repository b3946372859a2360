#ifndef BASSLINE_FORWARD_DECLARATIONS_H
#define BASSLINE_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace bassline {
    // Identifiers are plain strings so that snapshots can carry them verbatim.
    using ContactId = std::string;
    using WireId = std::string;
    using GroupId = std::string;
    using SessionId = std::string;
    using SubscriptionId = std::uint64_t;

    class LatticeValue;

    struct Contact;
    struct Wire;
    struct Group;

    struct GroupSnapshot;

    // GadgetSpec - immutable once registered, shared between registry and instances
    struct GadgetSpec;
    using gadget_spec_s_ptr = std::shared_ptr<const GadgetSpec>;

    struct GadgetRegistry;
    using gadget_registry_s_ptr = std::shared_ptr<const GadgetRegistry>;

    struct TopologySpec;
    struct GroupBuilder;

    struct NetworkState;
    struct PropagationResult;
    struct PropagationScheduler;

    struct PropagationObserver;
    using propagation_observer_ptr = PropagationObserver*;
    using propagation_observer_s_ptr = std::shared_ptr<PropagationObserver>;

    struct PropagationNetwork;
    using propagation_network_s_ptr = std::shared_ptr<PropagationNetwork>;

    struct Change;
    using change_callback = std::function<void(const Change &)>;
} // namespace bassline

#endif  // BASSLINE_FORWARD_DECLARATIONS_H
