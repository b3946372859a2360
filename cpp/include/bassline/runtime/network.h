#ifndef BASSLINE_NETWORK_H
#define BASSLINE_NETWORK_H

#include <bassline/bassline_base.h>
#include <bassline/builders/group_builder.h>
#include <bassline/runtime/network_config.h>
#include <bassline/runtime/network_state.h>
#include <bassline/runtime/scheduler.h>

#include <map>
#include <optional>

namespace bassline {

    enum class ChangeType : std::uint8_t {
        ContactAdded,
        ContactUpdated,
        ContactRemoved,
        WireAdded,
        WireRemoved,
        GroupAdded,
        GroupRemoved,
        GroupUpdated,
        Contradiction,
        GadgetFault,
        StateImported
    };

    [[nodiscard]] BASSLINE_EXPORT std::string_view to_string(ChangeType type);

    struct BASSLINE_EXPORT Change {
        ChangeType                  type;
        GroupId                     group_id;
        std::optional<ContactId>    contact_id{};
        std::optional<WireId>       wire_id{};
        std::optional<LatticeValue> value{};
        std::string                 message{};
    };

    /**
     * The public surface of a propagation network: owns the group arena, its indices and the
     * scheduler, and tells subscribers what changed once each operation has settled.
     *
     * Every mutating call runs propagation to a fixpoint before returning (import_snapshot excepted)
     * and then flushes pending change notifications. A subscription on a group sees changes of that
     * group and of everything nested in it.
     */
    struct BASSLINE_EXPORT PropagationNetwork {
        using ptr = propagation_network_s_ptr;

        explicit PropagationNetwork(gadget_registry_s_ptr registry, NetworkConfig config = {});

        PropagationNetwork(const PropagationNetwork &) = delete;
        PropagationNetwork &operator=(const PropagationNetwork &) = delete;
        PropagationNetwork(PropagationNetwork &&) = delete;
        PropagationNetwork &operator=(PropagationNetwork &&) = delete;

        // Groups

        /**
         * Create an empty group, as a root when parent_id is empty. An empty id is generated.
         */
        GroupId add_group(const std::optional<GroupId> &parent_id, std::string name = "", GroupId id = "");

        /**
         * Remove a group, everything nested in it and every wire that touches one of its contacts.
         */
        void remove_group(const GroupId &group_id);

        /**
         * Build a topology under parent (or as a root), seed the contacts that carry content and
         * propagate. Returns the id of the topology's root group.
         */
        GroupId register_group(const TopologySpec &spec, const std::optional<GroupId> &parent = std::nullopt);

        /**
         * Instantiate the registered gadget qualified_name as a primitive group under parent_id.
         */
        GroupId create_primitive_gadget(const GroupId &parent_id, const std::string &qualified_name,
                                        GroupId id = "");

        void reparent_group(const GroupId &group_id, const std::optional<GroupId> &new_parent_id);

        [[nodiscard]] const Group &get_state(const GroupId &group_id) const;

        [[nodiscard]] bool has_group(const GroupId &group_id) const { return _state.groups.contains(group_id); }

        [[nodiscard]] std::vector<GroupId> root_groups() const { return _state.groups.roots(); }

        [[nodiscard]] GroupSnapshot flatten(const GroupId &group_id) const;

        /**
         * Re-create the records of snapshot under parent. Primitive ids are resolved against the
         * registry and the boundary invariant is checked; no propagation is run.
         */
        GroupId import_snapshot(const GroupSnapshot &snapshot, const std::optional<GroupId> &parent = std::nullopt);

        // Contacts

        ContactId add_contact(const GroupId &group_id, const ContactSpec &spec);

        /**
         * Write value into the contact and propagate. Throws Contradiction, leaving the network
         * untouched, when the write itself has no join with the current content.
         */
        PropagationResult update_contact(const ContactId &contact_id, const LatticeValue &value);

        void remove_contact(const ContactId &contact_id);

        [[nodiscard]] const Contact &get_contact(const ContactId &contact_id) const;

        [[nodiscard]] bool has_contact(const ContactId &contact_id) const { return _state.has_contact(contact_id); }

        // Wires

        /**
         * Wire two contacts. The wire is owned by the nearest group, starting at the source's owner and
         * walking up, in which both endpoints resolve. Current content is delivered across the new wire
         * immediately.
         */
        WireId connect(const ContactId &from_id, const ContactId &to_id, WireKind kind = WireKind::Bidirectional);

        /**
         * As connect, but the wire must resolve in (and is owned by) group_id.
         */
        WireId connect_in(const GroupId &group_id, const ContactId &from_id, const ContactId &to_id,
                          WireKind kind = WireKind::Bidirectional);

        void remove_wire(const WireId &wire_id);

        [[nodiscard]] const Wire &get_wire(const WireId &wire_id) const;

        [[nodiscard]] bool has_wire(const WireId &wire_id) const { return _state.has_wire(wire_id); }

        // Propagation

        PropagationResult propagate();

        [[nodiscard]] const PropagationResult &last_result() const { return _last_result; }

        // Notifications

        SubscriptionId subscribe(const GroupId &group_id, change_callback callback);

        bool unsubscribe(SubscriptionId subscription_id);

        void add_observer(propagation_observer_s_ptr observer);

        void remove_observer(const propagation_observer_s_ptr &observer);

        [[nodiscard]] const NetworkConfig &config() const { return _config; }

        [[nodiscard]] const GadgetRegistry &registry() const { return *_registry; }

    private:
        struct Subscription {
            GroupId         group_id;
            change_callback callback;
        };

        struct PendingChange {
            Change               change;
            std::vector<GroupId> scope;
        };

        [[nodiscard]] std::string _next_id(IdKind kind);

        [[nodiscard]] Group &_mutable_group(const GroupId &group_id);

        void _require_composite(const GroupId &group_id) const;

        WireId _add_wire(const GroupId &owner, const ContactId &from_id, const ContactId &to_id, WireKind kind);

        void _remove_wire(const WireId &wire_id);

        void _unexpose(const GroupId &from_group, const ContactId &contact_id);

        GroupId _import(const GroupSnapshot &snapshot, const std::optional<GroupId> &parent);

        PropagationResult _run_propagation();

        void _record(Change change);

        void _flush();

        gadget_registry_s_ptr _registry;
        NetworkConfig         _config;
        NetworkState          _state;
        PropagationScheduler  _scheduler;
        GroupBuilder          _builder;

        PropagationResult                      _last_result;
        std::map<SubscriptionId, Subscription> _subscriptions;
        SubscriptionId                         _next_subscription{0};
        std::vector<PendingChange>             _pending;
        bool                                   _flushing{false};
        std::size_t                            _contact_counter{0};
        std::size_t                            _wire_counter{0};
        std::size_t                            _group_counter{0};
    };

} // namespace bassline

template<>
struct fmt::formatter<bassline::ChangeType> : fmt::formatter<std::string_view> {
    auto format(bassline::ChangeType type, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(bassline::to_string(type), ctx);
    }
};

#endif  // BASSLINE_NETWORK_H
