#include <bassline/runtime/network.h>
#include <bassline/types/error_type.h>
#include <bassline/util/errors.h>
#include <bassline/util/scope.h>

#include <algorithm>
#include <cstdio>

namespace bassline {

    std::string_view to_string(ChangeType type) {
        switch (type) {
            case ChangeType::ContactAdded: return "ContactAdded";
            case ChangeType::ContactUpdated: return "ContactUpdated";
            case ChangeType::ContactRemoved: return "ContactRemoved";
            case ChangeType::WireAdded: return "WireAdded";
            case ChangeType::WireRemoved: return "WireRemoved";
            case ChangeType::GroupAdded: return "GroupAdded";
            case ChangeType::GroupRemoved: return "GroupRemoved";
            case ChangeType::GroupUpdated: return "GroupUpdated";
            case ChangeType::Contradiction: return "Contradiction";
            case ChangeType::GadgetFault: return "GadgetFault";
            case ChangeType::StateImported: return "StateImported";
        }
        return "Unknown";
    }

    PropagationNetwork::PropagationNetwork(gadget_registry_s_ptr registry, NetworkConfig config)
        : _registry{std::move(registry)}, _config{std::move(config)}, _scheduler{_state, _config},
          _builder{_registry, [this](IdKind kind) { return _next_id(kind); }} {
    }

    // ============================================================================
    // Groups
    // ============================================================================

    GroupId PropagationNetwork::add_group(const std::optional<GroupId> &parent_id, std::string name, GroupId id) {
        if (parent_id.has_value()) { _require_composite(*parent_id); }
        if (id.empty()) { id = _next_id(IdKind::Group); }
        if (_state.groups.contains(id)) { throw_error<StructuralError>("Duplicate group id '{}'", id); }

        Group group;
        group.id        = id;
        group.name      = name.empty() ? id : std::move(name);
        group.parent_id = parent_id;
        _state.groups.insert(std::move(group));
        if (parent_id.has_value()) { _mutable_group(*parent_id).subgroup_ids.push_back(id); }

        _record(Change{ChangeType::GroupAdded, id});
        _flush();
        return id;
    }

    void PropagationNetwork::remove_group(const GroupId &group_id) {
        const auto &root{get_state(group_id)};
        auto        parent_id{root.parent_id};
        auto        subtree{_state.groups.subtree(group_id)};

        // Changes are recorded while the groups still exist so that their scope resolves.
        for (const auto &id : subtree) {
            for (const auto &[contact_id, _] : _state.groups.get(id).contacts) {
                for (const auto &wire_id : _state.wires_touching(contact_id)) {
                    if (_state.has_wire(wire_id)) { _remove_wire(wire_id); }
                }
            }
        }
        for (auto it = subtree.rbegin(); it != subtree.rend(); ++it) {
            _record(Change{ChangeType::GroupRemoved, *it});
        }

        if (parent_id.has_value()) {
            for (const auto &boundary_id : root.boundary_contact_ids) { _unexpose(*parent_id, boundary_id); }
            std::erase(_mutable_group(*parent_id).subgroup_ids, group_id);
        }
        for (auto it = subtree.rbegin(); it != subtree.rend(); ++it) {
            _state.unindex_group(_state.groups.get(*it));
            _state.groups.erase(*it);
        }
        _flush();
    }

    GroupId PropagationNetwork::register_group(const TopologySpec &spec, const std::optional<GroupId> &parent) {
        if (parent.has_value()) { _require_composite(*parent); }
        auto snapshot{_builder.make_instance(spec, parent)};
        auto root_id{_import(snapshot, parent)};

        for (const auto &[_, group] : snapshot.groups) {
            for (const auto &[contact_id, contact] : group.contacts) {
                if (contact.has_content()) { _scheduler.mark_dirty(contact_id); }
            }
        }
        _run_propagation();
        return root_id;
    }

    GroupId PropagationNetwork::create_primitive_gadget(const GroupId &parent_id, const std::string &qualified_name,
                                                        GroupId id) {
        _require_composite(parent_id);
        auto gadget{_registry->get(qualified_name)};
        if (id.empty()) { id = _next_id(IdKind::Group); }
        if (_state.groups.contains(id)) { throw_error<StructuralError>("Duplicate group id '{}'", id); }

        auto group{GroupBuilder::make_primitive_group(*gadget, id, "", parent_id)};
        for (const auto &[contact_id, _] : group.contacts) {
            if (_state.has_contact(contact_id)) {
                throw_error<StructuralError>("Duplicate contact id '{}'", contact_id);
            }
        }
        _state.index_group(group, gadget);
        auto port_ids{group.boundary_contact_ids};
        _state.groups.insert(std::move(group));
        _mutable_group(parent_id).subgroup_ids.push_back(id);

        _record(Change{ChangeType::GroupAdded, id, std::nullopt, std::nullopt, std::nullopt, qualified_name});
        for (const auto &contact_id : port_ids) { _record(Change{ChangeType::ContactAdded, id, contact_id}); }
        _flush();
        return id;
    }

    void PropagationNetwork::reparent_group(const GroupId &group_id, const std::optional<GroupId> &new_parent_id) {
        const auto &group{get_state(group_id)};
        auto        old_parent_id{group.parent_id};
        if (old_parent_id == new_parent_id) { return; }

        if (new_parent_id.has_value()) {
            _require_composite(*new_parent_id);
            if (_state.groups.is_ancestor(group_id, *new_parent_id)) {
                throw_error<StructuralError>("Cannot move group '{}' under its own descendant '{}'", group_id,
                                             *new_parent_id);
            }
        }

        auto subtree{_state.groups.subtree(group_id)};
        auto in_subtree = [&subtree](const GroupId &id) {
            return std::find(subtree.begin(), subtree.end(), id) != subtree.end();
        };
        for (const auto &boundary_id : group.boundary_contact_ids) {
            for (const auto &wire_id : _state.wires_touching(boundary_id)) {
                if (!in_subtree(_state.wire_owner.at(wire_id))) {
                    throw_error<StructuralError>("Cannot move group '{}': wire '{}' uses its boundary contact '{}'",
                                                 group_id, wire_id, boundary_id);
                }
            }
            if (old_parent_id.has_value() && _state.groups.get(*old_parent_id).exposes(boundary_id)) {
                throw_error<StructuralError>("Cannot move group '{}': its boundary contact '{}' is forwarded by '{}'",
                                             group_id, boundary_id, *old_parent_id);
            }
        }

        if (old_parent_id.has_value()) { std::erase(_mutable_group(*old_parent_id).subgroup_ids, group_id); }
        if (new_parent_id.has_value()) { _mutable_group(*new_parent_id).subgroup_ids.push_back(group_id); }
        _mutable_group(group_id).parent_id = new_parent_id;

        if (old_parent_id.has_value()) { _record(Change{ChangeType::GroupUpdated, *old_parent_id}); }
        _record(Change{ChangeType::GroupUpdated, group_id});
        _flush();
    }

    const Group &PropagationNetwork::get_state(const GroupId &group_id) const { return _state.groups.get(group_id); }

    GroupSnapshot PropagationNetwork::flatten(const GroupId &group_id) const {
        return _state.groups.flatten(group_id);
    }

    GroupId PropagationNetwork::import_snapshot(const GroupSnapshot &snapshot, const std::optional<GroupId> &parent) {
        if (parent.has_value()) { _require_composite(*parent); }
        auto root_id{_import(snapshot, parent)};
        _record(Change{ChangeType::StateImported, root_id});
        _flush();
        return root_id;
    }

    // ============================================================================
    // Contacts
    // ============================================================================

    ContactId PropagationNetwork::add_contact(const GroupId &group_id, const ContactSpec &spec) {
        _require_composite(group_id);
        auto contact_id{spec.id.empty() ? _next_id(IdKind::Contact) : spec.id};
        if (_state.has_contact(contact_id)) { throw_error<StructuralError>("Duplicate contact id '{}'", contact_id); }

        auto &group{_mutable_group(group_id)};
        group.contacts.emplace(contact_id, Contact::from_spec(contact_id, spec));
        if (spec.is_boundary) { group.boundary_contact_ids.push_back(contact_id); }
        _state.index_contact(group_id, contact_id);

        _record(Change{ChangeType::ContactAdded, group_id, contact_id, std::nullopt, spec.content});
        _flush();
        return contact_id;
    }

    PropagationResult PropagationNetwork::update_contact(const ContactId &contact_id, const LatticeValue &value) {
        if (_scheduler.is_propagating()) {
            throw std::logic_error("update_contact called while a propagation pass is running");
        }
        _scheduler.write(contact_id, value);
        return _run_propagation();
    }

    void PropagationNetwork::remove_contact(const ContactId &contact_id) {
        auto group_id{_state.owner_of_contact(contact_id)};
        if (_state.groups.get(group_id).is_primitive()) {
            throw_error<StructuralError>("Cannot remove port '{}' of primitive group '{}'", contact_id, group_id);
        }

        for (const auto &wire_id : _state.wires_touching(contact_id)) { _remove_wire(wire_id); }
        _unexpose(group_id, contact_id);

        _record(Change{ChangeType::ContactRemoved, group_id, contact_id});
        _state.unindex_contact(contact_id);
        _mutable_group(group_id).contacts.erase(contact_id);
        _flush();
    }

    const Contact &PropagationNetwork::get_contact(const ContactId &contact_id) const {
        return _state.contact(contact_id);
    }

    // ============================================================================
    // Wires
    // ============================================================================

    WireId PropagationNetwork::connect(const ContactId &from_id, const ContactId &to_id, WireKind kind) {
        if (from_id == to_id) { throw_error<StructuralError>("Cannot wire contact '{}' to itself", from_id); }
        if (!_state.has_contact(to_id)) { throw_error<StructuralError>("Unknown contact '{}'", to_id); }

        for (const auto &scope : _state.groups.ancestors(_state.owner_of_contact(from_id))) {
            if (_state.groups.resolve_owner(scope, from_id).has_value() &&
                _state.groups.resolve_owner(scope, to_id).has_value()) {
                return connect_in(scope, from_id, to_id, kind);
            }
        }
        throw_error<StructuralError>("Contacts '{}' and '{}' do not resolve in a common group", from_id, to_id);
    }

    WireId PropagationNetwork::connect_in(const GroupId &group_id, const ContactId &from_id, const ContactId &to_id,
                                          WireKind kind) {
        if (from_id == to_id) { throw_error<StructuralError>("Cannot wire contact '{}' to itself", from_id); }
        if (get_state(group_id).is_primitive()) {
            throw_error<StructuralError>("Cannot add a wire inside primitive group '{}'", group_id);
        }
        for (const auto &endpoint : {from_id, to_id}) {
            if (!_state.groups.resolve_owner(group_id, endpoint).has_value()) {
                throw_error<StructuralError>("Wire endpoint '{}' does not resolve in group '{}'", endpoint, group_id);
            }
        }

        auto wire_id{_add_wire(group_id, from_id, to_id, kind)};

        // Bring the new wire up to date with what its endpoints already hold.
        if (const auto &from{_state.contact(from_id)}; from.has_content()) {
            _scheduler.deliver(from_id, to_id, *from.content);
        }
        if (const auto &to{_state.contact(to_id)}; kind == WireKind::Bidirectional && to.has_content()) {
            _scheduler.deliver(to_id, from_id, *to.content);
        }
        _run_propagation();
        return wire_id;
    }

    void PropagationNetwork::remove_wire(const WireId &wire_id) {
        if (!_state.has_wire(wire_id)) { throw_error<StructuralError>("Unknown wire '{}'", wire_id); }
        _remove_wire(wire_id);
        _flush();
    }

    const Wire &PropagationNetwork::get_wire(const WireId &wire_id) const { return _state.wire(wire_id); }

    // ============================================================================
    // Propagation and notifications
    // ============================================================================

    PropagationResult PropagationNetwork::propagate() { return _run_propagation(); }

    SubscriptionId PropagationNetwork::subscribe(const GroupId &group_id, change_callback callback) {
        if (!_state.groups.contains(group_id)) { throw_error<StructuralError>("Unknown group '{}'", group_id); }
        if (!callback) { throw std::invalid_argument("Cannot subscribe with an empty callback"); }
        auto id{++_next_subscription};
        _subscriptions.emplace(id, Subscription{group_id, std::move(callback)});
        return id;
    }

    bool PropagationNetwork::unsubscribe(SubscriptionId subscription_id) {
        return _subscriptions.erase(subscription_id) > 0;
    }

    void PropagationNetwork::add_observer(propagation_observer_s_ptr observer) {
        _scheduler.add_observer(std::move(observer));
    }

    void PropagationNetwork::remove_observer(const propagation_observer_s_ptr &observer) {
        _scheduler.remove_observer(observer);
    }

    // ============================================================================
    // Internals
    // ============================================================================

    std::string PropagationNetwork::_next_id(IdKind kind) {
        while (true) {
            std::string id;
            switch (kind) {
                case IdKind::Contact:
                    id = fmt::format("{}-{}", _config.id_prefix_contact, ++_contact_counter);
                    if (!_state.has_contact(id)) { return id; }
                    break;
                case IdKind::Wire:
                    id = fmt::format("{}-{}", _config.id_prefix_wire, ++_wire_counter);
                    if (!_state.has_wire(id)) { return id; }
                    break;
                case IdKind::Group:
                    id = fmt::format("{}-{}", _config.id_prefix_group, ++_group_counter);
                    if (!_state.groups.contains(id)) { return id; }
                    break;
            }
        }
    }

    Group &PropagationNetwork::_mutable_group(const GroupId &group_id) { return _state.groups.get(group_id); }

    void PropagationNetwork::_require_composite(const GroupId &group_id) const {
        if (get_state(group_id).is_primitive()) {
            throw_error<StructuralError>("Primitive group '{}' cannot hold contacts, wires or subgroups", group_id);
        }
    }

    WireId PropagationNetwork::_add_wire(const GroupId &owner, const ContactId &from_id, const ContactId &to_id,
                                         WireKind kind) {
        auto wire_id{_next_id(IdKind::Wire)};
        Wire wire{wire_id, from_id, to_id, kind};
        _state.index_wire(owner, wire);
        _mutable_group(owner).wires.emplace(wire_id, std::move(wire));
        _record(Change{ChangeType::WireAdded, owner, std::nullopt, wire_id});
        return wire_id;
    }

    void PropagationNetwork::_remove_wire(const WireId &wire_id) {
        auto owner{_state.wire_owner.at(wire_id)};
        _state.unindex_wire(wire_id);
        _mutable_group(owner).wires.erase(wire_id);
        _record(Change{ChangeType::WireRemoved, owner, std::nullopt, wire_id});
    }

    void PropagationNetwork::_unexpose(const GroupId &from_group, const ContactId &contact_id) {
        std::optional<GroupId> current{from_group};
        while (current.has_value()) {
            auto &group{_mutable_group(*current)};
            if (!group.exposes(contact_id)) { return; }
            std::erase(group.boundary_contact_ids, contact_id);
            _record(Change{ChangeType::GroupUpdated, group.id});
            current = group.parent_id;
        }
    }

    GroupId PropagationNetwork::_import(const GroupSnapshot &snapshot, const std::optional<GroupId> &parent) {
        const auto &root{snapshot.root()};

        // Validate against a scratch arena first so a failed import leaves the network untouched.
        GroupArena                          scratch;
        id_set<ContactId>                   contact_ids;
        id_set<WireId>                      wire_ids;
        id_map<GroupId, gadget_spec_s_ptr>  gadgets;
        for (const auto &[id, group] : snapshot.groups) {
            if (id != group.id) { throw_error<StructuralError>("Snapshot entry '{}' holds group '{}'", id, group.id); }
            if (_state.groups.contains(id)) { throw_error<StructuralError>("Duplicate group id '{}'", id); }
            for (const auto &[contact_id, _] : group.contacts) {
                if (_state.has_contact(contact_id) || !contact_ids.insert(contact_id).second) {
                    throw_error<StructuralError>("Duplicate contact id '{}'", contact_id);
                }
            }
            for (const auto &[wire_id, _] : group.wires) {
                if (_state.has_wire(wire_id) || !wire_ids.insert(wire_id).second) {
                    throw_error<StructuralError>("Duplicate wire id '{}'", wire_id);
                }
            }
            if (group.is_primitive()) {
                auto gadget{_registry->get(*group.primitive_id)};
                if (!group.subgroup_ids.empty() || !group.wires.empty()) {
                    throw_error<StructuralError>("Primitive group '{}' cannot hold wires or subgroups", id);
                }
                for (const auto &port : gadget->inputs) {
                    if (!group.has_contact(GroupBuilder::port_contact_id(id, port))) {
                        throw_error<StructuralError>("Primitive group '{}' is missing port '{}'", id, port);
                    }
                }
                for (const auto &port : gadget->outputs) {
                    if (!group.has_contact(GroupBuilder::port_contact_id(id, port))) {
                        throw_error<StructuralError>("Primitive group '{}' is missing port '{}'", id, port);
                    }
                }
                gadgets.emplace(id, std::move(gadget));
            }
            if (id != snapshot.root_id) {
                auto parent_it{group.parent_id.has_value() ? snapshot.groups.find(*group.parent_id)
                                                           : snapshot.groups.end()};
                if (parent_it == snapshot.groups.end() || !parent_it->second.has_subgroup(id)) {
                    throw_error<StructuralError>("Group '{}' is not reachable from snapshot root '{}'", id,
                                                 snapshot.root_id);
                }
            }
            for (const auto &sub_id : group.subgroup_ids) {
                auto sub_it{snapshot.groups.find(sub_id)};
                if (sub_it == snapshot.groups.end()) {
                    throw_error<StructuralError>("Group '{}' lists missing subgroup '{}'", id, sub_id);
                }
                if (sub_id == snapshot.root_id || sub_it->second.parent_id != id) {
                    throw_error<StructuralError>("Group '{}' lists subgroup '{}' whose parent is not '{}'", id,
                                                 sub_id, id);
                }
                if (std::count(group.subgroup_ids.begin(), group.subgroup_ids.end(), sub_id) != 1) {
                    throw_error<StructuralError>("Group '{}' lists subgroup '{}' more than once", id, sub_id);
                }
            }
            auto copy{group};
            if (id == snapshot.root_id) { copy.parent_id = parent; }
            scratch.insert(std::move(copy));
        }

        // Every group names exactly one listing parent, so the walk from the root is a tree. Groups it misses sit
        // on a cycle detached from the root.
        auto members{scratch.subtree(root.id)};
        if (members.size() != snapshot.groups.size()) {
            throw_error<StructuralError>("Snapshot '{}' holds {} groups but only {} are reachable from the root",
                                         snapshot.root_id, snapshot.groups.size(), members.size());
        }

        for (const auto &[id, group] : snapshot.groups) {
            scratch.validate_boundaries(id, id == root.id);
            for (const auto &[wire_id, wire] : group.wires) {
                for (const auto &endpoint : {wire.from_id, wire.to_id}) {
                    if (!scratch.resolve_owner(id, endpoint).has_value()) {
                        throw_error<StructuralError>("Wire '{}' endpoint '{}' does not resolve in group '{}'",
                                                     wire_id, endpoint, id);
                    }
                }
            }
        }

        for (const auto &id : members) {
            auto gadget{gadgets.find(id)};
            auto group{scratch.get(id)};
            _state.index_group(group, gadget == gadgets.end() ? nullptr : gadget->second);
            _state.groups.insert(std::move(group));
            _scheduler.reset_gadget_cache(id);
        }
        if (parent.has_value()) { _mutable_group(*parent).subgroup_ids.push_back(root.id); }
        _record(Change{ChangeType::GroupAdded, root.id});
        return root.id;
    }

    PropagationResult PropagationNetwork::_run_propagation() {
        PropagationResult result;
        try {
            result = _scheduler.propagate();
        } catch (const NonConvergenceError &) {
            // Contents are rolled back, structural changes made by the operation still stand.
            _flush();
            throw;
        }
        for (const auto &contact_id : result.updated_contacts) {
            if (const auto *contact{_state.find_contact(contact_id)}; contact != nullptr) {
                _record(Change{ChangeType::ContactUpdated, _state.owner_of_contact(contact_id), contact_id,
                               std::nullopt, contact->content});
            }
        }
        for (const auto &contradiction : result.contradictions) {
            _record(Change{ChangeType::Contradiction, _state.owner_of_contact(contradiction.contact_id),
                           contradiction.contact_id, std::nullopt, contradiction.error.right,
                           contradiction.error.what()});
        }
        for (const auto &fault : result.gadget_faults) {
            _record(Change{ChangeType::GadgetFault, fault.group_id, std::nullopt, std::nullopt, std::nullopt,
                           fault.to_string()});
        }
        _last_result = result;
        _flush();
        return result;
    }

    void PropagationNetwork::_record(Change change) {
        auto scope{_state.groups.contains(change.group_id) ? _state.groups.ancestors(change.group_id)
                                                           : std::vector<GroupId>{change.group_id}};
        _pending.push_back(PendingChange{std::move(change), std::move(scope)});
    }

    void PropagationNetwork::_flush() {
        if (_flushing) { return; }
        _flushing = true;
        auto reset_flag{make_scope_exit([this]() { _flushing = false; })};

        while (!_pending.empty()) {
            auto batch{std::exchange(_pending, {})};
            std::vector<Subscription> subscribers;
            subscribers.reserve(_subscriptions.size());
            for (const auto &[_, subscription] : _subscriptions) { subscribers.push_back(subscription); }

            for (const auto &pending : batch) {
                for (const auto &subscriber : subscribers) {
                    if (std::find(pending.scope.begin(), pending.scope.end(), subscriber.group_id) ==
                        pending.scope.end()) {
                        continue;
                    }
                    try {
                        subscriber.callback(pending.change);
                    } catch (const std::exception &e) {
                        fmt::print(stderr, "Error in subscriber of '{}' ({}): {}\n", subscriber.group_id,
                                   pending.change.type, e.what());
                    }
                }
            }
        }
    }

} // namespace bassline
