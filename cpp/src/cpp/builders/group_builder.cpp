#include <bassline/builders/group_builder.h>
#include <bassline/types/error_type.h>
#include <bassline/util/errors.h>

#include <utility>

namespace bassline {

    GroupBuilder::GroupBuilder(gadget_registry_s_ptr registry, id_generator next_id)
        : _registry{std::move(registry)}, _next_id{std::move(next_id)} {
        if (_registry == nullptr) { throw std::invalid_argument("GroupBuilder requires a gadget registry"); }
        if (!_next_id) { throw std::invalid_argument("GroupBuilder requires an id generator"); }
    }

    GroupSnapshot GroupBuilder::make_instance(const TopologySpec &spec, const std::optional<GroupId> &parent) const {
        GroupArena        arena;
        id_set<ContactId> contact_ids;
        id_set<WireId>    wire_ids;
        auto              root_id{_build(spec, parent, arena, contact_ids, wire_ids)};
        return arena.flatten(root_id);
    }

    ContactId GroupBuilder::port_contact_id(const GroupId &group, const std::string &port) {
        return fmt::format("{}.{}", group, port);
    }

    Group GroupBuilder::make_primitive_group(const GadgetSpec &gadget, GroupId id, std::string name,
                                             std::optional<GroupId> parent) {
        Group group;
        group.id           = std::move(id);
        group.name         = name.empty() ? gadget.qualified_name : std::move(name);
        group.parent_id    = std::move(parent);
        group.primitive_id = gadget.qualified_name;

        auto add_port = [&group](const std::string &port, BoundaryDirection direction) {
            auto contact_id{port_contact_id(group.id, port)};
            if (group.contacts.contains(contact_id)) {
                throw_error<StructuralError>("Gadget '{}' declares port '{}' twice", *group.primitive_id, port);
            }
            group.contacts.emplace(contact_id, Contact{contact_id, port, std::nullopt, BlendMode::AcceptLast, true,
                                                       direction});
            group.boundary_contact_ids.push_back(std::move(contact_id));
        };
        for (const auto &port : gadget.inputs) { add_port(port, BoundaryDirection::Input); }
        for (const auto &port : gadget.outputs) { add_port(port, BoundaryDirection::Output); }
        return group;
    }

    GroupId GroupBuilder::_build(const TopologySpec &spec, const std::optional<GroupId> &parent, GroupArena &arena,
                                 id_set<ContactId> &contact_ids, id_set<WireId> &wire_ids) const {
        auto group_id{spec.id.empty() ? _next_id(IdKind::Group) : spec.id};
        if (arena.contains(group_id)) { throw_error<StructuralError>("Duplicate group id '{}'", group_id); }

        if (spec.primitive_id.has_value()) {
            if (!spec.contacts.empty() || !spec.wires.empty() || !spec.subgroups.empty() ||
                !spec.forwarded_boundary_ids.empty()) {
                throw_error<StructuralError>("Primitive group '{}' ({}) cannot declare its own contents", group_id,
                                             *spec.primitive_id);
            }
            auto gadget{_registry->get(*spec.primitive_id)};
            auto group{make_primitive_group(*gadget, group_id, spec.name, parent)};
            for (const auto &[contact_id, _] : group.contacts) {
                if (!contact_ids.insert(contact_id).second) {
                    throw_error<StructuralError>("Duplicate contact id '{}'", contact_id);
                }
            }
            arena.insert(std::move(group));
            return group_id;
        }

        Group group;
        group.id        = group_id;
        group.name      = spec.name.empty() ? group_id : spec.name;
        group.parent_id = parent;
        for (const auto &contact_spec : spec.contacts) {
            auto contact_id{contact_spec.id.empty() ? _next_id(IdKind::Contact) : contact_spec.id};
            if (!contact_ids.insert(contact_id).second) {
                throw_error<StructuralError>("Duplicate contact id '{}'", contact_id);
            }
            if (contact_spec.is_boundary) { group.boundary_contact_ids.push_back(contact_id); }
            group.contacts.emplace(contact_id, Contact::from_spec(contact_id, contact_spec));
        }
        group.boundary_contact_ids.insert(group.boundary_contact_ids.end(), spec.forwarded_boundary_ids.begin(),
                                          spec.forwarded_boundary_ids.end());
        arena.insert(std::move(group));

        std::vector<GroupId> subgroup_ids;
        for (const auto &sub_spec : spec.subgroups) {
            subgroup_ids.push_back(_build(sub_spec, group_id, arena, contact_ids, wire_ids));
        }
        arena.get(group_id).subgroup_ids = std::move(subgroup_ids);

        for (const auto &wire_spec : spec.wires) {
            if (wire_spec.from_id == wire_spec.to_id) {
                throw_error<StructuralError>("Wire in group '{}' connects '{}' to itself", group_id, wire_spec.from_id);
            }
            for (const auto &endpoint : {wire_spec.from_id, wire_spec.to_id}) {
                if (!arena.resolve_owner(group_id, endpoint).has_value()) {
                    throw_error<StructuralError>("Wire endpoint '{}' does not resolve in group '{}'", endpoint,
                                                 group_id);
                }
            }
            auto wire_id{wire_spec.id.empty() ? _next_id(IdKind::Wire) : wire_spec.id};
            if (!wire_ids.insert(wire_id).second) { throw_error<StructuralError>("Duplicate wire id '{}'", wire_id); }
            arena.get(group_id).wires.emplace(wire_id,
                                              Wire{wire_id, wire_spec.from_id, wire_spec.to_id, wire_spec.kind});
        }

        arena.validate_boundaries(group_id);
        return group_id;
    }

} // namespace bassline
