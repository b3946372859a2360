#include <bassline/types/error_type.h>
#include <bassline/types/group.h>
#include <bassline/util/errors.h>

#include <algorithm>

namespace bassline {

    bool Group::exposes(const ContactId &contact) const {
        return std::find(boundary_contact_ids.begin(), boundary_contact_ids.end(), contact) !=
               boundary_contact_ids.end();
    }

    bool Group::has_subgroup(const GroupId &group) const {
        return std::find(subgroup_ids.begin(), subgroup_ids.end(), group) != subgroup_ids.end();
    }

    const Group &GroupSnapshot::root() const {
        auto it{groups.find(root_id)};
        if (it == groups.end()) { throw_error<StructuralError>("Snapshot root '{}' is missing", root_id); }
        return it->second;
    }

    Group *GroupArena::find(const GroupId &id) {
        auto it{_groups.find(id)};
        return it == _groups.end() ? nullptr : &it->second;
    }

    const Group *GroupArena::find(const GroupId &id) const {
        auto it{_groups.find(id)};
        return it == _groups.end() ? nullptr : &it->second;
    }

    Group &GroupArena::get(const GroupId &id) {
        auto group{find(id)};
        if (group == nullptr) { throw_error<StructuralError>("Unknown group '{}'", id); }
        return *group;
    }

    const Group &GroupArena::get(const GroupId &id) const {
        auto group{find(id)};
        if (group == nullptr) { throw_error<StructuralError>("Unknown group '{}'", id); }
        return *group;
    }

    Group &GroupArena::insert(Group group) {
        if (_groups.contains(group.id)) { throw_error<StructuralError>("Duplicate group id '{}'", group.id); }
        auto id{group.id};
        return _groups.emplace(std::move(id), std::move(group)).first->second;
    }

    void GroupArena::erase(const GroupId &id) { _groups.erase(id); }

    std::vector<GroupId> GroupArena::roots() const {
        std::vector<GroupId> result;
        for (const auto &[id, group] : _groups) {
            if (!group.parent_id.has_value()) { result.push_back(id); }
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<GroupId> GroupArena::ids() const {
        std::vector<GroupId> result;
        result.reserve(_groups.size());
        for (const auto &[id, _] : _groups) { result.push_back(id); }
        std::sort(result.begin(), result.end());
        return result;
    }

    std::vector<GroupId> GroupArena::subtree(const GroupId &id) const {
        std::vector<GroupId> result{id};
        id_set<GroupId>      visited{id};
        for (std::size_t ndx = 0; ndx < result.size(); ++ndx) {
            const auto &group{get(result[ndx])};
            for (const auto &sub_id : group.subgroup_ids) {
                if (!visited.insert(sub_id).second) {
                    throw_error<StructuralError>("Group '{}' is reached twice below '{}'", sub_id, id);
                }
                result.push_back(sub_id);
            }
        }
        return result;
    }

    std::vector<GroupId> GroupArena::ancestors(const GroupId &id) const {
        std::vector<GroupId> result;
        std::optional<GroupId> current{id};
        while (current.has_value()) {
            const auto &group{get(*current)};
            result.push_back(group.id);
            current = group.parent_id;
        }
        return result;
    }

    bool GroupArena::is_ancestor(const GroupId &ancestor, const GroupId &id) const {
        auto chain{ancestors(id)};
        return std::find(chain.begin(), chain.end(), ancestor) != chain.end();
    }

    std::optional<GroupId> GroupArena::resolve_owner(const GroupId &scope, const ContactId &contact) const {
        const auto &group{get(scope)};
        if (group.has_contact(contact)) { return group.id; }
        for (const auto &sub_id : group.subgroup_ids) {
            const auto *sub{find(sub_id)};
            if (sub == nullptr || !sub->exposes(contact)) { continue; }
            return resolve_owner(sub_id, contact);
        }
        return std::nullopt;
    }

    void GroupArena::validate_boundaries(const GroupId &id, bool allow_free_ports) const {
        const auto &group{get(id)};
        for (const auto &boundary_id : group.boundary_contact_ids) {
            auto sources{group.has_contact(boundary_id) ? 1 : 0};
            for (const auto &sub_id : group.subgroup_ids) {
                if (get(sub_id).exposes(boundary_id)) { ++sources; }
            }
            if (sources > 1) {
                throw_error<StructuralError>("Boundary contact '{}' of group '{}' resolves to {} places", boundary_id,
                                             id, sources);
            }
            if (sources == 0 && !allow_free_ports) {
                throw_error<StructuralError>("Boundary contact '{}' of group '{}' does not resolve", boundary_id, id);
            }
            if (sources == 1 && group.has_contact(boundary_id) && !group.contacts.at(boundary_id).is_boundary) {
                throw_error<StructuralError>("Contact '{}' is exposed by group '{}' but is not a boundary contact",
                                             boundary_id, id);
            }
        }
    }

    GroupSnapshot GroupArena::flatten(const GroupId &id) const {
        GroupSnapshot snapshot{id};
        for (const auto &group_id : subtree(id)) { snapshot.groups.emplace(group_id, get(group_id)); }
        return snapshot;
    }

} // namespace bassline
