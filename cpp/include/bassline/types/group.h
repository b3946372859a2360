#ifndef BASSLINE_TYPES_GROUP_H
#define BASSLINE_TYPES_GROUP_H

#include <bassline/bassline_base.h>
#include <bassline/types/contact.h>
#include <bassline/types/wire.h>

#include <map>
#include <optional>

namespace bassline {

    /**
     * A node of the composition tree. Parent and children are referenced by id only, the records
     * themselves live in a GroupArena.
     *
     * boundary_contact_ids lists the contacts this group exposes to its parent. Each of them is
     * either one of the group's own contacts or a boundary contact of exactly one direct subgroup
     * (forwarded).
     */
    struct BASSLINE_EXPORT Group {
        GroupId                      id;
        std::string                  name;
        std::optional<GroupId>       parent_id{};
        std::map<ContactId, Contact> contacts{};
        std::map<WireId, Wire>       wires{};
        std::vector<GroupId>         subgroup_ids{};
        std::vector<ContactId>       boundary_contact_ids{};
        std::optional<std::string>   primitive_id{};

        [[nodiscard]] bool is_primitive() const { return primitive_id.has_value(); }

        [[nodiscard]] bool has_contact(const ContactId &contact) const { return contacts.contains(contact); }

        [[nodiscard]] bool exposes(const ContactId &contact) const;

        [[nodiscard]] bool has_subgroup(const GroupId &group) const;

        bool operator==(const Group &other) const = default;
    };

    /**
     * A detached copy of a group and everything nested in it.
     */
    struct BASSLINE_EXPORT GroupSnapshot {
        GroupId                  root_id;
        std::map<GroupId, Group> groups{};

        [[nodiscard]] const Group &root() const;

        bool operator==(const GroupSnapshot &other) const = default;
    };

    /**
     * Flat id -> Group store. Records move when the arena grows, so callers re-look-up a group by
     * id after any insertion rather than keep a reference across it.
     */
    struct BASSLINE_EXPORT GroupArena {
        [[nodiscard]] bool contains(const GroupId &id) const { return _groups.contains(id); }

        [[nodiscard]] Group *find(const GroupId &id);

        [[nodiscard]] const Group *find(const GroupId &id) const;

        /**
         * Throws StructuralError for unknown ids.
         */
        [[nodiscard]] Group &get(const GroupId &id);

        [[nodiscard]] const Group &get(const GroupId &id) const;

        Group &insert(Group group);

        void erase(const GroupId &id);

        [[nodiscard]] std::size_t size() const { return _groups.size(); }

        [[nodiscard]] bool empty() const { return _groups.empty(); }

        [[nodiscard]] std::vector<GroupId> roots() const;

        [[nodiscard]] std::vector<GroupId> ids() const;

        /**
         * Group itself followed by every transitively nested group, parents before children. Throws StructuralError
         * when a group is listed twice (a cycle or a group with two parents).
         */
        [[nodiscard]] std::vector<GroupId> subtree(const GroupId &id) const;

        /**
         * Group itself followed by its parent chain up to the root.
         */
        [[nodiscard]] std::vector<GroupId> ancestors(const GroupId &id) const;

        [[nodiscard]] bool is_ancestor(const GroupId &ancestor, const GroupId &id) const;

        /**
         * The group that owns contact when it is seen from scope: scope itself if the contact is
         * local, otherwise the owner reached through the boundary of a direct subgroup (recursively).
         */
        [[nodiscard]] std::optional<GroupId> resolve_owner(const GroupId &scope, const ContactId &contact) const;

        /**
         * Check every boundary id of group resolves to exactly one place. With allow_free_ports the
         * unresolved ids are tolerated (the root of a detached snapshot).
         */
        void validate_boundaries(const GroupId &id, bool allow_free_ports = false) const;

        [[nodiscard]] GroupSnapshot flatten(const GroupId &id) const;

    private:
        id_map<GroupId, Group> _groups;
    };

} // namespace bassline

#endif  // BASSLINE_TYPES_GROUP_H
