#ifndef BASSLINE_GROUP_BUILDER_H
#define BASSLINE_GROUP_BUILDER_H

#include <bassline/bassline_base.h>
#include <bassline/types/contact.h>
#include <bassline/types/gadget.h>
#include <bassline/types/group.h>
#include <bassline/types/wire.h>

#include <functional>
#include <optional>

namespace bassline {

    enum class IdKind : std::uint8_t { Contact, Wire, Group };

    struct BASSLINE_EXPORT WireSpec {
        WireId    id{};
        ContactId from_id;
        ContactId to_id;
        WireKind  kind{WireKind::Bidirectional};
    };

    /**
     * An already-resolved description of a group tree. Ids left empty are generated when the
     * topology is built, so anything a wire refers to must carry an explicit id.
     *
     * Contacts flagged is_boundary are exposed automatically; forwarded_boundary_ids lists
     * boundary contacts of direct subgroups that this group re-exposes.
     *
     * A primitive topology names a registered gadget and declares nothing else, its ports become
     * the boundary contacts "<group id>.<port>".
     */
    struct BASSLINE_EXPORT TopologySpec {
        GroupId                    id{};
        std::string                name{};
        std::vector<ContactSpec>   contacts{};
        std::vector<WireSpec>      wires{};
        std::vector<TopologySpec>  subgroups{};
        std::vector<ContactId>     forwarded_boundary_ids{};
        std::optional<std::string> primitive_id{};
    };

    /**
     * Materialises a TopologySpec into group records. The result is a detached snapshot which the
     * network then checks against its own ids and imports.
     */
    struct BASSLINE_EXPORT GroupBuilder {
        using id_generator = std::function<std::string(IdKind)>;

        GroupBuilder(gadget_registry_s_ptr registry, id_generator next_id);

        /**
         * Build the records for spec (and its subgroups). The root group gets parent as its parent id.
         * Throws StructuralError for duplicate ids, unresolvable wires, boundary violations and
         * unknown primitives.
         */
        [[nodiscard]] GroupSnapshot make_instance(const TopologySpec &spec,
                                                  const std::optional<GroupId> &parent = std::nullopt) const;

        /**
         * A primitive group for gadget: one AcceptLast boundary contact per port, inputs with the
         * Input direction and outputs with the Output direction.
         */
        [[nodiscard]] static Group make_primitive_group(const GadgetSpec &gadget, GroupId id, std::string name,
                                                        std::optional<GroupId> parent);

        [[nodiscard]] static ContactId port_contact_id(const GroupId &group, const std::string &port);

    private:
        GroupId _build(const TopologySpec &spec, const std::optional<GroupId> &parent, GroupArena &arena,
                       id_set<ContactId> &contact_ids, id_set<WireId> &wire_ids) const;

        gadget_registry_s_ptr _registry;
        id_generator          _next_id;
    };

} // namespace bassline

#endif  // BASSLINE_GROUP_BUILDER_H
