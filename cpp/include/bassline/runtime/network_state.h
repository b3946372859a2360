#ifndef BASSLINE_NETWORK_STATE_H
#define BASSLINE_NETWORK_STATE_H

#include <bassline/bassline_base.h>
#include <bassline/types/gadget.h>
#include <bassline/types/group.h>

#include <map>
#include <optional>

namespace bassline {

    /**
     * A live primitive group: the shared gadget spec plus the port -> contact mapping, the input
     * snapshot of the last successful invocation (pure gadgets only) and the group's own body state.
     */
    struct BASSLINE_EXPORT GadgetInstance {
        GroupId                          group_id;
        gadget_spec_s_ptr                spec;
        std::map<std::string, ContactId> input_contacts{};
        std::map<std::string, ContactId> output_contacts{};
        std::optional<PortValues>        last_inputs{};
        PortValues                       state{};
    };

    /**
     * Everything a network owns: the group arena and the indices that make contact, wire and gadget
     * lookups independent of where in the tree they live. The indices are kept in step with the
     * arena by the index_ / unindex_ calls.
     */
    struct BASSLINE_EXPORT NetworkState {
        GroupArena                             groups;
        id_map<ContactId, GroupId>             contact_owner;
        id_map<WireId, GroupId>                wire_owner;
        id_map<ContactId, std::vector<WireId>> wires_by_contact;
        id_map<GroupId, GadgetInstance>        gadgets;
        id_map<ContactId, GroupId>             gadget_inputs;

        [[nodiscard]] bool has_contact(const ContactId &id) const { return contact_owner.contains(id); }

        [[nodiscard]] bool has_wire(const WireId &id) const { return wire_owner.contains(id); }

        [[nodiscard]] Contact *find_contact(const ContactId &id);

        [[nodiscard]] const Contact *find_contact(const ContactId &id) const;

        /**
         * Throws StructuralError for unknown ids.
         */
        [[nodiscard]] Contact &contact(const ContactId &id);

        [[nodiscard]] const Contact &contact(const ContactId &id) const;

        [[nodiscard]] const Wire *find_wire(const WireId &id) const;

        [[nodiscard]] const Wire &wire(const WireId &id) const;

        [[nodiscard]] const GroupId &owner_of_contact(const ContactId &id) const;

        [[nodiscard]] std::vector<WireId> wires_touching(const ContactId &id) const;

        [[nodiscard]] GadgetInstance *find_gadget(const GroupId &group_id);

        void index_contact(const GroupId &group_id, const ContactId &contact_id);

        void unindex_contact(const ContactId &contact_id);

        void index_wire(const GroupId &group_id, const Wire &wire);

        void unindex_wire(const WireId &wire_id);

        /**
         * Index every contact and wire of the group and, when primitive, register its gadget instance.
         */
        void index_group(const Group &group, gadget_spec_s_ptr gadget = nullptr);

        void unindex_group(const Group &group);
    };

} // namespace bassline

#endif  // BASSLINE_NETWORK_STATE_H
