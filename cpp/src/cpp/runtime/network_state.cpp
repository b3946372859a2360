#include <bassline/runtime/network_state.h>
#include <bassline/types/error_type.h>
#include <bassline/util/errors.h>

#include <algorithm>

namespace bassline {

    Contact *NetworkState::find_contact(const ContactId &id) {
        auto owner{contact_owner.find(id)};
        if (owner == contact_owner.end()) { return nullptr; }
        auto *group{groups.find(owner->second)};
        if (group == nullptr) { return nullptr; }
        auto it{group->contacts.find(id)};
        return it == group->contacts.end() ? nullptr : &it->second;
    }

    const Contact *NetworkState::find_contact(const ContactId &id) const {
        return const_cast<NetworkState *>(this)->find_contact(id);
    }

    Contact &NetworkState::contact(const ContactId &id) {
        auto *result{find_contact(id)};
        if (result == nullptr) { throw_error<StructuralError>("Unknown contact '{}'", id); }
        return *result;
    }

    const Contact &NetworkState::contact(const ContactId &id) const {
        return const_cast<NetworkState *>(this)->contact(id);
    }

    const Wire *NetworkState::find_wire(const WireId &id) const {
        auto owner{wire_owner.find(id)};
        if (owner == wire_owner.end()) { return nullptr; }
        const auto *group{groups.find(owner->second)};
        if (group == nullptr) { return nullptr; }
        auto it{group->wires.find(id)};
        return it == group->wires.end() ? nullptr : &it->second;
    }

    const Wire &NetworkState::wire(const WireId &id) const {
        const auto *result{find_wire(id)};
        if (result == nullptr) { throw_error<StructuralError>("Unknown wire '{}'", id); }
        return *result;
    }

    const GroupId &NetworkState::owner_of_contact(const ContactId &id) const {
        auto it{contact_owner.find(id)};
        if (it == contact_owner.end()) { throw_error<StructuralError>("Unknown contact '{}'", id); }
        return it->second;
    }

    std::vector<WireId> NetworkState::wires_touching(const ContactId &id) const {
        auto it{wires_by_contact.find(id)};
        return it == wires_by_contact.end() ? std::vector<WireId>{} : it->second;
    }

    GadgetInstance *NetworkState::find_gadget(const GroupId &group_id) {
        auto it{gadgets.find(group_id)};
        return it == gadgets.end() ? nullptr : &it->second;
    }

    void NetworkState::index_contact(const GroupId &group_id, const ContactId &contact_id) {
        contact_owner.insert_or_assign(contact_id, group_id);
    }

    void NetworkState::unindex_contact(const ContactId &contact_id) {
        contact_owner.erase(contact_id);
        wires_by_contact.erase(contact_id);
        gadget_inputs.erase(contact_id);
    }

    void NetworkState::index_wire(const GroupId &group_id, const Wire &wire) {
        wire_owner.insert_or_assign(wire.id, group_id);
        wires_by_contact[wire.from_id].push_back(wire.id);
        wires_by_contact[wire.to_id].push_back(wire.id);
    }

    void NetworkState::unindex_wire(const WireId &wire_id) {
        const auto *wire{find_wire(wire_id)};
        if (wire != nullptr) {
            for (const auto &endpoint : {wire->from_id, wire->to_id}) {
                auto it{wires_by_contact.find(endpoint)};
                if (it == wires_by_contact.end()) { continue; }
                std::erase(it->second, wire_id);
                if (it->second.empty()) { wires_by_contact.erase(it); }
            }
        }
        wire_owner.erase(wire_id);
    }

    void NetworkState::index_group(const Group &group, gadget_spec_s_ptr gadget) {
        for (const auto &[contact_id, _] : group.contacts) { index_contact(group.id, contact_id); }
        for (const auto &[_, wire] : group.wires) { index_wire(group.id, wire); }
        if (gadget == nullptr) { return; }

        GadgetInstance instance{group.id, gadget};
        for (const auto &[contact_id, contact] : group.contacts) {
            if (gadget->has_input(contact.name) && contact.boundary_direction == BoundaryDirection::Input) {
                instance.input_contacts.emplace(contact.name, contact_id);
                gadget_inputs.insert_or_assign(contact_id, group.id);
            } else if (gadget->has_output(contact.name)) {
                instance.output_contacts.emplace(contact.name, contact_id);
            }
        }
        gadgets.insert_or_assign(group.id, std::move(instance));
    }

    void NetworkState::unindex_group(const Group &group) {
        for (const auto &[wire_id, _] : group.wires) { unindex_wire(wire_id); }
        for (const auto &[contact_id, _] : group.contacts) { unindex_contact(contact_id); }
        gadgets.erase(group.id);
    }

} // namespace bassline
