#include <bassline/serialization/snapshot_json.h>
#include <bassline/types/error_type.h>
#include <bassline/util/errors.h>

#include <array>

namespace bassline {

    namespace {
        const std::string TAG_KEY{"_tag"};

        constexpr std::array TAGGED_KINDS{ValueKind::Set,         ValueKind::GrowSet,   ValueKind::ShrinkSet,
                                          ValueKind::GrowArray,   ValueKind::ShrinkArray, ValueKind::GrowMap,
                                          ValueKind::ShrinkMap,   ValueKind::Dict};

        std::optional<ValueKind> tagged_kind(std::string_view tag) {
            for (auto kind : TAGGED_KINDS) {
                if (to_string(kind) == tag) { return kind; }
            }
            return std::nullopt;
        }

        nlohmann::json encode(const LatticeValue &value) {
            nlohmann::json j;
            to_json(j, value);
            return j;
        }

        LatticeValue decode(const nlohmann::json &j) {
            LatticeValue value;
            from_json(j, value);
            return value;
        }

        nlohmann::json encode_entries(const LatticeValue &value) {
            auto entries{nlohmann::json::object()};
            for (std::size_t i = 0; i < value.keys().size(); ++i) {
                entries[value.keys()[i]] = encode(value.elements()[i]);
            }
            return entries;
        }

        nlohmann::json encode_elements(const LatticeValue &value) {
            auto elements{nlohmann::json::array()};
            for (const auto &element : value.elements()) { elements.push_back(encode(element)); }
            return elements;
        }

        LatticeValue::entries_type decode_entries(const nlohmann::json &j) {
            if (!j.is_object()) { throw_error<StructuralError>("Expected a JSON object of entries, got {}", j.type_name()); }
            LatticeValue::entries_type entries;
            for (const auto &[key, item] : j.items()) { entries.emplace_back(key, decode(item)); }
            return entries;
        }

        LatticeValue::elements_type decode_elements(const nlohmann::json &j) {
            if (!j.is_array()) { throw_error<StructuralError>("Expected a JSON array of elements, got {}", j.type_name()); }
            LatticeValue::elements_type elements;
            elements.reserve(j.size());
            for (const auto &item : j) { elements.push_back(decode(item)); }
            return elements;
        }

        template<typename Enum, std::size_t N>
        Enum parse_enum(const nlohmann::json &j, const std::array<Enum, N> &options, std::string_view what) {
            auto text{j.get<std::string>()};
            for (auto option : options) {
                if (to_string(option) == text) { return option; }
            }
            throw_error<StructuralError>("Unknown {} '{}'", what, text);
        }

        template<typename T>
        std::optional<T> optional_field(const nlohmann::json &j, const char *key) {
            auto it{j.find(key)};
            if (it == j.end() || it->is_null()) { return std::nullopt; }
            return it->template get<T>();
        }
    } // namespace

    void to_json(nlohmann::json &j, const LatticeValue &value) {
        switch (value.kind()) {
            case ValueKind::None: j = nullptr; return;
            case ValueKind::Bool: j = value.as_bool(); return;
            case ValueKind::Number: j = value.as_number(); return;
            case ValueKind::String: j = value.as_string(); return;
            case ValueKind::Array: j = encode_elements(value); return;
            case ValueKind::Dict:
                if (value.find(TAG_KEY) == nullptr) {
                    j = encode_entries(value);
                } else {
                    j = {{TAG_KEY, std::string{to_string(value.kind())}}, {"entries", encode_entries(value)}};
                }
                return;
            default: break;
        }
        j = nlohmann::json::object();
        j[TAG_KEY] = std::string{to_string(value.kind())};
        switch (value.shape()) {
            case CollectionShape::Set: j["values"] = encode_elements(value); break;
            case CollectionShape::Array: j["items"] = encode_elements(value); break;
            case CollectionShape::Map: j["entries"] = encode_entries(value); break;
            case CollectionShape::Scalar: break;
        }
    }

    void from_json(const nlohmann::json &j, LatticeValue &value) {
        switch (j.type()) {
            case nlohmann::json::value_t::null: value = LatticeValue::none(); return;
            case nlohmann::json::value_t::boolean: value = LatticeValue{j.get<bool>()}; return;
            case nlohmann::json::value_t::number_integer:
            case nlohmann::json::value_t::number_unsigned:
            case nlohmann::json::value_t::number_float: value = LatticeValue{j.get<double>()}; return;
            case nlohmann::json::value_t::string: value = LatticeValue{j.get<std::string>()}; return;
            case nlohmann::json::value_t::array: value = LatticeValue::array(decode_elements(j)); return;
            case nlohmann::json::value_t::object: break;
            default: throw_error<StructuralError>("Cannot read a lattice value from JSON {}", j.type_name());
        }

        auto tag{j.find(TAG_KEY)};
        auto kind{tag != j.end() && tag->is_string() ? tagged_kind(tag->get<std::string>()) : std::nullopt};
        if (!kind.has_value()) {
            value = LatticeValue::dict(decode_entries(j));
            return;
        }
        switch (shape_of(*kind)) {
            case CollectionShape::Set: value = LatticeValue::collection(*kind, decode_elements(j.at("values"))); return;
            case CollectionShape::Array: value = LatticeValue::collection(*kind, decode_elements(j.at("items"))); return;
            case CollectionShape::Map: value = LatticeValue::map(*kind, decode_entries(j.at("entries"))); return;
            case CollectionShape::Scalar: break;
        }
        throw_error<StructuralError>("Tag '{}' does not name a collection", *kind);
    }

    void to_json(nlohmann::json &j, const Contact &contact) {
        j = {{"id", contact.id},
             {"name", contact.name},
             {"blendMode", std::string{to_string(contact.blend_mode)}},
             {"isBoundary", contact.is_boundary}};
        if (contact.content.has_value()) { j["content"] = encode(*contact.content); }
        if (contact.boundary_direction.has_value()) {
            j["boundaryDirection"] = std::string{to_string(*contact.boundary_direction)};
        }
    }

    void from_json(const nlohmann::json &j, Contact &contact) {
        contact.id          = j.at("id").get<std::string>();
        contact.name        = j.value("name", contact.id);
        contact.blend_mode  = j.contains("blendMode")
                                  ? parse_enum(j.at("blendMode"), std::array{BlendMode::AcceptLast, BlendMode::Merge},
                                               "blend mode")
                                  : BlendMode::Merge;
        contact.is_boundary = j.value("isBoundary", false);
        contact.content     = j.contains("content") ? std::optional<LatticeValue>{decode(j.at("content"))}
                                                    : std::nullopt;
        contact.boundary_direction = std::nullopt;
        if (auto it{j.find("boundaryDirection")}; it != j.end() && !it->is_null()) {
            contact.boundary_direction = parse_enum(
                *it, std::array{BoundaryDirection::Input, BoundaryDirection::Output}, "boundary direction");
        }
    }

    void to_json(nlohmann::json &j, const Wire &wire) {
        j = {{"id", wire.id}, {"fromId", wire.from_id}, {"toId", wire.to_id}, {"kind", std::string{to_string(wire.kind)}}};
    }

    void from_json(const nlohmann::json &j, Wire &wire) {
        wire.id      = j.at("id").get<std::string>();
        wire.from_id = j.at("fromId").get<std::string>();
        wire.to_id   = j.at("toId").get<std::string>();
        wire.kind    = j.contains("kind")
                           ? parse_enum(j.at("kind"), std::array{WireKind::Bidirectional, WireKind::Directed},
                                        "wire kind")
                           : WireKind::Bidirectional;
    }

    void to_json(nlohmann::json &j, const Group &group) {
        auto contacts{nlohmann::json::array()};
        for (const auto &[_, contact] : group.contacts) { contacts.push_back(nlohmann::json(contact)); }
        auto wires{nlohmann::json::array()};
        for (const auto &[_, wire] : group.wires) { wires.push_back(nlohmann::json(wire)); }

        j = {{"id", group.id},
             {"name", group.name},
             {"parentId", group.parent_id.has_value() ? nlohmann::json(*group.parent_id) : nlohmann::json()},
             {"contacts", std::move(contacts)},
             {"wires", std::move(wires)},
             {"subgroupIds", group.subgroup_ids},
             {"boundaryContactIds", group.boundary_contact_ids},
             {"primitiveId", group.primitive_id.has_value() ? nlohmann::json(*group.primitive_id)
                                                            : nlohmann::json()}};
    }

    void from_json(const nlohmann::json &j, Group &group) {
        group.id                   = j.at("id").get<std::string>();
        group.name                 = j.value("name", group.id);
        group.parent_id            = optional_field<std::string>(j, "parentId");
        group.primitive_id         = optional_field<std::string>(j, "primitiveId");
        group.subgroup_ids         = j.value("subgroupIds", std::vector<GroupId>{});
        group.boundary_contact_ids = j.value("boundaryContactIds", std::vector<ContactId>{});
        group.contacts.clear();
        group.wires.clear();
        for (const auto &item : j.value("contacts", nlohmann::json::array())) {
            auto contact{item.get<Contact>()};
            auto id{contact.id};
            if (!group.contacts.emplace(std::move(id), std::move(contact)).second) {
                throw_error<StructuralError>("Duplicate contact '{}' in group '{}'", item.at("id").get<std::string>(),
                                             group.id);
            }
        }
        for (const auto &item : j.value("wires", nlohmann::json::array())) {
            auto wire{item.get<Wire>()};
            auto id{wire.id};
            if (!group.wires.emplace(std::move(id), std::move(wire)).second) {
                throw_error<StructuralError>("Duplicate wire '{}' in group '{}'", item.at("id").get<std::string>(),
                                             group.id);
            }
        }
    }

    void to_json(nlohmann::json &j, const GroupSnapshot &snapshot) {
        auto groups{nlohmann::json::object()};
        for (const auto &[id, group] : snapshot.groups) { groups[id] = nlohmann::json(group); }
        j = {{"rootId", snapshot.root_id}, {"groups", std::move(groups)}};
    }

    void from_json(const nlohmann::json &j, GroupSnapshot &snapshot) {
        snapshot.root_id = j.at("rootId").get<std::string>();
        snapshot.groups.clear();
        for (const auto &[id, item] : j.at("groups").items()) {
            auto group{item.get<Group>()};
            if (group.id != id) { throw_error<StructuralError>("Snapshot entry '{}' holds group '{}'", id, group.id); }
            snapshot.groups.emplace(id, std::move(group));
        }
        if (!snapshot.groups.contains(snapshot.root_id)) {
            throw_error<StructuralError>("Snapshot root '{}' is missing", snapshot.root_id);
        }
    }

    std::string dump_snapshot(const GroupSnapshot &snapshot, int indent) {
        try {
            nlohmann::json j;
            to_json(j, snapshot);
            return j.dump(indent);
        } catch (const nlohmann::json::exception &e) {
            throw_error<StructuralError>("Snapshot '{}' cannot be written as JSON: {}", snapshot.root_id, e.what());
        }
    }

    GroupSnapshot parse_snapshot(std::string_view text) {
        try {
            auto          j{nlohmann::json::parse(std::string{text})};
            GroupSnapshot snapshot;
            from_json(j, snapshot);
            return snapshot;
        } catch (const nlohmann::json::exception &e) {
            throw_error<StructuralError>("Malformed snapshot: {}", e.what());
        }
    }

} // namespace bassline
