#ifndef BASSLINE_SNAPSHOT_JSON_H
#define BASSLINE_SNAPSHOT_JSON_H

/**
 * @file snapshot_json.h
 * @brief nlohmann::json codec for lattice values and group snapshots.
 *
 * Scalars map onto JSON scalars (none is null), plain arrays onto JSON arrays and plain dicts onto
 * JSON objects. Everything else is an object carrying a "_tag":
 *
 *   {"_tag": "GrowSet" | "ShrinkSet" | "Set", "values": [...]}
 *   {"_tag": "GrowArray" | "ShrinkArray", "items": [...]}
 *   {"_tag": "GrowMap" | "ShrinkMap", "entries": {...}}
 *   {"_tag": "Dict", "entries": {...}}    a plain dict that itself has a "_tag" key
 *
 * An unset contact has no "content" key, a contact holding none has "content": null.
 */

#include <bassline/bassline_base.h>
#include <bassline/types/group.h>
#include <bassline/types/value.h>

#include <nlohmann/json.hpp>

namespace bassline {

    BASSLINE_EXPORT void to_json(nlohmann::json &j, const LatticeValue &value);
    BASSLINE_EXPORT void from_json(const nlohmann::json &j, LatticeValue &value);

    BASSLINE_EXPORT void to_json(nlohmann::json &j, const Contact &contact);
    BASSLINE_EXPORT void from_json(const nlohmann::json &j, Contact &contact);

    BASSLINE_EXPORT void to_json(nlohmann::json &j, const Wire &wire);
    BASSLINE_EXPORT void from_json(const nlohmann::json &j, Wire &wire);

    BASSLINE_EXPORT void to_json(nlohmann::json &j, const Group &group);
    BASSLINE_EXPORT void from_json(const nlohmann::json &j, Group &group);

    BASSLINE_EXPORT void to_json(nlohmann::json &j, const GroupSnapshot &snapshot);
    BASSLINE_EXPORT void from_json(const nlohmann::json &j, GroupSnapshot &snapshot);

    /**
     * Serialise a snapshot to text. indent < 0 gives the compact form. Values JSON cannot hold (e.g. strings
     * that are not UTF-8) raise StructuralError.
     */
    [[nodiscard]] BASSLINE_EXPORT std::string dump_snapshot(const GroupSnapshot &snapshot, int indent = -1);

    /**
     * Parse a snapshot from text. Malformed input is reported as StructuralError.
     */
    [[nodiscard]] BASSLINE_EXPORT GroupSnapshot parse_snapshot(std::string_view text);

} // namespace bassline

#endif  // BASSLINE_SNAPSHOT_JSON_H
