#ifndef BASSLINE_TYPES_WIRE_H
#define BASSLINE_TYPES_WIRE_H

#include <bassline/bassline_base.h>

#include <optional>

namespace bassline {

    enum class WireKind : std::uint8_t { Bidirectional, Directed };

    [[nodiscard]] BASSLINE_EXPORT std::string_view to_string(WireKind kind);

    /**
     * A link between two contacts. Directed wires carry from_id -> to_id only, bidirectional wires
     * carry both ways.
     */
    struct BASSLINE_EXPORT Wire {
        WireId    id;
        ContactId from_id;
        ContactId to_id;
        WireKind  kind{WireKind::Bidirectional};

        [[nodiscard]] bool touches(const ContactId &contact) const { return from_id == contact || to_id == contact; }

        /**
         * The contact that receives a value sent from source over this wire, if the wire carries in
         * that direction.
         */
        [[nodiscard]] std::optional<ContactId> delivery_target(const ContactId &source) const;

        bool operator==(const Wire &other) const = default;
    };

} // namespace bassline

template<>
struct fmt::formatter<bassline::WireKind> : fmt::formatter<std::string_view> {
    auto format(bassline::WireKind kind, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(bassline::to_string(kind), ctx);
    }
};

#endif  // BASSLINE_TYPES_WIRE_H
