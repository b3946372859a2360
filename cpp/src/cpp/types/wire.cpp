#include <bassline/types/wire.h>

namespace bassline {

    std::string_view to_string(WireKind kind) {
        switch (kind) {
            case WireKind::Bidirectional: return "Bidirectional";
            case WireKind::Directed: return "Directed";
        }
        return "Unknown";
    }

    std::optional<ContactId> Wire::delivery_target(const ContactId &source) const {
        if (source == from_id) { return to_id; }
        if (source == to_id && kind == WireKind::Bidirectional) { return from_id; }
        return std::nullopt;
    }

} // namespace bassline
