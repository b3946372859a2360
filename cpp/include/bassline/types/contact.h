#ifndef BASSLINE_TYPES_CONTACT_H
#define BASSLINE_TYPES_CONTACT_H

#include <bassline/bassline_base.h>
#include <bassline/types/value.h>

#include <optional>

namespace bassline {

    enum class BlendMode : std::uint8_t { AcceptLast, Merge };

    enum class BoundaryDirection : std::uint8_t { Input, Output };

    [[nodiscard]] BASSLINE_EXPORT std::string_view to_string(BlendMode mode);

    [[nodiscard]] BASSLINE_EXPORT std::string_view to_string(BoundaryDirection direction);

    /**
     * Description of a contact to create. An empty id asks the network to generate one.
     */
    struct BASSLINE_EXPORT ContactSpec {
        ContactId                        id{};
        std::string                      name{};
        BlendMode                        blend_mode{BlendMode::Merge};
        bool                             is_boundary{false};
        std::optional<BoundaryDirection> boundary_direction{};
        std::optional<LatticeValue>      content{};
    };

    /**
     * A cell holding an optional lattice value. Unset until the first write, after which the blend
     * mode decides how incoming values combine with the stored one.
     */
    struct BASSLINE_EXPORT Contact {
        ContactId                        id;
        std::string                      name;
        std::optional<LatticeValue>      content{};
        BlendMode                        blend_mode{BlendMode::Merge};
        bool                             is_boundary{false};
        std::optional<BoundaryDirection> boundary_direction{};

        [[nodiscard]] static Contact from_spec(ContactId id, const ContactSpec &spec);

        [[nodiscard]] bool has_content() const { return content.has_value(); }

        /**
         * The value this contact would hold after receiving incoming. Throws Contradiction for a
         * Merge contact whose content has no join with incoming.
         */
        [[nodiscard]] LatticeValue blend(const LatticeValue &incoming) const;

        /**
         * Blend and store. Returns true when the stored value changed; on Contradiction the
         * previous content is left untouched.
         */
        bool write(const LatticeValue &incoming);

        bool operator==(const Contact &other) const = default;
    };

} // namespace bassline

template<>
struct fmt::formatter<bassline::BlendMode> : fmt::formatter<std::string_view> {
    auto format(bassline::BlendMode mode, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(bassline::to_string(mode), ctx);
    }
};

template<>
struct fmt::formatter<bassline::BoundaryDirection> : fmt::formatter<std::string_view> {
    auto format(bassline::BoundaryDirection direction, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(bassline::to_string(direction), ctx);
    }
};

#endif  // BASSLINE_TYPES_CONTACT_H
