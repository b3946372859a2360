#include <bassline/types/contact.h>
#include <bassline/types/merge.h>

namespace bassline {

    std::string_view to_string(BlendMode mode) {
        switch (mode) {
            case BlendMode::AcceptLast: return "AcceptLast";
            case BlendMode::Merge: return "Merge";
        }
        return "Unknown";
    }

    std::string_view to_string(BoundaryDirection direction) {
        switch (direction) {
            case BoundaryDirection::Input: return "Input";
            case BoundaryDirection::Output: return "Output";
        }
        return "Unknown";
    }

    Contact Contact::from_spec(ContactId id, const ContactSpec &spec) {
        auto name{spec.name.empty() ? id : spec.name};
        return Contact{std::move(id), std::move(name), spec.content, spec.blend_mode, spec.is_boundary,
                       spec.boundary_direction};
    }

    LatticeValue Contact::blend(const LatticeValue &incoming) const {
        if (blend_mode == BlendMode::AcceptLast) { return incoming; }
        return merge_into(content, incoming);
    }

    bool Contact::write(const LatticeValue &incoming) {
        auto next{blend(incoming)};
        if (content.has_value() && *content == next) { return false; }
        content = std::move(next);
        return true;
    }

} // namespace bassline
