#ifndef BASSLINE_TYPES_MERGE_H
#define BASSLINE_TYPES_MERGE_H

#include <bassline/bassline_base.h>
#include <bassline/types/value.h>

#include <optional>

namespace bassline {

    /**
     * Join two lattice values.
     *
     * - none on either side yields the other side, equal operands yield the left one.
     * - Same tag: GrowSet unions, ShrinkSet intersects, GrowArray / ShrinkArray use multiset
     *   max / min multiplicity (canonical order), GrowMap / ShrinkMap union / intersect keys and
     *   merge shared values recursively. Shrink results that become empty contradict.
     * - A plain collection meeting a tagged one of the same shape is read as that tag.
     * - Two plain values: sets union, dicts merge key-wise, arrays concatenate.
     *
     * Anything else throws Contradiction carrying both operands.
     */
    [[nodiscard]] BASSLINE_EXPORT LatticeValue merge(const LatticeValue &left, const LatticeValue &right);

    /**
     * Merge where the current value may be absent (an unset contact); absent yields incoming.
     */
    [[nodiscard]] BASSLINE_EXPORT LatticeValue merge_into(const std::optional<LatticeValue> &current,
                                                          const LatticeValue &incoming);

} // namespace bassline

#endif  // BASSLINE_TYPES_MERGE_H
