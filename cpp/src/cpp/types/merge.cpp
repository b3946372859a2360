#include <bassline/types/error_type.h>
#include <bassline/types/merge.h>

#include <algorithm>
#include <iterator>

namespace bassline {

    namespace {
        [[noreturn]] void cannot_merge(const LatticeValue &left, const LatticeValue &right) {
            throw Contradiction("Values cannot be merged", left, right);
        }

        LatticeValue::elements_type sorted(const LatticeValue::elements_type &elements) {
            auto result{elements};
            std::sort(result.begin(), result.end());
            return result;
        }

        // Sets are already canonical and unique, arrays are sorted first so that the std set
        // algorithms give max / min multiplicity.
        LatticeValue merge_collection(const LatticeValue &left, const LatticeValue &right, bool grow) {
            auto lhs{left.shape() == CollectionShape::Array ? sorted(left.elements()) : left.elements()};
            auto rhs{right.shape() == CollectionShape::Array ? sorted(right.elements()) : right.elements()};

            LatticeValue::elements_type result;
            if (grow) {
                std::set_union(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(result));
            } else {
                std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(result));
                if (result.empty()) {
                    throw Contradiction(left.shape() == CollectionShape::Set ? "Empty set intersection"
                                                                            : "Empty array intersection",
                                        left, right);
                }
            }
            return LatticeValue::collection(left.kind(), std::move(result));
        }

        LatticeValue merge_map(const LatticeValue &left, const LatticeValue &right, bool grow) {
            const auto &lk{left.keys()};
            const auto &rk{right.keys()};
            const auto &lv{left.elements()};
            const auto &rv{right.elements()};

            LatticeValue::keys_type     keys;
            LatticeValue::elements_type values;
            std::size_t                 i = 0, j = 0;
            while (i < lk.size() || j < rk.size()) {
                if (j == rk.size() || (i < lk.size() && lk[i] < rk[j])) {
                    if (grow) {
                        keys.push_back(lk[i]);
                        values.push_back(lv[i]);
                    }
                    ++i;
                } else if (i == lk.size() || rk[j] < lk[i]) {
                    if (grow) {
                        keys.push_back(rk[j]);
                        values.push_back(rv[j]);
                    }
                    ++j;
                } else {
                    keys.push_back(lk[i]);
                    values.push_back(merge(lv[i], rv[j]));
                    ++i;
                    ++j;
                }
            }
            if (!grow && keys.empty()) { throw Contradiction("Empty map intersection", left, right); }
            return LatticeValue::map(left.kind(), std::move(keys), std::move(values));
        }

        LatticeValue merge_same_tag(const LatticeValue &left, const LatticeValue &right) {
            auto grow{is_grow(left.kind())};
            if (left.shape() == CollectionShape::Map) { return merge_map(left, right, grow); }
            return merge_collection(left, right, grow);
        }

        LatticeValue merge_plain(const LatticeValue &left, const LatticeValue &right) {
            switch (left.kind()) {
                case ValueKind::Set: return merge_collection(left, right, true);
                case ValueKind::Dict: return merge_map(left, right, true);
                case ValueKind::Array: {
                    auto items{left.elements()};
                    items.insert(items.end(), right.elements().begin(), right.elements().end());
                    return LatticeValue::array(std::move(items));
                }
                default: cannot_merge(left, right);
            }
        }
    } // namespace

    LatticeValue merge(const LatticeValue &left, const LatticeValue &right) {
        if (left.is_none()) { return right; }
        if (right.is_none()) { return left; }
        if (left == right) { return left; }

        if (left.is_scalar() || right.is_scalar() || left.shape() != right.shape()) { cannot_merge(left, right); }

        if (left.is_tagged() && right.is_tagged()) {
            if (left.kind() != right.kind()) { cannot_merge(left, right); }
            return merge_same_tag(left, right);
        }
        if (left.is_tagged()) { return merge_same_tag(left, right.with_kind(left.kind())); }
        if (right.is_tagged()) { return merge_same_tag(left.with_kind(right.kind()), right); }
        return merge_plain(left, right);
    }

    LatticeValue merge_into(const std::optional<LatticeValue> &current, const LatticeValue &incoming) {
        if (!current.has_value()) { return incoming; }
        return merge(*current, incoming);
    }

} // namespace bassline
