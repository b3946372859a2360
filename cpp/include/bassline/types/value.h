#ifndef BASSLINE_TYPES_VALUE_H
#define BASSLINE_TYPES_VALUE_H

/**
 * @file value.h
 * @brief The lattice value carried by every contact.
 *
 * A LatticeValue is either a scalar (none, bool, number, string), a plain
 * collection (dict, array, set) or one of the six tagged collections whose
 * merge semantics are fixed by their tag (see merge.h).
 *
 * Storage invariants:
 * - Map kinds (Dict, GrowMap, ShrinkMap) hold unique keys sorted ascending,
 *   keys()[i] is the key of elements()[i].
 * - Set kinds (Set, GrowSet, ShrinkSet) hold unique elements in canonical order.
 * - Array kinds keep elements exactly as given.
 */

#include <bassline/bassline_base.h>

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bassline {

    enum class ValueKind : std::uint8_t {
        None = 0,
        Bool,
        Number,
        String,
        Dict,
        Array,
        Set,
        GrowSet,
        ShrinkSet,
        GrowArray,
        ShrinkArray,
        GrowMap,
        ShrinkMap
    };

    enum class CollectionShape : std::uint8_t { Scalar, Set, Array, Map };

    [[nodiscard]] BASSLINE_EXPORT std::string_view to_string(ValueKind kind);

    [[nodiscard]] BASSLINE_EXPORT CollectionShape shape_of(ValueKind kind);

    [[nodiscard]] BASSLINE_EXPORT bool is_tagged(ValueKind kind);

    [[nodiscard]] BASSLINE_EXPORT bool is_grow(ValueKind kind);

    [[nodiscard]] BASSLINE_EXPORT bool is_shrink(ValueKind kind);

    class BASSLINE_EXPORT LatticeValue {
    public:
        using elements_type = std::vector<LatticeValue>;
        using keys_type = std::vector<std::string>;
        using entries_type = std::vector<std::pair<std::string, LatticeValue>>;

        LatticeValue() = default;

        LatticeValue(bool value);

        template<typename T>
            requires (std::is_arithmetic_v<T> && !std::same_as<T, bool>)
        LatticeValue(T value) : _kind{ValueKind::Number}, _scalar{static_cast<double>(value)} {}

        LatticeValue(const char *value);

        LatticeValue(std::string value);

        LatticeValue(std::string_view value);

        [[nodiscard]] static LatticeValue none();

        [[nodiscard]] static LatticeValue dict(entries_type entries);

        [[nodiscard]] static LatticeValue array(elements_type elements);

        [[nodiscard]] static LatticeValue set(elements_type elements);

        [[nodiscard]] static LatticeValue grow_set(elements_type elements);

        [[nodiscard]] static LatticeValue shrink_set(elements_type elements);

        [[nodiscard]] static LatticeValue grow_array(elements_type elements);

        [[nodiscard]] static LatticeValue shrink_array(elements_type elements);

        [[nodiscard]] static LatticeValue grow_map(entries_type entries);

        [[nodiscard]] static LatticeValue shrink_map(entries_type entries);

        /**
         * Build a collection of the given kind. Set kinds are normalised to canonical order,
         * map kinds require keys, so use the entries overload for those.
         */
        [[nodiscard]] static LatticeValue collection(ValueKind kind, elements_type elements);

        [[nodiscard]] static LatticeValue map(ValueKind kind, entries_type entries);

        [[nodiscard]] static LatticeValue map(ValueKind kind, keys_type keys, elements_type elements);

        [[nodiscard]] ValueKind kind() const { return _kind; }

        [[nodiscard]] CollectionShape shape() const { return shape_of(_kind); }

        [[nodiscard]] bool is_none() const { return _kind == ValueKind::None; }

        [[nodiscard]] bool is_bool() const { return _kind == ValueKind::Bool; }

        [[nodiscard]] bool is_number() const { return _kind == ValueKind::Number; }

        [[nodiscard]] bool is_string() const { return _kind == ValueKind::String; }

        [[nodiscard]] bool is_scalar() const { return shape() == CollectionShape::Scalar; }

        [[nodiscard]] bool is_collection() const { return !is_scalar(); }

        [[nodiscard]] bool is_tagged() const { return bassline::is_tagged(_kind); }

        [[nodiscard]] bool as_bool() const;

        [[nodiscard]] double as_number() const;

        [[nodiscard]] const std::string &as_string() const;

        /**
         * Elements of a set or array, or the values of a map (aligned with keys()).
         */
        [[nodiscard]] const elements_type &elements() const;

        [[nodiscard]] const keys_type &keys() const;

        [[nodiscard]] std::size_t size() const;

        [[nodiscard]] bool empty() const { return size() == 0; }

        /**
         * Membership test for set kinds (binary search) and array kinds (linear scan).
         */
        [[nodiscard]] bool contains(const LatticeValue &element) const;

        /**
         * Value stored at key for map kinds, nullptr when absent.
         */
        [[nodiscard]] const LatticeValue *find(std::string_view key) const;

        /**
         * Same content re-labelled with another kind of the same shape, e.g. a plain set as a GrowSet.
         */
        [[nodiscard]] LatticeValue with_kind(ValueKind kind) const;

        /**
         * Total order over all values: kind first, then content. NaN equals only NaN and sorts after every other
         * number. Returns <0, 0 or >0.
         */
        [[nodiscard]] int compare(const LatticeValue &other) const;

        [[nodiscard]] std::string to_string() const;

        friend bool operator==(const LatticeValue &lhs, const LatticeValue &rhs) { return lhs.compare(rhs) == 0; }

        friend bool operator<(const LatticeValue &lhs, const LatticeValue &rhs) { return lhs.compare(rhs) < 0; }

    private:
        LatticeValue(ValueKind kind, keys_type keys, elements_type elements);

        void _normalise();

        ValueKind _kind{ValueKind::None};
        std::variant<std::monostate, bool, double, std::string> _scalar{};
        keys_type _keys{};
        elements_type _elements{};
    };

} // namespace bassline

template<>
struct fmt::formatter<bassline::LatticeValue> : fmt::formatter<std::string_view> {
    auto format(const bassline::LatticeValue &value, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};

template<>
struct fmt::formatter<bassline::ValueKind> : fmt::formatter<std::string_view> {
    auto format(bassline::ValueKind kind, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(bassline::to_string(kind), ctx);
    }
};

#endif  // BASSLINE_TYPES_VALUE_H
