#include <bassline/types/value.h>
#include <bassline/util/errors.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace bassline {

    std::string_view to_string(ValueKind kind) {
        switch (kind) {
            case ValueKind::None: return "None";
            case ValueKind::Bool: return "Bool";
            case ValueKind::Number: return "Number";
            case ValueKind::String: return "String";
            case ValueKind::Dict: return "Dict";
            case ValueKind::Array: return "Array";
            case ValueKind::Set: return "Set";
            case ValueKind::GrowSet: return "GrowSet";
            case ValueKind::ShrinkSet: return "ShrinkSet";
            case ValueKind::GrowArray: return "GrowArray";
            case ValueKind::ShrinkArray: return "ShrinkArray";
            case ValueKind::GrowMap: return "GrowMap";
            case ValueKind::ShrinkMap: return "ShrinkMap";
        }
        return "Unknown";
    }

    CollectionShape shape_of(ValueKind kind) {
        switch (kind) {
            case ValueKind::Set:
            case ValueKind::GrowSet:
            case ValueKind::ShrinkSet: return CollectionShape::Set;
            case ValueKind::Array:
            case ValueKind::GrowArray:
            case ValueKind::ShrinkArray: return CollectionShape::Array;
            case ValueKind::Dict:
            case ValueKind::GrowMap:
            case ValueKind::ShrinkMap: return CollectionShape::Map;
            default: return CollectionShape::Scalar;
        }
    }

    bool is_tagged(ValueKind kind) { return is_grow(kind) || is_shrink(kind); }

    bool is_grow(ValueKind kind) {
        return kind == ValueKind::GrowSet || kind == ValueKind::GrowArray || kind == ValueKind::GrowMap;
    }

    bool is_shrink(ValueKind kind) {
        return kind == ValueKind::ShrinkSet || kind == ValueKind::ShrinkArray || kind == ValueKind::ShrinkMap;
    }

    LatticeValue::LatticeValue(bool value) : _kind{ValueKind::Bool}, _scalar{value} {}

    LatticeValue::LatticeValue(const char *value) : _kind{ValueKind::String}, _scalar{std::string{value}} {}

    LatticeValue::LatticeValue(std::string value) : _kind{ValueKind::String}, _scalar{std::move(value)} {}

    LatticeValue::LatticeValue(std::string_view value) : _kind{ValueKind::String}, _scalar{std::string{value}} {}

    LatticeValue::LatticeValue(ValueKind kind, keys_type keys, elements_type elements)
        : _kind{kind}, _keys{std::move(keys)}, _elements{std::move(elements)} {
        _normalise();
    }

    LatticeValue LatticeValue::none() { return LatticeValue{}; }

    LatticeValue LatticeValue::dict(entries_type entries) { return map(ValueKind::Dict, std::move(entries)); }

    LatticeValue LatticeValue::array(elements_type elements) { return collection(ValueKind::Array, std::move(elements)); }

    LatticeValue LatticeValue::set(elements_type elements) { return collection(ValueKind::Set, std::move(elements)); }

    LatticeValue LatticeValue::grow_set(elements_type elements) {
        return collection(ValueKind::GrowSet, std::move(elements));
    }

    LatticeValue LatticeValue::shrink_set(elements_type elements) {
        return collection(ValueKind::ShrinkSet, std::move(elements));
    }

    LatticeValue LatticeValue::grow_array(elements_type elements) {
        return collection(ValueKind::GrowArray, std::move(elements));
    }

    LatticeValue LatticeValue::shrink_array(elements_type elements) {
        return collection(ValueKind::ShrinkArray, std::move(elements));
    }

    LatticeValue LatticeValue::grow_map(entries_type entries) { return map(ValueKind::GrowMap, std::move(entries)); }

    LatticeValue LatticeValue::shrink_map(entries_type entries) {
        return map(ValueKind::ShrinkMap, std::move(entries));
    }

    LatticeValue LatticeValue::collection(ValueKind kind, elements_type elements) {
        auto shape{shape_of(kind)};
        if (shape != CollectionShape::Set && shape != CollectionShape::Array) {
            throw_error<std::invalid_argument>("Cannot build a {} from a list of elements", kind);
        }
        return LatticeValue{kind, {}, std::move(elements)};
    }

    LatticeValue LatticeValue::map(ValueKind kind, entries_type entries) {
        keys_type     keys;
        elements_type values;
        keys.reserve(entries.size());
        values.reserve(entries.size());
        for (auto &[key, value] : entries) {
            keys.emplace_back(std::move(key));
            values.emplace_back(std::move(value));
        }
        return map(kind, std::move(keys), std::move(values));
    }

    LatticeValue LatticeValue::map(ValueKind kind, keys_type keys, elements_type elements) {
        if (shape_of(kind) != CollectionShape::Map) {
            throw_error<std::invalid_argument>("Cannot build a {} from key/value entries", kind);
        }
        if (keys.size() != elements.size()) {
            throw_error<std::invalid_argument>("Map built with {} keys but {} values", keys.size(), elements.size());
        }
        return LatticeValue{kind, std::move(keys), std::move(elements)};
    }

    void LatticeValue::_normalise() {
        switch (shape()) {
            case CollectionShape::Set: {
                std::sort(_elements.begin(), _elements.end());
                _elements.erase(std::unique(_elements.begin(), _elements.end()), _elements.end());
                break;
            }
            case CollectionShape::Map: {
                // Stable sort so that, for duplicate keys, the last entry given wins.
                std::vector<std::size_t> order(_keys.size());
                std::iota(order.begin(), order.end(), 0);
                std::stable_sort(order.begin(), order.end(),
                                 [this](std::size_t a, std::size_t b) { return _keys[a] < _keys[b]; });
                keys_type     keys;
                elements_type values;
                keys.reserve(order.size());
                values.reserve(order.size());
                for (auto ndx : order) {
                    if (!keys.empty() && keys.back() == _keys[ndx]) {
                        values.back() = std::move(_elements[ndx]);
                    } else {
                        keys.emplace_back(std::move(_keys[ndx]));
                        values.emplace_back(std::move(_elements[ndx]));
                    }
                }
                _keys     = std::move(keys);
                _elements = std::move(values);
                break;
            }
            default: break;
        }
    }

    bool LatticeValue::as_bool() const {
        if (!is_bool()) { throw_error<std::invalid_argument>("Expected Bool, got {}", _kind); }
        return std::get<bool>(_scalar);
    }

    double LatticeValue::as_number() const {
        if (!is_number()) { throw_error<std::invalid_argument>("Expected Number, got {}", _kind); }
        return std::get<double>(_scalar);
    }

    const std::string &LatticeValue::as_string() const {
        if (!is_string()) { throw_error<std::invalid_argument>("Expected String, got {}", _kind); }
        return std::get<std::string>(_scalar);
    }

    const LatticeValue::elements_type &LatticeValue::elements() const { return _elements; }

    const LatticeValue::keys_type &LatticeValue::keys() const { return _keys; }

    std::size_t LatticeValue::size() const { return is_scalar() ? 0 : _elements.size(); }

    bool LatticeValue::contains(const LatticeValue &element) const {
        switch (shape()) {
            case CollectionShape::Set: return std::binary_search(_elements.begin(), _elements.end(), element);
            case CollectionShape::Array: return std::find(_elements.begin(), _elements.end(), element) != _elements.end();
            default: return false;
        }
    }

    const LatticeValue *LatticeValue::find(std::string_view key) const {
        if (shape() != CollectionShape::Map) { return nullptr; }
        auto it{std::lower_bound(_keys.begin(), _keys.end(), key,
                                 [](const std::string &lhs, std::string_view rhs) { return lhs < rhs; })};
        if (it == _keys.end() || *it != key) { return nullptr; }
        return &_elements[static_cast<std::size_t>(std::distance(_keys.begin(), it))];
    }

    LatticeValue LatticeValue::with_kind(ValueKind kind) const {
        if (shape_of(kind) != shape() || is_scalar()) {
            throw_error<std::invalid_argument>("Cannot view a {} as a {}", _kind, kind);
        }
        return LatticeValue{kind, _keys, _elements};
    }

    namespace {
        template<typename T>
        int three_way(const T &lhs, const T &rhs) {
            if (lhs < rhs) { return -1; }
            if (rhs < lhs) { return 1; }
            return 0;
        }

        // NaN equals only NaN and sorts after every other number.
        int compare_numbers(double lhs, double rhs) {
            auto lhs_nan{std::isnan(lhs)};
            auto rhs_nan{std::isnan(rhs)};
            if (lhs_nan || rhs_nan) { return three_way(lhs_nan, rhs_nan); }
            return three_way(lhs, rhs);
        }
    } // namespace

    int LatticeValue::compare(const LatticeValue &other) const {
        if (_kind != other._kind) { return three_way(static_cast<int>(_kind), static_cast<int>(other._kind)); }
        switch (_kind) {
            case ValueKind::None: return 0;
            case ValueKind::Bool: return three_way(std::get<bool>(_scalar), std::get<bool>(other._scalar));
            case ValueKind::Number: return compare_numbers(std::get<double>(_scalar), std::get<double>(other._scalar));
            case ValueKind::String: return std::get<std::string>(_scalar).compare(std::get<std::string>(other._scalar));
            default: break;
        }
        auto n{std::min(_elements.size(), other._elements.size())};
        for (std::size_t i = 0; i < n; ++i) {
            if (shape() == CollectionShape::Map) {
                if (auto c{_keys[i].compare(other._keys[i])}; c != 0) { return c; }
            }
            if (auto c{_elements[i].compare(other._elements[i])}; c != 0) { return c; }
        }
        return three_way(_elements.size(), other._elements.size());
    }

    std::string LatticeValue::to_string() const {
        switch (_kind) {
            case ValueKind::None: return "none";
            case ValueKind::Bool: return std::get<bool>(_scalar) ? "true" : "false";
            case ValueKind::Number: return fmt::format("{}", std::get<double>(_scalar));
            case ValueKind::String: return fmt::format("\"{}\"", std::get<std::string>(_scalar));
            default: break;
        }
        std::vector<std::string> parts;
        parts.reserve(_elements.size());
        for (std::size_t i = 0; i < _elements.size(); ++i) {
            if (shape() == CollectionShape::Map) {
                parts.emplace_back(fmt::format("{}: {}", _keys[i], _elements[i].to_string()));
            } else {
                parts.emplace_back(_elements[i].to_string());
            }
        }
        auto open{shape() == CollectionShape::Array ? "[" : "{"};
        auto close{shape() == CollectionShape::Array ? "]" : "}"};
        if (is_tagged()) { return fmt::format("{}{}{}{}", _kind, open, fmt::join(parts, ", "), close); }
        return fmt::format("{}{}{}", open, fmt::join(parts, ", "), close);
    }

} // namespace bassline
