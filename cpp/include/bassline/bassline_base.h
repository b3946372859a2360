/*
 * The core imports for bassline. Use this to ensure the correct import order can be maintained.
 */

#ifndef BASSLINE_BASE_H
#define BASSLINE_BASE_H

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <ankerl/unordered_dense.h>

#include <bassline/bassline_export.h>
#include <bassline/bassline_forward_declarations.h>

#include <optional>
#include <string>
#include <vector>

namespace bassline {
    template<typename K, typename V>
    using id_map = ankerl::unordered_dense::map<K, V>;

    template<typename K>
    using id_set = ankerl::unordered_dense::set<K>;
} // namespace bassline

#endif //BASSLINE_BASE_H
