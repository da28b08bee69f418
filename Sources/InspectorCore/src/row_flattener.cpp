#include "inspector/row_flattener.hpp"
#include "inspector/field_type.hpp"
#include "inspector/log.hpp"
#include "inspector/value_formatter.hpp"
#include <algorithm>
#include <stdexcept>

namespace inspector {

std::vector<generic_value> flatten_rows(const table& t,
                                        int64_t limit,
                                        bool ascending,
                                        bool add_row_index) {
    if (limit < 0) {
        throw std::invalid_argument("limit must be non-negative, got " + std::to_string(limit));
    }

    const size_t num_columns = t.column_count();
    const size_t table_size = t.size();
    const size_t count = std::min(static_cast<size_t>(limit), table_size);

    // Column keys and logical types are resolved once per request
    std::vector<column_key_t> keys;
    std::vector<logical_field_type> types;
    keys.reserve(num_columns);
    types.reserve(num_columns);
    for (size_t column = 0; column < num_columns; ++column) {
        const auto& def = t.column(column);
        keys.push_back(def.key);
        types.push_back(classify(def.type));
        if (types.back() == logical_field_type::unknown) {
            LOG_WARN("flatten", "Column %s.%s has unsupported type %s",
                     t.name().c_str(), def.name.c_str(), to_string(def.type));
        }
    }

    std::vector<generic_value> flat;
    flat.reserve((count + 1) * (num_columns + (add_row_index ? 1 : 0)));

    for (size_t index = 0; index < count; ++index) {
        const size_t ordinal = ascending ? index : (table_size - index - 1);
        const row r = t.row_at(ordinal);
        if (add_row_index) {
            flat.push_back(r.object_key());
        }
        for (size_t column = 0; column < num_columns; ++column) {
            flat.push_back(format_value(r, keys[column], types[column]));
        }
    }

    if (static_cast<size_t>(limit) < table_size) {
        for (size_t column = 0; column < num_columns; ++column) {
            flat.push_back(std::string(k_truncated_sentinel));
        }
    }

    LOG_DEBUG("flatten", "%s: %zu of %zu rows, %zu values", t.name().c_str(), count, table_size, flat.size());
    return flat;
}

} // namespace inspector
