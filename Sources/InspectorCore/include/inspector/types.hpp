#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>

namespace inspector {

// Timestamp type (milliseconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Stable row identifier, independent of traversal order
using object_key_t = int64_t;

// Stable column identifier within a table (declared column index)
using column_key_t = int64_t;

// Values as stored by SQLite
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    std::vector<uint8_t>  // blob
>;

// Storage-level column types reported by the database. Numbering follows the
// engine's wire identifiers; gaps are identifiers the engine has retired.
enum class native_field_type : int {
    integer = 0,
    boolean = 1,
    string = 2,
    binary = 4,
    unsupported_table = 5,
    unsupported_mixed = 6,
    unsupported_date = 7,
    date = 8,
    float_ = 9,
    double_ = 10,
    object = 12,
    list = 13,
    linking_objects = 14,
    integer_list = 15,
    boolean_list = 16,
    string_list = 17,
    binary_list = 18,
    date_list = 19,
    float_list = 20,
    double_list = 21,
    decimal = 22,
    object_id = 23,
    uuid = 24,
    typed_link = 25
};

// Column definition as reported by a table
struct column_def {
    std::string name;
    native_field_type type = native_field_type::unsupported_mixed;
    column_key_t key = 0;
    std::optional<std::string> target_table;  // for object/list columns
};

// Reference to a row of another table, transmitted as its object key
struct link_ref {
    object_key_t key = 0;

    bool operator==(const link_ref& other) const { return key == other.key; }
    bool operator!=(const link_ref& other) const { return key != other.key; }
};

// One serialized cell. Nulls, numeric special values, dates and
// collections are carried as strings.
using generic_value = std::variant<
    std::string,
    bool,
    int64_t,
    double,
    std::vector<uint8_t>,
    link_ref
>;

inline constexpr const char* k_null_sentinel = "[null]";
inline constexpr const char* k_truncated_sentinel = "{truncated}";
inline constexpr const char* k_row_index_column = "<index>";

} // namespace inspector

#endif // __cplusplus
