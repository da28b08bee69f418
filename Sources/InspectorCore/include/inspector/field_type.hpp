#pragma once

#ifdef __cplusplus

#include "types.hpp"

namespace inspector {

// Engine-independent classification used to pick formatting behavior
enum class logical_field_type {
    integer,
    boolean,
    string,
    binary,
    unsupported_table,
    unsupported_mixed,
    legacy_date,
    date,
    float_,
    double_,
    object_link,
    link_list,
    integer_list,
    boolean_list,
    string_list,
    binary_list,
    date_list,
    float_list,
    double_list,
    unknown
};

/// Map a storage-level column type to its logical type.
/// Total: identifiers without a logical counterpart map to `unknown`.
logical_field_type classify(native_field_type type) noexcept;

/// Upper-case name, e.g. "INTEGER_LIST". Used as the prefix of formatted lists.
const char* to_string(logical_field_type type) noexcept;

/// Upper-case engine name of a storage type, e.g. "UNSUPPORTED_DATE".
const char* to_string(native_field_type type) noexcept;

/// True for the scalar-valued list types (not LINK_LIST).
bool is_value_list(logical_field_type type) noexcept;

} // namespace inspector

#endif // __cplusplus
