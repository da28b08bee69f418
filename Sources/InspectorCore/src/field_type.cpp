#include "inspector/field_type.hpp"

namespace inspector {

logical_field_type classify(native_field_type type) noexcept {
    switch (type) {
        case native_field_type::integer: return logical_field_type::integer;
        case native_field_type::boolean: return logical_field_type::boolean;
        case native_field_type::string: return logical_field_type::string;
        case native_field_type::binary: return logical_field_type::binary;
        case native_field_type::unsupported_table: return logical_field_type::unsupported_table;
        case native_field_type::unsupported_mixed: return logical_field_type::unsupported_mixed;
        case native_field_type::unsupported_date: return logical_field_type::legacy_date;
        case native_field_type::date: return logical_field_type::date;
        case native_field_type::float_: return logical_field_type::float_;
        case native_field_type::double_: return logical_field_type::double_;
        case native_field_type::object: return logical_field_type::object_link;
        case native_field_type::list: return logical_field_type::link_list;
        case native_field_type::integer_list: return logical_field_type::integer_list;
        case native_field_type::boolean_list: return logical_field_type::boolean_list;
        case native_field_type::string_list: return logical_field_type::string_list;
        case native_field_type::binary_list: return logical_field_type::binary_list;
        case native_field_type::date_list: return logical_field_type::date_list;
        case native_field_type::float_list: return logical_field_type::float_list;
        case native_field_type::double_list: return logical_field_type::double_list;
        // Backlinks and newer engine types are not rendered
        case native_field_type::linking_objects:
        case native_field_type::decimal:
        case native_field_type::object_id:
        case native_field_type::uuid:
        case native_field_type::typed_link:
        default:
            return logical_field_type::unknown;
    }
}

const char* to_string(logical_field_type type) noexcept {
    switch (type) {
        case logical_field_type::integer: return "INTEGER";
        case logical_field_type::boolean: return "BOOLEAN";
        case logical_field_type::string: return "STRING";
        case logical_field_type::binary: return "BINARY";
        case logical_field_type::unsupported_table: return "UNSUPPORTED_TABLE";
        case logical_field_type::unsupported_mixed: return "UNSUPPORTED_MIXED";
        case logical_field_type::legacy_date: return "LEGACY_DATE";
        case logical_field_type::date: return "DATE";
        case logical_field_type::float_: return "FLOAT";
        case logical_field_type::double_: return "DOUBLE";
        case logical_field_type::object_link: return "OBJECT_LINK";
        case logical_field_type::link_list: return "LINK_LIST";
        case logical_field_type::integer_list: return "INTEGER_LIST";
        case logical_field_type::boolean_list: return "BOOLEAN_LIST";
        case logical_field_type::string_list: return "STRING_LIST";
        case logical_field_type::binary_list: return "BINARY_LIST";
        case logical_field_type::date_list: return "DATE_LIST";
        case logical_field_type::float_list: return "FLOAT_LIST";
        case logical_field_type::double_list: return "DOUBLE_LIST";
        case logical_field_type::unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

const char* to_string(native_field_type type) noexcept {
    switch (type) {
        case native_field_type::integer: return "INTEGER";
        case native_field_type::boolean: return "BOOLEAN";
        case native_field_type::string: return "STRING";
        case native_field_type::binary: return "BINARY";
        case native_field_type::unsupported_table: return "UNSUPPORTED_TABLE";
        case native_field_type::unsupported_mixed: return "UNSUPPORTED_MIXED";
        case native_field_type::unsupported_date: return "UNSUPPORTED_DATE";
        case native_field_type::date: return "DATE";
        case native_field_type::float_: return "FLOAT";
        case native_field_type::double_: return "DOUBLE";
        case native_field_type::object: return "OBJECT";
        case native_field_type::list: return "LIST";
        case native_field_type::linking_objects: return "LINKING_OBJECTS";
        case native_field_type::integer_list: return "INTEGER_LIST";
        case native_field_type::boolean_list: return "BOOLEAN_LIST";
        case native_field_type::string_list: return "STRING_LIST";
        case native_field_type::binary_list: return "BINARY_LIST";
        case native_field_type::date_list: return "DATE_LIST";
        case native_field_type::float_list: return "FLOAT_LIST";
        case native_field_type::double_list: return "DOUBLE_LIST";
        case native_field_type::decimal: return "DECIMAL";
        case native_field_type::object_id: return "OBJECT_ID";
        case native_field_type::uuid: return "UUID";
        case native_field_type::typed_link: return "TYPED_LINK";
    }
    return "UNKNOWN";
}

bool is_value_list(logical_field_type type) noexcept {
    switch (type) {
        case logical_field_type::integer_list:
        case logical_field_type::boolean_list:
        case logical_field_type::string_list:
        case logical_field_type::binary_list:
        case logical_field_type::date_list:
        case logical_field_type::float_list:
        case logical_field_type::double_list:
            return true;
        default:
            return false;
    }
}

} // namespace inspector
