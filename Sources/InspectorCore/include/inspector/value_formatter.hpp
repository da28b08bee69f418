#pragma once

#ifdef __cplusplus

#include "field_type.hpp"
#include "table.hpp"
#include <locale>

namespace inspector {

// Long local date-time rendering, e.g. "March 04, 2024 10:15:00 AM PST".
// Created once on first use and read-only afterwards.
class date_formatter {
public:
    static const date_formatter& instance();

    /// "<long local date-time> (<epoch millis>)"
    std::string format(timestamp_t date) const;

private:
    date_formatter();
    std::locale locale_;
};

/// Render one cell of `r` according to its logical type.
/// Never throws for an unrecognized type; emits a diagnostic string instead.
generic_value format_value(const row& r, column_key_t column, logical_field_type type);

/// "NaN", "Infinity", "-Infinity" or the value itself.
generic_value format_floating(double value);

std::string format_date(timestamp_t date);

/// "<target>{k1,k2,...}"
std::string format_link_list(const link_list& list);

/// "<LOGICAL_TYPE_NAME>{v1,v2,...}", values rendered raw
std::string format_value_list(const value_list& list, logical_field_type type);

inline generic_value null_value() {
    return std::string(k_null_sentinel);
}

} // namespace inspector

#endif // __cplusplus
