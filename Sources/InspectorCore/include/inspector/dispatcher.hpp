#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "query.hpp"

namespace inspector {

struct sql_error {
    int code = 0;
    std::string message;
};

// Either columnNames + values, or sqlError
struct execute_sql_response {
    std::optional<std::vector<std::string>> column_names;
    std::optional<std::vector<generic_value>> values;
    std::optional<sql_error> error;
};

// Turns query outcomes into responses
class query_dispatcher {
public:
    query_dispatcher(database& db, const configuration& config)
        : engine_(db, config), config_(config) {}

    /// Execute `query_text`. Engine failures come back as response.error;
    /// contract violations (negative limit) propagate.
    execute_sql_response execute(const std::string& query_text);

    /// Build the response for an outcome that has already been produced.
    execute_sql_response respond(query_outcome outcome) const;

private:
    query_engine engine_;
    configuration config_;
};

} // namespace inspector

#endif // __cplusplus
