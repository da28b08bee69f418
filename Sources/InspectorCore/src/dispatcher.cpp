#include "inspector/dispatcher.hpp"
#include "inspector/log.hpp"
#include "inspector/row_flattener.hpp"

namespace inspector {

namespace {

execute_sql_response single_value(const char* column_name, generic_value value) {
    execute_sql_response response;
    response.column_names = std::vector<std::string>{column_name};
    response.values = std::vector<generic_value>{std::move(value)};
    return response;
}

} // namespace

execute_sql_response query_dispatcher::respond(query_outcome outcome) const {
    return std::visit([&](auto&& result) -> execute_sql_response {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, acknowledgement>) {
            return single_value("success", std::string("true"));
        } else if constexpr (std::is_same_v<T, tabular_result>) {
            execute_sql_response response;
            std::vector<std::string> names;
            if (result.add_row_index) {
                names.push_back(k_row_index_column);
            }
            for (auto& name : result.result->column_names()) {
                names.push_back(std::move(name));
            }
            response.values = flatten_rows(*result.result, config_.limit,
                                           config_.ascending_order, result.add_row_index);
            response.column_names = std::move(names);
            return response;
        } else if constexpr (std::is_same_v<T, insert_result>) {
            return single_value("ID of last inserted row", result.inserted_id);
        } else if constexpr (std::is_same_v<T, modify_result>) {
            return single_value("Modified rows", result.count);
        }
    }, outcome);
}

execute_sql_response query_dispatcher::execute(const std::string& query_text) {
    try {
        return respond(engine_.execute(query_text));
    } catch (const db_error& e) {
        LOG_ERROR("dispatcher", "Query failed: %s", e.what());
        execute_sql_response response;
        response.error = sql_error{0, e.what()};
        return response;
    }
}

} // namespace inspector
