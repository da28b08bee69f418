#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "table.hpp"
#include <memory>

namespace inspector {

// Non-select statement succeeded
struct acknowledgement {};

// Rows to flatten. add_row_index is set when browsing a stored table.
struct tabular_result {
    std::unique_ptr<table> result;
    bool add_row_index = false;
};

struct insert_result {
    object_key_t inserted_id = 0;
};

struct modify_result {
    int64_t count = 0;
};

using query_outcome = std::variant<
    acknowledgement,
    tabular_result,
    insert_result,
    modify_result
>;

// Statement kind, from the leading keyword (after any WITH clause)
enum class statement_kind {
    select,
    insert,
    update_delete,
    other
};

statement_kind classify_statement(const std::string& query_text);

/// If `query_text` is "SELECT * FROM <table>", the table name.
std::optional<std::string> whole_table_select(const std::string& query_text);

// Runs client queries against an open database. Select results keep only
// the rows the configured limit and order will emit.
class query_engine {
public:
    query_engine(database& db, const configuration& config) : db_(db), config_(config) {}

    /// Execute one query. Throws db_error on failure.
    query_outcome execute(const std::string& query_text);

private:
    database& db_;
    configuration config_;
};

} // namespace inspector

#endif // __cplusplus
