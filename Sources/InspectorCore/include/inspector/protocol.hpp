#pragma once

#ifdef __cplusplus

#include "configuration.hpp"
#include "dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <unordered_map>

namespace inspector {

class protocol_error : public std::runtime_error {
public:
    explicit protocol_error(const std::string& msg) : std::runtime_error(msg) {}
};

nlohmann::json to_json_value(const generic_value& value);

void to_json(nlohmann::json& j, const link_ref& ref);
void to_json(nlohmann::json& j, const sql_error& error);
void to_json(nlohmann::json& j, const execute_sql_response& response);

/// Handlers for the inspector's "Database" domain. Database ids are file paths;
/// each is opened on first use and kept open for the domain's lifetime.
class database_domain {
public:
    explicit database_domain(configuration config = {});

    /// params: {"databaseId": string}
    /// result: {"tableNames": [string]}
    nlohmann::json get_database_table_names(const nlohmann::json& params);

    /// params: {"databaseId": string, "query": string}
    /// result: {"columnNames": [...], "values": [...]} or {"sqlError": {...}}
    nlohmann::json execute_sql(const nlohmann::json& params);

    /// Route "getDatabaseTableNames" / "executeSQL" (optionally "Database."-prefixed).
    nlohmann::json handle(const std::string& method, const nlohmann::json& params);

private:
    database& open(const std::string& database_id);

    configuration config_;
    std::unordered_map<std::string, std::unique_ptr<database>> databases_;
};

} // namespace inspector

#endif // __cplusplus
