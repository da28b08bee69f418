#include "inspector/protocol.hpp"
#include "inspector/log.hpp"

namespace inspector {

namespace {

std::string required_string(const nlohmann::json& params, const char* key) {
    if (!params.is_object() || !params.contains(key) || !params[key].is_string()) {
        throw protocol_error(std::string("missing required string property: ") + key);
    }
    return params[key].get<std::string>();
}

} // namespace

nlohmann::json to_json_value(const generic_value& value) {
    return std::visit([](auto&& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            // Array of byte values
            nlohmann::json bytes = nlohmann::json::array();
            for (uint8_t b : v) {
                bytes.push_back(b);
            }
            return bytes;
        } else {
            return nlohmann::json(v);
        }
    }, value);
}

void to_json(nlohmann::json& j, const link_ref& ref) {
    j = ref.key;
}

void to_json(nlohmann::json& j, const sql_error& error) {
    j = nlohmann::json{{"message", error.message}, {"code", error.code}};
}

void to_json(nlohmann::json& j, const execute_sql_response& response) {
    j = nlohmann::json::object();
    if (response.column_names) {
        j["columnNames"] = *response.column_names;
    }
    if (response.values) {
        nlohmann::json values = nlohmann::json::array();
        for (const auto& value : *response.values) {
            values.push_back(to_json_value(value));
        }
        j["values"] = std::move(values);
    }
    if (response.error) {
        j["sqlError"] = *response.error;
    }
}

database_domain::database_domain(configuration config) : config_(config) {
    if (config_.limit < 0) {
        throw std::invalid_argument("limit must be non-negative");
    }
}

database& database_domain::open(const std::string& database_id) {
    auto it = databases_.find(database_id);
    if (it != databases_.end()) {
        return *it->second;
    }
    auto mode = config_.read_only ? database::open_mode::read_only
                                  : database::open_mode::read_write;
    auto db = std::make_unique<database>(database_id, mode);
    LOG_INFO("domain", "Opened database %s", database_id.c_str());
    auto& ref = *db;
    databases_.emplace(database_id, std::move(db));
    return ref;
}

nlohmann::json database_domain::get_database_table_names(const nlohmann::json& params) {
    auto database_id = required_string(params, "databaseId");
    auto& db = open(database_id);
    return nlohmann::json{{"tableNames", db.table_names(config_.with_meta_tables)}};
}

nlohmann::json database_domain::execute_sql(const nlohmann::json& params) {
    auto database_id = required_string(params, "databaseId");
    auto query = required_string(params, "query");

    database* db = nullptr;
    try {
        db = &open(database_id);
    } catch (const db_error& e) {
        execute_sql_response response;
        response.error = sql_error{0, e.what()};
        return response;
    }

    query_dispatcher dispatcher(*db, config_);
    return dispatcher.execute(query);
}

nlohmann::json database_domain::handle(const std::string& method, const nlohmann::json& params) {
    std::string name = method;
    const std::string prefix = "Database.";
    if (name.rfind(prefix, 0) == 0) {
        name = name.substr(prefix.size());
    }

    if (name == "getDatabaseTableNames") {
        return get_database_table_names(params);
    }
    if (name == "executeSQL") {
        return execute_sql(params);
    }
    LOG_WARN("domain", "Unsupported method %s", method.c_str());
    throw protocol_error("method not found: " + method);
}

} // namespace inspector
