#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>

namespace inspector {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// RAII prepared statement
class statement {
public:
    statement(sqlite3* db, const std::string& sql);
    ~statement();

    // Non-copyable
    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    statement(statement&& other) noexcept;
    statement& operator=(statement&& other) noexcept;

    void bind(int index, const column_value_t& value);

    /// Advance to the next row. Returns false once the statement is done.
    bool step();
    void reset();

    int column_count() const;
    std::string column_name(int index) const;
    /// Declared type of the source column, empty for expressions.
    std::string column_decltype(int index) const;
    column_value_t column_value(int index) const;

    sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
};

// One row of PRAGMA table_info
struct table_column_info {
    std::string name;
    std::string declared_type;
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema introspection
    bool table_exists(const std::string& name) const;
    /// False for WITHOUT ROWID tables.
    bool has_rowid(const std::string& name) const;
    /// All table names in creation order.
    std::vector<std::string> table_names() const;
    /// Table names for display; internal tables only when `with_meta_tables`.
    std::vector<std::string> table_names(bool with_meta_tables) const;
    std::vector<table_column_info> get_table_info(const std::string& table) const;
    /// Map of column name -> referenced table
    std::unordered_map<std::string, std::string> get_foreign_keys(const std::string& table) const;

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    statement prepare(const std::string& sql) const;

    object_key_t last_insert_rowid() const;
    int64_t changes() const;

private:
    sqlite3* db_ = nullptr;
};

/// SQLite internals, link/meta tables (leading underscore) and the audit log.
bool is_meta_table(const std::string& name);

} // namespace inspector

#endif // __cplusplus
