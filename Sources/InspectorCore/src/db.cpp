#include "inspector/db.hpp"
#include "inspector/log.hpp"
#include <cctype>

namespace inspector {

// ============================================================================
// statement
// ============================================================================

statement::statement(sqlite3* db, const std::string& sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
        throw db_error(error);
    }
    if (!stmt_) {
        // Only whitespace or comments
        throw db_error("empty query");
    }
}

statement::~statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

statement::statement(statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

statement& statement::operator=(statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void statement::bind(int index, const column_value_t& value) {
    int rc = std::visit([&](auto&& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return sqlite3_bind_text(stmt_, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                return sqlite3_bind_zeroblob(stmt_, index, 0);
            }
            return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
    if (rc != SQLITE_OK) {
        throw db_error("Failed to bind parameter " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
    }
}

bool statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw db_error(sqlite3_errmsg(db_));
}

void statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int statement::column_count() const {
    return sqlite3_column_count(stmt_);
}

std::string statement::column_name(int index) const {
    const char* name = sqlite3_column_name(stmt_, index);
    return name ? name : "";
}

std::string statement::column_decltype(int index) const {
    const char* type = sqlite3_column_decltype(stmt_, index);
    return type ? type : "";
}

column_value_t statement::column_value(int index) const {
    int type = sqlite3_column_type(stmt_, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt_, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt_, index);
            int size = sqlite3_column_bytes(stmt_, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

// ============================================================================
// database
// ============================================================================

database::database(const std::string& path, open_mode mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set busy timeout to handle lock contention with the owning app (5 seconds)
    sqlite3_busy_timeout(db_, 5000);
    LOG_DEBUG("db", "Opened %s (%s)", path.c_str(),
              mode == open_mode::read_only ? "read-only" : "read-write");
}

database::~database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements (may contain several)
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : sqlite3_errmsg(db_);
            sqlite3_free(errmsg);
            LOG_ERROR("db", "%s in %s", error.c_str(), sql.c_str());
            throw db_error(error);
        }
        return;
    }

    statement stmt(db_, sql);
    int index = 1;
    for (const auto& param : params) {
        stmt.bind(index++, param);
    }
    while (stmt.step()) {
    }
}

statement database::prepare(const std::string& sql) const {
    return statement(db_, sql);
}

object_key_t database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int64_t database::changes() const {
    return sqlite3_changes(db_);
}

bool database::table_exists(const std::string& name) const {
    statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    stmt.bind(1, name);
    return stmt.step();
}

bool database::has_rowid(const std::string& name) const {
    // wr: 1 for WITHOUT ROWID tables
    statement stmt(db_, "SELECT wr FROM pragma_table_list WHERE schema='main' AND type='table' AND name=?");
    stmt.bind(1, name);
    if (!stmt.step()) {
        throw db_error("no such table: " + name);
    }
    return sqlite3_column_int(stmt.handle(), 0) == 0;
}

std::vector<std::string> database::table_names() const {
    statement stmt(db_, "SELECT name FROM sqlite_master WHERE type='table' ORDER BY rowid");
    std::vector<std::string> names;
    while (stmt.step()) {
        auto value = stmt.column_value(0);
        if (std::holds_alternative<std::string>(value)) {
            names.push_back(std::get<std::string>(value));
        }
    }
    return names;
}

std::vector<std::string> database::table_names(bool with_meta_tables) const {
    auto names = table_names();
    if (with_meta_tables) {
        return names;
    }
    std::vector<std::string> visible;
    for (auto& name : names) {
        if (!is_meta_table(name)) {
            visible.push_back(std::move(name));
        }
    }
    return visible;
}

std::vector<table_column_info> database::get_table_info(const std::string& table) const {
    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    statement stmt(db_, "SELECT name, type FROM pragma_table_info(?) ORDER BY cid");
    stmt.bind(1, table);

    std::vector<table_column_info> columns;
    while (stmt.step()) {
        table_column_info info;
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle(), 0));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle(), 1));
        info.name = name ? name : "";
        info.declared_type = type ? type : "";
        columns.push_back(std::move(info));
    }
    return columns;
}

std::unordered_map<std::string, std::string> database::get_foreign_keys(const std::string& table) const {
    // PRAGMA foreign_key_list returns: id, seq, table, from, to, ...
    statement stmt(db_, "SELECT \"from\", \"table\" FROM pragma_foreign_key_list(?)");
    stmt.bind(1, table);

    std::unordered_map<std::string, std::string> keys;
    while (stmt.step()) {
        const char* from = reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle(), 0));
        const char* target = reinterpret_cast<const char*>(sqlite3_column_text(stmt.handle(), 1));
        if (from && target) {
            keys[from] = target;
        }
    }
    return keys;
}

bool is_meta_table(const std::string& name) {
    return name.rfind("sqlite_", 0) == 0 ||
           (!name.empty() && name[0] == '_') ||
           name == "AuditLog";
}

} // namespace inspector
