#include "inspector/query.hpp"
#include "inspector/log.hpp"
#include <cctype>
#include <regex>

namespace inspector {

namespace {

// Skip whitespace and SQL comments
size_t skip_insignificant(const std::string& sql, size_t pos) {
    while (pos < sql.size()) {
        if (std::isspace(static_cast<unsigned char>(sql[pos]))) {
            ++pos;
        } else if (sql.compare(pos, 2, "--") == 0) {
            size_t eol = sql.find('\n', pos);
            pos = eol == std::string::npos ? sql.size() : eol + 1;
        } else if (sql.compare(pos, 2, "/*") == 0) {
            size_t close = sql.find("*/", pos + 2);
            pos = close == std::string::npos ? sql.size() : close + 2;
        } else {
            break;
        }
    }
    return pos;
}

// Upper-cased identifier at pos, or empty
std::string keyword_at(const std::string& sql, size_t pos) {
    std::string keyword;
    while (pos < sql.size() && std::isalpha(static_cast<unsigned char>(sql[pos]))) {
        keyword += static_cast<char>(std::toupper(static_cast<unsigned char>(sql[pos])));
        ++pos;
    }
    return keyword;
}

// Position just past a quoted literal or identifier starting at pos
size_t skip_quoted(const std::string& sql, size_t pos) {
    char close = sql[pos] == '[' ? ']' : sql[pos];
    ++pos;
    while (pos < sql.size()) {
        if (sql[pos] == close) {
            // Doubled quote is an escaped quote
            if (close != ']' && pos + 1 < sql.size() && sql[pos + 1] == close) {
                pos += 2;
                continue;
            }
            return pos + 1;
        }
        ++pos;
    }
    return pos;
}

bool is_statement_keyword(const std::string& keyword) {
    return keyword == "SELECT" || keyword == "VALUES" || keyword == "INSERT" ||
           keyword == "REPLACE" || keyword == "UPDATE" || keyword == "DELETE";
}

// Keyword of the statement a WITH clause is attached to: the first
// statement keyword outside the parenthesized CTE bodies.
std::string keyword_after_with(const std::string& sql, size_t pos) {
    int depth = 0;
    while (pos < sql.size()) {
        pos = skip_insignificant(sql, pos);
        if (pos >= sql.size()) {
            break;
        }
        char c = sql[pos];
        if (c == '\'' || c == '"' || c == '`' || c == '[') {
            pos = skip_quoted(sql, pos);
        } else if (c == '(') {
            ++depth;
            ++pos;
        } else if (c == ')') {
            --depth;
            ++pos;
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t end = pos;
            while (end < sql.size() &&
                   (std::isalnum(static_cast<unsigned char>(sql[end])) || sql[end] == '_' || sql[end] == '$')) {
                ++end;
            }
            if (depth == 0) {
                std::string keyword = keyword_at(sql, pos);
                if (end == pos + keyword.size() && is_statement_keyword(keyword)) {
                    return keyword;
                }
            }
            pos = end;
        } else {
            ++pos;
        }
    }
    return "";
}

std::string first_keyword(const std::string& sql) {
    size_t pos = skip_insignificant(sql, 0);
    std::string keyword = keyword_at(sql, pos);
    if (keyword == "WITH") {
        return keyword_after_with(sql, pos + keyword.size());
    }
    return keyword;
}

std::string unquote_identifier(const std::string& token) {
    if (token.size() < 2) {
        return token;
    }
    char open = token.front();
    char close = token.back();
    if ((open == '[' && close == ']') || (open == '`' && close == '`')) {
        return token.substr(1, token.size() - 2);
    }
    if (open == '"' && close == '"') {
        std::string name;
        for (size_t i = 1; i + 1 < token.size(); ++i) {
            name += token[i];
            if (token[i] == '"') ++i;  // "" -> "
        }
        return name;
    }
    return token;
}

} // namespace

statement_kind classify_statement(const std::string& query_text) {
    std::string keyword = first_keyword(query_text);
    if (keyword == "SELECT" || keyword == "PRAGMA" ||
        keyword == "EXPLAIN" || keyword == "VALUES") {
        return statement_kind::select;
    }
    if (keyword == "INSERT" || keyword == "REPLACE") {
        return statement_kind::insert;
    }
    if (keyword == "UPDATE" || keyword == "DELETE") {
        return statement_kind::update_delete;
    }
    return statement_kind::other;
}

std::optional<std::string> whole_table_select(const std::string& query_text) {
    static const std::regex pattern(
        R"(^\s*select\s+\*\s+from\s+("(?:[^"]|"")+"|`[^`]+`|\[[^\]]+\]|[A-Za-z_][A-Za-z0-9_$]*)\s*;?\s*$)",
        std::regex::icase);

    std::smatch match;
    if (!std::regex_match(query_text, match, pattern)) {
        return std::nullopt;
    }
    return unquote_identifier(match[1].str());
}

query_outcome query_engine::execute(const std::string& query_text) {
    if (skip_insignificant(query_text, 0) == query_text.size()) {
        throw db_error("empty query");
    }

    switch (classify_statement(query_text)) {
        case statement_kind::select: {
            auto name = whole_table_select(query_text);
            if (name && db_.table_exists(*name)) {
                if (db_.has_rowid(*name)) {
                    LOG_DEBUG("query", "Browsing table %s", name->c_str());
                    return tabular_result{std::make_unique<stored_table>(db_, *name), true};
                }
                LOG_DEBUG("query", "%s has no rowid, reading it as a result", name->c_str());
            }
            LOG_DEBUG("query", "Select: %s", query_text.c_str());
            return tabular_result{
                std::make_unique<result_table>(db_.prepare(query_text), config_.limit,
                                               config_.ascending_order),
                false};
        }
        case statement_kind::insert:
            LOG_DEBUG("query", "Insert: %s", query_text.c_str());
            db_.execute(query_text);
            return insert_result{db_.last_insert_rowid()};
        case statement_kind::update_delete:
            LOG_DEBUG("query", "Update/delete: %s", query_text.c_str());
            db_.execute(query_text);
            return modify_result{db_.changes()};
        case statement_kind::other:
            break;
    }

    LOG_DEBUG("query", "Raw: %s", query_text.c_str());
    db_.execute(query_text);
    return acknowledgement{};
}

} // namespace inspector
