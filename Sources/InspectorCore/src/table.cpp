#include "inspector/table.hpp"
#include "inspector/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace inspector {

namespace {

std::string normalize_type(const std::string& declared) {
    std::string type;
    for (char c : declared) {
        if (c == '(') break;  // VARCHAR(255) -> VARCHAR
        type += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    while (!type.empty() && std::isspace(static_cast<unsigned char>(type.back()))) {
        type.pop_back();
    }
    size_t start = 0;
    while (start < type.size() && std::isspace(static_cast<unsigned char>(type[start]))) {
        ++start;
    }
    return type.substr(start);
}

const std::unordered_map<std::string, native_field_type>& engine_type_names() {
    static const std::unordered_map<std::string, native_field_type> names = {
        {"INTEGER", native_field_type::integer},
        {"INT", native_field_type::integer},
        {"BIGINT", native_field_type::integer},
        {"BOOLEAN", native_field_type::boolean},
        {"BOOL", native_field_type::boolean},
        {"TEXT", native_field_type::string},
        {"STRING", native_field_type::string},
        {"VARCHAR", native_field_type::string},
        {"BLOB", native_field_type::binary},
        {"BINARY", native_field_type::binary},
        {"TABLE", native_field_type::unsupported_table},
        {"MIXED", native_field_type::unsupported_mixed},
        {"", native_field_type::unsupported_mixed},
        {"LEGACY_DATE", native_field_type::unsupported_date},
        {"DATE", native_field_type::date},
        {"DATETIME", native_field_type::date},
        {"TIMESTAMP", native_field_type::date},
        {"FLOAT", native_field_type::float_},
        {"REAL", native_field_type::double_},
        {"DOUBLE", native_field_type::double_},
        {"LINK_LIST", native_field_type::list},
        {"LINKING_OBJECTS", native_field_type::linking_objects},
        {"INTEGER_LIST", native_field_type::integer_list},
        {"BOOLEAN_LIST", native_field_type::boolean_list},
        {"STRING_LIST", native_field_type::string_list},
        {"BINARY_LIST", native_field_type::binary_list},
        {"DATE_LIST", native_field_type::date_list},
        {"FLOAT_LIST", native_field_type::float_list},
        {"DOUBLE_LIST", native_field_type::double_list},
        {"DECIMAL", native_field_type::decimal},
        {"OBJECT_ID", native_field_type::object_id},
        {"UUID", native_field_type::uuid},
        {"TYPED_LINK", native_field_type::typed_link},
    };
    return names;
}

// ----------------------------------------------------------------------------
// SQLite-style coercions for loosely typed cells
// ----------------------------------------------------------------------------

int64_t as_int64(const column_value_t& v) {
    if (auto* i = std::get_if<int64_t>(&v)) return *i;
    if (auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto* s = std::get_if<std::string>(&v)) return std::strtoll(s->c_str(), nullptr, 10);
    return 0;
}

double as_double(const column_value_t& v) {
    if (auto* d = std::get_if<double>(&v)) return *d;
    if (auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto* s = std::get_if<std::string>(&v)) return std::strtod(s->c_str(), nullptr);
    return 0.0;
}

std::string as_text(const column_value_t& v) {
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&v)) {
        std::ostringstream ss;
        ss.precision(15);
        ss << *d;
        return ss.str();
    }
    if (auto* b = std::get_if<std::vector<uint8_t>>(&v)) return std::string(b->begin(), b->end());
    return "";
}

std::vector<uint8_t> decode_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw db_error("malformed hex value in binary list");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        char* end = nullptr;
        std::string pair = hex.substr(i, 2);
        long b = std::strtol(pair.c_str(), &end, 16);
        if (end != pair.c_str() + 2) {
            throw db_error("malformed hex value in binary list");
        }
        bytes.push_back(static_cast<uint8_t>(b));
    }
    return bytes;
}

double decode_floating(const nlohmann::json& element) {
    // JSON has no NaN/Infinity literals; storage writes them as strings
    if (element.is_string()) {
        const auto& s = element.get_ref<const std::string&>();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (s == "Infinity") return std::numeric_limits<double>::infinity();
        if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
        throw db_error("malformed floating point list element: " + s);
    }
    return element.get<double>();
}

list_value_t decode_list_element(native_field_type type, const nlohmann::json& element) {
    if (element.is_null()) {
        return nullptr;
    }
    switch (type) {
        case native_field_type::integer_list:
            return element.get<int64_t>();
        case native_field_type::boolean_list:
            if (element.is_number_integer()) return element.get<int64_t>() != 0;
            return element.get<bool>();
        case native_field_type::string_list:
            return element.get<std::string>();
        case native_field_type::binary_list:
            return decode_hex(element.get<std::string>());
        case native_field_type::date_list:
            return timestamp_t(std::chrono::milliseconds(element.get<int64_t>()));
        case native_field_type::float_list:
            return static_cast<float>(decode_floating(element));
        case native_field_type::double_list:
            return decode_floating(element);
        default:
            throw db_error(std::string("not a value list type: ") +
                           std::to_string(static_cast<int>(type)));
    }
}

nlohmann::json parse_list_cell(const column_def& def, const column_value_t& v) {
    if (!std::holds_alternative<std::string>(v)) {
        throw db_error("malformed list in column " + def.name + ": expected JSON text");
    }
    try {
        auto parsed = nlohmann::json::parse(std::get<std::string>(v));
        if (!parsed.is_array()) {
            throw db_error("malformed list in column " + def.name + ": expected JSON array");
        }
        return parsed;
    } catch (const nlohmann::json::exception& e) {
        throw db_error("malformed list in column " + def.name + ": " + e.what());
    }
}

native_field_type infer_from_value(const column_value_t& v) {
    if (std::holds_alternative<int64_t>(v)) return native_field_type::integer;
    if (std::holds_alternative<double>(v)) return native_field_type::double_;
    if (std::holds_alternative<std::vector<uint8_t>>(v)) return native_field_type::binary;
    return native_field_type::string;
}

row::columns_ptr load_columns(const database& db, const std::string& name) {
    if (!db.table_exists(name)) {
        throw db_error("no such table: " + name);
    }
    auto foreign_keys = db.get_foreign_keys(name);
    auto columns = std::make_shared<std::vector<column_def>>();
    for (const auto& info : db.get_table_info(name)) {
        column_def def;
        def.name = info.name;
        def.key = static_cast<column_key_t>(columns->size());
        auto fk = foreign_keys.find(info.name);
        bool has_fk = fk != foreign_keys.end();
        def.type = native_type_from_declared(info.declared_type, has_fk);
        if (has_fk) {
            def.target_table = fk->second;
        }
        columns->push_back(std::move(def));
    }
    return columns;
}

size_t count_rows(const database& db, const std::string& name) {
    auto stmt = db.prepare("SELECT count(*) FROM " + quote_identifier(name));
    if (!stmt.step()) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.handle(), 0));
}

std::string select_window_sql(const std::string& name, const std::vector<column_def>& columns,
                              bool descending) {
    std::ostringstream sql;
    sql << "SELECT rowid";
    for (const auto& col : columns) {
        sql << ", " << quote_identifier(col.name);
    }
    sql << " FROM " << quote_identifier(name) << " ORDER BY rowid"
        << (descending ? " DESC" : "") << " LIMIT -1 OFFSET ?";
    return sql.str();
}

// Julian day number of 1970-01-01T00:00:00Z
constexpr double k_unix_epoch_julian_day = 2440587.5;
constexpr const char* k_julian_day_sql = "SELECT julianday(?)";

bool is_numeric_text(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    std::strtod(text.c_str(), &end);
    while (*end && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    return end != text.c_str() && *end == '\0';
}

bool is_date_column(const column_def& def) {
    return def.type == native_field_type::date || def.type == native_field_type::unsupported_date;
}

// Rewrite date/time text that SQLite can parse into the column's numeric
// encoding (millis for DATE, seconds for LEGACY_DATE). Other text is kept.
void normalize_date_text(const std::vector<column_def>& columns,
                         std::vector<column_value_t>& values,
                         statement& julian_day) {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (!is_date_column(columns[i])) {
            continue;
        }
        auto* text = std::get_if<std::string>(&values[i]);
        if (!text || is_numeric_text(*text)) {
            continue;
        }
        julian_day.reset();
        julian_day.bind(1, *text);
        if (!julian_day.step()) {
            continue;
        }
        auto parsed = julian_day.column_value(0);
        auto* day = std::get_if<double>(&parsed);
        if (!day) {
            LOG_DEBUG("table", "Column %s: '%s' is not a date", columns[i].name.c_str(), text->c_str());
            continue;
        }
        double millis = (*day - k_unix_epoch_julian_day) * 86400000.0;
        if (columns[i].type == native_field_type::date) {
            values[i] = static_cast<int64_t>(std::llround(millis));
        } else {
            values[i] = std::round(millis) / 1000.0;
        }
    }
}

} // namespace

native_field_type native_type_from_declared(const std::string& declared_type, bool has_foreign_key) {
    std::string type = normalize_type(declared_type);

    auto& names = engine_type_names();
    auto it = names.find(type);
    native_field_type result;
    if (it != names.end()) {
        result = it->second;
    } else if (type.find("INT") != std::string::npos) {
        result = native_field_type::integer;
    } else if (type.find("CHAR") != std::string::npos ||
               type.find("CLOB") != std::string::npos ||
               type.find("TEXT") != std::string::npos) {
        result = native_field_type::string;
    } else if (type.find("BLOB") != std::string::npos) {
        result = native_field_type::binary;
    } else if (type.find("REAL") != std::string::npos ||
               type.find("FLOA") != std::string::npos ||
               type.find("DOUB") != std::string::npos) {
        result = native_field_type::double_;
    } else {
        // NUMERIC affinity
        result = native_field_type::decimal;
    }

    if (has_foreign_key && result == native_field_type::integer) {
        return native_field_type::object;
    }
    return result;
}

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ============================================================================
// row
// ============================================================================

row::row(object_key_t key, columns_ptr columns, std::vector<column_value_t> values)
    : key_(key), columns_(std::move(columns)), values_(std::move(values)) {}

const column_def& row::def(column_key_t column) const {
    if (column < 0 || static_cast<size_t>(column) >= columns_->size()) {
        throw db_error("invalid column key: " + std::to_string(column));
    }
    return (*columns_)[static_cast<size_t>(column)];
}

const column_value_t& row::value(column_key_t column) const {
    def(column);
    return values_[static_cast<size_t>(column)];
}

native_field_type row::get_column_type(column_key_t column) const {
    return def(column).type;
}

bool row::is_null(column_key_t column) const {
    return std::holds_alternative<std::nullptr_t>(value(column));
}

bool row::is_text(column_key_t column) const {
    return std::holds_alternative<std::string>(value(column));
}

bool row::is_null_link(column_key_t column) const {
    // A LINK_LIST cell is never null, only empty
    if (def(column).type == native_field_type::list) {
        return false;
    }
    return is_null(column);
}

int64_t row::get_long(column_key_t column) const {
    return as_int64(value(column));
}

bool row::get_boolean(column_key_t column) const {
    const auto& v = value(column);
    if (auto* s = std::get_if<std::string>(&v)) {
        return *s == "true" || *s == "TRUE" || *s == "1";
    }
    return as_int64(v) != 0;
}

double row::get_double(column_key_t column) const {
    return as_double(value(column));
}

std::string row::get_string(column_key_t column) const {
    return as_text(value(column));
}

std::vector<uint8_t> row::get_binary(column_key_t column) const {
    const auto& v = value(column);
    if (auto* b = std::get_if<std::vector<uint8_t>>(&v)) {
        return *b;
    }
    std::string text = as_text(v);
    return std::vector<uint8_t>(text.begin(), text.end());
}

timestamp_t row::get_date(column_key_t column) const {
    const auto& v = value(column);
    if (def(column).type == native_field_type::unsupported_date) {
        // Seconds since epoch, stored as REAL
        auto millis = static_cast<int64_t>(std::llround(as_double(v) * 1000.0));
        return timestamp_t(std::chrono::milliseconds(millis));
    }
    return timestamp_t(std::chrono::milliseconds(as_int64(v)));
}

object_key_t row::get_link(column_key_t column) const {
    return as_int64(value(column));
}

link_list row::get_link_list(column_key_t column) const {
    const auto& d = def(column);
    link_list list;
    list.target_table = d.target_table.value_or("");

    const auto& v = value(column);
    if (std::holds_alternative<std::nullptr_t>(v)) {
        return list;
    }
    auto parsed = parse_list_cell(d, v);
    for (const auto& element : parsed) {
        if (!element.is_number_integer()) {
            throw db_error("malformed link list in column " + d.name + ": expected object keys");
        }
        list.keys.push_back(element.get<object_key_t>());
    }
    return list;
}

value_list row::get_value_list(column_key_t column) const {
    const auto& d = def(column);
    value_list list;
    list.type = d.type;

    const auto& v = value(column);
    if (std::holds_alternative<std::nullptr_t>(v)) {
        return list;
    }
    auto parsed = parse_list_cell(d, v);
    list.values.reserve(parsed.size());
    try {
        for (const auto& element : parsed) {
            list.values.push_back(decode_list_element(d.type, element));
        }
    } catch (const nlohmann::json::exception& e) {
        throw db_error("malformed list element in column " + d.name + ": " + e.what());
    }
    return list;
}

// ============================================================================
// table
// ============================================================================

std::vector<std::string> table::column_names() const {
    std::vector<std::string> names;
    names.reserve(column_count());
    for (size_t i = 0; i < column_count(); ++i) {
        names.push_back(column(i).name);
    }
    return names;
}

stored_table::stored_table(const database& db, const std::string& name)
    : name_(name),
      columns_(load_columns(db, name)),
      size_(count_rows(db, name)),
      ascending_(db.prepare(select_window_sql(name, *columns_, false))),
      descending_(db.prepare(select_window_sql(name, *columns_, true))),
      julian_day_(db.prepare(k_julian_day_sql)) {
    LOG_DEBUG("table", "Opened %s: %zu columns, %zu rows", name_.c_str(), columns_->size(), size_);
}

row stored_table::row_at(size_t ordinal) const {
    if (ordinal >= size_) {
        throw std::out_of_range("row ordinal " + std::to_string(ordinal) +
                                " out of range for " + name_);
    }

    bool continues = cursor_ordinal_ &&
        (cursor_descending_ ? ordinal + 1 == *cursor_ordinal_ : ordinal == *cursor_ordinal_ + 1);
    if (!continues) {
        // Seek from the nearer end
        cursor_descending_ = ordinal >= size_ / 2;
        auto& cursor = cursor_descending_ ? descending_ : ascending_;
        cursor.reset();
        cursor.bind(1, static_cast<int64_t>(cursor_descending_ ? size_ - 1 - ordinal : ordinal));
    }

    auto& cursor = cursor_descending_ ? descending_ : ascending_;
    if (!cursor.step()) {
        cursor_ordinal_.reset();
        throw db_error("row " + std::to_string(ordinal) + " of " + name_ + " no longer exists");
    }
    cursor_ordinal_ = ordinal;

    std::vector<column_value_t> values;
    values.reserve(columns_->size());
    for (size_t i = 0; i < columns_->size(); ++i) {
        values.push_back(cursor.column_value(static_cast<int>(i) + 1));
    }
    normalize_date_text(*columns_, values, julian_day_);
    auto key = sqlite3_column_int64(cursor.handle(), 0);
    return row(key, columns_, std::move(values));
}

result_table::result_table(statement stmt, int64_t limit, bool ascending) : name_("result") {
    if (limit < 0) {
        throw std::invalid_argument("limit must be non-negative, got " + std::to_string(limit));
    }
    const size_t window = static_cast<size_t>(limit);

    int count = stmt.column_count();
    auto columns = std::make_shared<std::vector<column_def>>();
    std::vector<bool> resolved(static_cast<size_t>(count), false);
    for (int i = 0; i < count; ++i) {
        column_def def;
        def.name = stmt.column_name(i);
        def.key = i;
        def.type = native_field_type::string;
        std::string declared = stmt.column_decltype(i);
        if (!declared.empty()) {
            def.type = native_type_from_declared(declared);
            resolved[static_cast<size_t>(i)] = true;
        }
        columns->push_back(std::move(def));
    }

    while (stmt.step()) {
        std::vector<column_value_t> values;
        values.reserve(static_cast<size_t>(count));
        for (int i = 0; i < count; ++i) {
            values.push_back(stmt.column_value(i));
            // Expression columns take the storage class of their first non-null value
            auto column = static_cast<size_t>(i);
            if (!resolved[column] && !std::holds_alternative<std::nullptr_t>(values.back())) {
                (*columns)[column].type = infer_from_value(values.back());
                resolved[column] = true;
            }
        }
        ++size_;
        rows_.push_back(std::move(values));

        if (rows_.size() > window) {
            if (ascending) {
                // One row past the window is enough to know rows were left out
                rows_.pop_back();
                break;
            }
            rows_.pop_front();
            ++first_ordinal_;
        }
    }

    if (std::any_of(columns->begin(), columns->end(), is_date_column) && !rows_.empty()) {
        statement julian_day(sqlite3_db_handle(stmt.handle()), k_julian_day_sql);
        for (auto& values : rows_) {
            normalize_date_text(*columns, values, julian_day);
        }
    }
    columns_ = std::move(columns);
    LOG_DEBUG("table", "Result: %zu columns, %zu rows kept of %zu read",
              columns_->size(), rows_.size(), size_);
}

row result_table::row_at(size_t ordinal) const {
    if (ordinal < first_ordinal_ || ordinal - first_ordinal_ >= rows_.size()) {
        throw std::out_of_range("row ordinal " + std::to_string(ordinal) + " out of range");
    }
    return row(static_cast<object_key_t>(ordinal), columns_, rows_[ordinal - first_ordinal_]);
}

} // namespace inspector
