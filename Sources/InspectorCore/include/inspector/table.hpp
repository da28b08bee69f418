#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <deque>
#include <memory>

namespace inspector {

/// Map a declared SQL column type to the storage-level type.
/// Exact engine type names win over SQLite affinity rules; an INTEGER or
/// LINK_LIST column backed by a foreign key is a link.
native_field_type native_type_from_declared(const std::string& declared_type,
                                            bool has_foreign_key = false);

/// Quote an identifier for interpolation into SQL.
std::string quote_identifier(const std::string& name);

// Object keys of the rows a LINK_LIST cell points at
struct link_list {
    std::string target_table;
    std::vector<object_key_t> keys;

    size_t size() const { return keys.size(); }
    object_key_t key_at(size_t pos) const { return keys.at(pos); }
};

// Element of a scalar list, as decoded from storage
using list_value_t = std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    float,
    double,
    std::string,
    std::vector<uint8_t>,
    timestamp_t
>;

struct value_list {
    native_field_type type = native_field_type::integer_list;
    std::vector<list_value_t> values;

    size_t size() const { return values.size(); }
    const list_value_t& value(size_t pos) const { return values.at(pos); }
};

// ============================================================================
// row - one stored row with typed accessors keyed by column key
// ============================================================================

class row {
public:
    using columns_ptr = std::shared_ptr<const std::vector<column_def>>;

    row(object_key_t key, columns_ptr columns, std::vector<column_value_t> values);

    /// Stable key; independent of the ordinal used to reach this row.
    object_key_t object_key() const { return key_; }

    native_field_type get_column_type(column_key_t column) const;

    bool is_null(column_key_t column) const;
    bool is_null_link(column_key_t column) const;
    bool is_text(column_key_t column) const;

    int64_t get_long(column_key_t column) const;
    bool get_boolean(column_key_t column) const;
    double get_double(column_key_t column) const;
    std::string get_string(column_key_t column) const;
    std::vector<uint8_t> get_binary(column_key_t column) const;
    timestamp_t get_date(column_key_t column) const;

    object_key_t get_link(column_key_t column) const;
    /// Never null: a missing list reads as empty.
    link_list get_link_list(column_key_t column) const;
    value_list get_value_list(column_key_t column) const;

private:
    const column_def& def(column_key_t column) const;
    const column_value_t& value(column_key_t column) const;

    object_key_t key_;
    columns_ptr columns_;
    std::vector<column_value_t> values_;
};

// ============================================================================
// table - ordered columns plus positional row access
// ============================================================================

class table {
public:
    virtual ~table() = default;

    virtual const std::string& name() const = 0;
    virtual size_t column_count() const = 0;
    virtual const column_def& column(size_t index) const = 0;
    /// Number of rows at the time the table handle was opened.
    virtual size_t size() const = 0;
    /// Row at a physical ordinal in [0, size()).
    virtual row row_at(size_t ordinal) const = 0;

    std::vector<std::string> column_names() const;
};

/// A live rowid table. Physical order is ascending rowid; object key is rowid.
/// Consecutive ordinals in either direction are read from one open cursor.
class stored_table : public table {
public:
    stored_table(const database& db, const std::string& name);

    const std::string& name() const override { return name_; }
    size_t column_count() const override { return columns_->size(); }
    const column_def& column(size_t index) const override { return columns_->at(index); }
    size_t size() const override { return size_; }
    row row_at(size_t ordinal) const override;

private:
    std::string name_;
    row::columns_ptr columns_;
    size_t size_ = 0;
    mutable statement ascending_;
    mutable statement descending_;
    mutable statement julian_day_;
    // Ordinal of the row the active cursor is on
    mutable std::optional<size_t> cursor_ordinal_;
    mutable bool cursor_descending_ = false;
};

/// Rows of an arbitrary statement. Object key is the ordinal.
///
/// Only the window a flatten with the same `limit` and direction reads is
/// kept. In ascending order the statement is stepped at most `limit + 1`
/// times, so size() is exact when everything fit and `limit + 1` when rows
/// were left out. In descending order every row is stepped and the last
/// `limit` are kept.
class result_table : public table {
public:
    result_table(statement stmt, int64_t limit, bool ascending);

    const std::string& name() const override { return name_; }
    size_t column_count() const override { return columns_->size(); }
    const column_def& column(size_t index) const override { return columns_->at(index); }
    size_t size() const override { return size_; }
    row row_at(size_t ordinal) const override;

private:
    std::string name_;
    row::columns_ptr columns_;
    size_t size_ = 0;
    size_t first_ordinal_ = 0;
    std::deque<std::vector<column_value_t>> rows_;
};

} // namespace inspector

#endif // __cplusplus
