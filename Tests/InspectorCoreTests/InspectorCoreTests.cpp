#undef NDEBUG
#include <InspectorCore.hpp>
#include <algorithm>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <cmath>
#include <limits>

using inspector::generic_value;
using inspector::logical_field_type;
using inspector::native_field_type;

// ============================================================================
// Helpers
// ============================================================================

static generic_value str(const char* s) {
    return std::string(s);
}

static generic_value num(int64_t v) {
    return v;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static const std::string& as_string(const generic_value& v) {
    assert(std::holds_alternative<std::string>(v));
    return std::get<std::string>(v);
}

// Table "nums" holding 1..rows in insertion order
static void fill_numbers(inspector::database& db, int rows) {
    db.execute("CREATE TABLE nums(n INTEGER)");
    for (int i = 1; i <= rows; ++i) {
        db.execute("INSERT INTO nums(n) VALUES(?)", {static_cast<int64_t>(i)});
    }
}

// Single cell of a one-row table, read without the index column
static generic_value browse_cell(inspector::database& db, const std::string& table, size_t column) {
    inspector::stored_table t(db, table);
    auto values = inspector::flatten_rows(t, 10, true, false);
    assert(values.size() == t.column_count());
    return values.at(column);
}

// ============================================================================
// Test: Field Type Classifier
// ============================================================================

void test_classifier() {
    std::cout << "Testing field type classifier..." << std::endl;

    using inspector::classify;
    assert(classify(native_field_type::integer) == logical_field_type::integer);
    assert(classify(native_field_type::boolean) == logical_field_type::boolean);
    assert(classify(native_field_type::string) == logical_field_type::string);
    assert(classify(native_field_type::binary) == logical_field_type::binary);
    assert(classify(native_field_type::unsupported_table) == logical_field_type::unsupported_table);
    assert(classify(native_field_type::unsupported_mixed) == logical_field_type::unsupported_mixed);
    assert(classify(native_field_type::unsupported_date) == logical_field_type::legacy_date);
    assert(classify(native_field_type::date) == logical_field_type::date);
    assert(classify(native_field_type::float_) == logical_field_type::float_);
    assert(classify(native_field_type::double_) == logical_field_type::double_);
    assert(classify(native_field_type::object) == logical_field_type::object_link);
    assert(classify(native_field_type::list) == logical_field_type::link_list);
    assert(classify(native_field_type::integer_list) == logical_field_type::integer_list);
    assert(classify(native_field_type::boolean_list) == logical_field_type::boolean_list);
    assert(classify(native_field_type::string_list) == logical_field_type::string_list);
    assert(classify(native_field_type::binary_list) == logical_field_type::binary_list);
    assert(classify(native_field_type::date_list) == logical_field_type::date_list);
    assert(classify(native_field_type::float_list) == logical_field_type::float_list);
    assert(classify(native_field_type::double_list) == logical_field_type::double_list);

    // No logical counterpart
    assert(classify(native_field_type::linking_objects) == logical_field_type::unknown);
    assert(classify(native_field_type::decimal) == logical_field_type::unknown);
    assert(classify(native_field_type::object_id) == logical_field_type::unknown);
    assert(classify(native_field_type::uuid) == logical_field_type::unknown);
    assert(classify(native_field_type::typed_link) == logical_field_type::unknown);

    // Identifiers a newer engine might report
    assert(classify(static_cast<native_field_type>(3)) == logical_field_type::unknown);
    assert(classify(static_cast<native_field_type>(99)) == logical_field_type::unknown);

    assert(std::string(inspector::to_string(logical_field_type::integer_list)) == "INTEGER_LIST");
    assert(std::string(inspector::to_string(native_field_type::unsupported_date)) == "UNSUPPORTED_DATE");
    assert(inspector::is_value_list(logical_field_type::date_list));
    assert(!inspector::is_value_list(logical_field_type::link_list));

    std::cout << "  Classifier test passed!" << std::endl;
}

// ============================================================================
// Test: Declared SQL types -> storage types
// ============================================================================

void test_declared_types() {
    std::cout << "Testing declared column types..." << std::endl;

    using inspector::native_type_from_declared;
    assert(native_type_from_declared("INTEGER") == native_field_type::integer);
    assert(native_type_from_declared("integer") == native_field_type::integer);
    assert(native_type_from_declared("INTEGER", true) == native_field_type::object);
    assert(native_type_from_declared("BOOLEAN") == native_field_type::boolean);
    assert(native_type_from_declared("VARCHAR(255)") == native_field_type::string);
    assert(native_type_from_declared("BLOB") == native_field_type::binary);
    assert(native_type_from_declared("FLOAT") == native_field_type::float_);
    assert(native_type_from_declared("REAL") == native_field_type::double_);
    assert(native_type_from_declared("DOUBLE PRECISION") == native_field_type::double_);
    assert(native_type_from_declared("DATE") == native_field_type::date);
    assert(native_type_from_declared("LEGACY_DATE") == native_field_type::unsupported_date);
    assert(native_type_from_declared("LINK_LIST", true) == native_field_type::list);
    assert(native_type_from_declared("INTEGER_LIST") == native_field_type::integer_list);
    assert(native_type_from_declared("DOUBLE_LIST") == native_field_type::double_list);
    assert(native_type_from_declared("") == native_field_type::unsupported_mixed);
    assert(native_type_from_declared("NUMERIC") == native_field_type::decimal);
    assert(native_type_from_declared("NVARCHAR") == native_field_type::string);
    assert(native_type_from_declared("MEDIUMINT") == native_field_type::integer);

    std::cout << "  Declared types test passed!" << std::endl;
}

// ============================================================================
// Test: End-to-end two-column example
// ============================================================================

void test_end_to_end() {
    std::cout << "Testing end-to-end select..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE t(id INTEGER, name TEXT)");
    db.execute("INSERT INTO t(id, name) VALUES (1, 'a'), (2, NULL)");

    inspector::configuration config(10, true);
    inspector::query_dispatcher dispatcher(db, config);

    auto response = dispatcher.execute("SELECT id, name FROM t");
    assert(!response.error);
    assert(response.column_names);
    assert((*response.column_names == std::vector<std::string>{"id", "name"}));
    assert(response.values);
    assert((*response.values == std::vector<generic_value>{num(1), str("a"), num(2), str("[null]")}));

    // Whole-table browse gets the synthetic index column
    response = dispatcher.execute("select * from t;");
    assert((*response.column_names == std::vector<std::string>{"<index>", "id", "name"}));
    assert((*response.values == std::vector<generic_value>{
        num(1), num(1), str("a"),
        num(2), num(2), str("[null]")}));

    std::cout << "  End-to-end test passed!" << std::endl;
}

// ============================================================================
// Test: Row window, ordering and truncation
// ============================================================================

void test_row_window() {
    std::cout << "Testing row window and truncation..." << std::endl;

    inspector::database db(":memory:");
    fill_numbers(db, 5);
    db.execute("CREATE TABLE empty(a INTEGER, b TEXT)");
    inspector::stored_table t(db, "nums");
    assert(t.size() == 5);

    for (int64_t limit = 0; limit <= 7; ++limit) {
        for (bool ascending : {true, false}) {
            auto values = inspector::flatten_rows(t, limit, ascending, false);
            size_t count = static_cast<size_t>(std::min<int64_t>(limit, 5));
            bool truncated = limit < 5;
            assert(values.size() == count + (truncated ? 1 : 0));

            for (size_t i = 0; i < count; ++i) {
                int64_t expected = ascending ? static_cast<int64_t>(i) + 1 : 5 - static_cast<int64_t>(i);
                assert(values[i] == num(expected));
            }
            if (truncated) {
                assert(values.back() == str("{truncated}"));
            }
        }
    }

    // Out-of-order reads reposition the cursor
    for (size_t ordinal : {3u, 0u, 4u, 2u, 1u, 1u, 0u}) {
        assert(t.row_at(ordinal).object_key() == static_cast<int64_t>(ordinal) + 1);
    }

    bool threw = false;
    try {
        t.row_at(5);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // Empty table: nothing, not even a truncation row
    inspector::stored_table empty(db, "empty");
    assert(inspector::flatten_rows(empty, 0, true, true).empty());
    assert(inspector::flatten_rows(empty, 10, false, true).empty());

    std::cout << "  Row window test passed!" << std::endl;
}

void test_row_index_column() {
    std::cout << "Testing row index column..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE pets(name TEXT, age INTEGER)");
    db.execute("INSERT INTO pets(rowid, name, age) VALUES (10, 'Max', 3), (20, 'Bella', 5), (30, 'Rex', 1)");

    inspector::stored_table t(db, "pets");
    auto values = inspector::flatten_rows(t, 2, false, true);

    // Two rows of (key, name, age), then one marker per column without a key
    assert(values.size() == 2 * 3 + 2);
    assert(values[0] == num(30));
    assert(values[1] == str("Rex"));
    assert(values[2] == num(1));
    assert(values[3] == num(20));
    assert(values[4] == str("Bella"));
    assert(values[6] == str("{truncated}"));
    assert(values[7] == str("{truncated}"));

    // Object key does not depend on traversal direction
    auto ascending = inspector::flatten_rows(t, 3, true, true);
    assert(ascending.size() == 9);
    assert(ascending[0] == num(10));
    assert(ascending[6] == num(30));

    std::cout << "  Row index test passed!" << std::endl;
}

void test_result_window() {
    std::cout << "Testing result row window..." << std::endl;

    inspector::database db(":memory:");
    fill_numbers(db, 10);

    // Stepping stops one row past the window
    inspector::result_table first(db.prepare("SELECT n FROM nums"), 3, true);
    assert(first.size() == 4);
    assert(first.row_at(0).get_long(0) == 1);
    assert(first.row_at(2).get_long(0) == 3);
    bool threw = false;
    try {
        first.row_at(3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert((inspector::flatten_rows(first, 3, true, false) ==
            std::vector<generic_value>{num(1), num(2), num(3), str("{truncated}")}));

    // Descending keeps the last rows
    inspector::result_table last(db.prepare("SELECT n FROM nums"), 3, false);
    assert(last.size() == 10);
    assert(last.row_at(9).get_long(0) == 10);
    assert(last.row_at(7).get_long(0) == 8);
    threw = false;
    try {
        last.row_at(6);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert((inspector::flatten_rows(last, 3, false, false) ==
            std::vector<generic_value>{num(10), num(9), num(8), str("{truncated}")}));

    // Everything fits: exact size, no truncation
    inspector::result_table all(db.prepare("SELECT n FROM nums WHERE n > 8"), 3, true);
    assert(all.size() == 2);
    assert((inspector::flatten_rows(all, 3, true, false) == std::vector<generic_value>{num(9), num(10)}));

    inspector::result_table none(db.prepare("SELECT n FROM nums"), 0, true);
    assert(none.size() == 1);
    assert((inspector::flatten_rows(none, 0, true, false) == std::vector<generic_value>{str("{truncated}")}));

    inspector::query_dispatcher dispatcher(db, inspector::configuration(2, false));
    auto response = dispatcher.execute("SELECT n * 10 AS tens FROM nums WHERE n <= 5");
    assert((*response.column_names == std::vector<std::string>{"tens"}));
    assert((*response.values == std::vector<generic_value>{num(50), num(40), str("{truncated}")}));

    std::cout << "  Result window test passed!" << std::endl;
}

void test_negative_limit() {
    std::cout << "Testing negative limit..." << std::endl;

    inspector::database db(":memory:");
    fill_numbers(db, 2);
    inspector::stored_table t(db, "nums");

    bool threw = false;
    try {
        inspector::flatten_rows(t, -1, true, false);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Not turned into a structured client error
    inspector::configuration config(-1, true);
    inspector::query_dispatcher dispatcher(db, config);
    threw = false;
    try {
        dispatcher.execute("SELECT * FROM nums");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        dispatcher.execute("SELECT n FROM nums WHERE n > 0");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Negative limit test passed!" << std::endl;
}

// ============================================================================
// Test: Value Formatter
// ============================================================================

void test_null_values() {
    std::cout << "Testing null values..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE Pet(name TEXT)");
    db.execute(R"(
        CREATE TABLE everything(
            i INTEGER, b BOOLEAN, s TEXT, bin BLOB, f FLOAT, d DOUBLE,
            dt DATE, old LEGACY_DATE,
            pet INTEGER REFERENCES Pet(rowid),
            pets LINK_LIST REFERENCES Pet(rowid),
            ints INTEGER_LIST, strings STRING_LIST
        )
    )");
    db.execute("INSERT INTO everything(ints, strings) VALUES (NULL, '[]')");

    inspector::stored_table t(db, "everything");
    assert(t.column(8).type == native_field_type::object);
    assert(t.column(9).type == native_field_type::list);
    assert(t.column(9).target_table == std::optional<std::string>("Pet"));

    auto values = inspector::flatten_rows(t, 10, true, false);
    assert(values.size() == 12);
    for (size_t i = 0; i < 9; ++i) {
        assert(values[i] == str("[null]"));
    }
    // Link lists are never null, only empty
    assert(values[9] == str("Pet{}"));
    assert(values[10] == str("[null]"));
    // Empty list is not null
    assert(values[11] == str("STRING_LIST{}"));

    std::cout << "  Null values test passed!" << std::endl;
}

void test_scalar_values() {
    std::cout << "Testing scalar values..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE scalars(i INTEGER, b BOOLEAN, s TEXT, bin BLOB, f FLOAT, d DOUBLE)");
    db.execute("INSERT INTO scalars VALUES (-42, 1, 'hello', x'00ff10', 1.5, 2.25)");

    assert(browse_cell(db, "scalars", 0) == num(-42));
    assert(browse_cell(db, "scalars", 1) == generic_value(true));
    assert(browse_cell(db, "scalars", 2) == str("hello"));
    assert(browse_cell(db, "scalars", 3) == generic_value(std::vector<uint8_t>{0x00, 0xff, 0x10}));
    assert(browse_cell(db, "scalars", 4) == generic_value(1.5));
    assert(browse_cell(db, "scalars", 5) == generic_value(2.25));

    // FLOAT is not narrowed on the way out
    db.execute("CREATE TABLE ratios(f FLOAT)");
    db.execute("INSERT INTO ratios VALUES (0.1)");
    assert(browse_cell(db, "ratios", 0) == generic_value(0.1));

    std::cout << "  Scalar values test passed!" << std::endl;
}

void test_floating_special_values() {
    std::cout << "Testing floating point special values..." << std::endl;

    using inspector::format_floating;
    assert(format_floating(std::numeric_limits<double>::quiet_NaN()) == str("NaN"));
    assert(format_floating(std::numeric_limits<double>::infinity()) == str("Infinity"));
    assert(format_floating(-std::numeric_limits<double>::infinity()) == str("-Infinity"));
    assert(format_floating(0.0) == generic_value(0.0));
    assert(format_floating(-3.5) == generic_value(-3.5));
    assert(format_floating(std::numeric_limits<double>::max()) ==
           generic_value(std::numeric_limits<double>::max()));

    // Infinities survive storage; SQLite stores NaN as NULL
    inspector::database db(":memory:");
    db.execute("CREATE TABLE measurements(f FLOAT, d DOUBLE)");
    db.execute("INSERT INTO measurements VALUES (9e999, -9e999)");
    assert(browse_cell(db, "measurements", 0) == str("Infinity"));
    assert(browse_cell(db, "measurements", 1) == str("-Infinity"));

    std::cout << "  Floating point test passed!" << std::endl;
}

void test_dates() {
    std::cout << "Testing dates..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE events(at DATE, legacy LEGACY_DATE)");
    db.execute("INSERT INTO events VALUES (1700000000000, 1700000000.5)");

    auto at_cell = browse_cell(db, "events", 0);
    const auto& at = as_string(at_cell);
    assert(ends_with(at, " (1700000000000)"));
    assert(at.size() > std::string(" (1700000000000)").size());

    // Seconds since epoch, reported in milliseconds
    auto legacy_cell = browse_cell(db, "events", 1);
    const auto& legacy = as_string(legacy_cell);
    assert(ends_with(legacy, " (1700000000500)"));

    // Same instant, same rendering
    auto direct = inspector::format_date(inspector::timestamp_t(std::chrono::milliseconds(1700000000000)));
    assert(direct == at);

    // ISO-8601 text is parsed as UTC
    db.execute("CREATE TABLE logged(at DATETIME, stamp TIMESTAMP, legacy LEGACY_DATE, note DATE)");
    db.execute("INSERT INTO logged VALUES ('2024-03-04 10:15:00', '2024-03-04T10:15:00.250Z', "
               "'1970-01-01 00:00:01', 'soon')");
    auto text_cell = browse_cell(db, "logged", 0);
    assert(ends_with(as_string(text_cell), " (1709547300000)"));
    auto stamp_cell = browse_cell(db, "logged", 1);
    assert(ends_with(as_string(stamp_cell), " (1709547300250)"));
    auto legacy_text_cell = browse_cell(db, "logged", 2);
    assert(ends_with(as_string(legacy_text_cell), " (1000)"));
    // Text that is not a date is passed through
    assert(browse_cell(db, "logged", 3) == str("soon"));

    // Same parsing for query results
    inspector::query_dispatcher dispatcher(db, inspector::configuration{});
    auto response = dispatcher.execute("SELECT at FROM logged WHERE note = 'soon'");
    assert(ends_with(as_string((*response.values)[0]), " (1709547300000)"));

    // Before the epoch
    auto early = inspector::format_date(inspector::timestamp_t(std::chrono::milliseconds(-1500)));
    assert(ends_with(early, " (-1500)"));

    std::cout << "  Dates test passed!" << std::endl;
}

void test_links() {
    std::cout << "Testing links and link lists..." << std::endl;

    inspector::link_list empty{"T", {}};
    assert(inspector::format_link_list(empty) == "T{}");
    inspector::link_list two{"T", {5, 9}};
    assert(inspector::format_link_list(two) == "T{5,9}");

    inspector::database db(":memory:");
    db.execute("CREATE TABLE Person(name TEXT)");
    db.execute("CREATE TABLE Dog(name TEXT)");
    db.execute("CREATE TABLE Owner(name TEXT, "
               "person INTEGER REFERENCES Person(rowid), "
               "dogs LINK_LIST REFERENCES Dog(rowid))");
    db.execute("INSERT INTO Owner VALUES ('a', 3, '[5,9]'), ('b', NULL, '[]'), ('c', 7, NULL)");

    inspector::stored_table t(db, "Owner");
    auto values = inspector::flatten_rows(t, 10, true, false);
    assert(values.size() == 9);
    assert(values[1] == generic_value(inspector::link_ref{3}));
    assert(values[2] == str("Dog{5,9}"));
    assert(values[4] == str("[null]"));
    assert(values[5] == str("Dog{}"));
    assert(values[7] == generic_value(inspector::link_ref{7}));
    assert(values[8] == str("Dog{}"));

    std::cout << "  Links test passed!" << std::endl;
}

void test_value_lists() {
    std::cout << "Testing value lists..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE lists(ints INTEGER_LIST, bools BOOLEAN_LIST, strings STRING_LIST, "
               "blobs BINARY_LIST, dates DATE_LIST, floats FLOAT_LIST, doubles DOUBLE_LIST)");
    db.execute(R"(INSERT INTO lists VALUES (
        '[1,2,3]', '[true,false,1]', '["a","b c"]',
        '["0aff",""]', '[1000,-5]', '[0.5,"Infinity"]', '[1.25,"NaN",null]'
    ))");

    inspector::stored_table t(db, "lists");
    auto values = inspector::flatten_rows(t, 1, true, false);
    assert(values.size() == 7);
    assert(values[0] == str("INTEGER_LIST{1,2,3}"));
    assert(values[1] == str("BOOLEAN_LIST{true,false,true}"));
    assert(values[2] == str("STRING_LIST{a,b c}"));
    assert(values[3] == str("BINARY_LIST{0aff,}"));
    assert(values[4] == str("DATE_LIST{1000,-5}"));
    // No per-element substitution
    assert(values[5] == str("FLOAT_LIST{0.5,inf}"));
    assert(values[6] == str("DOUBLE_LIST{1.25,nan,null}"));

    std::cout << "  Value lists test passed!" << std::endl;
}

void test_unknown_types() {
    std::cout << "Testing unsupported column types..." << std::endl;

    inspector::database db(":memory:");
    db.execute("CREATE TABLE odd(price NUMERIC, anything, owners LINKING_OBJECTS, id UUID, name TEXT)");
    db.execute("INSERT INTO odd VALUES (1.5, 'x', NULL, 'abc', 'kept')");

    inspector::stored_table t(db, "odd");
    auto values = inspector::flatten_rows(t, 10, true, false);
    assert(values.size() == 5);
    assert(values[0] == str("unknown column type: DECIMAL"));
    assert(values[1] == str("unknown column type: UNSUPPORTED_MIXED"));
    assert(values[2] == str("unknown column type: LINKING_OBJECTS"));
    assert(values[3] == str("unknown column type: UUID"));
    // The rest of the row is unaffected
    assert(values[4] == str("kept"));

    std::cout << "  Unsupported types test passed!" << std::endl;
}

void test_log_level() {
    std::cout << "Testing log level..." << std::endl;

    assert(inspector::get_log_level() == inspector::log_level::off);
    inspector::set_log_level(inspector::log_level::warn);
    assert(inspector::get_log_level() == inspector::log_level::warn);

    // Unsupported columns are reported once per request at warn level
    inspector::database db(":memory:");
    db.execute("CREATE TABLE tagged(id UUID)");
    db.execute("INSERT INTO tagged VALUES ('abc')");
    assert(browse_cell(db, "tagged", 0) == str("unknown column type: UUID"));

    inspector::set_log_level(inspector::log_level::off);
    assert(inspector::get_log_level() == inspector::log_level::off);

    std::cout << "  Log level test passed!" << std::endl;
}

// ============================================================================
// Test: Query engine and dispatcher
// ============================================================================

void test_statement_kinds() {
    std::cout << "Testing statement classification..." << std::endl;

    using inspector::statement_kind;
    using inspector::classify_statement;
    assert(classify_statement("SELECT 1") == statement_kind::select);
    assert(classify_statement("  -- comment\n select 1") == statement_kind::select);
    assert(classify_statement("/* c */ WITH x AS (SELECT 1) SELECT * FROM x") == statement_kind::select);
    assert(classify_statement("PRAGMA table_info(t)") == statement_kind::select);
    assert(classify_statement("insert into t values (1)") == statement_kind::insert);
    assert(classify_statement("REPLACE INTO t VALUES (1)") == statement_kind::insert);
    assert(classify_statement("UPDATE t SET a = 1") == statement_kind::update_delete);
    assert(classify_statement("delete from t") == statement_kind::update_delete);
    assert(classify_statement("CREATE TABLE t(a)") == statement_kind::other);
    assert(classify_statement("WITH x(a) AS (SELECT 1) INSERT INTO t SELECT a FROM x") == statement_kind::insert);
    assert(classify_statement("with recursive c AS (select 1 union all select 1) "
                              "delete from t where 'select' = ')'") == statement_kind::update_delete);
    assert(classify_statement("WITH \"insert\" AS (SELECT 1) SELECT * FROM \"insert\"") == statement_kind::select);
    assert(classify_statement("WITH x AS MATERIALIZED (SELECT 1) UPDATE t SET a = 1") == statement_kind::update_delete);

    using inspector::whole_table_select;
    assert(whole_table_select("SELECT * FROM Trip") == std::optional<std::string>("Trip"));
    assert(whole_table_select("  select *  from trip ; ") == std::optional<std::string>("trip"));
    assert(whole_table_select("SELECT * FROM \"My \"\"Table\"\"\"") == std::optional<std::string>("My \"Table\""));
    assert(whole_table_select("SELECT * FROM [Order]") == std::optional<std::string>("Order"));
    assert(!whole_table_select("SELECT * FROM Trip WHERE days > 3"));
    assert(!whole_table_select("SELECT name FROM Trip"));

    std::cout << "  Statement classification test passed!" << std::endl;
}

void test_query_outcomes() {
    std::cout << "Testing query outcomes..." << std::endl;

    inspector::database db(":memory:");
    inspector::query_dispatcher dispatcher(db, inspector::configuration{});

    auto response = dispatcher.execute("CREATE TABLE Trip(name TEXT, days INTEGER)");
    assert(!response.error);
    assert((*response.column_names == std::vector<std::string>{"success"}));
    assert((*response.values == std::vector<generic_value>{str("true")}));

    response = dispatcher.execute("INSERT INTO Trip VALUES ('Costa Rica', 10)");
    assert((*response.column_names == std::vector<std::string>{"ID of last inserted row"}));
    assert((*response.values == std::vector<generic_value>{num(1)}));

    dispatcher.execute("INSERT INTO Trip VALUES ('Iceland', 5)");
    dispatcher.execute("INSERT INTO Trip VALUES ('Japan', 14)");

    response = dispatcher.execute("UPDATE Trip SET days = days + 1 WHERE days > 6");
    assert((*response.column_names == std::vector<std::string>{"Modified rows"}));
    assert((*response.values == std::vector<generic_value>{num(2)}));

    response = dispatcher.execute("DELETE FROM Trip WHERE name = 'nowhere'");
    assert((*response.values == std::vector<generic_value>{num(0)}));

    // Aggregates have no declared type; inferred from the value
    response = dispatcher.execute("SELECT count(*) AS n, avg(days) AS avg_days FROM Trip");
    assert((*response.column_names == std::vector<std::string>{"n", "avg_days"}));
    assert((*response.values)[0] == num(3));
    assert(std::holds_alternative<double>((*response.values)[1]));

    // Filtered select is not a whole-table browse
    response = dispatcher.execute("SELECT name FROM Trip WHERE days > 10 ORDER BY name");
    assert((*response.column_names == std::vector<std::string>{"name"}));
    assert((*response.values == std::vector<generic_value>{str("Costa Rica"), str("Japan")}));

    // WITH clauses are classified by the statement they introduce
    response = dispatcher.execute(
        "WITH t(n, d) AS (VALUES ('Peru', 9)) INSERT INTO Trip SELECT n, d FROM t");
    assert((*response.column_names == std::vector<std::string>{"ID of last inserted row"}));
    assert((*response.values == std::vector<generic_value>{num(4)}));

    response = dispatcher.execute(
        "WITH long AS (SELECT name FROM Trip WHERE days > 10) "
        "DELETE FROM Trip WHERE name IN (SELECT name FROM long)");
    assert((*response.column_names == std::vector<std::string>{"Modified rows"}));
    assert((*response.values == std::vector<generic_value>{num(2)}));

    // WITHOUT ROWID tables are read as plain results, without the index column
    dispatcher.execute("CREATE TABLE kv(k TEXT PRIMARY KEY, v INTEGER) WITHOUT ROWID");
    dispatcher.execute("INSERT INTO kv VALUES ('b', 2), ('a', 1)");
    assert(!db.has_rowid("kv"));
    assert(db.has_rowid("Trip"));
    response = dispatcher.execute("SELECT * FROM kv");
    assert(!response.error);
    assert((*response.column_names == std::vector<std::string>{"k", "v"}));
    assert((*response.values == std::vector<generic_value>{str("a"), num(1), str("b"), num(2)}));

    std::cout << "  Query outcomes test passed!" << std::endl;
}

void test_query_errors() {
    std::cout << "Testing query errors..." << std::endl;

    inspector::database db(":memory:");
    inspector::query_dispatcher dispatcher(db, inspector::configuration{});

    auto response = dispatcher.execute("SELEC nonsense");
    assert(response.error);
    assert(response.error->code == 0);
    assert(response.error->message.find("syntax error") != std::string::npos);
    assert(!response.column_names);
    assert(!response.values);

    response = dispatcher.execute("SELECT * FROM missing");
    assert(response.error);
    assert(response.error->message.find("no such table") != std::string::npos);

    response = dispatcher.execute("   ");
    assert(response.error);
    assert(response.error->message == "empty query");

    // Malformed stored list surfaces as an engine error
    db.execute("CREATE TABLE broken(v INTEGER_LIST)");
    db.execute("INSERT INTO broken VALUES ('not json')");
    response = dispatcher.execute("SELECT * FROM broken");
    assert(response.error);
    assert(response.error->code == 0);
    assert(!response.values);

    std::cout << "  Query errors test passed!" << std::endl;
}

// ============================================================================
// Test: Database domain (JSON protocol)
// ============================================================================

void test_database_domain() {
    std::cout << "Testing database domain..." << std::endl;

    std::string test_path = (std::filesystem::temp_directory_path() / "inspector_domain_test.db").string();
    std::filesystem::remove(test_path);

    {
        inspector::database db(test_path);
        db.execute("CREATE TABLE Trip(name TEXT, days INTEGER, photo BLOB)");
        db.execute("CREATE TABLE _Trip_Place_places(lhs TEXT, rhs TEXT)");
        db.execute("CREATE TABLE AuditLog(id INTEGER PRIMARY KEY AUTOINCREMENT, tableName TEXT)");
        db.execute("INSERT INTO Trip VALUES ('Costa Rica', 10, x'0102'), ('Iceland', NULL, NULL)");
    }

    inspector::configuration config;
    config.limit = 1;
    config.ascending_order = false;
    inspector::database_domain domain(config);

    auto tables = domain.handle("Database.getDatabaseTableNames", {{"databaseId", test_path}});
    assert(tables["tableNames"] == nlohmann::json::array({"Trip"}));

    auto result = domain.execute_sql({{"databaseId", test_path}, {"query", "SELECT * FROM Trip"}});
    assert(result["columnNames"] == nlohmann::json::array({"<index>", "name", "days", "photo"}));
    assert(result["values"] == nlohmann::json::parse(
        R"([2, "Iceland", "[null]", "[null]", "{truncated}", "{truncated}", "{truncated}"])"));
    assert(!result.contains("sqlError"));

    result = domain.handle("executeSQL", {{"databaseId", test_path}, {"query", "SELECT photo FROM Trip WHERE days = 10"}});
    assert(result["values"] == nlohmann::json::parse("[[1, 2]]"));

    result = domain.execute_sql({{"databaseId", test_path}, {"query", "SELEC"}});
    assert(result.size() == 1);
    assert(result["sqlError"]["code"] == 0);
    assert(result["sqlError"]["message"].get<std::string>().find("syntax error") != std::string::npos);

    // Missing params are a protocol error, not an SQL error
    bool threw = false;
    try {
        domain.execute_sql({{"databaseId", test_path}});
    } catch (const inspector::protocol_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        domain.handle("Database.enable", nlohmann::json::object());
    } catch (const inspector::protocol_error&) {
        threw = true;
    }
    assert(threw);

    inspector::configuration meta_config;
    meta_config.with_meta_tables = true;
    inspector::database_domain meta_domain(meta_config);
    tables = meta_domain.get_database_table_names({{"databaseId", test_path}});
    auto names = tables["tableNames"].get<std::vector<std::string>>();
    assert(std::find(names.begin(), names.end(), "_Trip_Place_places") != names.end());
    assert(std::find(names.begin(), names.end(), "AuditLog") != names.end());
    assert(std::find(names.begin(), names.end(), "sqlite_sequence") != names.end());

    std::filesystem::remove(test_path);

    std::cout << "  Database domain test passed!" << std::endl;
}

void test_read_only_domain() {
    std::cout << "Testing read-only database domain..." << std::endl;

    std::string test_path = (std::filesystem::temp_directory_path() / "inspector_read_only_test.db").string();
    std::filesystem::remove(test_path);

    {
        inspector::database db(test_path);
        db.execute("CREATE TABLE Trip(name TEXT)");
    }

    inspector::configuration config;
    config.read_only = true;
    inspector::database_domain domain(config);

    auto result = domain.execute_sql({{"databaseId", test_path}, {"query", "INSERT INTO Trip VALUES ('x')"}});
    assert(result.contains("sqlError"));
    assert(result["sqlError"]["code"] == 0);
    assert(!result.contains("columnNames"));

    // Opening a database that does not exist is reported the same way
    result = domain.execute_sql({{"databaseId", test_path + ".missing"}, {"query", "SELECT 1"}});
    assert(result.contains("sqlError"));

    std::filesystem::remove(test_path);

    std::cout << "  Read-only domain test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== InspectorCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Type mapping
        test_classifier();
        test_declared_types();

        // Flattening
        test_end_to_end();
        test_row_window();
        test_row_index_column();
        test_result_window();
        test_negative_limit();

        // Formatting
        test_null_values();
        test_scalar_values();
        test_floating_special_values();
        test_dates();
        test_links();
        test_value_lists();
        test_unknown_types();
        test_log_level();

        // Queries
        test_statement_kinds();
        test_query_outcomes();
        test_query_errors();

        // Protocol
        test_database_domain();
        test_read_only_domain();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (20 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
