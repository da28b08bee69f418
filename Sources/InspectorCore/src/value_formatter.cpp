#include "inspector/value_formatter.hpp"
#include "inspector/log.hpp"
#include <charconv>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace inspector {

namespace {

int64_t epoch_millis(timestamp_t date) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(date.time_since_epoch()).count();
}

template<typename Float>
std::string shortest(Float value) {
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        return std::to_string(value);
    }
    return std::string(buf, end);
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        hex += digits[b >> 4];
        hex += digits[b & 0x0F];
    }
    return hex;
}

void append_raw(std::string& out, const list_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
            out += shortest(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            out += v;
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            out += to_hex(v);
        } else if constexpr (std::is_same_v<T, timestamp_t>) {
            out += std::to_string(epoch_millis(v));
        }
    }, value);
}

} // namespace

// ============================================================================
// date_formatter
// ============================================================================

date_formatter::date_formatter() : locale_(std::locale::classic()) {
    try {
        locale_ = std::locale("");
    } catch (const std::runtime_error& e) {
        LOG_WARN("formatter", "System locale unavailable, using \"C\": %s", e.what());
    }
}

const date_formatter& date_formatter::instance() {
    static const date_formatter formatter;
    return formatter;
}

std::string date_formatter::format(timestamp_t date) const {
    int64_t millis = epoch_millis(date);
    auto seconds = std::chrono::floor<std::chrono::seconds>(date);
    std::time_t time = std::chrono::system_clock::to_time_t(seconds);

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream ss;
    ss.imbue(locale_);
    ss << std::put_time(&local, "%B %d, %Y %I:%M:%S %p %Z");
    ss << " (" << millis << ')';
    return ss.str();
}

// ============================================================================
// Per-type formatting
// ============================================================================

generic_value format_floating(double value) {
    if (std::isnan(value)) {
        return std::string("NaN");
    }
    if (std::isinf(value)) {
        return std::string(value > 0 ? "Infinity" : "-Infinity");
    }
    return value;
}

std::string format_date(timestamp_t date) {
    return date_formatter::instance().format(date);
}

std::string format_link_list(const link_list& list) {
    std::string out = list.target_table;
    out += '{';
    for (size_t pos = 0; pos < list.size(); ++pos) {
        if (pos != 0) out += ',';
        out += std::to_string(list.key_at(pos));
    }
    out += '}';
    return out;
}

std::string format_value_list(const value_list& list, logical_field_type type) {
    std::string out = to_string(type);
    out += '{';
    for (size_t pos = 0; pos < list.size(); ++pos) {
        if (pos != 0) out += ',';
        append_raw(out, list.value(pos));
    }
    out += '}';
    return out;
}

generic_value format_value(const row& r, column_key_t column, logical_field_type type) {
    if (is_value_list(type)) {
        if (r.is_null_link(column)) return null_value();
        return format_value_list(r.get_value_list(column), type);
    }

    switch (type) {
        case logical_field_type::integer:
            if (r.is_null(column)) return null_value();
            return r.get_long(column);
        case logical_field_type::boolean:
            if (r.is_null(column)) return null_value();
            return r.get_boolean(column);
        case logical_field_type::string:
            if (r.is_null(column)) return null_value();
            return r.get_string(column);
        case logical_field_type::binary:
            if (r.is_null(column)) return null_value();
            return r.get_binary(column);
        case logical_field_type::float_:
        case logical_field_type::double_:
            // SQLite stores both as 8-byte REAL
            if (r.is_null(column)) return null_value();
            return format_floating(r.get_double(column));
        case logical_field_type::legacy_date:
        case logical_field_type::date:
            if (r.is_null(column)) return null_value();
            // Text that does not parse as a date/time
            if (r.is_text(column)) return r.get_string(column);
            return format_date(r.get_date(column));
        case logical_field_type::object_link:
            if (r.is_null_link(column)) return null_value();
            return link_ref{r.get_link(column)};
        case logical_field_type::link_list:
            return format_link_list(r.get_link_list(column));
        default:
            break;
    }
    return std::string("unknown column type: ") + to_string(r.get_column_type(column));
}

} // namespace inspector
