#pragma once

#ifdef __cplusplus

#include <cstdint>

namespace inspector {

struct configuration {
    /// Include internal tables (sqlite_*, _*, AuditLog) when listing tables.
    bool with_meta_tables = false;

    /// Maximum number of rows returned for a tabular result. Must be >= 0.
    int64_t limit = 250;

    /// true: rows in storage order. false: last stored row first.
    bool ascending_order = true;

    /// Open inspected databases with SQLITE_OPEN_READONLY.
    /// Write statements then fail with a structured error.
    bool read_only = false;

    configuration() = default;

    configuration(int64_t l, bool ascending)
        : limit(l), ascending_order(ascending) {}
};

} // namespace inspector

#endif // __cplusplus
