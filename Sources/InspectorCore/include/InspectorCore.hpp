#pragma once

// InspectorCore - serve Lattice/SQLite databases to a remote inspector
//
// Usage:
//   #include <InspectorCore.hpp>
//
//   inspector::configuration config;
//   config.limit = 100;
//   inspector::database_domain domain(config);
//
//   auto result = domain.execute_sql({
//       {"databaseId", "/data/app/trips.db"},
//       {"query", "SELECT * FROM Trip"}
//   });
//   // {"columnNames": ["<index>", "id", "name"], "values": [1, 1, "Costa Rica", ...]}

#include "inspector/log.hpp"
#include "inspector/types.hpp"
#include "inspector/configuration.hpp"
#include "inspector/db.hpp"
#include "inspector/table.hpp"
#include "inspector/field_type.hpp"
#include "inspector/value_formatter.hpp"
#include "inspector/row_flattener.hpp"
#include "inspector/query.hpp"
#include "inspector/dispatcher.hpp"
#include "inspector/protocol.hpp"
