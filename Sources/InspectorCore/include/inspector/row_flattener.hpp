#pragma once

#ifdef __cplusplus

#include "table.hpp"

namespace inspector {

/// Flatten a window of `t` into one row-major, column-minor value sequence.
///
/// Emits min(limit, t.size()) rows. Ascending walks physical ordinals
/// 0, 1, ...; descending walks size-1, size-2, ... . With `add_row_index`
/// each row is prefixed by its object key. When rows were left out, one
/// trailing row of "{truncated}" markers (one per column, no index prefix)
/// is appended.
///
/// Throws std::invalid_argument when `limit` is negative.
std::vector<generic_value> flatten_rows(const table& t,
                                        int64_t limit,
                                        bool ascending,
                                        bool add_row_index);

} // namespace inspector

#endif // __cplusplus
