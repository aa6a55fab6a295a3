#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <istream>
#include <string>

namespace dumpscrub {

/**
 * @brief First pass over a plain-format dump: collect the table layout
 *
 * Columns come from CREATE TABLE bodies. A table that only appears as a
 * COPY target (e.g. a partition) takes its columns from the COPY column
 * list, with an empty SQL type. COPY data blocks are skipped unread.
 */
class DumpReader {
public:
    [[nodiscard]] static Result<DatabaseSchema> read_schema(std::istream& in);
    [[nodiscard]] static Result<DatabaseSchema> read_schema_file(const std::string& path);
};

} // namespace dumpscrub
