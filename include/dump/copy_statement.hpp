#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dumpscrub {
namespace dump {

// ============================================================================
// Statement Recognition (plain-format pg_dump)
// ============================================================================

/**
 * @brief A `COPY <table> (<col>, ...) FROM stdin;` header line
 *
 * Identifiers are unquoted ("Order" -> Order); schema qualification is kept.
 */
struct CopyStatement {
    std::string table_name;
    std::vector<std::string> columns;
};

// Only text-format COPY ... FROM stdin headers are recognised
[[nodiscard]] std::optional<CopyStatement> parse_copy_statement(std::string_view line);

// `CREATE TABLE <name> (` -> <name>
[[nodiscard]] std::optional<std::string> parse_create_table(std::string_view line);

/**
 * @brief One line of a CREATE TABLE body -> column
 *
 * Returns nullopt for table constraints (CONSTRAINT, PRIMARY KEY, UNIQUE,
 * CHECK, FOREIGN KEY, EXCLUDE) and for the closing `);` line.
 */
[[nodiscard]] std::optional<SchemaColumn> parse_column_definition(std::string_view line);

// Terminator of a COPY data block
[[nodiscard]] inline bool is_copy_terminator(std::string_view line) {
    return line == "\\.";
}

// Closing line of a CREATE TABLE body
[[nodiscard]] bool is_create_table_end(std::string_view line);

// Strip double quotes from each part of a (possibly qualified) identifier
[[nodiscard]] std::string unquote_identifier(std::string_view ident);

} // namespace dump
} // namespace dumpscrub
