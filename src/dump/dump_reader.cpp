#include "dump/dump_reader.hpp"
#include "dump/copy_statement.hpp"

#include <format>
#include <fstream>

namespace dumpscrub {

Result<DatabaseSchema> DumpReader::read_schema(std::istream& in) {
    DatabaseSchema schema;
    TableSchema* current = nullptr;
    bool in_copy = false;
    size_t line_no = 0;

    std::string line;
    while (std::getline(in, line)) {
        ++line_no;

        if (in_copy) {
            if (dump::is_copy_terminator(line)) in_copy = false;
            continue;
        }

        if (current) {
            if (dump::is_create_table_end(line)) {
                current = nullptr;
            } else if (auto col = dump::parse_column_definition(line)) {
                current->columns.emplace_back(std::move(*col));
            }
            continue;
        }

        if (auto name = dump::parse_create_table(line)) {
            if (schema.find_table(*name)) {
                return Result<DatabaseSchema>::error(ErrorCode::PARSE_ERROR,
                    std::format("line {}: table {} is created twice", line_no, *name));
            }
            schema.tables.push_back(TableSchema{std::move(*name), {}});
            current = &schema.tables.back();
            continue;
        }

        if (auto copy = dump::parse_copy_statement(line)) {
            in_copy = true;
            if (!schema.find_table(copy->table_name)) {
                TableSchema table{copy->table_name, {}};
                for (auto& col : copy->columns) {
                    table.columns.emplace_back(std::move(col), "");
                }
                schema.tables.push_back(std::move(table));
            }
        }
    }

    if (in.bad()) {
        return Result<DatabaseSchema>::error(ErrorCode::IO_ERROR, "read error while scanning dump");
    }
    if (current) {
        return Result<DatabaseSchema>::error(ErrorCode::PARSE_ERROR,
            std::format("unterminated CREATE TABLE {}", current->name));
    }
    if (in_copy) {
        return Result<DatabaseSchema>::error(ErrorCode::PARSE_ERROR,
            "unterminated COPY data block");
    }
    return Result<DatabaseSchema>::ok(std::move(schema));
}

Result<DatabaseSchema> DumpReader::read_schema_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<DatabaseSchema>::error(ErrorCode::IO_ERROR,
            std::format("Failed to open dump file: {}", path));
    }
    return read_schema(in);
}

} // namespace dumpscrub
