#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace dumpscrub {

/**
 * @brief Anonymisation strategy for one table
 *
 * A truncated table keeps its schema in the output but loses all its rows;
 * its columns need no configuration.
 */
struct TableStrategy {
    std::string table_name;
    std::string description;
    bool truncate = false;
    std::vector<ColumnConfig> columns;     // File order

    [[nodiscard]] const ColumnConfig* find_column(std::string_view name) const {
        for (const auto& c : columns) {
            if (c.name == name) return &c;
        }
        return nullptr;
    }
};

/**
 * @brief Immutable, validated-once per-run column configuration
 */
class Strategy {
public:
    Strategy() = default;
    explicit Strategy(std::vector<TableStrategy> tables) : tables_(std::move(tables)) {}

    [[nodiscard]] const std::vector<TableStrategy>& tables() const { return tables_; }

    [[nodiscard]] const TableStrategy* find_table(std::string_view name) const {
        for (const auto& t : tables_) {
            if (t.table_name == name) return &t;
        }
        return nullptr;
    }

    // Columns of every non-truncated table
    [[nodiscard]] std::vector<ColumnConfig> all_columns() const {
        std::vector<ColumnConfig> result;
        for (const auto& t : tables_) {
            if (t.truncate) continue;
            result.insert(result.end(), t.columns.begin(), t.columns.end());
        }
        return result;
    }

    [[nodiscard]] std::unordered_set<std::string> truncated_tables() const {
        std::unordered_set<std::string> result;
        for (const auto& t : tables_) {
            if (t.truncate) result.insert(t.table_name);
        }
        return result;
    }

private:
    std::vector<TableStrategy> tables_;
};

} // namespace dumpscrub
