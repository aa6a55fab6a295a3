#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "transform/ifake_data_source.hpp"
#include "transform/transformer.hpp"
#include "transform/uniqueness_tracker.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dumpscrub {

/**
 * @brief Applies each column's transformer to one row at a time
 *
 * Thread-safe: rows may be rewritten concurrently from several workers.
 * Resolved transformers are cached per (table, column) after first use.
 * SQL NULLs pass through untouched. For array-typed columns the transformer
 * is applied to every element of the array literal.
 */
class RowRewriter {
public:
    RowRewriter(IFakeDataSource& fake, UniquenessTracker& uniqueness);

    /**
     * @brief Rewrite one row
     * @param table Table name (uniqueness scope)
     * @param columns Column configs, positionally aligned with values
     * @param values Original values
     * @param array_columns Optional per-position flag marking array-typed columns
     * @return Rewritten row, or the first data error with column context
     * @throws std::logic_error if columns and values differ in length
     */
    [[nodiscard]] Result<Row> rewrite_row(const std::string& table,
                                          const std::vector<ColumnConfig>& columns,
                                          const Row& values,
                                          const std::vector<bool>& array_columns = {});

    [[nodiscard]] size_t cached_transformer_count() const;

private:
    [[nodiscard]] Result<std::shared_ptr<const Transformer>> transformer_for(
        const std::string& table, const ColumnConfig& column);

    IFakeDataSource& fake_;
    UniquenessTracker& uniqueness_;

    std::unordered_map<ColumnKey, std::shared_ptr<const Transformer>, ColumnKeyHash> cache_;
    mutable std::shared_mutex cache_mutex_;
};

} // namespace dumpscrub
