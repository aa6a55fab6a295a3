#pragma once

#include "config/strategy.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace dumpscrub {

/**
 * @brief Fail-fast gate run before any row is processed
 *
 * Composes:
 * 1. ClassificationRegistry::validate (UNCLASSIFIED_COLUMN, UNANONYMISED_PII)
 * 2. TransformerRegistry::check for every column (UNCONFIGURED_TRANSFORMER,
 *    MISSING_ARGUMENT, INVALID_ARGUMENT)
 * 3. Schema reconciliation (UNKNOWN_COLUMN, UNCONFIGURED_COLUMN)
 *
 * Never stops at the first problem.
 */
class ConfigurationValidator {
public:
    /**
     * @brief Validate columns against the schema
     * @param truncated_tables Tables whose schema columns need no config
     */
    [[nodiscard]] static ValidationReport validate_all(
        const DatabaseSchema& schema,
        const std::vector<ColumnConfig>& columns,
        const std::unordered_set<std::string>& truncated_tables = {});

    [[nodiscard]] static ValidationReport validate_all(
        const DatabaseSchema& schema, const Strategy& strategy);

    /**
     * @brief Classification and transformer checks only (no schema)
     */
    [[nodiscard]] static ValidationReport validate_columns(const std::vector<ColumnConfig>& columns);
};

} // namespace dumpscrub
