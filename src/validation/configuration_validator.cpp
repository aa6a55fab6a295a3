#include "validation/configuration_validator.hpp"
#include "classifier/classification_registry.hpp"
#include "transform/transformer_registry.hpp"

#include <set>

namespace dumpscrub {

ValidationReport ConfigurationValidator::validate_columns(const std::vector<ColumnConfig>& columns) {
    ValidationReport report = ClassificationRegistry::validate(columns);

    for (const auto& col : columns) {
        auto errors = TransformerRegistry::check(col);
        report.errors.insert(report.errors.end(),
                             std::make_move_iterator(errors.begin()),
                             std::make_move_iterator(errors.end()));
    }

    return report;
}

ValidationReport ConfigurationValidator::validate_all(
    const DatabaseSchema& schema,
    const std::vector<ColumnConfig>& columns,
    const std::unordered_set<std::string>& truncated_tables) {

    ValidationReport report = validate_columns(columns);

    std::set<ColumnKey> from_schema;
    for (const auto& table : schema.tables) {
        if (truncated_tables.contains(table.name)) continue;
        for (const auto& col : table.columns) {
            from_schema.emplace(table.name, col.name);
        }
    }

    std::set<ColumnKey> from_config;
    for (const auto& col : columns) {
        from_config.emplace(col.table, col.name);
    }

    for (const auto& key : from_config) {
        if (!from_schema.contains(key) && !truncated_tables.contains(key.table)) {
            report.errors.emplace_back(ErrorCode::UNKNOWN_COLUMN, key.table, key.column,
                                       "not present in the dump schema");
        }
    }

    for (const auto& key : from_schema) {
        if (!from_config.contains(key)) {
            report.errors.emplace_back(ErrorCode::UNCONFIGURED_COLUMN, key.table, key.column,
                                       "present in the dump schema but not configured");
        }
    }

    report.sort();
    return report;
}

ValidationReport ConfigurationValidator::validate_all(
    const DatabaseSchema& schema, const Strategy& strategy) {
    return validate_all(schema, strategy.all_columns(), strategy.truncated_tables());
}

} // namespace dumpscrub
