#include "classifier/classification_registry.hpp"

#include <array>
#include <format>

namespace dumpscrub {

namespace {

constexpr std::array<DataType, 5> kAssignable = {
    DataType::COMMERCIALLY_SENSITIVE,
    DataType::GENERAL,
    DataType::POTENTIAL_PII,
    DataType::PII,
    DataType::SECURITY,
};

} // anonymous namespace

std::span<const DataType> ClassificationRegistry::assignable() {
    return kAssignable;
}

bool ClassificationRegistry::is_personal(DataType type) {
    return type == DataType::PII || type == DataType::POTENTIAL_PII;
}

ValidationReport ClassificationRegistry::validate(const std::vector<ColumnConfig>& columns) {
    ValidationReport report;

    for (const auto& col : columns) {
        if (col.data_type == DataType::UNKNOWN) {
            report.errors.emplace_back(ErrorCode::UNCLASSIFIED_COLUMN, col.table, col.name);
        }

        // Judged on the author's choice; an operator override to Identity is allowed
        if (is_personal(col.data_type) &&
            col.declared_transformer().name == TransformerKind::IDENTITY) {
            report.errors.emplace_back(
                ErrorCode::UNANONYMISED_PII, col.table, col.name,
                std::format("{} column uses Identity", data_type_to_string(col.data_type)));
        }
    }

    return report;
}

} // namespace dumpscrub
