#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <tuple>

namespace dumpscrub {

std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                     return "None";
        case ErrorCode::UNCLASSIFIED_COLUMN:      return "UnclassifiedColumn";
        case ErrorCode::UNCONFIGURED_TRANSFORMER: return "UnconfiguredTransformer";
        case ErrorCode::MISSING_ARGUMENT:         return "MissingArgument";
        case ErrorCode::INVALID_ARGUMENT:         return "InvalidArgument";
        case ErrorCode::UNKNOWN_COLUMN:           return "UnknownColumn";
        case ErrorCode::UNCONFIGURED_COLUMN:      return "UnconfiguredColumn";
        case ErrorCode::DUPLICATE_COLUMN:         return "DuplicateColumn";
        case ErrorCode::DUPLICATE_TABLE:          return "DuplicateTable";
        case ErrorCode::UNANONYMISED_PII:         return "UnanonymisedPii";
        case ErrorCode::UNPARSEABLE_DATE:         return "UnparseableDate";
        case ErrorCode::UNSUPPORTED_COUNTRY_CODE: return "UnsupportedCountryCode";
        case ErrorCode::IO_ERROR:                 return "IoError";
        case ErrorCode::PARSE_ERROR:              return "ParseError";
        case ErrorCode::CANCELLED:                return "Cancelled";
    }
    return "Unknown";
}

std::string ConfigError::to_string() const {
    std::string location = column.empty() ? table : std::format("{}.{}", table, column);
    if (detail.empty()) {
        return std::format("{}: {}", error_code_to_string(code), location);
    }
    return std::format("{}: {} ({})", error_code_to_string(code), location, detail);
}

void ValidationReport::sort() {
    std::stable_sort(errors.begin(), errors.end(),
        [](const ConfigError& a, const ConfigError& b) {
            return std::tie(a.code, a.table, a.column) < std::tie(b.code, b.table, b.column);
        });
}

bool ValidationReport::contains(ErrorCode code, std::string_view table,
                                std::string_view column) const {
    return std::any_of(errors.begin(), errors.end(), [&](const ConfigError& e) {
        return e.code == code && e.table == table && e.column == column;
    });
}

size_t ValidationReport::count(ErrorCode code) const {
    return static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
        [code](const ConfigError& e) { return e.code == code; }));
}

std::string ValidationReport::summary() const {
    if (errors.empty()) return "configuration valid";
    std::string out = std::format("{} configuration error(s):", errors.size());
    for (const auto& e : errors) {
        out += "\n  ";
        out += e.to_string();
    }
    return out;
}

} // namespace dumpscrub
