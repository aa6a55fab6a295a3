#pragma once

#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dumpscrub {

/**
 * @brief Error codes for the anonymisation engine
 *
 * Configuration errors abort the run before any row is touched and are
 * reported together. Data errors are raised per row and handled according
 * to the run's data error policy.
 */
enum class ErrorCode {
    NONE,

    // Configuration errors
    UNCLASSIFIED_COLUMN,
    UNCONFIGURED_TRANSFORMER,
    MISSING_ARGUMENT,
    INVALID_ARGUMENT,
    UNKNOWN_COLUMN,
    UNCONFIGURED_COLUMN,
    DUPLICATE_COLUMN,
    DUPLICATE_TABLE,
    UNANONYMISED_PII,

    // Data errors
    UNPARSEABLE_DATE,
    UNSUPPORTED_COUNTRY_CODE,

    // Everything else
    IO_ERROR,
    PARSE_ERROR,
    CANCELLED
};

[[nodiscard]] std::string_view error_code_to_string(ErrorCode code);

[[nodiscard]] inline bool is_data_error(ErrorCode code) {
    return code == ErrorCode::UNPARSEABLE_DATE || code == ErrorCode::UNSUPPORTED_COUNTRY_CODE;
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

/**
 * @brief One configuration problem, attributed to a table/column
 */
struct ConfigError {
    ErrorCode code = ErrorCode::NONE;
    std::string table;
    std::string column;     // Empty for table-level errors
    std::string detail;

    ConfigError() = default;
    ConfigError(ErrorCode c, std::string t, std::string col, std::string d = {})
        : code(c), table(std::move(t)), column(std::move(col)), detail(std::move(d)) {}

    [[nodiscard]] std::string to_string() const;

    bool operator==(const ConfigError&) const = default;
};

/**
 * @brief Aggregate of every configuration error found in one pass
 */
struct ValidationReport {
    std::vector<ConfigError> errors;

    [[nodiscard]] bool ok() const { return errors.empty(); }

    void merge(ValidationReport other) {
        errors.insert(errors.end(),
                      std::make_move_iterator(other.errors.begin()),
                      std::make_move_iterator(other.errors.end()));
    }

    // Stable (code, table, column) order for reporting
    void sort();

    [[nodiscard]] bool contains(ErrorCode code, std::string_view table,
                                std::string_view column) const;
    [[nodiscard]] size_t count(ErrorCode code) const;
    [[nodiscard]] std::string summary() const;
};

} // namespace dumpscrub
