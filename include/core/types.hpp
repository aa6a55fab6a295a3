#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dumpscrub {

// ============================================================================
// Sensitivity Classification
// ============================================================================

enum class DataType {
    COMMERCIALLY_SENSITIVE,
    GENERAL,
    POTENTIAL_PII,
    PII,
    SECURITY,
    UNKNOWN     // Not yet classified; invalid in a final configuration
};

[[nodiscard]] std::string_view data_type_to_string(DataType type);

// Unrecognised names map to UNKNOWN so that validation reports them
[[nodiscard]] DataType parse_data_type(std::string_view name);

// ============================================================================
// Transformers
// ============================================================================

enum class TransformerKind {
    EMPTY_JSON,
    ERROR,      // Not yet configured; invalid at run time
    FAKE_BASE16_STRING,
    FAKE_BASE32_STRING,
    FAKE_CITY,
    FAKE_COMPANY_NAME,
    FAKE_EMAIL,
    FAKE_FIRST_NAME,
    FAKE_FULL_ADDRESS,
    FAKE_FULL_NAME,
    FAKE_IPV4,
    FAKE_LAST_NAME,
    FAKE_NATIONAL_IDENTITY_NUMBER,
    FAKE_PHONE_NUMBER,
    FAKE_POST_CODE,
    FAKE_STATE,
    FAKE_STREET_ADDRESS,
    FAKE_USERNAME,
    FAKE_UUID,
    FIXED,
    IDENTITY,
    OBFUSCATE_DAY,
    SCRAMBLE,
    SCRAMBLE_BLANK
};

[[nodiscard]] std::string_view transformer_kind_to_string(TransformerKind kind);

// Unrecognised names map to ERROR so that validation reports them
[[nodiscard]] TransformerKind parse_transformer_kind(std::string_view name);

using TransformerArgs = std::map<std::string, std::string>;

struct TransformerSpec {
    TransformerKind name = TransformerKind::ERROR;
    TransformerArgs args;

    TransformerSpec() = default;
    TransformerSpec(TransformerKind n, TransformerArgs a = {})
        : name(n), args(std::move(a)) {}

    bool operator==(const TransformerSpec&) const = default;
};

// ============================================================================
// Column Configuration
// ============================================================================

struct ColumnConfig {
    std::string table;
    std::string name;
    std::string description;
    DataType data_type = DataType::UNKNOWN;
    TransformerSpec transformer;                        // Applied at run time
    std::optional<TransformerSpec> declared;            // As written, when an override replaced it

    // Transformer chosen by the strategy author, before run-config overrides
    [[nodiscard]] const TransformerSpec& declared_transformer() const {
        return declared ? *declared : transformer;
    }

    bool operator==(const ColumnConfig&) const = default;
};

/**
 * @brief (table, column) pair. Used as the uniqueness key and for
 * schema/config reconciliation.
 */
struct ColumnKey {
    std::string table;
    std::string column;

    ColumnKey() = default;
    ColumnKey(std::string t, std::string c) : table(std::move(t)), column(std::move(c)) {}

    [[nodiscard]] std::string full_name() const { return table + "." + column; }

    bool operator==(const ColumnKey&) const = default;
    auto operator<=>(const ColumnKey&) const = default;
};

struct ColumnKeyHash {
    size_t operator()(const ColumnKey& k) const noexcept {
        const size_t h1 = std::hash<std::string>{}(k.table);
        const size_t h2 = std::hash<std::string>{}(k.column);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// ============================================================================
// Row Data
// ============================================================================

// std::nullopt is SQL NULL; NULLs are never transformed
using Field = std::optional<std::string>;
using Row = std::vector<Field>;

// ============================================================================
// Schema (as discovered from the dump)
// ============================================================================

struct SchemaColumn {
    std::string name;
    std::string sql_type;

    SchemaColumn() = default;
    SchemaColumn(std::string n, std::string t) : name(std::move(n)), sql_type(std::move(t)) {}

    [[nodiscard]] bool is_array() const {
        return sql_type.size() >= 2 && sql_type.ends_with("[]");
    }

    bool operator==(const SchemaColumn&) const = default;
};

struct TableSchema {
    std::string name;
    std::vector<SchemaColumn> columns;
};

struct DatabaseSchema {
    std::vector<TableSchema> tables;   // Declaration order

    [[nodiscard]] const TableSchema* find_table(std::string_view name) const {
        for (const auto& t : tables) {
            if (t.name == name) return &t;
        }
        return nullptr;
    }
};

// ============================================================================
// Run Policy
// ============================================================================

enum class DataErrorPolicy {
    ABORT,      // Stop the run at the first data error
    SKIP_ROW    // Drop the row, log a warning, carry on
};

} // namespace dumpscrub
