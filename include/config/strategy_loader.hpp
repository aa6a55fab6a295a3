#pragma once

#include "config/strategy.hpp"
#include "core/error.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace dumpscrub {

/**
 * @brief Load-time relaxations applied to the strategy file
 *
 * allow_potential_pii / allow_commercially_sensitive replace the transformer
 * of every column in that class with Identity. Otherwise scramble_blank
 * replaces Scramble with ScrambleBlank.
 */
struct TransformerOverrides {
    bool allow_potential_pii = false;
    bool allow_commercially_sensitive = false;
    bool scramble_blank = false;

    [[nodiscard]] static TransformerOverrides none() { return {}; }
};

// ============================================================================
// StrategyLoader - JSON strategy file -> Strategy
// ============================================================================

/**
 * File layout (array of tables):
 *
 *   [{ "table_name": "public.person", "description": "", "truncate": false,
 *      "columns": [{ "name": "email", "description": "", "data_category": "Pii",
 *                    "transformer": { "name": "FakeEmail", "args": { "unique": true } } }] }]
 *
 * Unknown data categories load as Unknown and unknown transformer names as
 * Error, so the validator reports them together with everything else.
 */
class StrategyLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        Strategy strategy;
        ValidationReport report;    // Duplicate tables / columns

        static LoadResult ok(Strategy s) {
            LoadResult result;
            result.success = true;
            result.strategy = std::move(s);
            return result;
        }

        static LoadResult error(std::string message, ValidationReport report = {}) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            result.report = std::move(report);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& path,
                                                   const TransformerOverrides& overrides);

    [[nodiscard]] static LoadResult load_from_string(const std::string& json_content,
                                                     const TransformerOverrides& overrides);

    /**
     * @brief Skeleton strategy covering every column of a schema
     *
     * Every column is emitted as Unknown / Error so that a run refuses it
     * until an operator has classified it.
     */
    [[nodiscard]] static nlohmann::json skeleton_for(const DatabaseSchema& schema);

    [[nodiscard]] static TransformerSpec apply_overrides(DataType data_type,
                                                         TransformerSpec transformer,
                                                         const TransformerOverrides& overrides);

private:
    static LoadResult from_json(const nlohmann::json& root, const TransformerOverrides& overrides);
    static ColumnConfig parse_column(const std::string& table, const nlohmann::json& col,
                                     const TransformerOverrides& overrides);
    static TransformerArgs parse_args(const nlohmann::json& args);
};

} // namespace dumpscrub
