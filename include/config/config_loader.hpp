#pragma once

#include "config/strategy_loader.hpp"

#include <toml.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace dumpscrub {

// ============================================================================
// Run Config
// ============================================================================

struct RunConfig {
    std::string input;
    std::string output;
    std::string strategy_file;
    size_t workers = 1;
    size_t batch_size = 1000;
    DataErrorPolicy on_data_error = DataErrorPolicy::ABORT;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// AppConfig - Complete parsed configuration
// ============================================================================

struct AppConfig {
    RunConfig run;
    TransformerOverrides overrides;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from a TOML run file
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        AppConfig config;

        static LoadResult ok(AppConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     *
     * Relative paths in [run] are resolved against the file's directory.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     * @param base_dir Directory relative paths are resolved against ("" = as given)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content,
                                                     const std::string& base_dir = "");

private:
    static RunConfig extract_run(const toml::table& root);
    static TransformerOverrides extract_overrides(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);

    static AppConfig extract_all_sections(const toml::table& root, const std::string& base_dir);
    static std::vector<std::string> validate_config(const toml::table& root, const AppConfig& config);
};

} // namespace dumpscrub
