#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace dumpscrub {

// ============================================================================
// TOML Parsing Helpers (env expansion, path resolution)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

std::string resolve_path(const std::string& path, const std::string& base_dir) {
    if (path.empty() || base_dir.empty()) return path;
    const std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return (std::filesystem::path(base_dir) / p).lexically_normal().string();
}

size_t positive_or_zero(int64_t value) {
    return value < 0 ? 0 : static_cast<size_t>(value);
}

} // anonymous namespace

// ============================================================================
// Section Extractors
// ============================================================================

RunConfig ConfigLoader::extract_run(const toml::table& root) {
    RunConfig cfg;
    const auto* run = root["run"].as_table();
    if (!run) return cfg;

    cfg.input = (*run)["input"].value_or(""s);
    cfg.output = (*run)["output"].value_or(""s);
    cfg.strategy_file = (*run)["strategy_file"].value_or(""s);
    cfg.workers = positive_or_zero((*run)["workers"].value_or(int64_t{1}));
    cfg.batch_size = positive_or_zero((*run)["batch_size"].value_or(int64_t{1000}));

    const std::string policy = utils::to_lower((*run)["on_data_error"].value_or("abort"s));
    cfg.on_data_error = (policy == "skip_row") ? DataErrorPolicy::SKIP_ROW : DataErrorPolicy::ABORT;
    return cfg;
}

TransformerOverrides ConfigLoader::extract_overrides(const toml::table& root) {
    TransformerOverrides overrides;
    const auto* tbl = root["overrides"].as_table();
    if (!tbl) return overrides;

    overrides.allow_potential_pii = (*tbl)["allow_potential_pii"].value_or(false);
    overrides.allow_commercially_sensitive = (*tbl)["allow_commercially_sensitive"].value_or(false);
    overrides.scramble_blank = (*tbl)["scramble_blank"].value_or(false);
    return overrides;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* tbl = root["logging"].as_table();
    if (!tbl) return cfg;

    cfg.level = utils::to_lower((*tbl)["level"].value_or("info"s));
    return cfg;
}

AppConfig ConfigLoader::extract_all_sections(const toml::table& root, const std::string& base_dir) {
    AppConfig config;
    config.run = extract_run(root);
    config.overrides = extract_overrides(root);
    config.logging = extract_logging(root);

    config.run.input = resolve_path(config.run.input, base_dir);
    config.run.output = resolve_path(config.run.output, base_dir);
    config.run.strategy_file = resolve_path(config.run.strategy_file, base_dir);
    return config;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const toml::table& root, const AppConfig& config) {
    std::vector<std::string> errors;

    if (!root["run"].as_table()) {
        errors.emplace_back("[run] section is required");
    }
    if (config.run.strategy_file.empty()) {
        errors.emplace_back("run.strategy_file is required");
    }
    if (config.run.workers < 1) {
        errors.emplace_back("run.workers must be >= 1");
    }
    if (config.run.batch_size < 1) {
        errors.emplace_back("run.batch_size must be >= 1");
    }

    const std::string policy = utils::to_lower(root["run"]["on_data_error"].value_or("abort"s));
    if (policy != "abort" && policy != "skip_row") {
        errors.push_back(std::format(
            "run.on_data_error must be 'abort' or 'skip_row', got '{}'", policy));
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    return errors;
}

// ---- Public API ------------------------------------------------------------

namespace {

ConfigLoader::LoadResult validate_and_return(AppConfig config, std::vector<std::string> errors) {
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
        auto config = extract_all_sections(tbl, base_dir);
        auto errors = validate_config(tbl, config);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content,
                                                        const std::string& base_dir) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        auto config = extract_all_sections(tbl, base_dir);
        auto errors = validate_config(tbl, config);
        return validate_and_return(std::move(config), std::move(errors));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace dumpscrub
