#include "config/strategy_loader.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using json = nlohmann::json;

namespace dumpscrub {

namespace {

std::string string_or(const json& obj, const char* key, const std::string& fallback = "") {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // anonymous namespace

TransformerSpec StrategyLoader::apply_overrides(DataType data_type,
                                                TransformerSpec transformer,
                                                const TransformerOverrides& overrides) {
    if (data_type == DataType::POTENTIAL_PII && overrides.allow_potential_pii) {
        return TransformerSpec(TransformerKind::IDENTITY);
    }
    if (data_type == DataType::COMMERCIALLY_SENSITIVE && overrides.allow_commercially_sensitive) {
        return TransformerSpec(TransformerKind::IDENTITY);
    }
    if (overrides.scramble_blank && transformer.name == TransformerKind::SCRAMBLE) {
        return TransformerSpec(TransformerKind::SCRAMBLE_BLANK);
    }
    return transformer;
}

TransformerArgs StrategyLoader::parse_args(const json& args) {
    TransformerArgs result;
    if (!args.is_object()) return result;

    for (const auto& [key, value] : args.items()) {
        if (value.is_string()) {
            result[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            result[key] = value.get<bool>() ? "true" : "false";
        } else if (value.is_null()) {
            continue;
        } else {
            result[key] = value.dump();
        }
    }
    return result;
}

ColumnConfig StrategyLoader::parse_column(const std::string& table, const json& col,
                                          const TransformerOverrides& overrides) {
    ColumnConfig cfg;
    cfg.table = table;
    cfg.name = string_or(col, "name");
    cfg.description = string_or(col, "description");

    std::string category = string_or(col, "data_category");
    if (category.empty()) category = string_or(col, "data_type");
    cfg.data_type = parse_data_type(category);

    TransformerSpec spec;
    if (const auto it = col.find("transformer"); it != col.end() && it->is_object()) {
        spec.name = parse_transformer_kind(string_or(*it, "name"));
        if (const auto args = it->find("args"); args != it->end()) {
            spec.args = parse_args(*args);
        }
    }
    cfg.transformer = apply_overrides(cfg.data_type, spec, overrides);
    if (cfg.transformer != spec) {
        cfg.declared = std::move(spec);
    }
    return cfg;
}

StrategyLoader::LoadResult StrategyLoader::from_json(const json& root,
                                                     const TransformerOverrides& overrides) {
    if (!root.is_array()) {
        return LoadResult::error("strategy file must contain a JSON array of tables");
    }

    std::vector<TableStrategy> tables;
    ValidationReport report;
    std::unordered_set<std::string> seen_tables;

    for (size_t i = 0; i < root.size(); ++i) {
        const auto& entry = root[i];
        if (!entry.is_object()) {
            return LoadResult::error(std::format("strategy[{}] is not an object", i));
        }

        TableStrategy table;
        table.table_name = string_or(entry, "table_name");
        if (table.table_name.empty()) {
            return LoadResult::error(std::format("strategy[{}].table_name must not be empty", i));
        }
        table.description = string_or(entry, "description");
        table.truncate = entry.value("truncate", false);

        if (!seen_tables.insert(table.table_name).second) {
            report.errors.emplace_back(ErrorCode::DUPLICATE_TABLE, table.table_name, "");
            continue;
        }

        std::unordered_set<std::string> seen_columns;
        if (const auto cols = entry.find("columns"); cols != entry.end() && cols->is_array()) {
            for (const auto& col : *cols) {
                if (!col.is_object()) continue;
                auto cfg = parse_column(table.table_name, col, overrides);
                if (!seen_columns.insert(cfg.name).second) {
                    report.errors.emplace_back(ErrorCode::DUPLICATE_COLUMN, table.table_name, cfg.name);
                    continue;
                }
                table.columns.emplace_back(std::move(cfg));
            }
        }

        tables.emplace_back(std::move(table));
    }

    if (!report.ok()) {
        report.sort();
        return LoadResult::error(report.summary(), std::move(report));
    }
    return LoadResult::ok(Strategy(std::move(tables)));
}

StrategyLoader::LoadResult StrategyLoader::load_from_string(const std::string& json_content,
                                                            const TransformerOverrides& overrides) {
    try {
        return from_json(json::parse(json_content), overrides);
    } catch (const json::exception& e) {
        return LoadResult::error(std::format("Failed to parse strategy: {}", e.what()));
    }
}

StrategyLoader::LoadResult StrategyLoader::load_from_file(const std::string& path,
                                                          const TransformerOverrides& overrides) {
    std::ifstream in(path);
    if (!in) {
        return LoadResult::error(std::format("Failed to open strategy file: {}", path));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_from_string(buffer.str(), overrides);
}

json StrategyLoader::skeleton_for(const DatabaseSchema& schema) {
    json root = json::array();
    for (const auto& table : schema.tables) {
        json columns = json::array();
        for (const auto& col : table.columns) {
            columns.push_back({
                {"name", col.name},
                {"description", ""},
                {"data_category", std::string(data_type_to_string(DataType::UNKNOWN))},
                {"transformer", {
                    {"name", std::string(transformer_kind_to_string(TransformerKind::ERROR))},
                    {"args", json::object()},
                }},
            });
        }
        root.push_back({
            {"table_name", table.name},
            {"description", ""},
            {"truncate", false},
            {"columns", std::move(columns)},
        });
    }
    return root;
}

} // namespace dumpscrub
