#include "config/config_loader.hpp"
#include "config/strategy_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "dump/dump_processor.hpp"
#include "dump/dump_reader.hpp"
#include "transform/corpus_fake_data_source.hpp"
#include "validation/configuration_validator.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string_view>

using namespace dumpscrub;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

// Processor of the run in flight, cancelled on SIGINT/SIGTERM
std::atomic<DumpProcessor*> g_processor{nullptr};

void signal_handler(int /*signal*/) {
    if (auto* processor = g_processor.load()) {
        processor->cancel();
    }
}

void print_usage() {
    std::cerr << "usage: dumpscrub <anonymise|check|generate> <config.toml>\n"
              << "  anonymise  validate the strategy, then rewrite input into output\n"
              << "  check      validate the strategy against the dump schema only\n"
              << "  generate   write a skeleton strategy file for every dump column\n";
}

void log_report(const ValidationReport& report) {
    for (const auto& err : report.errors) {
        utils::log::error(err.to_string());
    }
    utils::log::error(std::format("{} configuration error(s)", report.errors.size()));
}

struct PreparedRun {
    Strategy strategy;
    DatabaseSchema schema;
};

// Load strategy, scan the dump schema and validate; logs every problem
std::optional<PreparedRun> prepare(const AppConfig& config) {
    auto loaded = StrategyLoader::load_from_file(config.run.strategy_file, config.overrides);
    if (!loaded.success) {
        if (!loaded.report.ok()) {
            log_report(loaded.report);
        } else {
            utils::log::error(loaded.error_message);
        }
        return std::nullopt;
    }

    utils::log::info(std::format("Scanning schema of {}", config.run.input));
    auto schema = DumpReader::read_schema_file(config.run.input);
    if (schema.is_error()) {
        utils::log::error(schema.error_message());
        return std::nullopt;
    }

    const auto report = ConfigurationValidator::validate_all(schema.value(), loaded.strategy);
    if (!report.ok()) {
        log_report(report);
        return std::nullopt;
    }

    return PreparedRun{std::move(loaded.strategy), std::move(schema.value())};
}

int run_check(const AppConfig& config) {
    const auto prepared = prepare(config);
    if (!prepared) return kExitError;

    utils::log::info(std::format("Configuration valid: {} tables, {} columns",
        prepared->strategy.tables().size(), prepared->strategy.all_columns().size()));
    return kExitOk;
}

int run_anonymise(const AppConfig& config) {
    if (config.run.input.empty() || config.run.output.empty()) {
        utils::log::error("run.input and run.output are required for anonymise");
        return kExitError;
    }

    const auto prepared = prepare(config);
    if (!prepared) return kExitError;

    CorpusFakeDataSource fake;
    ProcessorOptions options;
    options.workers = config.run.workers;
    options.batch_size = config.run.batch_size;
    options.on_data_error = config.run.on_data_error;

    DumpProcessor processor(prepared->strategy, prepared->schema, fake, options);

    utils::log::info(std::format("Anonymising {} -> {} ({} workers, batch size {})",
        config.run.input, config.run.output, options.workers, options.batch_size));

    utils::Timer timer;
    g_processor.store(&processor);
    auto result = processor.process_file(config.run.input, config.run.output);
    g_processor.store(nullptr);

    if (result.is_error()) {
        utils::log::error(std::format("{}: {}",
            error_code_to_string(result.error_code()), result.error_message()));
        return kExitError;
    }

    const auto& stats = result.value();
    utils::log::info(std::format(
        "Done in {}ms: {} tables ({} truncated), {} rows read, {} written, {} skipped",
        timer.elapsed_ms().count(), stats.tables, stats.truncated_tables,
        stats.rows_read, stats.rows_written, stats.rows_skipped));
    return kExitOk;
}

int run_generate(const AppConfig& config) {
    const auto& path = config.run.strategy_file;
    if (std::filesystem::exists(path)) {
        utils::log::error(std::format("Refusing to overwrite existing strategy file {}", path));
        return kExitError;
    }

    auto schema = DumpReader::read_schema_file(config.run.input);
    if (schema.is_error()) {
        utils::log::error(schema.error_message());
        return kExitError;
    }

    std::ofstream out(path);
    if (!out) {
        utils::log::error(std::format("Failed to open {} for writing", path));
        return kExitError;
    }
    out << StrategyLoader::skeleton_for(schema.value()).dump(2) << '\n';
    out.close();
    if (!out) {
        utils::log::error(std::format("Failed to write {}", path));
        return kExitError;
    }

    utils::log::info(std::format("Wrote skeleton strategy for {} tables to {}",
        schema.value().tables.size(), path));
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        print_usage();
        return kExitUsage;
    }

    const std::string_view command = argv[1];
    if (command != "anonymise" && command != "check" && command != "generate") {
        print_usage();
        return kExitUsage;
    }

    try {
        const std::string config_file = argv[2];
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitError;
        }
        const auto& config = loaded.config;

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (command == "check") return run_check(config);
        if (command == "generate") return run_generate(config);
        return run_anonymise(config);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }
}
