#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dumpscrub;

TEST_CASE("Full run config loads", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[run]
input = "/data/dump.sql"
output = "/data/out.sql"
strategy_file = "/data/strategy.json"
workers = 4
batch_size = 250
on_data_error = "skip_row"

[overrides]
allow_potential_pii = true
scramble_blank = true

[logging]
level = "debug"
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.run.input == "/data/dump.sql");
    CHECK(cfg.run.output == "/data/out.sql");
    CHECK(cfg.run.strategy_file == "/data/strategy.json");
    CHECK(cfg.run.workers == 4);
    CHECK(cfg.run.batch_size == 250);
    CHECK(cfg.run.on_data_error == DataErrorPolicy::SKIP_ROW);
    CHECK(cfg.overrides.allow_potential_pii);
    CHECK_FALSE(cfg.overrides.allow_commercially_sensitive);
    CHECK(cfg.overrides.scramble_blank);
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("Defaults apply for omitted keys", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[run]
strategy_file = "strategy.json"
)");
    REQUIRE(result.success);
    CHECK(result.config.run.workers == 1);
    CHECK(result.config.run.batch_size == 1000);
    CHECK(result.config.run.on_data_error == DataErrorPolicy::ABORT);
    CHECK(result.config.logging.level == "info");
    CHECK_FALSE(result.config.overrides.scramble_blank);
}

TEST_CASE("Relative paths resolve against the base directory", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[run]
input = "dump.sql"
output = "/abs/out.sql"
strategy_file = "conf/strategy.json"
)", "/srv/scrub");
    REQUIRE(result.success);
    CHECK(result.config.run.input == "/srv/scrub/dump.sql");
    CHECK(result.config.run.output == "/abs/out.sql");
    CHECK(result.config.run.strategy_file == "/srv/scrub/conf/strategy.json");
}

TEST_CASE("Environment variables are expanded", "[config]") {
    ::setenv("DUMPSCRUB_TEST_DIR", "/tmp/scrub", 1);
    auto result = ConfigLoader::load_from_string(R"(
[run]
input = "${DUMPSCRUB_TEST_DIR}/dump.sql"
strategy_file = "${DUMPSCRUB_TEST_DIR}/strategy.json"
)");
    ::unsetenv("DUMPSCRUB_TEST_DIR");
    REQUIRE(result.success);
    CHECK(result.config.run.input == "/tmp/scrub/dump.sql");
}

TEST_CASE("Invalid values are all reported", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[run]
workers = 0
batch_size = -5
on_data_error = "ignore"

[logging]
level = "verbose"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.starts_with("Config validation failed:"));
    CHECK(msg.find("run.strategy_file") != std::string::npos);
    CHECK(msg.find("run.workers") != std::string::npos);
    CHECK(msg.find("run.batch_size") != std::string::npos);
    CHECK(msg.find("run.on_data_error") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
}

TEST_CASE("Malformed TOML fails to parse", "[config]") {
    auto result = ConfigLoader::load_from_string("[run\ninput = ");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("Config file paths resolve against the file's directory", "[config]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "dumpscrub_config_test";
    fs::create_directories(dir);
    const fs::path file = dir / "run.toml";
    {
        std::ofstream out(file);
        out << "[run]\ninput = \"dump.sql\"\nstrategy_file = \"strategy.json\"\n";
    }

    auto result = ConfigLoader::load_from_file(file.string());
    fs::remove_all(dir);

    REQUIRE(result.success);
    CHECK(result.config.run.input == (dir / "dump.sql").string());
    CHECK(result.config.run.strategy_file == (dir / "strategy.json").string());
}

TEST_CASE("Missing config file fails to load", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/run.toml");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config:"));
}
