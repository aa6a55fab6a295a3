#include <catch2/catch_test_macros.hpp>
#include "config/strategy_loader.hpp"
#include "dump/dump_processor.hpp"
#include "dump/dump_reader.hpp"
#include "validation/configuration_validator.hpp"
#include "mocks/stub_fake_data_source.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using namespace dumpscrub;
using dumpscrub::testing::StubFakeDataSource;

namespace {

constexpr const char* kDump =
    "SET client_encoding = 'UTF8';\n"
    "\n"
    "CREATE TABLE public.person (\n"
    "    id integer NOT NULL,\n"
    "    name text,\n"
    "    dob date,\n"
    "    aliases text[]\n"
    ");\n"
    "\n"
    "CREATE TABLE public.session (\n"
    "    token text\n"
    ");\n"
    "\n"
    "COPY public.person (id, name, dob, aliases) FROM stdin;\n"
    "1\tJane Smith\t1980-06-15\t{Janey,NULL}\n"
    "2\t\\N\t1975-01-31\t\\N\n"
    "3\tJohn\\tTab\t2001-12-12\t{}\n"
    "\\.\n"
    "\n"
    "COPY public.session (token) FROM stdin;\n"
    "abc\n"
    "def\n"
    "\\.\n"
    "\n"
    "ALTER TABLE ONLY public.person ADD CONSTRAINT person_pkey PRIMARY KEY (id);\n";

constexpr const char* kStrategy = R"([
  {"table_name": "public.person", "columns": [
    {"name": "id", "data_category": "General", "transformer": {"name": "Identity"}},
    {"name": "name", "data_category": "Pii", "transformer": {"name": "FakeFullName"}},
    {"name": "dob", "data_category": "Pii", "transformer": {"name": "ObfuscateDay"}},
    {"name": "aliases", "data_category": "Pii", "transformer": {"name": "FakeFirstName"}}
  ]},
  {"table_name": "public.session", "truncate": true, "columns": []}
])";

struct Run {
    Strategy strategy;
    DatabaseSchema schema;
};

Run prepare(const std::string& dump, const std::string& strategy_json) {
    std::istringstream in(dump);
    auto schema = DumpReader::read_schema(in);
    REQUIRE(schema.is_ok());
    auto loaded = StrategyLoader::load_from_string(strategy_json, TransformerOverrides::none());
    REQUIRE(loaded.success);
    return Run{std::move(loaded.strategy), std::move(schema.value())};
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // anonymous namespace

TEST_CASE("Dump rows are rewritten and everything else passes through", "[dump_processor]") {
    auto run = prepare(kDump, kStrategy);
    REQUIRE(ConfigurationValidator::validate_all(run.schema, run.strategy).ok());

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);

    std::istringstream in(kDump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_ok());

    const auto lines = lines_of(out.str());
    const auto expected_input = lines_of(kDump);
    REQUIRE(lines.size() == expected_input.size() - 2);  // two truncated session rows

    CHECK(lines[0] == "SET client_encoding = 'UTF8';");
    CHECK(lines[13] == "COPY public.person (id, name, dob, aliases) FROM stdin;");
    CHECK(lines[14] == "1\tfull_name-1\t1980-06-01\t{first_name-2,NULL}");
    CHECK(lines[15] == "2\t\\N\t1975-01-01\t\\N");
    CHECK(lines[16] == "3\tfull_name-3\t2001-12-01\t{}");
    CHECK(lines[17] == "\\.");
    CHECK(lines[19] == "COPY public.session (token) FROM stdin;");
    CHECK(lines[20] == "\\.");
    CHECK(lines.back() == "ALTER TABLE ONLY public.person ADD CONSTRAINT person_pkey PRIMARY KEY (id);");

    const auto& stats = result.value();
    CHECK(stats.tables == 2);
    CHECK(stats.truncated_tables == 1);
    CHECK(stats.rows_read == 5);
    CHECK(stats.rows_written == 3);
    CHECK(stats.rows_truncated == 2);
    CHECK(stats.rows_skipped == 0);
}

TEST_CASE("Error transformer on a Security column aborts before any row", "[dump_processor]") {
    const std::string dump =
        "CREATE TABLE public.account (\n"
        "    id integer,\n"
        "    password_hash text\n"
        ");\n"
        "COPY public.account (id, password_hash) FROM stdin;\n"
        "1\t$2b$10$aaaa\n"
        "2\t$2b$10$bbbb\n"
        "3\t$2b$10$cccc\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.account", "columns": [
        {"name": "id", "data_category": "General", "transformer": {"name": "Identity"}},
        {"name": "password_hash", "data_category": "Security", "transformer": {"name": "Error"}}
    ]}])";

    auto run = prepare(dump, strategy);

    // Validation gate: the run is refused as a whole
    const auto report = ConfigurationValidator::validate_all(run.schema, run.strategy);
    REQUIRE_FALSE(report.ok());
    CHECK(report.contains(ErrorCode::UNCONFIGURED_TRANSFORMER, "public.account", "password_hash"));

    // Even without the gate, the processor emits no rewritten row
    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNCONFIGURED_TRANSFORMER);
    CHECK(out.str().find("$2b$10$") == std::string::npos);
}

TEST_CASE("Data errors abort by default", "[dump_processor]") {
    const std::string dump =
        "COPY public.person (dob) FROM stdin;\n"
        "2000-01-15\n"
        "not-a-date\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.person", "columns": [
        {"name": "dob", "data_category": "Pii", "transformer": {"name": "ObfuscateDay"}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNPARSEABLE_DATE);
    CHECK(result.error_message().find("row 2") != std::string::npos);
    CHECK(result.error_message().find("public.person.dob") != std::string::npos);
}

TEST_CASE("skip_row drops rows with data errors", "[dump_processor]") {
    const std::string dump =
        "COPY public.person (phone) FROM stdin;\n"
        "+44 20 7946 0958\n"
        "+33 1 23 45 67 89\n"
        "020 7946 0000\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.person", "columns": [
        {"name": "phone", "data_category": "Pii", "transformer": {"name": "FakePhoneNumber"}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake;
    ProcessorOptions options;
    options.on_data_error = DataErrorPolicy::SKIP_ROW;
    DumpProcessor processor(run.strategy, run.schema, fake, options);

    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_ok());
    CHECK(result.value().rows_written == 2);
    CHECK(result.value().rows_skipped == 1);

    const auto lines = lines_of(out.str());
    REQUIRE(lines.size() == 4);
    CHECK(lines[1].starts_with("+447"));
    CHECK(lines[2].starts_with("07"));
}

TEST_CASE("Parallel batches keep row order and uniqueness", "[dump_processor][concurrency]") {
    std::string dump = "COPY public.person (id, login) FROM stdin;\n";
    constexpr int kRows = 2000;
    for (int i = 1; i <= kRows; ++i) {
        dump += std::to_string(i) + "\tsame\n";
    }
    dump += "\\.\n";

    const std::string strategy = R"([{"table_name": "public.person", "columns": [
        {"name": "id", "data_category": "General", "transformer": {"name": "Identity"}},
        {"name": "login", "data_category": "Pii",
         "transformer": {"name": "FakeUsername", "args": {"unique": true}}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake("dup");
    ProcessorOptions options;
    options.workers = 4;
    options.batch_size = 128;
    DumpProcessor processor(run.strategy, run.schema, fake, options);

    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_ok());
    CHECK(result.value().rows_written == kRows);

    const auto lines = lines_of(out.str());
    REQUIRE(lines.size() == kRows + 2);

    std::set<std::string> logins;
    for (int i = 1; i <= kRows; ++i) {
        const auto& line = lines[static_cast<size_t>(i)];
        const auto tab = line.find('\t');
        REQUIRE(tab != std::string::npos);
        CHECK(line.substr(0, tab) == std::to_string(i));
        logins.insert(line.substr(tab + 1));
    }
    CHECK(logins.size() == static_cast<size_t>(kRows));
}

TEST_CASE("Rows with the wrong field count are parse errors", "[dump_processor]") {
    const std::string dump =
        "COPY public.t (a, b) FROM stdin;\n"
        "only-one\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.t", "columns": [
        {"name": "a", "data_category": "General", "transformer": {"name": "Identity"}},
        {"name": "b", "data_category": "General", "transformer": {"name": "Identity"}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::PARSE_ERROR);
}

TEST_CASE("Unconfigured COPY column fails the run", "[dump_processor]") {
    const std::string dump =
        "COPY public.t (a, extra) FROM stdin;\n"
        "1\t2\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.t", "columns": [
        {"name": "a", "data_category": "General", "transformer": {"name": "Identity"}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNCONFIGURED_COLUMN);
}

TEST_CASE("COPY without a column list is rewritten in CREATE TABLE order", "[dump_processor]") {
    const std::string dump =
        "CREATE TABLE public.person (\n"
        "    id integer,\n"
        "    email text\n"
        ");\n"
        "\n"
        "COPY public.person FROM stdin;\n"
        "7\tjane.secret@real-corp.com\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.person", "columns": [
        {"name": "id", "data_category": "General", "transformer": {"name": "Identity"}},
        {"name": "email", "data_category": "Pii", "transformer": {"name": "FakeEmail"}}]}])";
    auto run = prepare(dump, strategy);
    REQUIRE(ConfigurationValidator::validate_all(run.schema, run.strategy).ok());

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_ok());
    CHECK(result.value().rows_written == 1);

    const auto text = out.str();
    CHECK(text.find("jane.secret@real-corp.com") == std::string::npos);

    const auto lines = lines_of(text);
    REQUIRE(lines.size() == 8);
    CHECK(lines[5] == "COPY public.person FROM stdin;");
    CHECK(lines[6] == "7\tuser1@example.com");
    CHECK(lines[7] == "\\.");
}

TEST_CASE("COPY without a column list or CREATE TABLE fails the run", "[dump_processor]") {
    const std::string dump =
        "COPY public.person FROM stdin;\n"
        "jane.secret@real-corp.com\n"
        "\\.\n";
    const std::string strategy = R"([{"table_name": "public.person", "columns": [
        {"name": "email", "data_category": "Pii", "transformer": {"name": "FakeEmail"}}]}])";
    auto run = prepare(dump, strategy);

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    std::istringstream in(dump);
    std::ostringstream out;
    auto result = processor.process(in, out);
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNCONFIGURED_COLUMN);
    CHECK(out.str().find("jane.secret@real-corp.com") == std::string::npos);
}

TEST_CASE("Cancelled run stops and removes partial output", "[dump_processor]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "dumpscrub_cancel_test";
    fs::create_directories(dir);
    const fs::path input = dir / "in.sql";
    const fs::path output = dir / "out.sql";
    {
        std::ofstream f(input);
        f << "COPY public.t (a) FROM stdin;\n1\n2\n\\.\n";
    }

    auto run = prepare("COPY public.t (a) FROM stdin;\n\\.\n",
        R"([{"table_name": "public.t", "columns": [
            {"name": "a", "data_category": "General", "transformer": {"name": "Identity"}}]}])");

    StubFakeDataSource fake;
    DumpProcessor processor(run.strategy, run.schema, fake);
    processor.cancel();
    auto result = processor.process_file(input.string(), output.string());

    CHECK(result.is_error());
    CHECK(result.error_code() == ErrorCode::CANCELLED);
    CHECK_FALSE(fs::exists(output));
    fs::remove_all(dir);
}

TEST_CASE("Missing input file is an IO error", "[dump_processor]") {
    Strategy strategy;
    DatabaseSchema schema;
    StubFakeDataSource fake;
    DumpProcessor processor(strategy, schema, fake);
    auto result = processor.process_file("/nonexistent/in.sql", "/nonexistent/out.sql");
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::IO_ERROR);
}
