#include <catch2/catch_test_macros.hpp>
#include "dump/pg_array.hpp"

#include <cctype>
#include <vector>

using namespace dumpscrub;

namespace {

// Upper-cases each element and records what it saw
struct Recorder {
    std::vector<std::string> seen;

    pg_array::ElementTransform fn() {
        return [this](std::string_view e) {
            seen.emplace_back(e);
            std::string out(e);
            for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return Result<std::string>::ok(std::move(out));
        };
    }
};

} // anonymous namespace

TEST_CASE("Simple array elements are transformed", "[pg_array]") {
    Recorder rec;
    auto result = pg_array::transform("{a,b,c}", rec.fn());
    REQUIRE(result.is_ok());
    CHECK(result.value() == "{A,B,C}");
    CHECK(rec.seen == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Empty array stays empty", "[pg_array]") {
    Recorder rec;
    auto result = pg_array::transform("{}", rec.fn());
    REQUIRE(result.is_ok());
    CHECK(result.value() == "{}");
    CHECK(rec.seen.empty());
}

TEST_CASE("Quoted elements are unescaped before and requoted after", "[pg_array]") {
    Recorder rec;
    auto result = pg_array::transform(R"({"hello world","a\"b",plain})", rec.fn());
    REQUIRE(result.is_ok());
    CHECK(rec.seen == std::vector<std::string>{"hello world", "a\"b", "plain"});
    CHECK(result.value() == R"({"HELLO WORLD","A\"B",PLAIN})");
}

TEST_CASE("NULL elements are preserved and not transformed", "[pg_array]") {
    Recorder rec;
    auto result = pg_array::transform("{x,NULL,y}", rec.fn());
    REQUIRE(result.is_ok());
    CHECK(result.value() == "{X,NULL,Y}");
    CHECK(rec.seen.size() == 2);
}

TEST_CASE("Quoted \"NULL\" is a string, not NULL", "[pg_array]") {
    auto result = pg_array::transform(R"({"NULL"})", [](std::string_view e) {
        return Result<std::string>::ok(std::string(e));
    });
    REQUIRE(result.is_ok());
    CHECK(result.value() == R"({"NULL"})");
}

TEST_CASE("Nested arrays keep their shape", "[pg_array]") {
    Recorder rec;
    auto result = pg_array::transform("{{a,b},{c,d}}", rec.fn());
    REQUIRE(result.is_ok());
    CHECK(result.value() == "{{A,B},{C,D}}");
}

TEST_CASE("Element errors propagate", "[pg_array]") {
    auto result = pg_array::transform("{ok,bad}", [](std::string_view e) {
        if (e == "bad") return Result<std::string>::error(ErrorCode::UNPARSEABLE_DATE, "bad");
        return Result<std::string>::ok(std::string(e));
    });
    REQUIRE(result.is_error());
    CHECK(result.error_code() == ErrorCode::UNPARSEABLE_DATE);
}

TEST_CASE("Malformed literals are parse errors", "[pg_array]") {
    Recorder rec;
    for (const char* bad : {"", "a,b", "{a,b", "{\"open}", "{a}x"}) {
        auto result = pg_array::transform(bad, rec.fn());
        CHECK(result.is_error());
        CHECK(result.error_code() == ErrorCode::PARSE_ERROR);
    }
}

TEST_CASE("quote_element quotes only when needed", "[pg_array]") {
    CHECK(pg_array::quote_element("abc") == "abc");
    CHECK(pg_array::quote_element("") == "\"\"");
    CHECK(pg_array::quote_element("null") == "\"null\"");
    CHECK(pg_array::quote_element("a b") == "\"a b\"");
    CHECK(pg_array::quote_element("a,b") == "\"a,b\"");
    CHECK(pg_array::quote_element("a\\b") == "\"a\\\\b\"");
}
