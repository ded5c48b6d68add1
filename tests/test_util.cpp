#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdint>
#include <cstdlib>
#include <regex>

using namespace memkeep;

// ── timestamp_now ────────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC with microseconds", "[util]") {
    std::string ts = timestamp_now();
    std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{6}Z)");
    REQUIRE(std::regex_match(ts, pattern));
}

TEST_CASE("timestamp_now: never decreases", "[util]") {
    std::string a = timestamp_now();
    std::string b = timestamp_now();
    REQUIRE(a <= b);
}

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\nhello world\r\n") == "hello world");
}

TEST_CASE("trim: leaves inner whitespace and empty input alone", "[util]") {
    REQUIRE(trim("a  b") == "a  b");
    REQUIRE(trim("").empty());
    REQUIRE(trim("   ").empty());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/x/y.db") == std::string(home) + "/x/y.db");
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/abs/path") == "/abs/path");
    REQUIRE(expand_home("rel/~/path") == "rel/~/path");
    REQUIRE(expand_home("").empty());
}

// ── parse_int64 ──────────────────────────────────────────────────

TEST_CASE("parse_int64: accepts plain integers", "[util]") {
    REQUIRE(parse_int64("0") == 0);
    REQUIRE(parse_int64("42") == 42);
    REQUIRE(parse_int64("-7") == -7);
    REQUIRE(parse_int64(" 15 ") == 15);
    REQUIRE(parse_int64("9223372036854775807") == INT64_MAX);
}

TEST_CASE("parse_int64: rejects junk and overflow", "[util]") {
    REQUIRE_FALSE(parse_int64("").has_value());
    REQUIRE_FALSE(parse_int64("   ").has_value());
    REQUIRE_FALSE(parse_int64("abc").has_value());
    REQUIRE_FALSE(parse_int64("12abc").has_value());
    REQUIRE_FALSE(parse_int64("1.5").has_value());
    REQUIRE_FALSE(parse_int64("99999999999999999999").has_value());
}
