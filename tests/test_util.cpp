#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace embcache;

// ── trim / to_lower ──────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("") == "");
    REQUIRE(trim("   ") == "");
    REQUIRE(trim("a b") == "a b");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("TrUe") == "true");
    REQUIRE(to_lower("caf\xc3\x89") == "caf\xc3\x89");
}

// ── parse_uint ───────────────────────────────────────────────────

TEST_CASE("parse_uint: accepts decimal digits", "[util]") {
    REQUIRE(parse_uint("0") == std::optional<uint64_t>(0));
    REQUIRE(parse_uint(" 6379 ") == std::optional<uint64_t>(6379));
    REQUIRE(parse_uint("18446744073709551615") ==
            std::optional<uint64_t>(18446744073709551615ULL));
}

TEST_CASE("parse_uint: rejects junk, signs and overflow", "[util]") {
    REQUIRE_FALSE(parse_uint("").has_value());
    REQUIRE_FALSE(parse_uint("12a").has_value());
    REQUIRE_FALSE(parse_uint("-1").has_value());
    REQUIRE_FALSE(parse_uint("+1").has_value());
    REQUIRE_FALSE(parse_uint("18446744073709551616").has_value());
}

// ── parse_bool ───────────────────────────────────────────────────

TEST_CASE("parse_bool: recognised spellings", "[util]") {
    REQUIRE(parse_bool("1") == std::optional<bool>(true));
    REQUIRE(parse_bool("YES") == std::optional<bool>(true));
    REQUIRE(parse_bool(" on ") == std::optional<bool>(true));
    REQUIRE(parse_bool("0") == std::optional<bool>(false));
    REQUIRE(parse_bool("False") == std::optional<bool>(false));
    REQUIRE(parse_bool("off") == std::optional<bool>(false));
    REQUIRE_FALSE(parse_bool("maybe").has_value());
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    REQUIRE(expand_home("/abs/~") == "/abs/~");
}
