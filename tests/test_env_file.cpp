#include <catch2/catch.hpp>
#include "env_file.hpp"
#include "test_helpers.hpp"

using namespace cortex;

// ── parse_env_line ───────────────────────────────────────────────

TEST_CASE("parse_env_line: skips comments, blanks and lines without '='", "[env_file]") {
    REQUIRE_FALSE(parse_env_line(""));
    REQUIRE_FALSE(parse_env_line("   "));
    REQUIRE_FALSE(parse_env_line("# ANTHROPIC_API_KEY=sk-ant-x"));
    REQUIRE_FALSE(parse_env_line("just text"));
    REQUIRE_FALSE(parse_env_line("=value"));
}

TEST_CASE("parse_env_line: strips one layer of quotes", "[env_file]") {
    auto a = parse_env_line("KEY=\"value\"");
    REQUIRE(a);
    REQUIRE(a->first == "KEY");
    REQUIRE(a->second == "value");

    auto b = parse_env_line("KEY='value'");
    REQUIRE(b->second == "value");

    auto c = parse_env_line("KEY=\"'nested'\"");
    REQUIRE(c->second == "'nested'");
}

TEST_CASE("parse_env_line: accepts export prefix and surrounding spaces", "[env_file]") {
    auto e = parse_env_line("  export KEY = value  ");
    REQUIRE(e);
    REQUIRE(e->first == "KEY");
    REQUIRE(e->second == "value");
}

// ── find_env_value ───────────────────────────────────────────────

TEST_CASE("find_env_value: distinguishes missing, blank and present", "[env_file]") {
    std::string text = "A=one\nB=\nC=\"\"\n";
    REQUIRE(find_env_value(text, "A").state == EntryState::Present);
    REQUIRE(find_env_value(text, "A").value == "one");
    REQUIRE(find_env_value(text, "B").state == EntryState::Blank);
    REQUIRE(find_env_value(text, "C").state == EntryState::Blank);
    REQUIRE(find_env_value(text, "D").state == EntryState::Missing);
}

TEST_CASE("find_env_value: last definition wins", "[env_file]") {
    REQUIRE(find_env_value("A=one\nA=two\n", "A").value == "two");
    REQUIRE(find_env_value("A=one\nA=\n", "A").state == EntryState::Blank);
}

TEST_CASE("read_env_value: missing file is Missing", "[env_file]") {
    REQUIRE(read_env_value("/nonexistent/.env", "A").state == EntryState::Missing);
}

TEST_CASE("read_env_value: file that cannot be opened is Unreadable", "[env_file]") {
    TempHome home;
    home.make_unreadable(home.paths.credential_file());
    REQUIRE(read_env_value(home.paths.credential_file(), "A").state == EntryState::Unreadable);
}

// ── upsert_env_text ──────────────────────────────────────────────

TEST_CASE("upsert_env_text: appends a new name with double quotes", "[env_file]") {
    REQUIRE(upsert_env_text("", "KEY", "v") == "KEY=\"v\"\n");
    REQUIRE(upsert_env_text("# header\nOTHER=1\n", "KEY", "v") ==
            "# header\nOTHER=1\nKEY=\"v\"\n");
}

TEST_CASE("upsert_env_text: writing twice leaves one line with the last value", "[env_file]") {
    std::string text = "A=1\n# note\nB=2\n";
    text = upsert_env_text(text, "KEY", "v1");
    text = upsert_env_text(text, "KEY", "v2");
    REQUIRE(text == "A=1\n# note\nB=2\nKEY=\"v2\"\n");
}

TEST_CASE("upsert_env_text: replaces in place and collapses duplicates", "[env_file]") {
    std::string text = "A=1\nKEY='old'\nB=2\nexport KEY=older\n";
    REQUIRE(upsert_env_text(text, "KEY", "new") == "A=1\nKEY=\"new\"\nB=2\n");
}

TEST_CASE("upsert_env_text: does not touch names sharing a prefix", "[env_file]") {
    std::string text = "KEY_EXTRA=1\n";
    REQUIRE(upsert_env_text(text, "KEY", "v") == "KEY_EXTRA=1\nKEY=\"v\"\n");
}
