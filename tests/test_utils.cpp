#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using stagehand::testing::TempDir;
namespace core = stagehand::core;

TEST_CASE("translate_name_lowercases_and_replaces_spaces") {
    REQUIRE(core::translate_name("Align Reads") == "align-reads");
    REQUIRE(core::translate_name("  QC  ") == "qc");
    REQUIRE(core::translate_name("already-fine") == "already-fine");
}

TEST_CASE("translate_name_keeps_non_ascii_bytes") {
    REQUIRE(core::translate_name("Qualit\xC3\xA4t Check") == "qualit\xC3\xA4t-check");
    REQUIRE(core::to_lower("\xC3\x84" "BC") == "\xC3\x84" "bc");
}

TEST_CASE("split_and_join_are_inverse_for_simple_lists") {
    auto parts = core::split("a,b,,c", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[2].empty());
    REQUIRE(core::join(parts, ",") == "a,b,,c");
}

TEST_CASE("shell_quote_leaves_safe_words_and_quotes_the_rest") {
    REQUIRE(core::shell_quote("out/file_1.txt") == "out/file_1.txt");
    REQUIRE(core::shell_quote("") == "''");
    REQUIRE(core::shell_quote("a b") == "'a b'");
    REQUIRE(core::shell_quote("it's") == "'it'\\''s'");
    REQUIRE(core::shell_quote("*.tmp") == "'*.tmp'");
}

TEST_CASE("glob_match_handles_wildcards_and_literal_dots") {
    REQUIRE(core::glob_match("*.bam", "sample.bam"));
    REQUIRE_FALSE(core::glob_match("*.bam", "sample.bai"));
    REQUIRE(core::glob_match("part?.txt", "part1.txt"));
    REQUIRE_FALSE(core::glob_match("part?.txt", "part12.txt"));
    REQUIRE_FALSE(core::glob_match("a.b", "axb"));
    REQUIRE(core::glob_match("x[1].log", "x[1].log"));
}

TEST_CASE("expand_path_pattern_lists_matches_sorted") {
    TempDir tmp;
    core::write_text(tmp / "b.tmp", "");
    core::write_text(tmp / "a.tmp", "");
    core::write_text(tmp / "keep.txt", "");

    auto matches = core::expand_path_pattern(tmp / "*.tmp");
    REQUIRE(matches.size() == 2);
    REQUIRE(matches[0].filename() == "a.tmp");
    REQUIRE(matches[1].filename() == "b.tmp");

    REQUIRE(core::expand_path_pattern(tmp / "keep.txt").size() == 1);
    REQUIRE(core::expand_path_pattern(tmp / "missing.txt").empty());
    REQUIRE(core::expand_path_pattern(tmp / "nodir" / "*.tmp").empty());
}

TEST_CASE("write_text_durable_replaces_content_without_leftovers") {
    TempDir tmp;
    fs::path p = tmp / "state.json";
    core::write_text_durable(p, "first");
    core::write_text_durable(p, "second");
    REQUIRE(core::read_text(p) == "second");

    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(tmp.path())) {
        (void)entry;
        ++n;
    }
    REQUIRE(n == 1);
}

TEST_CASE("read_text_of_missing_file_throws_io_error") {
    TempDir tmp;
    REQUIRE_THROWS_AS(core::read_text(tmp / "nope"), stagehand::IOError);
}

TEST_CASE("sha256_file_matches_known_digest") {
    TempDir tmp;
    fs::path p = tmp / "abc.txt";
    core::write_text(p, "abc");
    REQUIRE(core::sha256_file(p) ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE_THROWS_AS(core::sha256_file(tmp / "missing"), stagehand::IOError);
}

TEST_CASE("run_id_and_timestamp_have_expected_shape") {
    std::string ts = core::get_iso_timestamp();
    REQUIRE(ts.size() >= 20);
    REQUIRE(ts.back() == 'Z');
    REQUIRE(ts[10] == 'T');
    REQUIRE_FALSE(core::get_run_id().empty());
    REQUIRE(core::now_unix_ns() > 0);
}
