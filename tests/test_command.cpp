#include "stagehand/core/errors.hpp"
#include "stagehand/process/command.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using stagehand::process::Command;
using stagehand::process::Streams;
using stagehand::process::needs_shell;
using stagehand::process::tokenize;

TEST_CASE("tokenize_splits_on_whitespace_and_honors_quotes") {
    auto t = tokenize("samtools sort  -o 'out file.bam' \"in \\\"x\\\".bam\"");
    REQUIRE(t.size() == 5);
    REQUIRE(t[0] == "samtools");
    REQUIRE(t[1] == "sort");
    REQUIRE(t[2] == "-o");
    REQUIRE(t[3] == "out file.bam");
    REQUIRE(t[4] == "in \"x\".bam");
}

TEST_CASE("tokenize_keeps_empty_quoted_arguments_and_backslash_escapes") {
    auto t = tokenize("printf '' a\\ b");
    REQUIRE(t.size() == 3);
    REQUIRE(t[1].empty());
    REQUIRE(t[2] == "a b");
}

TEST_CASE("tokenize_rejects_unterminated_quotes") {
    REQUIRE_THROWS_AS(tokenize("echo 'oops"), stagehand::ProcessError);
    REQUIRE_THROWS_AS(tokenize("echo \"oops"), stagehand::ProcessError);
}

TEST_CASE("from_line_uses_the_shell_only_for_metacharacters") {
    REQUIRE(needs_shell("cat a | sort"));
    REQUIRE(needs_shell("echo $HOME"));
    REQUIRE(needs_shell("ls *.txt"));
    REQUIRE_FALSE(needs_shell("echo plain words"));

    Command direct = Command::from_line("echo plain words");
    REQUIRE(direct.segments().size() == 1);
    REQUIRE(direct.segments()[0] == std::vector<std::string>{"echo", "plain", "words"});

    Command shelled = Command::from_line("echo a > b", "/bin/sh");
    REQUIRE(shelled.segments()[0] == std::vector<std::string>{"/bin/sh", "-c", "echo a > b"});
}

TEST_CASE("from_line_rejects_blank_lines") {
    REQUIRE_THROWS_AS(Command::from_line("   "), stagehand::ProcessError);
    REQUIRE_THROWS_AS(Command::from_argv({}), stagehand::ProcessError);
}

TEST_CASE("to_string_renders_pipes_and_redirections") {
    Command cmd = Command::from_argv({"echo", "a b"});
    cmd.pipe({"wc", "-c"});
    Streams s;
    s.stdin_path = "in.txt";
    s.stdout_path = "out file.txt";
    s.stderr_path = "err.log";
    cmd.redirect(s);
    REQUIRE(cmd.to_string() == "echo 'a b' | wc -c < in.txt > 'out file.txt' 2> err.log");

    s.append = true;
    cmd.redirect(s);
    REQUIRE(cmd.to_string() == "echo 'a b' | wc -c < in.txt >> 'out file.txt' 2>> err.log");
}

TEST_CASE("wrapped_for_container_runs_each_segment_through_exec") {
    Command cmd = Command::from_line("gzip -d reads.fq.gz");
    cmd.pipe({"wc", "-l"});
    Command wrapped = cmd.wrapped_for_container("docker", "aligner");
    REQUIRE(wrapped.segments().size() == 2);
    REQUIRE(wrapped.segments()[0] ==
            std::vector<std::string>{"docker", "exec", "aligner", "sh", "-c", "gzip -d reads.fq.gz"});
    REQUIRE(wrapped.segments()[1] ==
            std::vector<std::string>{"docker", "exec", "aligner", "sh", "-c", "wc -l"});
}
