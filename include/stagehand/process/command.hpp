#pragma once

#include <string>
#include <vector>

namespace stagehand::process {

struct Streams {
    std::string stdin_path;
    std::string stdout_path;
    std::string stderr_path;
    bool append = false;   // stdout/stderr are opened O_APPEND instead of O_TRUNC
};

// A pipe-connected group of argv segments with optional redirection of the
// group's stdin (first segment), stdout (last segment) and stderr (all).
class Command {
public:
    Command() = default;

    // Lines with shell metacharacters run through `<shell> -c`, everything
    // else is tokenized and exec'd directly.
    static Command from_line(const std::string& line, const std::string& shell = "/bin/sh");
    static Command from_argv(std::vector<std::string> argv);

    Command& pipe(std::vector<std::string> argv);
    Command& redirect(Streams streams);

    // Every segment becomes `<runtime> exec <container> sh -c '<segment>'`.
    Command wrapped_for_container(const std::string& runtime,
                                  const std::string& container) const;

    const std::vector<std::vector<std::string>>& segments() const { return segments_; }
    const Streams& streams() const { return streams_; }
    bool empty() const { return segments_.empty(); }

    // Shell rendition including redirections, used for the command log.
    std::string to_string() const;

private:
    std::vector<std::vector<std::string>> segments_;
    std::vector<std::string> display_;   // one shell text per segment
    Streams streams_;
};

bool needs_shell(const std::string& line);

// Splits on unquoted whitespace. Single quotes are literal, double quotes
// honor backslash escapes. Throws ProcessError on an unterminated quote.
std::vector<std::string> tokenize(const std::string& line);

} // namespace stagehand::process
