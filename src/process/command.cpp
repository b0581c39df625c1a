#include "stagehand/process/command.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include <cctype>
#include <utility>

namespace stagehand::process {

static std::string quote_argv(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());
    for (const auto& a : argv) {
        quoted.push_back(core::shell_quote(a));
    }
    return core::join(quoted, " ");
}

bool needs_shell(const std::string& line) {
    return line.find_first_of("|><*;&$`") != std::string::npos;
}

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string cur;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote == '\'') {
            if (c == '\'') {
                quote = 0;
            } else {
                cur += c;
            }
            continue;
        }
        if (quote == '"') {
            if (c == '"') {
                quote = 0;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\')) {
                cur += line[++i];
            } else {
                cur += c;
            }
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_token) {
                tokens.push_back(cur);
                cur.clear();
                in_token = false;
            }
            continue;
        }
        in_token = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < line.size()) {
            cur += line[++i];
        } else {
            cur += c;
        }
    }

    if (quote != 0) {
        throw ProcessError("unterminated quote in command: " + line);
    }
    if (in_token) {
        tokens.push_back(cur);
    }
    return tokens;
}

Command Command::from_line(const std::string& line, const std::string& shell) {
    Command cmd;
    std::string text = core::trim(line);
    if (text.empty()) {
        throw ProcessError("empty command line");
    }
    if (needs_shell(text)) {
        cmd.segments_.push_back({shell, "-c", text});
    } else {
        cmd.segments_.push_back(tokenize(text));
    }
    cmd.display_.push_back(text);
    return cmd;
}

Command Command::from_argv(std::vector<std::string> argv) {
    if (argv.empty()) {
        throw ProcessError("empty argv");
    }
    Command cmd;
    cmd.display_.push_back(quote_argv(argv));
    cmd.segments_.push_back(std::move(argv));
    return cmd;
}

Command& Command::pipe(std::vector<std::string> argv) {
    if (argv.empty()) {
        throw ProcessError("empty argv in pipe segment");
    }
    display_.push_back(quote_argv(argv));
    segments_.push_back(std::move(argv));
    return *this;
}

Command& Command::redirect(Streams streams) {
    streams_ = std::move(streams);
    return *this;
}

Command Command::wrapped_for_container(const std::string& runtime,
                                       const std::string& container) const {
    Command out;
    out.streams_ = streams_;
    for (const auto& text : display_) {
        std::vector<std::string> argv{runtime, "exec", container, "sh", "-c", text};
        out.display_.push_back(quote_argv(argv));
        out.segments_.push_back(std::move(argv));
    }
    return out;
}

std::string Command::to_string() const {
    std::string s = core::join(display_, " | ");
    if (!streams_.stdin_path.empty()) {
        s += " < " + core::shell_quote(streams_.stdin_path);
    }
    const char* op = streams_.append ? " >> " : " > ";
    if (!streams_.stdout_path.empty()) {
        s += op + core::shell_quote(streams_.stdout_path);
    }
    if (!streams_.stderr_path.empty()) {
        s += std::string(" 2") + (streams_.append ? ">> " : "> ") + core::shell_quote(streams_.stderr_path);
    }
    return s;
}

} // namespace stagehand::process
