#include "stagehand/runner/cleanup_manifest.hpp"
#include "stagehand/core/errors.hpp"
#include "stagehand/core/utils.hpp"

#include <set>
#include <sstream>
#include <utility>

namespace stagehand::runner {

namespace {

bool failure_outcome(RunState outcome) {
    return outcome == RunState::FAILED || outcome == RunState::HALTED;
}

// Quotes everything except the wildcard characters so the shell still
// expands them.
std::string script_word(const std::string& pattern) {
    if (!core::has_glob_chars(pattern)) {
        return core::shell_quote(pattern);
    }
    std::string out;
    std::string literal;
    auto flush = [&]() {
        if (!literal.empty()) {
            out += core::shell_quote(literal);
            literal.clear();
        }
    };
    for (char c : pattern) {
        if (c == '*' || c == '?') {
            flush();
            out += c;
        } else {
            literal += c;
        }
    }
    flush();
    return out;
}

} // namespace

void CleanupManifest::append(std::string pattern, CleanupPolicy policy, std::string key) {
    entries_.push_back({std::move(pattern), policy, std::move(key)});
}

std::vector<CleanupEntry> CleanupManifest::applicable(RunState outcome) const {
    std::vector<CleanupEntry> out;
    std::set<std::string> seen;
    for (const auto& e : entries_) {
        if (e.policy == CleanupPolicy::ONLY_ON_FAILURE && !failure_outcome(outcome)) continue;
        if (!seen.insert(e.pattern).second) continue;
        out.push_back(e);
    }
    return out;
}

std::string CleanupManifest::render_script(const std::string& pipeline, RunState outcome) const {
    std::ostringstream oss;
    oss << "#!/bin/sh\n";
    oss << "# cleanup for pipeline '" << pipeline << "', run outcome: "
        << run_state_to_string(outcome) << "\n";
    oss << "# generated " << core::get_iso_timestamp() << "\n";
    for (const auto& e : applicable(outcome)) {
        if (!e.key.empty()) {
            oss << "# " << e.key << " (" << cleanup_policy_to_string(e.policy) << ")\n";
        }
        oss << "rm -rf -- " << script_word(e.pattern) << "\n";
    }
    return oss.str();
}

void CleanupManifest::write_script(const fs::path& path, const std::string& pipeline,
                                   RunState outcome) const {
    core::write_text(path, render_script(pipeline, outcome));
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw IOError("cannot chmod " + path.string() + ": " + ec.message());
    }
}

size_t CleanupManifest::perform(RunState outcome, std::ostream& log) const {
    size_t removed = 0;
    for (const auto& e : applicable(outcome)) {
        for (const auto& p : core::expand_path_pattern(e.pattern)) {
            std::error_code ec;
            auto n = fs::remove_all(p, ec);
            if (ec) {
                log << "[cleanup] cannot remove " << p.string() << ": " << ec.message() << std::endl;
                continue;
            }
            if (n > 0) ++removed;
        }
    }
    return removed;
}

} // namespace stagehand::runner
