#pragma once

#include "stagehand/core/types.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace stagehand::runner {

namespace fs = std::filesystem;

struct CleanupEntry {
    std::string pattern;   // absolute path, wildcards allowed in the last component
    CleanupPolicy policy = CleanupPolicy::ALWAYS;
    std::string key;       // step that registered it
};

// Append-only list of intermediate artifacts for one run.
class CleanupManifest {
public:
    void append(std::string pattern, CleanupPolicy policy, std::string key = "");

    const std::vector<CleanupEntry>& entries() const { return entries_; }
    bool empty() const { return entries_.empty(); }

    // `always` entries apply to every outcome, `only_on_failure` entries to
    // failed and halted runs. Duplicate patterns are listed once.
    std::vector<CleanupEntry> applicable(RunState outcome) const;

    std::string render_script(const std::string& pipeline, RunState outcome) const;
    void write_script(const fs::path& path, const std::string& pipeline, RunState outcome) const;

    // Deletes the applicable entries. Returns the number of paths removed.
    size_t perform(RunState outcome, std::ostream& log) const;

private:
    std::vector<CleanupEntry> entries_;
};

} // namespace stagehand::runner
