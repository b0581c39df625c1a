#pragma once

#include "stagehand/core/types.hpp"

#include <filesystem>
#include <string>

namespace stagehand::runner {

namespace fs = std::filesystem;

struct StepReport {
    std::string key;
    std::string outcome;   // completed | failed | skipped | interrupted
    Seconds duration{0.0};
    size_t commands = 0;
    long max_rss_kb = 0;
};

// Invoked by the stage runner after every step and stage.
class ReportHook {
public:
    virtual ~ReportHook() = default;

    virtual void on_step(const StepReport& report) = 0;
    virtual void on_stage(const std::string& stage, Seconds duration, StageOutcome outcome) = 0;
};

// Appends one TSV row per executed step to <out>/<pipeline>_profile.tsv.
class ProfileReporter : public ReportHook {
public:
    ProfileReporter(fs::path path, std::string run_id);

    void on_step(const StepReport& report) override;
    void on_stage(const std::string& stage, Seconds duration, StageOutcome outcome) override;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    std::string run_id_;
};

} // namespace stagehand::runner
