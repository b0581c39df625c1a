#include "stagehand/runner/reporting.hpp"
#include "stagehand/core/utils.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace stagehand::runner {

ProfileReporter::ProfileReporter(fs::path path, std::string run_id)
    : path_(std::move(path)), run_id_(std::move(run_id)) {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        core::write_text(path_, "# key\tcommands\tseconds\tmax_rss_kb\toutcome\n");
    }
    core::append_text(path_, "# run " + run_id_ + " " + core::get_iso_timestamp() + "\n");
}

void ProfileReporter::on_step(const StepReport& report) {
    if (report.outcome == "skipped") return;

    std::ostringstream oss;
    oss << report.key << '\t' << report.commands << '\t'
        << std::fixed << std::setprecision(3) << report.duration.count() << '\t'
        << report.max_rss_kb << '\t' << report.outcome << '\n';
    core::append_text(path_, oss.str());
}

void ProfileReporter::on_stage(const std::string& stage, Seconds duration, StageOutcome outcome) {
    std::ostringstream oss;
    oss << "# stage " << stage << '\t' << std::fixed << std::setprecision(3)
        << duration.count() << '\t' << stage_outcome_to_string(outcome) << '\n';
    core::append_text(path_, oss.str());
}

} // namespace stagehand::runner
