#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/collector_errors.hpp"
#include "core/logging/activity_log.hpp"
#include "protocol/collection_request.hpp"
#include "protocol/step_outcome.hpp"
#include "report/report_filter.hpp"
#include "runtime/collection_plan.hpp"
#include "runtime/step_runner.hpp"
#include "tools/collaborators.hpp"

namespace diagcollect::session {

// Initializing -> Running -> ArchivalOptional -> Completed, no way back.
enum class RunState {
    Initializing,
    Running,
    ArchivalOptional,
    Completed
};

std::string to_string(RunState state);

// One execution of the collector. Owns the output root and the activity log;
// every step outcome of the run ends up in `steps()`, in invocation order.
class CollectionRun {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    CollectionRun(std::filesystem::path base_path, protocol::ArtifactFamily family,
                  tools::Collaborators& collaborators, Clock clock = {});

    // Checks privileges, creates the output root and opens the activity log.
    // The only phase whose failure aborts the run.
    core::errors::Result<std::filesystem::path> initialize();

    // Runs every planned step in order. Step failures are recorded, never
    // returned; an error here only means the call was out of order.
    core::errors::Result<std::size_t> run_steps(const runtime::CollectionPlan& plan);

    core::errors::Result<RunState> archive_if_requested(bool requested);

    core::errors::Result<std::filesystem::path> complete();

    // run_steps + archive_if_requested + complete on an initialized run.
    core::errors::Result<std::filesystem::path> execute(const runtime::CollectionPlan& plan,
                                                        bool archive);

    RunState state() const { return state_; }
    const std::filesystem::path& log_root() const { return log_root_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }
    const std::vector<protocol::StepOutcome>& steps() const { return steps_; }
    std::optional<std::filesystem::path> archive_path() const;

private:
    protocol::StepOutcome run_planned_step(const runtime::PlannedStep& step);
    protocol::StepOutcome run_report_step(const runtime::ReportExtractionPlan& plan);
    void write_summary();
    core::errors::CollectorError out_of_order(const std::string& operation) const;

    std::filesystem::path base_path_;
    protocol::ArtifactFamily family_;
    tools::Collaborators& collaborators_;
    Clock clock_;

    RunState state_ = RunState::Initializing;
    bool archival_done_ = false;
    std::chrono::system_clock::time_point started_at_{};
    std::filesystem::path log_root_;
    std::unique_ptr<core::logging::ActivityLog> log_;
    std::unique_ptr<runtime::StepRunner> runner_;
    report::ReportFilter report_filter_;
    std::vector<protocol::StepOutcome> steps_;
};

}  // namespace diagcollect::session
