#include "session/collection_run.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/channel_fallback_resolver.hpp"
#include "runtime/step_actions.hpp"
#include "session/run_directory.hpp"
#include "session/summary_writer.hpp"

namespace diagcollect::session {

using core::errors::CollectorError;
using core::errors::ErrorCategory;
using protocol::StepKind;
using protocol::StepOutcome;
using protocol::StepSpec;
using protocol::StepStatus;

namespace {

runtime::StepAction missing_collaborator(const std::string& what) {
    return [what]() -> core::errors::Result<protocol::ExportAttempt> {
        return CollectorError{ErrorCategory::Internal, "No " + what + " is configured.",
                              "collaborator_missing"};
    };
}

}  // namespace

std::string to_string(const RunState state) {
    switch (state) {
        case RunState::Initializing:
            return "initializing";
        case RunState::Running:
            return "running";
        case RunState::ArchivalOptional:
            return "archival";
        case RunState::Completed:
            return "completed";
        default:
            return "unknown";
    }
}

CollectionRun::CollectionRun(std::filesystem::path base_path,
                             const protocol::ArtifactFamily family,
                             tools::Collaborators& collaborators, Clock clock)
    : base_path_(std::move(base_path)),
      family_(family),
      collaborators_(collaborators),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

CollectorError CollectionRun::out_of_order(const std::string& operation) const {
    return CollectorError{ErrorCategory::Internal,
                          "Cannot " + operation + " while run is " + to_string(state_),
                          "invalid_state_transition"};
}

core::errors::Result<std::filesystem::path> CollectionRun::initialize() {
    if (state_ != RunState::Initializing || log_) {
        return out_of_order("initialize");
    }

    if (!collaborators_.privilege) {
        return CollectorError{ErrorCategory::Internal, "No privilege checker is configured.",
                              "collaborator_missing"};
    }
    if (!collaborators_.privilege->is_elevated()) {
        return CollectorError{ErrorCategory::Precondition,
                              "Collection requires elevated privileges.",
                              "insufficient_privilege",
                              "Re-run from an elevated (administrator/root) shell."};
    }

    started_at_ = clock_();
    auto created =
        create_run_directory(base_path_, protocol::to_string(family_), started_at_);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const auto root = core::errors::get_value(created);

    auto log = std::make_unique<core::logging::ActivityLog>(
        root / core::logging::ActivityLog::kFileName, clock_);
    auto opened = log->open();
    if (core::errors::is_error(opened)) {
        return core::errors::get_error(opened);
    }

    log_root_ = root;
    log_ = std::move(log);
    runner_ = std::make_unique<runtime::StepRunner>(*log_);
    core::logging::Logger::get().set_run_tag(log_root_.filename().string());

    log_->info("Collecting " + protocol::to_string(family_) + " diagnostics into '" +
               log_root_.string() + "'");
    state_ = RunState::Running;
    return log_root_;
}

core::errors::Result<std::size_t> CollectionRun::run_steps(
    const runtime::CollectionPlan& plan) {
    if (state_ != RunState::Running) {
        return out_of_order("run steps");
    }

    std::size_t executed = 0;
    for (const auto& step : plan.steps) {
        steps_.push_back(run_planned_step(step));
        ++executed;
    }
    if (plan.report.has_value()) {
        steps_.push_back(run_report_step(plan.report.value()));
        ++executed;
    }

    state_ = RunState::ArchivalOptional;
    write_summary();
    return executed;
}

StepOutcome CollectionRun::run_planned_step(const runtime::PlannedStep& step) {
    StepSpec spec = step.spec;
    spec.output_path = log_root_ / spec.output_path;

    if (!step.enabled) {
        return runner_->skip(spec, protocol::reasons::kDisabled);
    }
    if (step.sources.empty()) {
        return runner_->run(spec, missing_collaborator("source for '" + spec.name + "'"));
    }

    switch (spec.kind) {
        case StepKind::FileQuery:
            if (!collaborators_.query) {
                return runner_->run(spec, missing_collaborator("state query"));
            }
            return runner_->run(spec, runtime::make_query_action(*collaborators_.query,
                                                                 step.sources.front(),
                                                                 spec.output_path));
        case StepKind::ChannelExport: {
            if (!collaborators_.event_logs) {
                return runner_->run(spec, missing_collaborator("event log exporter"));
            }
            const runtime::ChannelFallbackResolver resolver(*runner_,
                                                            *collaborators_.event_logs);
            return resolver.resolve_and_export(spec, step.sources);
        }
        case StepKind::RegistryExport:
            if (!collaborators_.registry) {
                return runner_->run(spec, missing_collaborator("registry exporter"));
            }
            return runner_->run(spec, runtime::make_registry_action(*collaborators_.registry,
                                                                    step.sources.front(),
                                                                    spec.output_path));
        default:
            return runner_->run(spec, missing_collaborator("handler for " +
                                                           protocol::to_string(spec.kind) +
                                                           " in the step list"));
    }
}

StepOutcome CollectionRun::run_report_step(const runtime::ReportExtractionPlan& plan) {
    runtime::ReportExtractionPlan resolved = plan;
    resolved.spec.output_path = log_root_ / plan.spec.output_path;
    const StepSpec spec = resolved.spec;

    if (!collaborators_.report) {
        return runner_->run(spec, missing_collaborator("report generator"));
    }
    const auto report_directory = log_root_ / plan.report_directory;
    return runner_->run(spec, runtime::make_report_action(*collaborators_.report,
                                                          report_filter_, std::move(resolved),
                                                          report_directory, *log_));
}

core::errors::Result<RunState> CollectionRun::archive_if_requested(const bool requested) {
    if (state_ != RunState::ArchivalOptional || archival_done_) {
        return out_of_order("archive");
    }
    archival_done_ = true;
    if (!requested) {
        log_->debug("Archive not requested");
        return state_;
    }

    const auto destination =
        log_root_.parent_path() / (log_root_.filename().string() + ".zip");
    const StepSpec spec{runtime::kArchiveStepName, StepKind::Archive, destination};
    if (!collaborators_.archiver) {
        steps_.push_back(runner_->run(spec, missing_collaborator("archive compressor")));
    } else {
        steps_.push_back(runner_->run(
            spec, runtime::make_archive_action(*collaborators_.archiver, log_root_,
                                               destination)));
    }
    write_summary();
    return state_;
}

core::errors::Result<std::filesystem::path> CollectionRun::complete() {
    if (state_ != RunState::ArchivalOptional) {
        return out_of_order("complete");
    }

    const auto count = [this](const StepStatus status) {
        return std::count_if(steps_.begin(), steps_.end(),
                             [status](const StepOutcome& step) { return step.status == status; });
    };
    log_->info("Collection complete: " + std::to_string(count(StepStatus::Success)) + " of " +
               std::to_string(steps_.size()) + " steps succeeded, " +
               std::to_string(count(StepStatus::Failed)) + " failed, " +
               std::to_string(count(StepStatus::Skipped)) + " skipped");
    if (log_->write_failures() > 0) {
        LOG_ERROR(std::to_string(log_->write_failures()) +
                  " activity log lines could not be written to " + log_->path().string());
    }
    if (const auto archive = archive_path()) {
        log_->info("Archive: '" + archive->string() + "'");
    }
    log_->info("Output directory: '" + log_root_.string() + "'");

    state_ = RunState::Completed;
    return log_root_;
}

core::errors::Result<std::filesystem::path> CollectionRun::execute(
    const runtime::CollectionPlan& plan, const bool archive) {
    auto ran = run_steps(plan);
    if (core::errors::is_error(ran)) {
        return core::errors::get_error(ran);
    }
    auto archived = archive_if_requested(archive);
    if (core::errors::is_error(archived)) {
        return core::errors::get_error(archived);
    }
    return complete();
}

std::optional<std::filesystem::path> CollectionRun::archive_path() const {
    for (const auto& step : steps_) {
        if (step.kind == StepKind::Archive && step.status == StepStatus::Success) {
            return step.output_path;
        }
    }
    return std::nullopt;
}

void CollectionRun::write_summary() {
    const SummaryWriter writer(log_root_);
    RunSummary summary{protocol::to_string(family_), log_root_, started_at_, steps_};
    core::errors::Result<std::filesystem::path> written = std::filesystem::path{};
    try {
        written = writer.write(summary);
    } catch (const std::exception& ex) {
        log_->error(std::string("Unable to write run summary: ") + ex.what());
        return;
    }
    if (core::errors::is_error(written)) {
        log_->error("Unable to write run summary [" +
                    core::errors::get_error(written).code +
                    "]: " + core::errors::get_error(written).message);
        return;
    }
    log_->debug("Run summary written to '" + core::errors::get_value(written).string() + "'");
}

}  // namespace diagcollect::session
