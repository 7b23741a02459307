#include "runtime/step_runner.hpp"

#include <exception>
#include <utility>
#include "runtime/step_markers.hpp"

namespace diagcollect::runtime {

using core::logging::LogLevel;
using protocol::ExportAttempt;
using protocol::StepKind;
using protocol::StepOutcome;
using protocol::StepSpec;
using protocol::StepStatus;
namespace reasons = protocol::reasons;

namespace {

std::string failure_reason_for(const StepKind kind) {
    return kind == StepKind::Archive ? reasons::kArchiveFailed : reasons::kExportFailed;
}

StepOutcome begin_outcome(const StepSpec& spec) {
    StepOutcome outcome;
    outcome.name = spec.name;
    outcome.kind = spec.kind;
    if (!spec.output_path.empty()) {
        outcome.output_path = spec.output_path;
    }
    return outcome;
}

}  // namespace

StepRunner::StepRunner(core::logging::ActivityLog& log, ArtifactValidator validator)
    : log_(log), validator_(validator) {}

StepOutcome StepRunner::run(const StepSpec& spec, const StepAction& action) const {
    log_.debug("Starting step: " + spec.name + " (" + protocol::to_string(spec.kind) + ")");

    core::errors::Result<ExportAttempt> result = ExportAttempt{};
    try {
        result = action();
    } catch (const std::exception& ex) {
        return from_exception(spec, ex.what());
    } catch (...) {
        return from_exception(spec, "unknown exception");
    }

    StepOutcome outcome = begin_outcome(spec);
    const auto min_size = ArtifactValidator::min_size_for(spec.kind);

    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        outcome.status = StepStatus::Failed;
        outcome.reason = err.code == "source_not_found" ? std::string(reasons::kSourceNotFound)
                                                        : failure_reason_for(spec.kind);
        outcome.error = err.message;
    } else {
        const auto& attempt = core::errors::get_value(result);
        outcome.source = attempt.source;
        outcome.attempted = attempt.attempted;
        outcome.item_count = attempt.item_count;
        outcome.exit_code = attempt.exit_code;
        outcome.error = attempt.error;
        if (!attempt.output_path.empty()) {
            outcome.output_path = attempt.output_path;
        }

        if (attempt.failure_reason.has_value()) {
            outcome.status = StepStatus::Failed;
            outcome.reason = attempt.failure_reason;
        } else if (attempt.exit_code != 0) {
            outcome.status = StepStatus::Failed;
            outcome.reason = failure_reason_for(spec.kind);
        } else {
            outcome.status = StepStatus::Success;
        }
    }

    const auto validation =
        validator_.validate(outcome.output_path.value_or(std::filesystem::path{}), min_size);
    outcome.exists = validation.exists;
    outcome.size_ok = validation.size_ok;
    if (outcome.status == StepStatus::Success && !validation.valid()) {
        outcome.status = StepStatus::Failed;
        outcome.reason = reasons::kEmptyOrMissing;
    }

    return finalize(std::move(outcome));
}

StepOutcome StepRunner::skip(const StepSpec& spec, const std::string& reason) const {
    StepOutcome outcome = begin_outcome(spec);
    outcome.status = StepStatus::Skipped;
    outcome.reason = reason;
    return finalize(std::move(outcome));
}

StepOutcome StepRunner::from_exception(const StepSpec& spec,
                                       const std::string& message) const {
    StepOutcome outcome = begin_outcome(spec);
    outcome.status = StepStatus::Failed;
    outcome.reason = reasons::kException;
    outcome.error = message;

    const auto validation =
        validator_.validate(spec.output_path, ArtifactValidator::min_size_for(spec.kind));
    outcome.exists = validation.exists;
    outcome.size_ok = validation.size_ok;
    return finalize(std::move(outcome));
}

StepOutcome StepRunner::finalize(StepOutcome outcome) const {
    LogLevel level = LogLevel::INFO;
    if (outcome.status == StepStatus::Failed) {
        level = LogLevel::ERROR;
    } else if (outcome.status == StepStatus::Skipped) {
        level = LogLevel::WARN;
    }
    log_.append(level, format_step_marker(outcome));

    // The Archive and report markers have no error slot.
    const bool marker_has_error =
        outcome.reason.has_value() && *outcome.reason == reasons::kException &&
        outcome.kind != StepKind::Archive && outcome.kind != StepKind::ReportExtraction;
    if (outcome.status == StepStatus::Failed && outcome.error.has_value() &&
        !marker_has_error) {
        log_.append(LogLevel::WARN, outcome.name + " error: " + outcome.error.value());
    }
    return outcome;
}

}  // namespace diagcollect::runtime
