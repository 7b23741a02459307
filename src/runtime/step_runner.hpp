#pragma once

#include <functional>
#include <string>
#include "core/errors/collector_errors.hpp"
#include "core/logging/activity_log.hpp"
#include "protocol/step_outcome.hpp"
#include "runtime/artifact_validator.hpp"

namespace diagcollect::runtime {

// One collection task. Returning an error value, returning an attempt with a
// failure reason and throwing are all turned into a Failed outcome.
using StepAction = std::function<core::errors::Result<protocol::ExportAttempt>()>;

// Error boundary around a single step: whatever happens inside `action`, the
// caller gets a finalized StepOutcome and exactly one STEP line is logged.
class StepRunner {
public:
    explicit StepRunner(core::logging::ActivityLog& log,
                        ArtifactValidator validator = ArtifactValidator{});

    protocol::StepOutcome run(const protocol::StepSpec& spec,
                              const StepAction& action) const;

    // Records a step that was configured but not executed.
    protocol::StepOutcome skip(const protocol::StepSpec& spec,
                               const std::string& reason) const;

    core::logging::ActivityLog& log() const { return log_; }
    const ArtifactValidator& validator() const { return validator_; }

private:
    protocol::StepOutcome finalize(protocol::StepOutcome outcome) const;
    protocol::StepOutcome from_exception(const protocol::StepSpec& spec,
                                         const std::string& message) const;

    core::logging::ActivityLog& log_;
    ArtifactValidator validator_;
};

}  // namespace diagcollect::runtime
