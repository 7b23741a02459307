#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/collector_errors.hpp"
#include "protocol/step_outcome.hpp"
#include "runtime/step_runner.hpp"
#include "tools/collaborators.hpp"

namespace diagcollect::runtime {

// Tries equivalent sources in order and keeps the first one that produces a
// valid artifact. Sources that do not exist on this machine are skipped with
// a warning; they are not failures on their own.
class ChannelFallbackResolver {
public:
    using ProbeFn = std::function<bool(const std::string& candidate)>;
    using ExportFn = std::function<core::errors::Result<int>(
        const std::string& candidate, const std::filesystem::path& output_path)>;

    ChannelFallbackResolver(const StepRunner& runner, ProbeFn probe, ExportFn export_fn);
    ChannelFallbackResolver(const StepRunner& runner, tools::EventLogExporter& exporter);

    protocol::StepOutcome resolve_and_export(const protocol::StepSpec& spec,
                                             const std::vector<std::string>& candidates) const;

private:
    core::errors::Result<protocol::ExportAttempt> try_candidates(
        const protocol::StepSpec& spec, const std::vector<std::string>& candidates) const;

    const StepRunner& runner_;
    ProbeFn probe_;
    ExportFn export_fn_;
};

}  // namespace diagcollect::runtime
