#include "runtime/channel_fallback_resolver.hpp"

#include <utility>
#include "runtime/step_markers.hpp"

namespace diagcollect::runtime {

using protocol::ExportAttempt;
using protocol::StepOutcome;
using protocol::StepSpec;

ChannelFallbackResolver::ChannelFallbackResolver(const StepRunner& runner, ProbeFn probe,
                                                 ExportFn export_fn)
    : runner_(runner), probe_(std::move(probe)), export_fn_(std::move(export_fn)) {}

ChannelFallbackResolver::ChannelFallbackResolver(const StepRunner& runner,
                                                 tools::EventLogExporter& exporter)
    : ChannelFallbackResolver(
          runner,
          [&exporter](const std::string& channel) { return exporter.channel_exists(channel); },
          [&exporter](const std::string& channel, const std::filesystem::path& output_path) {
              return exporter.export_channel(channel, output_path);
          }) {}

StepOutcome ChannelFallbackResolver::resolve_and_export(
    const StepSpec& spec, const std::vector<std::string>& candidates) const {
    return runner_.run(spec, [this, &spec, &candidates]() {
        return try_candidates(spec, candidates);
    });
}

core::errors::Result<ExportAttempt> ChannelFallbackResolver::try_candidates(
    const StepSpec& spec, const std::vector<std::string>& candidates) const {
    auto& log = runner_.log();
    const auto min_size = ArtifactValidator::min_size_for(spec.kind);

    ExportAttempt attempt;
    attempt.output_path = spec.output_path;
    attempt.exit_code = -1;

    for (const auto& candidate : candidates) {
        attempt.attempted.push_back(candidate);

        if (!probe_(candidate)) {
            log.warn(spec.name + ": channel '" + candidate +
                     "' not found on this machine, skipping");
            continue;
        }

        auto exported = export_fn_(candidate, spec.output_path);
        if (core::errors::is_error(exported)) {
            const auto& err = core::errors::get_error(exported);
            attempt.error = err.message;
            log.warn(spec.name + ": channel '" + candidate + "' could not be exported: " +
                     err.message);
            continue;
        }

        attempt.exit_code = core::errors::get_value(exported);
        const auto validation = runner_.validator().validate(spec.output_path, min_size);
        if (attempt.exit_code == 0 && validation.valid()) {
            attempt.source = candidate;
            attempt.error.reset();
            return attempt;
        }

        log.warn(spec.name + ": channel '" + candidate + "' produced no usable export (exit=" +
                 std::to_string(attempt.exit_code) +
                 ", exists=" + (validation.exists ? "true" : "false") +
                 ", size=" + std::to_string(validation.size_bytes) + ")");
    }

    attempt.failure_reason = protocol::reasons::kNoChannelSucceeded;
    if (!attempt.error.has_value()) {
        attempt.error = "attempted: " + join_candidates(attempt.attempted);
    }
    return attempt;
}

}  // namespace diagcollect::runtime
