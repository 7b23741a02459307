#include "runtime/step_actions.hpp"

#include <system_error>
#include <utility>
#include "runtime/artifact_validator.hpp"

namespace diagcollect::runtime {

using core::errors::CollectorError;
using core::errors::ErrorCategory;
using protocol::ExportAttempt;
namespace reasons = protocol::reasons;

namespace {

ExportAttempt attempt_from_exit(std::string source, std::filesystem::path output_path,
                                const int exit_code) {
    ExportAttempt attempt;
    attempt.source = std::move(source);
    attempt.output_path = std::move(output_path);
    attempt.exit_code = exit_code;
    return attempt;
}

std::filesystem::path partial_path_for(const std::filesystem::path& destination) {
    auto partial = destination;
    partial.replace_extension(".partial.zip");
    return partial;
}

}  // namespace

StepAction make_query_action(tools::StateQuery& query, std::string command,
                             std::filesystem::path output_path) {
    return [&query, command = std::move(command),
            output_path = std::move(output_path)]() -> core::errors::Result<ExportAttempt> {
        auto result = query.run_query(command, output_path);
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        return attempt_from_exit(command, output_path, core::errors::get_value(result));
    };
}

StepAction make_registry_action(tools::RegistryExporter& registry, std::string key,
                                std::filesystem::path output_path) {
    return [&registry, key = std::move(key),
            output_path = std::move(output_path)]() -> core::errors::Result<ExportAttempt> {
        if (!registry.key_exists(key)) {
            return CollectorError{ErrorCategory::Execution,
                                  "Registry key not found: " + key, "source_not_found"};
        }
        auto result = registry.export_key(key, output_path);
        if (core::errors::is_error(result)) {
            return core::errors::get_error(result);
        }
        return attempt_from_exit(key, output_path, core::errors::get_value(result));
    };
}

StepAction make_report_action(tools::ReportGenerator& generator,
                              const report::ReportFilter& filter,
                              ReportExtractionPlan plan,
                              std::filesystem::path report_directory,
                              core::logging::ActivityLog& log) {
    return [&generator, &filter, &log, plan = std::move(plan),
            report_directory = std::move(report_directory)]()
               -> core::errors::Result<ExportAttempt> {
        ExportAttempt attempt;
        attempt.source = plan.query.selector_value;
        attempt.output_path = plan.spec.output_path;

        const auto report_path = report_directory / plan.report_file;
        auto generated = generator.generate(report_directory);
        std::error_code ec;
        const bool report_present = std::filesystem::is_regular_file(report_path, ec) && !ec;
        if (core::errors::is_error(generated)) {
            const auto& err = core::errors::get_error(generated);
            if (!report_present) {
                attempt.exit_code = -1;
                attempt.failure_reason = reasons::kReportGenerationFailed;
                attempt.error = err.message;
                return attempt;
            }
            log.warn(plan.spec.name + ": report generator failed but left a report: " +
                     err.message);
        } else if (core::errors::get_value(generated) != 0) {
            log.warn(plan.spec.name + ": report generator exited with code " +
                     std::to_string(core::errors::get_value(generated)));
        }

        const auto filtered = filter.extract_file(report_path, plan.query, plan.spec.output_path);
        switch (filtered.status) {
            case report::FilterStatus::Matched:
                attempt.exit_code = 0;
                attempt.item_count = filtered.count;
                break;
            case report::FilterStatus::NoMatchingNodes:
                attempt.exit_code = 0;
                attempt.item_count = 0;
                attempt.failure_reason = reasons::kNoMatchingNodes;
                break;
            case report::FilterStatus::SourceNotFound:
                attempt.failure_reason = reasons::kSourceDocumentNotFound;
                attempt.error = filtered.error;
                break;
            case report::FilterStatus::ParseFailed:
                attempt.failure_reason = reasons::kParseException;
                attempt.error = filtered.error;
                break;
            case report::FilterStatus::WriteFailed:
                attempt.failure_reason = reasons::kExportFailed;
                attempt.error = filtered.error;
                break;
        }
        return attempt;
    };
}

StepAction make_archive_action(tools::ArchiveCompressor& archiver,
                               std::filesystem::path source_directory,
                               std::filesystem::path destination) {
    return [&archiver, source_directory = std::move(source_directory),
            destination = std::move(destination)]() -> core::errors::Result<ExportAttempt> {
        const auto partial = partial_path_for(destination);
        std::error_code ec;
        std::filesystem::remove(partial, ec);

        auto compressed = archiver.compress(source_directory, partial);
        if (core::errors::is_error(compressed)) {
            std::filesystem::remove(partial, ec);
            return core::errors::get_error(compressed);
        }

        const int exit_code = core::errors::get_value(compressed);
        const ArtifactValidator validator;
        const auto validation =
            validator.validate(partial, ArtifactValidator::kBinaryArtifactMinBytes);
        if (exit_code != 0 || !validation.valid()) {
            std::filesystem::remove(partial, ec);
            // A previous archive under the final name must not pass for this one.
            auto attempt = attempt_from_exit(source_directory.string(), destination, exit_code);
            if (exit_code == 0) {
                attempt.failure_reason = reasons::kEmptyOrMissing;
            }
            return attempt;
        }

        std::filesystem::rename(partial, destination, ec);
        if (ec) {
            std::filesystem::remove(partial, ec);
            return CollectorError{ErrorCategory::Execution,
                                  "Unable to move archive into place: " +
                                      destination.string(),
                                  "archive_rename_failed"};
        }
        return attempt_from_exit(source_directory.string(), destination, exit_code);
    };
}

}  // namespace diagcollect::runtime
