#pragma once

#include <filesystem>
#include <string>
#include "core/logging/activity_log.hpp"
#include "report/report_filter.hpp"
#include "runtime/collection_plan.hpp"
#include "runtime/step_runner.hpp"
#include "tools/collaborators.hpp"

namespace diagcollect::runtime {

// Builders for the StepActions of each step kind. Outputs are absolute paths
// resolved against the run's output root by the caller.

StepAction make_query_action(tools::StateQuery& query, std::string command,
                             std::filesystem::path output_path);

StepAction make_registry_action(tools::RegistryExporter& registry, std::string key,
                                std::filesystem::path output_path);

StepAction make_report_action(tools::ReportGenerator& generator,
                              const report::ReportFilter& filter,
                              ReportExtractionPlan plan,
                              std::filesystem::path report_directory,
                              core::logging::ActivityLog& log);

// Compresses `source_directory` into `destination` through a temporary
// "<name>.partial.zip" so an interrupted or failed run never leaves a
// half-written archive under the final name.
StepAction make_archive_action(tools::ArchiveCompressor& archiver,
                               std::filesystem::path source_directory,
                               std::filesystem::path destination);

}  // namespace diagcollect::runtime
