#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/collector_config.hpp"
#include "protocol/collection_request.hpp"
#include "protocol/step_outcome.hpp"
#include "report/report_filter.hpp"

namespace diagcollect::runtime {

// A step as declared at build time. `spec.output_path` is a file name
// relative to the run's output root. `sources` holds the query command
// (FileQuery), the candidate channels (ChannelExport) or the key path
// (RegistryExport).
struct PlannedStep {
    protocol::StepSpec spec;
    std::vector<std::string> sources;
    bool enabled = true;
};

struct ReportExtractionPlan {
    protocol::StepSpec spec;
    std::string report_directory = "MDMDiag";
    std::string report_file = "MDMDiagReport.xml";
    report::FilterQuery query;
};

struct CollectionPlan {
    protocol::ArtifactFamily family = protocol::ArtifactFamily::BitLocker;
    std::vector<PlannedStep> steps;
    std::optional<ReportExtractionPlan> report;
};

inline constexpr const char* kReportStepName = "MDM XML parsing";
inline constexpr const char* kArchiveStepName = "ZIP archive";

CollectionPlan build_plan(protocol::ArtifactFamily family, bool include_report,
                          const core::config::CollectorConfig& config);

}  // namespace diagcollect::runtime
