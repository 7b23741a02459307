#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace diagcollect::protocol {

enum class StepKind {
    FileQuery,
    ChannelExport,
    RegistryExport,
    ReportExtraction,
    Archive
};

enum class StepStatus {
    Success,
    Failed,
    Skipped
};

// Static description of one collection step.
struct StepSpec {
    std::string name;
    StepKind kind = StepKind::FileQuery;
    std::filesystem::path output_path;
};

// What a step action reports back to the StepRunner. `failure_reason` is set
// when the action itself already knows the step failed (e.g. no channel was
// reachable); otherwise the runner decides from the exit code and the file.
struct ExportAttempt {
    std::string source;
    std::filesystem::path output_path;
    int exit_code = 0;
    std::optional<std::string> failure_reason;
    std::optional<std::string> error;
    std::vector<std::string> attempted;
    std::optional<std::size_t> item_count;
};

struct StepOutcome {
    std::string name;
    StepKind kind = StepKind::FileQuery;
    std::optional<std::filesystem::path> output_path;
    StepStatus status = StepStatus::Failed;
    std::optional<std::string> reason;
    std::optional<std::string> error;

    std::string source;
    std::vector<std::string> attempted;
    std::optional<int> exit_code;
    bool exists = false;
    bool size_ok = false;
    std::optional<std::size_t> item_count;
};

// Outcome reasons shared by the runner, the resolver and the report step.
namespace reasons {
inline constexpr const char* kExportFailed = "export failed";
inline constexpr const char* kEmptyOrMissing = "empty or missing file";
inline constexpr const char* kException = "exception";
inline constexpr const char* kSourceNotFound = "source not found";
inline constexpr const char* kNoChannelSucceeded = "no channel succeeded";
inline constexpr const char* kNoMatchingNodes = "no matching nodes";
inline constexpr const char* kSourceDocumentNotFound = "source document not found";
inline constexpr const char* kParseException = "parse exception";
inline constexpr const char* kReportGenerationFailed = "report generation failed";
inline constexpr const char* kArchiveFailed = "archive failed";
inline constexpr const char* kDisabled = "disabled by configuration";
}  // namespace reasons

inline std::string to_string(const StepStatus status) {
    switch (status) {
        case StepStatus::Success:
            return "success";
        case StepStatus::Failed:
            return "failed";
        case StepStatus::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

inline std::string to_string(const StepKind kind) {
    switch (kind) {
        case StepKind::FileQuery:
            return "file_query";
        case StepKind::ChannelExport:
            return "channel_export";
        case StepKind::RegistryExport:
            return "registry_export";
        case StepKind::ReportExtraction:
            return "report_extraction";
        case StepKind::Archive:
            return "archive";
        default:
            return "unknown";
    }
}

}  // namespace diagcollect::protocol
