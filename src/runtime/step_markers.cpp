#include "runtime/step_markers.hpp"

#include <sstream>

namespace diagcollect::runtime {

using protocol::StepKind;
using protocol::StepOutcome;
using protocol::StepStatus;

namespace {

const char* bool_text(const bool value) {
    return value ? "true" : "false";
}

// Single-quoted marker value with quotes and line breaks escaped.
std::string quoted(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        switch (c) {
            case '\'':
                out += "\\'";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                out += c;
        }
    }
    out += '\'';
    return out;
}

std::string path_text(const StepOutcome& outcome) {
    return outcome.output_path.has_value() ? outcome.output_path->string() : "";
}

std::string reason_text(const StepOutcome& outcome) {
    return outcome.reason.value_or(protocol::reasons::kExportFailed);
}

std::string archive_marker(const StepOutcome& outcome) {
    std::ostringstream line;
    if (outcome.status == StepStatus::Success) {
        line << "STEP: ZIP archive succeeded; output=" << quoted(path_text(outcome));
    } else {
        line << "STEP: ZIP archive failed; reason=" << quoted(reason_text(outcome))
             << "; file=" << quoted(path_text(outcome));
    }
    return line.str();
}

std::string report_marker(const StepOutcome& outcome) {
    std::ostringstream line;
    if (outcome.status == StepStatus::Success) {
        line << "STEP: MDM XML parsing succeeded; output=" << quoted(path_text(outcome))
             << "; count=" << outcome.item_count.value_or(0);
    } else {
        line << "STEP: MDM XML parsing failed; reason=" << quoted(reason_text(outcome))
             << "; file=" << quoted(path_text(outcome));
    }
    return line.str();
}

std::string export_marker(const StepOutcome& outcome) {
    std::ostringstream line;
    line << "STEP: " << outcome.name << " export ";
    if (outcome.status == StepStatus::Success) {
        line << "succeeded; channel=" << quoted(outcome.source)
             << "; output=" << quoted(path_text(outcome));
        return line.str();
    }
    if (outcome.status == StepStatus::Skipped) {
        line << "skipped; reason=" << quoted(reason_text(outcome))
             << "; file=" << quoted(path_text(outcome));
        return line.str();
    }

    const std::string reason = reason_text(outcome);
    if (reason == protocol::reasons::kException) {
        line << "failed; reason='exception'; file=" << quoted(path_text(outcome))
             << "; error=" << quoted(outcome.error.value_or(""));
    } else if (reason == protocol::reasons::kNoChannelSucceeded) {
        line << "failed; reason=" << quoted(reason)
             << "; attempted=" << quoted(join_candidates(outcome.attempted))
             << "; file=" << quoted(path_text(outcome));
    } else {
        line << "failed; reason=" << quoted(reason) << "; exit=" << outcome.exit_code.value_or(-1)
             << "; exists=" << bool_text(outcome.exists)
             << "; sizeOK=" << bool_text(outcome.size_ok)
             << "; file=" << quoted(path_text(outcome));
    }
    return line.str();
}

}  // namespace

std::string join_candidates(const std::vector<std::string>& candidates) {
    std::string joined;
    for (const auto& candidate : candidates) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += candidate;
    }
    return joined;
}

std::string format_step_marker(const StepOutcome& outcome) {
    switch (outcome.kind) {
        case StepKind::Archive:
            return archive_marker(outcome);
        case StepKind::ReportExtraction:
            return report_marker(outcome);
        default:
            return export_marker(outcome);
    }
}

}  // namespace diagcollect::runtime
