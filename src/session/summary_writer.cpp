#include "session/summary_writer.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_directory_name.hpp"

namespace diagcollect::session {

using core::errors::CollectorError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json step_to_json(const protocol::StepOutcome& step) {
    json payload;
    payload["name"] = step.name;
    payload["kind"] = protocol::to_string(step.kind);
    payload["status"] = protocol::to_string(step.status);
    payload["reason"] = step.reason.has_value() ? json(step.reason.value()) : json(nullptr);
    payload["error"] = step.error.has_value() ? json(step.error.value()) : json(nullptr);
    payload["output"] =
        step.output_path.has_value() ? json(step.output_path->string()) : json(nullptr);
    payload["source"] = step.source;
    payload["attempted"] = step.attempted;
    payload["exit_code"] = step.exit_code.has_value() ? json(step.exit_code.value()) : json(nullptr);
    payload["exists"] = step.exists;
    payload["size_ok"] = step.size_ok;
    if (step.item_count.has_value()) {
        payload["count"] = step.item_count.value();
    }
    return payload;
}

}  // namespace

SummaryWriter::SummaryWriter(std::filesystem::path log_root)
    : log_root_(std::move(log_root)) {}

std::string SummaryWriter::to_json_text(const RunSummary& summary) {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
    json steps = json::array();
    for (const auto& step : summary.steps) {
        switch (step.status) {
            case protocol::StepStatus::Success:
                ++succeeded;
                break;
            case protocol::StepStatus::Failed:
                ++failed;
                break;
            case protocol::StepStatus::Skipped:
                ++skipped;
                break;
        }
        steps.push_back(step_to_json(step));
    }

    json document;
    document["family"] = summary.family;
    document["output_root"] = summary.log_root.string();
    document["started_at"] =
        core::config::format_local_time(summary.started_at, "%Y-%m-%dT%H:%M:%S");
    document["counts"] = {{"total", summary.steps.size()},
                          {"succeeded", succeeded},
                          {"failed", failed},
                          {"skipped", skipped}};
    document["steps"] = std::move(steps);
    // Step errors and paths may carry bytes that are not UTF-8.
    return document.dump(2, ' ', false, json::error_handler_t::replace);
}

core::errors::Result<std::filesystem::path> SummaryWriter::write(
    const RunSummary& summary) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(log_root_, ec) || ec) {
        return CollectorError{ErrorCategory::Internal,
                              "Output root does not exist: " + log_root_.string(),
                              "invalid_output_root"};
    }

    std::string text;
    try {
        text = to_json_text(summary);
    } catch (const json::exception& ex) {
        return CollectorError{ErrorCategory::Internal,
                              std::string("Unable to serialize run summary: ") + ex.what(),
                              "summary_serialize_failed"};
    }

    const auto path = log_root_ / kFileName;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return CollectorError{ErrorCategory::Internal,
                              "Unable to open summary file: " + path.string(),
                              "summary_open_failed"};
    }

    out << text << "\n";
    if (!out.good()) {
        return CollectorError{ErrorCategory::Internal,
                              "Unable to write summary file: " + path.string(),
                              "summary_write_failed"};
    }
    return path;
}

}  // namespace diagcollect::session
