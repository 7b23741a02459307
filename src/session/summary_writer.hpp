#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/collector_errors.hpp"
#include "protocol/step_outcome.hpp"

namespace diagcollect::session {

struct RunSummary {
    std::string family;
    std::filesystem::path log_root;
    std::chrono::system_clock::time_point started_at;
    std::vector<protocol::StepOutcome> steps;
};

// Writes the machine-readable counterpart of the activity log.
class SummaryWriter {
public:
    static constexpr const char* kFileName = "collection_summary.json";

    explicit SummaryWriter(std::filesystem::path log_root);

    core::errors::Result<std::filesystem::path> write(const RunSummary& summary) const;

    static std::string to_json_text(const RunSummary& summary);

private:
    std::filesystem::path log_root_;
};

}  // namespace diagcollect::session
