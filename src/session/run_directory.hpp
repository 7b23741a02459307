#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "core/errors/collector_errors.hpp"
#include "protocol/collection_request.hpp"

namespace diagcollect::session {

// --output-path, then --use-temp, then the user's Documents directory.
core::errors::Result<std::filesystem::path> resolve_base_path(
    const protocol::CollectionRequest& request);

// Creates "<family>Logs-DD-MM-YYYY-HH-MM" under `base_path`. When that name is
// already taken (a second run in the same minute), "-2", "-3", ... is
// appended; an existing directory is never reused.
core::errors::Result<std::filesystem::path> create_run_directory(
    const std::filesystem::path& base_path, const std::string& family,
    std::chrono::system_clock::time_point now);

}  // namespace diagcollect::session
