#include "session/run_directory.hpp"

#include <cstdlib>
#include <system_error>
#include "core/config/run_directory_name.hpp"

namespace diagcollect::session {

using core::errors::CollectorError;
using core::errors::ErrorCategory;

namespace {

core::errors::Result<std::filesystem::path> documents_directory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        home = std::getenv("USERPROFILE");
    }
    if (home == nullptr || *home == '\0') {
        return CollectorError{ErrorCategory::Precondition,
                              "Unable to determine the user's home directory.",
                              "no_default_output_root",
                              "Pass --output-path or --use-temp."};
    }

    const std::filesystem::path home_path(home);
    const auto documents = home_path / "Documents";
    std::error_code ec;
    if (std::filesystem::is_directory(documents, ec) && !ec) {
        return documents;
    }
    return home_path;
}

}  // namespace

core::errors::Result<std::filesystem::path> resolve_base_path(
    const protocol::CollectionRequest& request) {
    std::error_code ec;
    if (request.output_path.has_value()) {
        const auto absolute = std::filesystem::absolute(request.output_path.value(), ec);
        if (ec) {
            return CollectorError{ErrorCategory::Input,
                                  "Unable to resolve output path: " +
                                      request.output_path->string(),
                                  "invalid_path"};
        }
        return absolute;
    }

    if (request.use_temp) {
        const auto temp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return CollectorError{ErrorCategory::Precondition,
                                  "Unable to locate the temp directory.",
                                  "no_temp_directory"};
        }
        return temp;
    }

    return documents_directory();
}

core::errors::Result<std::filesystem::path> create_run_directory(
    const std::filesystem::path& base_path, const std::string& family,
    const std::chrono::system_clock::time_point now) {
    std::error_code ec;
    std::filesystem::create_directories(base_path, ec);
    if (ec || !std::filesystem::is_directory(base_path, ec)) {
        return CollectorError{ErrorCategory::Precondition,
                              "Unable to create output root: " + base_path.string(),
                              "output_root_unwritable",
                              "Choose a writable --output-path."};
    }

    const auto canonical_base = std::filesystem::weakly_canonical(base_path, ec);
    if (ec) {
        return CollectorError{ErrorCategory::Precondition,
                              "Unable to resolve output root: " + base_path.string(),
                              "output_root_unwritable"};
    }

    const std::string name = core::config::make_run_directory_name(family, now);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string candidate_name =
            attempt == 0 ? name : name + "-" + std::to_string(attempt + 1);
        const auto candidate = canonical_base / candidate_name;

        const bool created = std::filesystem::create_directory(candidate, ec);
        if (ec) {
            return CollectorError{ErrorCategory::Precondition,
                                  "Unable to create run directory: " + candidate.string() +
                                      " (" + ec.message() + ")",
                                  "output_root_unwritable"};
        }
        if (created) {
            return candidate;
        }
    }

    return CollectorError{ErrorCategory::Precondition,
                          "Unable to allocate a unique run directory under " +
                              canonical_base.string(),
                          "run_directory_exhausted"};
}

}  // namespace diagcollect::session
