#include "core/logging/activity_log.hpp"

#include <system_error>
#include <utility>
#include "core/config/run_directory_name.hpp"

namespace diagcollect::core::logging {

using core::errors::CollectorError;
using core::errors::ErrorCategory;

std::string ActivityLog::single_line(const std::string& message) {
    std::string line;
    line.reserve(message.size());
    for (const char c : message) {
        if (c == '\n') {
            line += "\\n";
        } else if (c == '\r') {
            line += "\\r";
        } else {
            line += c;
        }
    }
    return line;
}

ActivityLog::ActivityLog(std::filesystem::path file_path, Clock clock)
    : file_path_(std::move(file_path)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

core::errors::Result<std::filesystem::path> ActivityLog::open() {
    if (out_.is_open()) {
        return file_path_;
    }

    std::error_code ec;
    const auto parent = file_path_.parent_path();
    if (!parent.empty() && (!std::filesystem::is_directory(parent, ec) || ec)) {
        return CollectorError{ErrorCategory::Precondition,
                              "Activity log directory does not exist: " +
                                  parent.string(),
                              "log_dir_missing"};
    }

    out_.open(file_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        return CollectorError{ErrorCategory::Precondition,
                              "Unable to open activity log: " + file_path_.string(),
                              "log_open_failed",
                              "Check that the output directory is writable."};
    }
    return file_path_;
}

std::string ActivityLog::format_line(
    const std::chrono::system_clock::time_point timestamp, const LogLevel level,
    const std::string& message) {
    return core::config::format_local_time(timestamp, "%Y-%m-%d %H:%M:%S") + " [" +
           level_to_string(level) + "] " + single_line(message);
}

void ActivityLog::append(const std::chrono::system_clock::time_point timestamp,
                         const LogLevel level, const std::string& message) {
    Logger::get().log(level, single_line(message));

    if (!out_.is_open()) {
        ++write_failures_;
        return;
    }

    out_ << format_line(timestamp, level, message) << '\n';
    out_.flush();
    if (!out_.good()) {
        ++write_failures_;
        out_.clear();
        Logger::get().log(LogLevel::ERROR,
                          "Unable to write activity log line: " + file_path_.string());
        return;
    }
    ++lines_written_;
}

void ActivityLog::append(const LogLevel level, const std::string& message) {
    append(clock_(), level, message);
}

}  // namespace diagcollect::core::logging
