#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include "core/errors/collector_errors.hpp"
#include "core/logging/logger.hpp"

namespace diagcollect::core::logging {

// Per-run, append-only log file. Every line is flushed as soon as it is
// written and mirrored to the console through Logger, in call order.
class ActivityLog {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* kFileName = "CollectorActivity.log";

    explicit ActivityLog(std::filesystem::path file_path, Clock clock = {});

    // Opens (or creates) the file in append mode.
    core::errors::Result<std::filesystem::path> open();

    void append(std::chrono::system_clock::time_point timestamp, LogLevel level,
                const std::string& message);
    void append(LogLevel level, const std::string& message);

    void debug(const std::string& message) { append(LogLevel::DEBUG, message); }
    void info(const std::string& message) { append(LogLevel::INFO, message); }
    void warn(const std::string& message) { append(LogLevel::WARN, message); }
    void error(const std::string& message) { append(LogLevel::ERROR, message); }

    const std::filesystem::path& path() const { return file_path_; }
    bool is_open() const { return out_.is_open(); }
    std::size_t lines_written() const { return lines_written_; }
    std::size_t write_failures() const { return write_failures_; }

    static std::string format_line(std::chrono::system_clock::time_point timestamp,
                                   LogLevel level, const std::string& message);

    // Escapes CR and LF so one call always produces exactly one line.
    static std::string single_line(const std::string& message);

private:
    std::filesystem::path file_path_;
    Clock clock_;
    std::ofstream out_;
    std::size_t lines_written_ = 0;
    std::size_t write_failures_ = 0;
};

}  // namespace diagcollect::core::logging
