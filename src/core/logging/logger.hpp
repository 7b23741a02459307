#pragma once
#include <iostream>
#include <string>
#include <mutex>

namespace diagcollect::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    // 2. Console logger shared by the whole process
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tag prefixed to every console line, usually the run directory name.
        void set_run_tag(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_tag_ = tag;
        }

        void set_verbose(bool verbose) {
            std::lock_guard<std::mutex> lock(mutex_);
            verbose_ = verbose;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level == LogLevel::DEBUG && !verbose_) {
                return;
            }

            std::cout << "[" << level_to_string(level) << "] "
                      << (run_tag_.empty() ? "" : "[" + run_tag_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_tag_;
        bool verbose_ = false;
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) diagcollect::core::logging::Logger::get().log(diagcollect::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  diagcollect::core::logging::Logger::get().log(diagcollect::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  diagcollect::core::logging::Logger::get().log(diagcollect::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) diagcollect::core::logging::Logger::get().log(diagcollect::core::logging::LogLevel::ERROR, msg)

} // namespace diagcollect::core::logging
