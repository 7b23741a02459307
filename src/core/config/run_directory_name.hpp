#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace diagcollect::core::config {

    // strftime over local time; returns an empty string if the pattern does not fit.
    inline std::string format_local_time(std::chrono::system_clock::time_point tp,
                                         const char* pattern) {
        const std::time_t raw = std::chrono::system_clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&raw, &local);

        char buffer[64];
        const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
        return std::string(buffer, written);
    }

    // "<Family>Logs-DD-MM-YYYY-HH-MM", the directory name operator tooling greps for.
    inline std::string make_run_directory_name(const std::string& family,
                                               std::chrono::system_clock::time_point tp) {
        return family + "Logs-" + format_local_time(tp, "%d-%m-%Y-%H-%M");
    }

} // namespace diagcollect::core::config
