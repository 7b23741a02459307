#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/collector_errors.hpp"

namespace diagcollect::tools {

struct CommandRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    // 0 waits for the command to finish on its own.
    std::uint32_t timeout_ms = 0;
};

struct CommandResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs a command through /bin/sh and captures both output streams.
class ProcessRunner {
public:
    core::errors::Result<CommandResult> run(const CommandRequest& request) const;
};

// Wraps a value in single quotes so the shell passes it through verbatim.
std::string shell_quote(const std::string& value);

}  // namespace diagcollect::tools
