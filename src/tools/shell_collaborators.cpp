#include "tools/shell_collaborators.hpp"

#include <fstream>
#include <system_error>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace diagcollect::tools {

using core::errors::CollectorError;
using core::errors::ErrorCategory;

namespace {

core::errors::Result<CommandResult> run_logged(const ProcessRunner& runner,
                                               const std::string& command,
                                               const std::filesystem::path& cwd,
                                               const std::uint32_t timeout_ms) {
    LOG_DEBUG("Running: " + command);
    CommandRequest request;
    request.command = command;
    request.working_directory = cwd;
    request.timeout_ms = timeout_ms;

    auto result = runner.run(request);
    if (core::errors::is_error(result)) {
        return result;
    }
    const auto& capture = core::errors::get_value(result);
    if (capture.timed_out) {
        return CollectorError{ErrorCategory::Execution,
                              "Command timed out after " +
                                  std::to_string(timeout_ms) + " ms: " + command,
                              "command_timed_out"};
    }
    if (capture.exit_code != 0 && !capture.stderr_text.empty()) {
        LOG_DEBUG("stderr: " + capture.stderr_text);
    }
    return result;
}

// Probes only need a yes/no; a probe that cannot run counts as "absent".
bool probe_succeeds(const ProcessRunner& runner, const std::string& command,
                    const std::uint32_t timeout_ms) {
    auto result = run_logged(runner, command, ".", timeout_ms);
    if (core::errors::is_error(result)) {
        LOG_DEBUG("Probe failed to run: " + core::errors::get_error(result).message);
        return false;
    }
    return core::errors::get_value(result).exit_code == 0;
}

core::errors::Result<int> exit_code_of(core::errors::Result<CommandResult> result) {
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    return core::errors::get_value(result).exit_code;
}

}  // namespace

std::string expand_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tmpl.size() + 64);
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        const std::size_t open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        const std::size_t close = tmpl.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        const auto it = values.find(tmpl.substr(open + 1, close - open - 1));
        if (it == values.end()) {
            out.append(tmpl, open, close - open + 1);
        } else {
            out += shell_quote(it->second);
        }
        pos = close + 1;
    }
    return out;
}

bool PosixPrivilegeChecker::is_elevated() const {
    return geteuid() == 0;
}

ShellStateQuery::ShellStateQuery(const std::uint32_t timeout_ms)
    : timeout_ms_(timeout_ms) {}

core::errors::Result<int> ShellStateQuery::run_query(
    const std::string& command, const std::filesystem::path& output_path) {
    auto result = run_logged(runner_, command, ".", timeout_ms_);
    if (core::errors::is_error(result)) {
        return core::errors::get_error(result);
    }
    const auto& capture = core::errors::get_value(result);

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return CollectorError{ErrorCategory::Execution,
                              "Unable to open query output: " + output_path.string(),
                              "query_output_open_failed"};
    }
    out << capture.stdout_text;
    if (!out.good()) {
        return CollectorError{ErrorCategory::Execution,
                              "Unable to write query output: " + output_path.string(),
                              "query_output_write_failed"};
    }
    return capture.exit_code;
}

ShellEventLogExporter::ShellEventLogExporter(core::config::CommandTemplates templates,
                                             const std::uint32_t timeout_ms)
    : templates_(std::move(templates)), timeout_ms_(timeout_ms) {}

bool ShellEventLogExporter::channel_exists(const std::string& channel) {
    return probe_succeeds(runner_,
                          expand_template(templates_.channel_probe, {{"channel", channel}}),
                          timeout_ms_);
}

core::errors::Result<int> ShellEventLogExporter::export_channel(
    const std::string& channel, const std::filesystem::path& output_path) {
    const std::string command = expand_template(
        templates_.channel_export,
        {{"channel", channel}, {"output", output_path.string()}});
    return exit_code_of(run_logged(runner_, command, ".", timeout_ms_));
}

ShellRegistryExporter::ShellRegistryExporter(core::config::CommandTemplates templates,
                                             const std::uint32_t timeout_ms)
    : templates_(std::move(templates)), timeout_ms_(timeout_ms) {}

bool ShellRegistryExporter::key_exists(const std::string& key) {
    return probe_succeeds(runner_, expand_template(templates_.registry_probe, {{"key", key}}),
                          timeout_ms_);
}

core::errors::Result<int> ShellRegistryExporter::export_key(
    const std::string& key, const std::filesystem::path& output_path) {
    const std::string command = expand_template(
        templates_.registry_export, {{"key", key}, {"output", output_path.string()}});
    return exit_code_of(run_logged(runner_, command, ".", timeout_ms_));
}

ShellReportGenerator::ShellReportGenerator(std::string command_template,
                                           const std::uint32_t timeout_ms)
    : command_template_(std::move(command_template)), timeout_ms_(timeout_ms) {}

core::errors::Result<int> ShellReportGenerator::generate(
    const std::filesystem::path& output_directory) {
    std::error_code ec;
    std::filesystem::create_directories(output_directory, ec);
    if (ec) {
        return CollectorError{ErrorCategory::Execution,
                              "Unable to create report directory: " +
                                  output_directory.string(),
                              "report_dir_create_failed"};
    }
    const std::string command =
        expand_template(command_template_, {{"dir", output_directory.string()}});
    return exit_code_of(run_logged(runner_, command, ".", timeout_ms_));
}

ShellArchiveCompressor::ShellArchiveCompressor(std::string command_template,
                                               const std::uint32_t timeout_ms)
    : command_template_(std::move(command_template)), timeout_ms_(timeout_ms) {}

core::errors::Result<int> ShellArchiveCompressor::compress(
    const std::filesystem::path& source_directory,
    const std::filesystem::path& destination) {
    const std::string command = expand_template(
        command_template_, {{"source", source_directory.filename().string()},
                            {"dir", source_directory.string()},
                            {"dest", destination.string()}});
    return exit_code_of(
        run_logged(runner_, command, source_directory.parent_path(), timeout_ms_));
}

Collaborators make_shell_collaborators(const core::config::CollectorConfig& config) {
    const auto timeout = config.command_timeout_ms;
    Collaborators collaborators;
    collaborators.privilege = std::make_unique<PosixPrivilegeChecker>();
    collaborators.query = std::make_unique<ShellStateQuery>(timeout);
    collaborators.event_logs =
        std::make_unique<ShellEventLogExporter>(config.commands, timeout);
    collaborators.registry =
        std::make_unique<ShellRegistryExporter>(config.commands, timeout);
    collaborators.report =
        std::make_unique<ShellReportGenerator>(config.commands.report_generate, timeout);
    collaborators.archiver =
        std::make_unique<ShellArchiveCompressor>(config.commands.archive, timeout);
    return collaborators;
}

}  // namespace diagcollect::tools
