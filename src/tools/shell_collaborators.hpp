#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include "core/config/collector_config.hpp"
#include "tools/collaborators.hpp"
#include "tools/process_runner.hpp"

namespace diagcollect::tools {

// Replaces each {name} in `tmpl` with the shell-quoted value; unknown
// placeholders are left untouched.
std::string expand_template(const std::string& tmpl,
                            const std::map<std::string, std::string>& values);

class PosixPrivilegeChecker : public PrivilegeChecker {
public:
    bool is_elevated() const override;
};

class ShellStateQuery : public StateQuery {
public:
    explicit ShellStateQuery(std::uint32_t timeout_ms = 0);
    core::errors::Result<int> run_query(
        const std::string& command, const std::filesystem::path& output_path) override;

private:
    ProcessRunner runner_;
    std::uint32_t timeout_ms_;
};

class ShellEventLogExporter : public EventLogExporter {
public:
    explicit ShellEventLogExporter(core::config::CommandTemplates templates,
                                   std::uint32_t timeout_ms = 0);
    bool channel_exists(const std::string& channel) override;
    core::errors::Result<int> export_channel(
        const std::string& channel, const std::filesystem::path& output_path) override;

private:
    ProcessRunner runner_;
    core::config::CommandTemplates templates_;
    std::uint32_t timeout_ms_;
};

class ShellRegistryExporter : public RegistryExporter {
public:
    explicit ShellRegistryExporter(core::config::CommandTemplates templates,
                                   std::uint32_t timeout_ms = 0);
    bool key_exists(const std::string& key) override;
    core::errors::Result<int> export_key(
        const std::string& key, const std::filesystem::path& output_path) override;

private:
    ProcessRunner runner_;
    core::config::CommandTemplates templates_;
    std::uint32_t timeout_ms_;
};

class ShellReportGenerator : public ReportGenerator {
public:
    explicit ShellReportGenerator(std::string command_template,
                                  std::uint32_t timeout_ms = 0);
    core::errors::Result<int> generate(
        const std::filesystem::path& output_directory) override;

private:
    ProcessRunner runner_;
    std::string command_template_;
    std::uint32_t timeout_ms_;
};

class ShellArchiveCompressor : public ArchiveCompressor {
public:
    explicit ShellArchiveCompressor(std::string command_template,
                                    std::uint32_t timeout_ms = 0);
    core::errors::Result<int> compress(
        const std::filesystem::path& source_directory,
        const std::filesystem::path& destination) override;

private:
    ProcessRunner runner_;
    std::string command_template_;
    std::uint32_t timeout_ms_;
};

Collaborators make_shell_collaborators(const core::config::CollectorConfig& config);

}  // namespace diagcollect::tools
