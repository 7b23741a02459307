#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/collector_errors.hpp"

namespace diagcollect::tools {

// Narrow interfaces to everything outside the orchestrator. Export calls
// return the external tool's exit code; an error value means the tool could
// not be run at all.

class PrivilegeChecker {
public:
    virtual ~PrivilegeChecker() = default;
    virtual bool is_elevated() const = 0;
};

class StateQuery {
public:
    virtual ~StateQuery() = default;
    // Runs `command` and stores its textual output at `output_path`.
    virtual core::errors::Result<int> run_query(
        const std::string& command, const std::filesystem::path& output_path) = 0;
};

class EventLogExporter {
public:
    virtual ~EventLogExporter() = default;
    virtual bool channel_exists(const std::string& channel) = 0;
    virtual core::errors::Result<int> export_channel(
        const std::string& channel, const std::filesystem::path& output_path) = 0;
};

class RegistryExporter {
public:
    virtual ~RegistryExporter() = default;
    virtual bool key_exists(const std::string& key) = 0;
    virtual core::errors::Result<int> export_key(
        const std::string& key, const std::filesystem::path& output_path) = 0;
};

class ReportGenerator {
public:
    virtual ~ReportGenerator() = default;
    virtual core::errors::Result<int> generate(
        const std::filesystem::path& output_directory) = 0;
};

class ArchiveCompressor {
public:
    virtual ~ArchiveCompressor() = default;
    virtual core::errors::Result<int> compress(
        const std::filesystem::path& source_directory,
        const std::filesystem::path& destination) = 0;
};

struct Collaborators {
    std::unique_ptr<PrivilegeChecker> privilege;
    std::unique_ptr<StateQuery> query;
    std::unique_ptr<EventLogExporter> event_logs;
    std::unique_ptr<RegistryExporter> registry;
    std::unique_ptr<ReportGenerator> report;
    std::unique_ptr<ArchiveCompressor> archiver;
};

}  // namespace diagcollect::tools
