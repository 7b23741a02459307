#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include "core/errors/collector_errors.hpp"

namespace diagcollect::core::config {

// Shell command templates for the external collaborators. Placeholders
// ({channel}, {key}, {output}, {dir}, {source}, {dest}) are replaced with
// single-quoted values.
struct CommandTemplates {
    std::string channel_probe = "wevtutil.exe gl {channel}";
    std::string channel_export = "wevtutil.exe epl {channel} {output} /ow:true";
    std::string registry_probe = "reg.exe query {key}";
    std::string registry_export = "reg.exe export {key} {output} /y";
    std::string report_generate = "MdmDiagnosticsTool.exe -out {dir}";
    // Runs from the parent of the output root; {source} is the root's name.
    std::string archive = "zip -r -q -X {dest} {source}";
    // Step name -> command, overriding the built-in query of that step.
    std::map<std::string, std::string> queries;
};

struct CollectorConfig {
    std::uint32_t command_timeout_ms = 0;
    std::set<std::string> disabled_steps;
    CommandTemplates commands;
};

core::errors::Result<CollectorConfig> parse_config(const std::string& text);
core::errors::Result<CollectorConfig> load_config(const std::filesystem::path& path);

}  // namespace diagcollect::core::config
