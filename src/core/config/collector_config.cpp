#include "core/config/collector_config.hpp"

#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>
#include <nlohmann/json.hpp>

namespace diagcollect::core::config {

using core::errors::CollectorError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

CollectorError invalid_config(const std::string& message) {
    return CollectorError{ErrorCategory::Input, message, "invalid_config",
                          "Expected keys: command_timeout_ms, disabled_steps, commands."};
}

// Copies an optional string member; false when present with the wrong type.
bool read_string(const json& object, const char* key, std::string& target) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    target = it->get<std::string>();
    return true;
}

}  // namespace

core::errors::Result<CollectorConfig> parse_config(const std::string& text) {
    const json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return invalid_config("Configuration is not valid JSON.");
    }
    if (!root.is_object()) {
        return invalid_config("Configuration root must be a JSON object.");
    }

    CollectorConfig config;

    if (const auto it = root.find("command_timeout_ms"); it != root.end()) {
        if (!it->is_number_unsigned()) {
            return invalid_config("command_timeout_ms must be a non-negative integer.");
        }
        config.command_timeout_ms = it->get<std::uint32_t>();
    }

    if (const auto it = root.find("disabled_steps"); it != root.end()) {
        if (!it->is_array()) {
            return invalid_config("disabled_steps must be an array of step names.");
        }
        for (const auto& entry : *it) {
            if (!entry.is_string()) {
                return invalid_config("disabled_steps entries must be strings.");
            }
            config.disabled_steps.insert(entry.get<std::string>());
        }
    }

    if (const auto it = root.find("commands"); it != root.end()) {
        if (!it->is_object()) {
            return invalid_config("commands must be an object.");
        }
        const json& commands = *it;
        auto& templates = config.commands;
        if (!read_string(commands, "channel_probe", templates.channel_probe) ||
            !read_string(commands, "channel_export", templates.channel_export) ||
            !read_string(commands, "registry_probe", templates.registry_probe) ||
            !read_string(commands, "registry_export", templates.registry_export) ||
            !read_string(commands, "report_generate", templates.report_generate) ||
            !read_string(commands, "archive", templates.archive)) {
            return invalid_config("Command templates must be strings.");
        }

        constexpr std::string_view kQueryPrefix = "query.";
        for (const auto& [key, value] : commands.items()) {
            if (key.rfind(kQueryPrefix.data(), 0) != 0) {
                continue;
            }
            if (!value.is_string()) {
                return invalid_config("Query override '" + key + "' must be a string.");
            }
            templates.queries[key.substr(kQueryPrefix.size())] = value.get<std::string>();
        }
    }

    return config;
}

core::errors::Result<CollectorConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return CollectorError{ErrorCategory::Input,
                              "Configuration file does not exist: " + path.string(),
                              "config_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return CollectorError{ErrorCategory::Input,
                              "Unable to open configuration file: " + path.string(),
                              "config_open_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace diagcollect::core::config
