#include "cli_parser.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <system_error>
#include <vector>

namespace diagcollect::app::cli {

    using namespace diagcollect::core::errors;
    using diagcollect::protocol::ArtifactFamily;
    using diagcollect::protocol::CollectionRequest;

    namespace {

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> output_path;
        std::optional<std::string> config_file;
        bool use_temp = false;
        bool archive = false;
        bool mdm = false;
        bool verbose = false;
    };

    std::optional<ArtifactFamily> family_from_string(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (value == "bitlocker") return ArtifactFamily::BitLocker;
        if (value == "defender") return ArtifactFamily::Defender;
        return std::nullopt;
    }

    } // namespace

    std::string usage() {
        return "Usage: diagcollect <bitlocker|defender> [--output-path DIR] [--use-temp] "
               "[--zip|--archive] [--mdm] [--config FILE] [--verbose]";
    }

    Result<ParsedCommand> parse_and_validate(int argc, char* argv[]) {
        ParsedCommand parsed;
        if (argc < 2) {
            return CollectorError{ErrorCategory::Input, "No artifact family provided.", "missing_family", usage()};
        }

        std::string family_arg = argv[1];
        if (family_arg == "--help" || family_arg == "-h") {
            parsed.show_help = true;
            return parsed;
        }

        const auto family = family_from_string(family_arg);
        if (!family.has_value()) {
            return CollectorError{ErrorCategory::Input, "Unknown artifact family: " + family_arg, "unknown_family", "Supported families: bitlocker, defender."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and family
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--output-path") {
                if (i + 1 < args.size()) raw.output_path = args[++i];
                else return CollectorError{ErrorCategory::Input, "Missing value for --output-path", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config_file = args[++i];
                else return CollectorError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--use-temp") {
                raw.use_temp = true;
            } else if (args[i] == "--zip" || args[i] == "--archive") {
                raw.archive = true;
            } else if (args[i] == "--mdm") {
                raw.mdm = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                parsed.show_help = true;
                return parsed;
            } else {
                return CollectorError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        // 3. Validator Phase: Enforce logic
        CollectionRequest req;
        req.family = family.value();
        req.use_temp = raw.use_temp;
        req.archive = raw.archive;
        req.include_mdm = raw.mdm;
        req.verbose = raw.verbose;

        if (raw.mdm && req.family != ArtifactFamily::BitLocker) {
            return CollectorError{ErrorCategory::Input, "--mdm is only supported for the bitlocker family", "mdm_not_supported"};
        }

        // --output-path takes precedence over --use-temp when both are given.
        // Path validation: the base directory may not exist yet, but it must not be a file.
        if (raw.output_path) {
            if (raw.output_path->empty()) {
                return CollectorError{ErrorCategory::Input, "--output-path cannot be empty", "invalid_path"};
            }
            std::filesystem::path p(raw.output_path.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return CollectorError{ErrorCategory::Input, "Output path exists and is not a directory", "invalid_path"};
            }
            req.output_path = std::move(p);
        }

        if (raw.config_file) {
            req.config_file = std::filesystem::path(raw.config_file.value());
        }

        parsed.request = std::move(req);
        return parsed;
    }

} // namespace diagcollect::app::cli
