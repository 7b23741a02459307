#pragma once
#include <string>
#include <filesystem>
#include <optional>

namespace diagcollect::protocol {

    enum class ArtifactFamily {
        BitLocker,
        Defender
    };

    // Validated operator input required to start a collection run
    struct CollectionRequest {
        ArtifactFamily family = ArtifactFamily::BitLocker;
        std::optional<std::filesystem::path> output_path;
        bool use_temp = false;
        bool archive = false;
        bool include_mdm = false;
        std::optional<std::filesystem::path> config_file;
        bool verbose = false;
    };

    // Name used in the output directory ("BitLockerLogs-...").
    inline std::string to_string(const ArtifactFamily family) {
        switch (family) {
            case ArtifactFamily::BitLocker:
                return "BitLocker";
            case ArtifactFamily::Defender:
                return "Defender";
            default:
                return "Unknown";
        }
    }

} // namespace diagcollect::protocol
