#pragma once

#include <cstdint>
#include <filesystem>
#include "protocol/step_outcome.hpp"

namespace diagcollect::runtime {

struct ValidationResult {
    bool exists = false;
    bool size_ok = false;
    std::uintmax_t size_bytes = 0;

    bool valid() const { return exists && size_ok; }
};

// Stats the artifact on every call; nothing is cached between steps.
class ArtifactValidator {
public:
    // Exported event logs and archives.
    static constexpr std::uintmax_t kBinaryArtifactMinBytes = 1024;
    // Free-form text, .reg and XML output only has to be non-empty.
    static constexpr std::uintmax_t kTextArtifactMinBytes = 1;

    static std::uintmax_t min_size_for(protocol::StepKind kind);

    ValidationResult validate(const std::filesystem::path& path,
                              std::uintmax_t min_size_bytes) const;
};

}  // namespace diagcollect::runtime
