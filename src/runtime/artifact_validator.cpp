#include "runtime/artifact_validator.hpp"

#include <system_error>

namespace diagcollect::runtime {

std::uintmax_t ArtifactValidator::min_size_for(const protocol::StepKind kind) {
    switch (kind) {
        case protocol::StepKind::ChannelExport:
        case protocol::StepKind::Archive:
            return kBinaryArtifactMinBytes;
        case protocol::StepKind::FileQuery:
        case protocol::StepKind::RegistryExport:
        case protocol::StepKind::ReportExtraction:
        default:
            return kTextArtifactMinBytes;
    }
}

ValidationResult ArtifactValidator::validate(const std::filesystem::path& path,
                                             const std::uintmax_t min_size_bytes) const {
    ValidationResult result;
    if (path.empty()) {
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return result;
    }
    result.exists = true;

    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return result;
    }
    result.size_bytes = size;
    result.size_ok = size >= min_size_bytes;
    return result;
}

}  // namespace diagcollect::runtime
