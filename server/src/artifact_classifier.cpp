#include "filedock/server/artifact_classifier.hpp"

namespace filedock::server
{

    std::string_view to_string(ArtifactKind kind) noexcept
    {
        switch (kind)
        {
        case ArtifactKind::LogicalFile:
            return "logical_file";
        case ArtifactKind::ProgressArtifact:
            return "progress_artifact";
        case ArtifactKind::SidecarMetadata:
            return "sidecar_metadata";
        }
        return "unknown";
    }

    std::optional<ArtifactKind> classify(const UploadDirectory &directory, std::string_view name)
    {
        if (name.ends_with(kProgressSuffix))
        {
            return ArtifactKind::ProgressArtifact;
        }

        if (name.ends_with(kSidecarSuffix))
        {
            const auto primary = name.substr(0, name.size() - kSidecarSuffix.size());
            if (!primary.empty() && directory.is_regular_file(primary))
            {
                return ArtifactKind::SidecarMetadata;
            }
        }

        if (directory.is_regular_file(name))
        {
            return ArtifactKind::LogicalFile;
        }
        return std::nullopt;
    }

} // namespace filedock::server
