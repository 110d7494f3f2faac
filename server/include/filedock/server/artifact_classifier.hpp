#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "filedock/server/upload_directory.hpp"

namespace filedock::server
{

    enum class ArtifactKind : std::uint8_t
    {
        LogicalFile,
        ProgressArtifact,
        SidecarMetadata
    };

    std::string_view to_string(ArtifactKind kind) noexcept;

    // Classifies one entry of the upload directory against its current contents.
    // Returns std::nullopt for directories, special files and entries that are gone.
    // A "<name>.json" entry is only a sidecar while a regular file "<name>" exists.
    std::optional<ArtifactKind> classify(const UploadDirectory &directory, std::string_view name);

} // namespace filedock::server
