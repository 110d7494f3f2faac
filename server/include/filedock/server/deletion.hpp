#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "filedock/server/upload_directory.hpp"

namespace filedock::server
{

    struct DeletionReport
    {
        std::vector<std::string> removed;
        // One entry per bookkeeping artifact that existed but could not be removed.
        std::vector<std::string> warnings;

        bool clean() const noexcept { return warnings.empty(); }
    };

    // Removes "<name>", then "<name>.info" and "<name>.json" when present.
    // Throws StorageError(NotFound) when "<name>" is not a regular file, in which case nothing
    // is touched, and StorageError(InternalError) when the primary cannot be removed.
    // The three removals are not atomic: a crash in between can leave an orphaned artifact.
    DeletionReport delete_file(const UploadDirectory &directory, std::string_view name);

} // namespace filedock::server
