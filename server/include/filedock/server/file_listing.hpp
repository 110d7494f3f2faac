#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "filedock/api.hpp"
#include "filedock/server/upload_directory.hpp"

namespace filedock::server
{

    inline constexpr std::string_view kFilesApiPrefix = "/api/files";

    std::string download_url(std::string_view name);

    // Throws StorageError(StorageUnavailable) when the directory cannot be enumerated.
    std::vector<filedock::api::FileEntry> list_files(const UploadDirectory &directory);

} // namespace filedock::server
