#include "filedock/server/file_listing.hpp"

#include <filesystem>
#include <system_error>

#include "filedock/encoding/percent.hpp"
#include "filedock/server/artifact_classifier.hpp"

namespace filedock::server
{

    std::string download_url(std::string_view name)
    {
        std::string url(kFilesApiPrefix);
        url.push_back('/');
        url += filedock::encoding::encode_uri_component(name);
        return url;
    }

    std::vector<filedock::api::FileEntry> list_files(const UploadDirectory &directory)
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(directory.root(), ec);
        if (ec)
        {
            throw StorageError(filedock::ErrorCode::StorageUnavailable,
                               "Cannot read upload directory: " + ec.message());
        }

        std::vector<std::string> names;
        const std::filesystem::directory_iterator end{};
        while (it != end)
        {
            names.push_back(it->path().filename().string());
            it.increment(ec);
            if (ec)
            {
                throw StorageError(filedock::ErrorCode::StorageUnavailable,
                                   "Cannot read upload directory: " + ec.message());
            }
        }

        std::vector<filedock::api::FileEntry> files;
        files.reserve(names.size());
        for (const auto &name : names)
        {
            if (classify(directory, name) != ArtifactKind::LogicalFile)
            {
                continue;
            }
            // The entry may have been deleted since it was enumerated.
            const auto status = directory.probe(name);
            if (!status || status->kind != EntryKind::RegularFile)
            {
                continue;
            }
            files.push_back(filedock::api::FileEntry{
                .name = name,
                .size = status->size,
                .uploaded_at = status->modified,
                .url = download_url(name),
            });
        }
        return files;
    }

} // namespace filedock::server
