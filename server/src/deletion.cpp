#include "filedock/server/deletion.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace filedock::server
{

    namespace
    {

        void remove_auxiliary(const UploadDirectory &directory, const std::string &name, DeletionReport &report)
        {
            const auto path = directory.path_for(name);
            if (!path)
            {
                return;
            }
            std::error_code ec;
            const bool removed = std::filesystem::remove(*path, ec);
            if (ec)
            {
                if (ec == std::errc::no_such_file_or_directory)
                {
                    return;
                }
                spdlog::warn("Failed to remove artifact {}: {}", name, ec.message());
                report.warnings.push_back("Failed to remove " + name + ": " + ec.message());
                return;
            }
            if (removed)
            {
                report.removed.push_back(name);
            }
        }

    } // namespace

    DeletionReport delete_file(const UploadDirectory &directory, std::string_view name)
    {
        if (!directory.is_regular_file(name))
        {
            throw StorageError(filedock::ErrorCode::NotFound, "File not found");
        }

        const std::string primary(name);
        std::error_code ec;
        const bool removed = std::filesystem::remove(*directory.path_for(primary), ec);
        if (ec)
        {
            throw StorageError(filedock::ErrorCode::InternalError,
                               "Failed to remove " + primary + ": " + ec.message());
        }
        if (!removed)
        {
            throw StorageError(filedock::ErrorCode::NotFound, "File not found");
        }

        DeletionReport report;
        report.removed.push_back(primary);
        remove_auxiliary(directory, primary + std::string(kProgressSuffix), report);
        remove_auxiliary(directory, primary + std::string(kSidecarSuffix), report);
        return report;
    }

} // namespace filedock::server
