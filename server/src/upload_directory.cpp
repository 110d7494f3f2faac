#include "filedock/server/upload_directory.hpp"

#include <algorithm>
#include <system_error>

namespace filedock::server
{

    StorageError::StorageError(filedock::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    std::chrono::system_clock::time_point to_system_time(const std::filesystem::file_time_type &time)
    {
        using namespace std::chrono;
        return time_point_cast<system_clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                       system_clock::now());
    }

    UploadDirectory::UploadDirectory(std::filesystem::path root) : root_(std::move(root)) {}

    void UploadDirectory::ensure_exists() const
    {
        std::error_code ec;
        std::filesystem::create_directories(root_, ec);
        if (ec)
        {
            throw StorageError(filedock::ErrorCode::StorageUnavailable,
                               "Cannot create upload directory " + root_.string() + ": " + ec.message());
        }
    }

    std::optional<std::filesystem::path> UploadDirectory::path_for(std::string_view name) const
    {
        if (name.empty() || name == "." || name == ".." || name.find('/') != std::string_view::npos)
        {
            return std::nullopt;
        }
        // NUL and the other control characters never reach a header or a log line.
        const bool has_control = std::any_of(name.begin(), name.end(), [](char ch)
                                             {
            const auto c = static_cast<unsigned char>(ch);
            return c < 0x20 || c == 0x7F; });
        if (has_control)
        {
            return std::nullopt;
        }
        return root_ / std::filesystem::path(std::string(name));
    }

    std::optional<EntryStatus> UploadDirectory::probe(std::string_view name) const
    {
        const auto path = path_for(name);
        if (!path)
        {
            return std::nullopt;
        }

        std::error_code ec;
        const auto status = std::filesystem::status(*path, ec);
        if (ec || !std::filesystem::exists(status))
        {
            return std::nullopt;
        }

        EntryStatus entry{};
        if (std::filesystem::is_regular_file(status))
        {
            entry.kind = EntryKind::RegularFile;
            entry.size = std::filesystem::file_size(*path, ec);
            if (ec)
            {
                return std::nullopt;
            }
        }
        else if (std::filesystem::is_directory(status))
        {
            entry.kind = EntryKind::Directory;
        }

        const auto mtime = std::filesystem::last_write_time(*path, ec);
        if (ec)
        {
            return std::nullopt;
        }
        entry.modified = to_system_time(mtime);
        return entry;
    }

    bool UploadDirectory::is_regular_file(std::string_view name) const
    {
        const auto entry = probe(name);
        return entry && entry->kind == EntryKind::RegularFile;
    }

} // namespace filedock::server
