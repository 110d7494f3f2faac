#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "filedock/error_codes.hpp"

namespace filedock::server
{

    inline constexpr std::string_view kProgressSuffix = ".info";
    inline constexpr std::string_view kSidecarSuffix = ".json";

    class StorageError : public std::runtime_error
    {
    public:
        StorageError(filedock::ErrorCode code, std::string message);

        filedock::ErrorCode code() const noexcept { return code_; }

    private:
        filedock::ErrorCode code_;
    };

    enum class EntryKind : std::uint8_t
    {
        RegularFile,
        Directory,
        Other
    };

    struct EntryStatus
    {
        EntryKind kind{EntryKind::Other};
        std::uint64_t size{};
        std::chrono::system_clock::time_point modified{};
    };

    // Handle on the flat directory shared by the upload engine, the listing and the deletion paths.
    // Entries are addressed by bare name; a name that is empty, "." or "..", or that contains a
    // separator or a control character, never maps to a path.
    class UploadDirectory
    {
    public:
        explicit UploadDirectory(std::filesystem::path root);

        const std::filesystem::path &root() const noexcept { return root_; }

        void ensure_exists() const;

        std::optional<std::filesystem::path> path_for(std::string_view name) const;

        // std::nullopt when the entry does not exist (or vanished, or the name is not addressable).
        std::optional<EntryStatus> probe(std::string_view name) const;

        bool is_regular_file(std::string_view name) const;

    private:
        std::filesystem::path root_;
    };

    std::chrono::system_clock::time_point to_system_time(const std::filesystem::file_time_type &time);

} // namespace filedock::server
