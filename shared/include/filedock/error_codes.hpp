/**
 * FileDock - Error codes shared by the storage layer, the upload engine and the HTTP surface.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace filedock
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidRequest = 1,
        NotFound = 2,
        Conflict = 3,
        PreconditionFailed = 4,
        PayloadTooLarge = 5,
        UnsupportedMediaType = 6,
        StorageUnavailable = 7,
        PartialCleanup = 8,
        InternalError = 9
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace filedock
