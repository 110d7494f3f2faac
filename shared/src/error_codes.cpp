#include "filedock/error_codes.hpp"

#include <array>

namespace filedock
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 10> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidRequest, "invalid_request"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::PreconditionFailed, "precondition_failed"},
            {ErrorCode::PayloadTooLarge, "payload_too_large"},
            {ErrorCode::UnsupportedMediaType, "unsupported_media_type"},
            {ErrorCode::StorageUnavailable, "storage_unavailable"},
            {ErrorCode::PartialCleanup, "partial_cleanup"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace filedock
