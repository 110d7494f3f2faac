#include "response_common.hpp"

#include "filedock/api.hpp"

namespace filedock::server::response_common
{

    namespace
    {
        constexpr auto kExposedHeaders =
            "Location, Upload-Offset, Upload-Length, Upload-Metadata, Tus-Resumable, Tus-Version, "
            "Tus-Extension, Tus-Max-Size";
    } // namespace

    http::status http_status_for(filedock::ErrorCode code) noexcept
    {
        switch (code)
        {
        case filedock::ErrorCode::Ok:
        case filedock::ErrorCode::PartialCleanup:
            return http::status::ok;
        case filedock::ErrorCode::InvalidRequest:
            return http::status::bad_request;
        case filedock::ErrorCode::NotFound:
            return http::status::not_found;
        case filedock::ErrorCode::Conflict:
            return http::status::conflict;
        case filedock::ErrorCode::PreconditionFailed:
            return http::status::precondition_failed;
        case filedock::ErrorCode::PayloadTooLarge:
            return http::status::payload_too_large;
        case filedock::ErrorCode::UnsupportedMediaType:
            return http::status::unsupported_media_type;
        case filedock::ErrorCode::StorageUnavailable:
        case filedock::ErrorCode::InternalError:
            return http::status::internal_server_error;
        }
        return http::status::internal_server_error;
    }

    HttpResponse make_json_response(http::status status, const nlohmann::json &payload, const HttpRequest &request)
    {
        HttpResponse response{status, request.version()};
        response.set(http::field::content_type, "application/json; charset=utf-8");
        response.keep_alive(request.keep_alive());
        // Names read back from disk are not guaranteed to be UTF-8.
        response.body() = payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        response.prepare_payload();
        return response;
    }

    HttpResponse make_error_response(http::status status, std::string message, const HttpRequest &request,
                                     std::optional<std::string> details)
    {
        const filedock::api::ErrorBody body{.error = std::move(message), .details = std::move(details)};
        return make_json_response(status, nlohmann::json(body), request);
    }

    HttpResponse make_empty_response(http::status status, const HttpRequest &request)
    {
        HttpResponse response{status, request.version()};
        response.keep_alive(request.keep_alive());
        response.prepare_payload();
        return response;
    }

    void apply_cors(http::response_header<> &header)
    {
        header.set(http::field::access_control_allow_origin, "*");
        header.set(http::field::access_control_expose_headers, kExposedHeaders);
    }

    std::string_view target_path(std::string_view target)
    {
        const auto query = target.find('?');
        return query == std::string_view::npos ? target : target.substr(0, query);
    }

} // namespace filedock::server::response_common
