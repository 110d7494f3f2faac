#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "filedock/error_codes.hpp"
#include "filedock/server/http.hpp"

namespace filedock::server::response_common
{

    http::status http_status_for(filedock::ErrorCode code) noexcept;

    HttpResponse make_json_response(http::status status, const nlohmann::json &payload, const HttpRequest &request);

    HttpResponse make_error_response(http::status status, std::string message, const HttpRequest &request,
                                     std::optional<std::string> details = std::nullopt);

    HttpResponse make_empty_response(http::status status, const HttpRequest &request);

    void apply_cors(http::response_header<> &header);

    // Strips the query string from a request target.
    std::string_view target_path(std::string_view target);

} // namespace filedock::server::response_common
