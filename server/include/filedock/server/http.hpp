#pragma once

#include <variant>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace filedock::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;

    using HttpRequest = http::request<http::string_body>;
    using HttpResponse = http::response<http::string_body>;
    using FileResponse = http::response<http::file_body>;

    using RoutedResponse = std::variant<HttpResponse, FileResponse>;

} // namespace filedock::server
