#include "filedock/server/router.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filedock/api.hpp"
#include "filedock/encoding/percent.hpp"
#include "filedock/server/deletion.hpp"
#include "filedock/server/file_listing.hpp"
#include "response_common.hpp"

namespace filedock::server
{

    namespace
    {
        using response_common::make_error_response;
        using response_common::make_json_response;

        constexpr std::string_view kApiPrefix = "/api";
        constexpr auto kNotFoundMessage = "File not found";

        bool has_prefix(std::string_view path, std::string_view prefix)
        {
            return path == prefix || (path.starts_with(prefix) && path[prefix.size()] == '/');
        }

        bool is_json_request(const HttpRequest &request)
        {
            const auto content_type = request[http::field::content_type];
            const std::string_view value(content_type.data(), content_type.size());
            return value.starts_with("application/json");
        }

        std::string_view mime_type_for(const std::filesystem::path &path)
        {
            const auto extension = path.extension().string();
            if (extension == ".html" || extension == ".htm")
            {
                return "text/html; charset=utf-8";
            }
            if (extension == ".css")
            {
                return "text/css; charset=utf-8";
            }
            if (extension == ".js")
            {
                return "application/javascript; charset=utf-8";
            }
            if (extension == ".json")
            {
                return "application/json; charset=utf-8";
            }
            if (extension == ".svg")
            {
                return "image/svg+xml";
            }
            if (extension == ".png")
            {
                return "image/png";
            }
            if (extension == ".ico")
            {
                return "image/x-icon";
            }
            if (extension == ".txt")
            {
                return "text/plain; charset=utf-8";
            }
            return "application/octet-stream";
        }

        // Joins a request path onto the public root, refusing any ".." component.
        std::optional<std::filesystem::path> sanitize(const std::filesystem::path &base, std::string_view requested)
        {
            std::filesystem::path relative{std::string(requested)};
            if (relative.is_absolute())
            {
                relative = relative.lexically_relative("/");
            }

            std::filesystem::path sanitized = base;
            for (const auto &part : relative)
            {
                const auto part_string = part.generic_string();
                if (part_string.empty() || part_string == ".")
                {
                    continue;
                }
                if (part_string == "..")
                {
                    return std::nullopt;
                }
                sanitized /= part;
            }
            return sanitized;
        }

        bool is_read(const HttpRequest &request)
        {
            return request.method() == http::verb::get || request.method() == http::verb::head;
        }

        // RFC 6266 value: an ASCII fallback with '"' and '\\' escaped, plus filename* when the name is not ASCII.
        std::string content_disposition(std::string_view name)
        {
            std::string fallback;
            bool ascii = true;
            for (const char ch : name)
            {
                const auto c = static_cast<unsigned char>(ch);
                if (c >= 0x80)
                {
                    ascii = false;
                    // One '?' per code point, skipping continuation bytes.
                    if ((c & 0xC0) != 0x80)
                    {
                        fallback.push_back('?');
                    }
                    continue;
                }
                if (ch == '"' || ch == '\\')
                {
                    fallback.push_back('\\');
                }
                fallback.push_back(ch);
            }

            std::string value = "attachment; filename=\"" + fallback + "\"";
            if (!ascii)
            {
                value += "; filename*=UTF-8''" + filedock::encoding::encode_header_parameter(name);
            }
            return value;
        }

        // HEAD keeps the status line and every header, Content-Length included, and drops the body.
        RoutedResponse without_body(RoutedResponse routed)
        {
            if (auto *file = std::get_if<FileResponse>(&routed))
            {
                return HttpResponse{std::move(file->base())};
            }
            std::get<HttpResponse>(routed).body().clear();
            return routed;
        }

        RoutedResponse open_file(const HttpRequest &request, const std::filesystem::path &path,
                                 std::string_view content_type)
        {
            http::file_body::value_type body;
            beast::error_code ec;
            body.open(path.c_str(), beast::file_mode::scan, ec);
            if (ec == beast::errc::no_such_file_or_directory)
            {
                return make_error_response(http::status::not_found, kNotFoundMessage, request);
            }
            if (ec)
            {
                return make_error_response(http::status::internal_server_error, ec.message(), request);
            }

            const auto size = body.size();
            FileResponse response{std::piecewise_construct, std::make_tuple(std::move(body)),
                                  std::make_tuple(http::status::ok, request.version())};
            response.set(http::field::content_type, std::string(content_type));
            response.content_length(size);
            response.keep_alive(request.keep_alive());
            return response;
        }

    } // namespace

    Router::Router(UploadDirectory directory, UploadGateway gateway,
                   std::optional<std::filesystem::path> public_root)
        : directory_(std::move(directory)), gateway_(gateway), public_root_(std::move(public_root)) {}

    RoutedResponse Router::route(const HttpRequest &request) const
    {
        const auto target = request.target();
        const auto path = response_common::target_path(std::string_view(target.data(), target.size()));

        RoutedResponse routed = [&]() -> RoutedResponse
        {
            if (has_prefix(path, kUploadPrefix))
            {
                return gateway_.handle(request);
            }
            try
            {
                if (has_prefix(path, kApiPrefix))
                {
                    return route_api(request, path);
                }
                if (public_root_ && is_read(request))
                {
                    return handle_static(request, path);
                }
                return make_error_response(http::status::not_found, "Not found", request);
            }
            catch (const StorageError &error)
            {
                return make_error_response(response_common::http_status_for(error.code()), error.what(), request);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Request {} failed: {}", std::string(path), ex.what());
                return make_error_response(http::status::internal_server_error, ex.what(), request);
            }
        }();

        std::visit([](auto &response)
                   { response_common::apply_cors(response); },
                   routed);
        if (request.method() == http::verb::head && !has_prefix(path, kUploadPrefix))
        {
            return without_body(std::move(routed));
        }
        return routed;
    }

    RoutedResponse Router::route_api(const HttpRequest &request, std::string_view path) const
    {
        if (request.method() == http::verb::options)
        {
            auto response = response_common::make_empty_response(http::status::no_content, request);
            response.set(http::field::access_control_allow_methods, "GET,HEAD,PUT,PATCH,POST,DELETE");
            const auto requested = request[http::field::access_control_request_headers];
            if (!requested.empty())
            {
                response.set(http::field::access_control_allow_headers,
                             std::string(requested.data(), requested.size()));
            }
            return response;
        }

        if (is_json_request(request) && !request.body().empty())
        {
            const auto body = nlohmann::json::parse(request.body(), nullptr, false);
            if (body.is_discarded())
            {
                return make_error_response(http::status::bad_request, "Invalid JSON body", request);
            }
        }

        const std::string files_prefix = std::string(kFilesApiPrefix) + "/";
        if (path == kFilesApiPrefix && is_read(request))
        {
            return handle_list(request);
        }
        if (path.starts_with(files_prefix))
        {
            const auto encoded_name = path.substr(files_prefix.size());
            if (!encoded_name.empty() && encoded_name.find('/') == std::string_view::npos)
            {
                if (is_read(request))
                {
                    return handle_download(request, encoded_name);
                }
                if (request.method() == http::verb::delete_)
                {
                    return handle_delete(request, encoded_name);
                }
            }
        }
        return make_error_response(http::status::not_found, "Not found", request);
    }

    RoutedResponse Router::handle_list(const HttpRequest &request) const
    {
        const auto files = list_files(directory_);
        return make_json_response(http::status::ok, nlohmann::json(files), request);
    }

    RoutedResponse Router::handle_download(const HttpRequest &request, std::string_view encoded_name) const
    {
        const auto name = filedock::encoding::decode_uri_component(encoded_name);
        if (!name)
        {
            return make_error_response(http::status::bad_request, "Malformed file name", request);
        }
        if (!directory_.is_regular_file(*name))
        {
            return make_error_response(http::status::not_found, kNotFoundMessage, request);
        }

        auto routed = open_file(request, *directory_.path_for(*name), "application/octet-stream");
        if (auto *response = std::get_if<FileResponse>(&routed))
        {
            response->set(http::field::content_disposition, content_disposition(*name));
        }
        return routed;
    }

    RoutedResponse Router::handle_delete(const HttpRequest &request, std::string_view encoded_name) const
    {
        const auto name = filedock::encoding::decode_uri_component(encoded_name);
        if (!name)
        {
            return make_error_response(http::status::bad_request, "Malformed file name", request);
        }

        const auto report = delete_file(directory_, *name);
        filedock::api::DeleteResponse body{.message = "File deleted successfully", .warnings = report.warnings};
        if (!report.clean())
        {
            spdlog::warn("Deleted {} with {} cleanup warning(s)", *name, report.warnings.size());
        }
        else
        {
            spdlog::info("Deleted {}", *name);
        }
        return make_json_response(http::status::ok, nlohmann::json(body), request);
    }

    RoutedResponse Router::handle_static(const HttpRequest &request, std::string_view path) const
    {
        const auto decoded = filedock::encoding::decode_uri_component(path);
        if (!decoded)
        {
            return make_error_response(http::status::bad_request, "Malformed path", request);
        }
        auto resolved = sanitize(*public_root_, *decoded);
        if (!resolved)
        {
            return make_error_response(http::status::not_found, "Not found", request);
        }

        std::error_code ec;
        if (std::filesystem::is_directory(*resolved, ec))
        {
            *resolved /= "index.html";
        }
        if (!std::filesystem::is_regular_file(*resolved, ec))
        {
            return make_error_response(http::status::not_found, "Not found", request);
        }
        return open_file(request, *resolved, mime_type_for(*resolved));
    }

} // namespace filedock::server
