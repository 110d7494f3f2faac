#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "filedock/server/http.hpp"
#include "filedock/server/upload_directory.hpp"
#include "filedock/server/upload_gateway.hpp"

namespace filedock::server
{

    inline constexpr std::string_view kUploadPrefix = "/files";

    class Router
    {
    public:
        Router(UploadDirectory directory, UploadGateway gateway,
               std::optional<std::filesystem::path> public_root = std::nullopt);

        RoutedResponse route(const HttpRequest &request) const;

    private:
        RoutedResponse route_api(const HttpRequest &request, std::string_view path) const;
        RoutedResponse handle_list(const HttpRequest &request) const;
        RoutedResponse handle_download(const HttpRequest &request, std::string_view encoded_name) const;
        RoutedResponse handle_delete(const HttpRequest &request, std::string_view encoded_name) const;
        RoutedResponse handle_static(const HttpRequest &request, std::string_view path) const;

        UploadDirectory directory_;
        UploadGateway gateway_;
        std::optional<std::filesystem::path> public_root_;
    };

} // namespace filedock::server
