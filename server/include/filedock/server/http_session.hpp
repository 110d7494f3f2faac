#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>

#include "filedock/server/http.hpp"

namespace filedock::server
{

    class Router;

    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(boost::asio::ip::tcp::socket socket, const Router &router, std::uint64_t body_limit);

        void start();

    private:
        void read_request();
        void on_read(beast::error_code ec, std::size_t bytes_transferred);
        void send(RoutedResponse response);
        void on_write(bool close, beast::error_code ec);
        void stop();

        std::string remote_endpoint() const;

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        const Router &router_;
        std::uint64_t body_limit_;
    };

} // namespace filedock::server
