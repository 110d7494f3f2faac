#include "filedock/server/http_session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "filedock/server/router.hpp"
#include "response_common.hpp"

namespace filedock::server
{

    HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const Router &router, std::uint64_t body_limit)
        : stream_(std::move(socket)), router_(router), body_limit_(body_limit) {}

    void HttpSession::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        read_request();
    }

    void HttpSession::read_request()
    {
        parser_.emplace();
        parser_->body_limit(body_limit_);

        auto self = shared_from_this();
        http::async_read(stream_, buffer_, *parser_,
                         [this, self](beast::error_code ec, std::size_t bytes_transferred)
                         { on_read(ec, bytes_transferred); });
    }

    void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred)
    {
        if (ec == http::error::end_of_stream)
        {
            stop();
            return;
        }
        if (ec == http::error::body_limit)
        {
            spdlog::warn("Request body from {} exceeds {} bytes", remote_endpoint(), body_limit_);
            HttpRequest request = parser_->get();
            request.keep_alive(false);
            auto response = response_common::make_error_response(http::status::payload_too_large,
                                                                  "Request body too large", request);
            response_common::apply_cors(response);
            send(std::move(response));
            return;
        }
        if (ec)
        {
            spdlog::error("Read error from {}: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }

        spdlog::debug("Read {} bytes from {}", bytes_transferred, remote_endpoint());
        send(router_.route(parser_->get()));
    }

    void HttpSession::send(RoutedResponse response)
    {
        auto self = shared_from_this();
        std::visit(
            [this, self](auto &&message)
            {
                using Message = std::decay_t<decltype(message)>;
                auto shared = std::make_shared<Message>(std::forward<decltype(message)>(message));
                const bool close = shared->need_eof();
                http::async_write(stream_, *shared,
                                  [this, self, shared, close](beast::error_code ec, std::size_t /*bytes*/)
                                  { on_write(close, ec); });
            },
            std::move(response));
    }

    void HttpSession::on_write(bool close, beast::error_code ec)
    {
        if (ec)
        {
            // The status line may already be on the wire; all that is left is to drop the connection.
            spdlog::error("Write error to {}: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }
        if (close)
        {
            stop();
            return;
        }
        read_request();
    }

    void HttpSession::stop()
    {
        beast::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }

    std::string HttpSession::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace filedock::server
