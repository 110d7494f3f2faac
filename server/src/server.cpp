#include "filedock/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "filedock/server/http_session.hpp"

namespace filedock::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        UploadDirectory prepare_directory(const std::filesystem::path &root)
        {
            UploadDirectory directory(root);
            directory.ensure_exists();
            return directory;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          directory_(prepare_directory(config_.upload_root)),
          engine_(directory_, TusOptions{.base_path = std::string(kUploadPrefix), .max_size = config_.max_upload_size}),
          gateway_(engine_),
          router_(directory_, gateway_, config_.public_root)
    {
        const auto address = boost::asio::ip::make_address(config_.address);
        const boost::asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Server is running on http://{}:{}", config_.address, config_.port);
        spdlog::info("Upload endpoint: http://{}:{}{}", config_.address, config_.port, kUploadPrefix);
        spdlog::info("Files directory: {}", std::filesystem::absolute(config_.upload_root).string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(boost::asio::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            auto session = std::make_shared<HttpSession>(std::move(socket), router_, config_.body_limit);
            session->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == boost::asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::handle_signal()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace filedock::server
