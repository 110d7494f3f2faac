#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <thread>
#include <vector>

#include "filedock/server/config.hpp"
#include "filedock/server/router.hpp"
#include "filedock/server/tus_engine.hpp"
#include "filedock/server/upload_directory.hpp"
#include "filedock/server/upload_gateway.hpp"

namespace filedock::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void handle_signal();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;

        UploadDirectory directory_;
        TusEngine engine_;
        UploadGateway gateway_;
        Router router_;

        std::vector<std::thread> workers_;
    };

} // namespace filedock::server
