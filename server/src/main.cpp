#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "filedock/server/server.hpp"
#include "filedock/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "FileDock server " << filedock::version() << "\n"
                  << "Usage: " << program_name
                  << " [--port <PORT>] [--root <UPLOAD_DIR>] [--address <ADDRESS>] [--threads <N>] "
                     "[--public <DIR>] [--max-size <BYTES>] [--body-limit <BYTES>] [--log <FILE>]\n"
                  << "The port defaults to $PORT, then 3000; the upload directory defaults to ./uploads.\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

} // namespace

int main(int argc, char *argv[])
{
    using filedock::server::Server;
    using filedock::server::ServerConfig;

    ServerConfig config;
    if (const char *port = std::getenv("PORT"); port != nullptr && *port != '\0')
    {
        try
        {
            config.port = static_cast<std::uint16_t>(std::stoi(port));
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid PORT environment value: " << port << std::endl;
            return EXIT_FAILURE;
        }
    }

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" || arg == "--threads" ||
                                     arg == "--public" || arg == "--max-size" || arg == "--body-limit" ||
                                     arg == "--log";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.upload_root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--public")
            {
                config.public_root = std::filesystem::path(*value);
            }
            else if (arg == "--max-size")
            {
                config.max_upload_size = std::stoull(*value);
            }
            else if (arg == "--body-limit")
            {
                config.body_limit = std::stoull(*value);
            }
            else
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.upload_root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting FileDock server {} on {}:{}", filedock::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
