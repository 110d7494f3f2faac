#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filedock::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::filesystem::path upload_root{"uploads"};
        std::optional<std::filesystem::path> public_root;
        std::size_t worker_threads{0};
        std::uint64_t max_upload_size{0};
        std::uint64_t body_limit{64ULL * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;
    };

} // namespace filedock::server
