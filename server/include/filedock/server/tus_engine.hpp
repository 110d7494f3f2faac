#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "filedock/server/http.hpp"
#include "filedock/server/naming.hpp"
#include "filedock/server/upload_directory.hpp"
#include "filedock/server/upload_engine.hpp"

namespace filedock::server
{

    inline constexpr std::string_view kTusVersion = "1.0.0";
    inline constexpr std::string_view kTusExtensions = "creation,creation-with-upload,termination";
    inline constexpr std::string_view kOffsetContentType = "application/offset+octet-stream";

    using NamingFunction = std::function<std::string(const HttpRequest &)>;

    // Names an upload from its Upload-Metadata header.
    std::string name_from_metadata(const HttpRequest &request);

    struct TusOptions
    {
        std::string base_path{"/files"};
        std::uint64_t max_size{0};
        NamingFunction naming{name_from_metadata};
    };

    struct UploadRecord
    {
        std::string id;
        std::uint64_t size{};
        UploadMetadata metadata;
        std::chrono::system_clock::time_point created{};
    };

    // tus 1.0.0 core protocol with the creation, creation-with-upload and termination extensions.
    // Layout per upload: "<id>" holds the bytes received so far, "<id>.info" the UploadRecord and
    // "<id>.json" the metadata map when the client sent any.
    class TusEngine : public UploadEngine
    {
    public:
        TusEngine(UploadDirectory directory, TusOptions options);

        bool handle(const HttpRequest &request, HttpResponse &response) override;

        std::optional<UploadRecord> find(const std::string &id) const;

    private:
        void handle_options(HttpResponse &response) const;
        void handle_create(const HttpRequest &request, HttpResponse &response) const;
        void handle_head(const std::string &id, HttpResponse &response) const;
        void handle_patch(const HttpRequest &request, const std::string &id, HttpResponse &response) const;
        void handle_terminate(const std::string &id, HttpResponse &response) const;

        std::optional<std::string> upload_id_from_target(std::string_view path) const;
        std::uint64_t current_offset(const std::string &id) const;
        std::uint64_t append(const std::string &id, std::string_view bytes) const;
        void persist_record(const UploadRecord &record) const;

        UploadDirectory directory_;
        TusOptions options_;
    };

} // namespace filedock::server
