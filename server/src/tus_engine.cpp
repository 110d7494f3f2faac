#include "filedock/server/tus_engine.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filedock/api.hpp"
#include "filedock/encoding/percent.hpp"
#include "filedock/server/deletion.hpp"
#include "response_common.hpp"

namespace filedock::server
{

    namespace
    {

        std::string_view to_std(beast::string_view value)
        {
            return {value.data(), value.size()};
        }

        std::string_view header(const HttpRequest &request, const char *name)
        {
            return to_std(request[name]);
        }

        std::optional<std::uint64_t> parse_u64(std::string_view text)
        {
            std::uint64_t value{};
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(text.data(), end, value);
            if (text.empty() || ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        bool has_offset_content_type(const HttpRequest &request)
        {
            auto content_type = to_std(request[http::field::content_type]);
            content_type = content_type.substr(0, content_type.find(';'));
            while (!content_type.empty() && content_type.back() == ' ')
            {
                content_type.remove_suffix(1);
            }
            return content_type == kOffsetContentType;
        }

        nlohmann::json to_json(const UploadRecord &record)
        {
            return {
                {"id", record.id},
                {"size", record.size},
                {"metadata", record.metadata},
                {"creation_date", filedock::api::format_timestamp(record.created)},
            };
        }

        UploadRecord record_from_json(const nlohmann::json &json)
        {
            UploadRecord record{};
            record.id = json.at("id").get<std::string>();
            record.size = json.at("size").get<std::uint64_t>();
            record.metadata = json.value("metadata", UploadMetadata{});
            const auto created = filedock::api::parse_timestamp(json.value("creation_date", std::string{}));
            record.created = created.value_or(std::chrono::system_clock::time_point{});
            return record;
        }

        void write_json(const std::filesystem::path &path, const nlohmann::json &json)
        {
            std::ofstream out(path, std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError(filedock::ErrorCode::InternalError, "Failed to write " + path.filename().string());
            }
            out << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        }

    } // namespace

    std::string name_from_metadata(const HttpRequest &request)
    {
        const auto it = request.find("Upload-Metadata");
        if (it == request.end())
        {
            return resolve_upload_name(std::nullopt);
        }
        return resolve_upload_name(std::string(to_std(it->value())));
    }

    TusEngine::TusEngine(UploadDirectory directory, TusOptions options)
        : directory_(std::move(directory)), options_(std::move(options))
    {
        if (!options_.naming)
        {
            options_.naming = name_from_metadata;
        }
    }

    bool TusEngine::handle(const HttpRequest &request, HttpResponse &response)
    {
        auto path = to_std(request.target());
        path = path.substr(0, path.find('?'));

        const bool is_collection = path == options_.base_path || path == options_.base_path + "/";
        std::optional<std::string> id;
        if (!is_collection)
        {
            id = upload_id_from_target(path);
            if (!id)
            {
                return false;
            }
        }

        const bool known = request.method() == http::verb::options ||
                           (is_collection && request.method() == http::verb::post) ||
                           (!is_collection && (request.method() == http::verb::head ||
                                               request.method() == http::verb::patch ||
                                               request.method() == http::verb::delete_));
        if (!known)
        {
            return false;
        }

        response.version(request.version());
        response.keep_alive(request.keep_alive());
        response.set("Tus-Resumable", std::string(kTusVersion));

        if (request.method() == http::verb::options)
        {
            handle_options(response);
            response.prepare_payload();
            return true;
        }

        try
        {
            if (header(request, "Tus-Resumable") != kTusVersion)
            {
                response.set("Tus-Version", std::string(kTusVersion));
                throw StorageError(filedock::ErrorCode::PreconditionFailed, "Unsupported version");
            }

            switch (request.method())
            {
            case http::verb::post:
                handle_create(request, response);
                break;
            case http::verb::head:
                handle_head(*id, response);
                break;
            case http::verb::patch:
                handle_patch(request, *id, response);
                break;
            default:
                handle_terminate(*id, response);
                break;
            }
        }
        catch (const StorageError &error)
        {
            response.result(response_common::http_status_for(error.code()));
            response.set(http::field::content_type, "text/plain; charset=utf-8");
            response.body() = std::string(error.what()) + "\n";
        }
        response.prepare_payload();
        return true;
    }

    std::optional<UploadRecord> TusEngine::find(const std::string &id) const
    {
        const auto path = directory_.path_for(id + std::string(kProgressSuffix));
        if (!path || !directory_.is_regular_file(id + std::string(kProgressSuffix)))
        {
            return std::nullopt;
        }
        std::ifstream in(*path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded())
        {
            throw StorageError(filedock::ErrorCode::InternalError, "Corrupt upload record for " + id);
        }
        return record_from_json(json);
    }

    void TusEngine::handle_options(HttpResponse &response) const
    {
        response.result(http::status::no_content);
        response.set("Tus-Version", std::string(kTusVersion));
        response.set("Tus-Extension", std::string(kTusExtensions));
        if (options_.max_size > 0)
        {
            response.set("Tus-Max-Size", std::to_string(options_.max_size));
        }
    }

    void TusEngine::handle_create(const HttpRequest &request, HttpResponse &response) const
    {
        const auto length = parse_u64(header(request, "Upload-Length"));
        if (!length)
        {
            throw StorageError(filedock::ErrorCode::InvalidRequest, "Upload-Length header required");
        }
        if (options_.max_size > 0 && *length > options_.max_size)
        {
            throw StorageError(filedock::ErrorCode::PayloadTooLarge, "Maximum size exceeded");
        }
        if (!request.body().empty())
        {
            if (!has_offset_content_type(request))
            {
                throw StorageError(filedock::ErrorCode::UnsupportedMediaType, "Invalid Content-Type");
            }
            if (request.body().size() > *length)
            {
                throw StorageError(filedock::ErrorCode::PayloadTooLarge, "Upload exceeds Upload-Length");
            }
        }

        UploadRecord record{};
        record.id = options_.naming(request);
        record.size = *length;
        record.created = std::chrono::system_clock::now();
        if (const auto it = request.find("Upload-Metadata"); it != request.end())
        {
            record.metadata = parse_upload_metadata(to_std(it->value()));
        }

        const auto path = directory_.path_for(record.id);
        if (!path)
        {
            throw StorageError(filedock::ErrorCode::InvalidRequest, "Invalid upload name");
        }
        if (directory_.probe(record.id))
        {
            spdlog::warn("Upload {} replaces an existing entry", record.id);
        }

        {
            std::ofstream out(*path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw StorageError(filedock::ErrorCode::InternalError, "Failed to create upload " + record.id);
            }
        }
        persist_record(record);

        std::uint64_t offset = 0;
        if (!request.body().empty())
        {
            offset = append(record.id, request.body());
        }

        spdlog::info("Created upload {} ({} bytes expected)", record.id, record.size);
        response.result(http::status::created);
        response.set(http::field::location,
                     options_.base_path + "/" + filedock::encoding::encode_uri_component(record.id));
        response.set("Upload-Offset", std::to_string(offset));
    }

    void TusEngine::handle_head(const std::string &id, HttpResponse &response) const
    {
        const auto record = find(id);
        if (!record)
        {
            throw StorageError(filedock::ErrorCode::NotFound, "Upload not found");
        }
        response.result(http::status::ok);
        response.set(http::field::cache_control, "no-store");
        response.set("Upload-Offset", std::to_string(current_offset(id)));
        response.set("Upload-Length", std::to_string(record->size));
        if (!record->metadata.empty())
        {
            response.set("Upload-Metadata", encode_upload_metadata(record->metadata));
        }
    }

    void TusEngine::handle_patch(const HttpRequest &request, const std::string &id, HttpResponse &response) const
    {
        if (!has_offset_content_type(request))
        {
            throw StorageError(filedock::ErrorCode::UnsupportedMediaType, "Invalid Content-Type");
        }
        const auto record = find(id);
        if (!record)
        {
            throw StorageError(filedock::ErrorCode::NotFound, "Upload not found");
        }
        const auto requested = parse_u64(header(request, "Upload-Offset"));
        if (!requested)
        {
            throw StorageError(filedock::ErrorCode::InvalidRequest, "Upload-Offset header required");
        }
        const auto offset = current_offset(id);
        if (*requested != offset)
        {
            throw StorageError(filedock::ErrorCode::Conflict, "Upload-Offset does not match current offset");
        }
        if (offset + request.body().size() > record->size)
        {
            throw StorageError(filedock::ErrorCode::PayloadTooLarge, "Upload exceeds Upload-Length");
        }

        const auto new_offset = append(id, request.body());
        if (new_offset == record->size)
        {
            spdlog::info("Upload {} complete ({} bytes)", id, new_offset);
        }
        response.result(http::status::no_content);
        response.set("Upload-Offset", std::to_string(new_offset));
    }

    void TusEngine::handle_terminate(const std::string &id, HttpResponse &response) const
    {
        const auto report = delete_file(directory_, id);
        if (!report.clean())
        {
            spdlog::warn("Upload {} terminated with {} leftover artifact(s)", id, report.warnings.size());
        }
        response.result(http::status::no_content);
    }

    std::optional<std::string> TusEngine::upload_id_from_target(std::string_view path) const
    {
        const auto prefix = options_.base_path + "/";
        if (!path.starts_with(prefix))
        {
            return std::nullopt;
        }
        const auto encoded = path.substr(prefix.size());
        if (encoded.empty() || encoded.find('/') != std::string_view::npos)
        {
            return std::nullopt;
        }
        auto id = filedock::encoding::decode_uri_component(encoded);
        if (!id || !directory_.path_for(*id))
        {
            return std::nullopt;
        }
        return id;
    }

    std::uint64_t TusEngine::current_offset(const std::string &id) const
    {
        const auto status = directory_.probe(id);
        if (!status || status->kind != EntryKind::RegularFile)
        {
            throw StorageError(filedock::ErrorCode::NotFound, "Upload not found");
        }
        return status->size;
    }

    std::uint64_t TusEngine::append(const std::string &id, std::string_view bytes) const
    {
        const auto path = directory_.path_for(id);
        if (!path)
        {
            throw StorageError(filedock::ErrorCode::InvalidRequest, "Invalid upload name");
        }
        {
            std::ofstream out(*path, std::ios::binary | std::ios::app);
            if (!out.is_open())
            {
                throw StorageError(filedock::ErrorCode::InternalError, "Failed to open upload " + id);
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out)
            {
                throw StorageError(filedock::ErrorCode::InternalError, "Failed to write upload " + id);
            }
        }
        return current_offset(id);
    }

    void TusEngine::persist_record(const UploadRecord &record) const
    {
        const auto info_name = record.id + std::string(kProgressSuffix);
        const auto sidecar_name = record.id + std::string(kSidecarSuffix);
        const auto info_path = directory_.path_for(info_name);
        const auto sidecar_path = directory_.path_for(sidecar_name);
        if (!info_path || !sidecar_path)
        {
            throw StorageError(filedock::ErrorCode::InvalidRequest, "Invalid upload name");
        }

        write_json(*info_path, to_json(record));
        if (!record.metadata.empty())
        {
            write_json(*sidecar_path, nlohmann::json(record.metadata));
            return;
        }

        // A replaced upload must not keep the previous upload's metadata.
        std::error_code ec;
        std::filesystem::remove(*sidecar_path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            spdlog::warn("Failed to remove stale metadata {}: {}", sidecar_name, ec.message());
        }
    }

} // namespace filedock::server
