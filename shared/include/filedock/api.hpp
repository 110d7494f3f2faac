/**
 * FileDock - JSON schema of the /api surface and its serialization helpers.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace filedock::api
{

    // ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T09:30:00.250Z.
    std::string format_timestamp(std::chrono::system_clock::time_point time);
    std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text);

    struct FileEntry
    {
        std::string name;
        std::uint64_t size{};
        std::chrono::system_clock::time_point uploaded_at{};
        std::string url;
    };

    void to_json(nlohmann::json &json, const FileEntry &entry);
    void from_json(const nlohmann::json &json, FileEntry &entry);

    struct ErrorBody
    {
        std::string error;
        std::optional<std::string> details{};
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);
    void from_json(const nlohmann::json &json, ErrorBody &body);

    struct DeleteResponse
    {
        std::string message;
        std::vector<std::string> warnings;
    };

    void to_json(nlohmann::json &json, const DeleteResponse &response);
    void from_json(const nlohmann::json &json, DeleteResponse &response);

} // namespace filedock::api
