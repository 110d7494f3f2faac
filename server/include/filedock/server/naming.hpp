#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace filedock::server
{

    using UploadMetadata = std::map<std::string, std::string>;

    // Parses an Upload-Metadata header: comma separated "key base64(value)" pairs.
    // Pairs whose value is not valid base64 are skipped; a repeated key keeps its last value.
    // Decoded text is UTF-8; ill-formed sequences come back as U+FFFD.
    UploadMetadata parse_upload_metadata(std::string_view header);

    std::string encode_upload_metadata(const UploadMetadata &metadata);

    std::string resolve_upload_name(const std::optional<std::string> &metadata_header,
                                    std::chrono::system_clock::time_point now);

    std::string resolve_upload_name(const std::optional<std::string> &metadata_header);

} // namespace filedock::server
