#include "filedock/server/naming.hpp"

#include "filedock/encoding/base64.hpp"
#include "filedock/encoding/utf8.hpp"

namespace filedock::server
{

    namespace
    {
        constexpr auto kFilenameKey = "filename";

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

    } // namespace

    UploadMetadata parse_upload_metadata(std::string_view header)
    {
        UploadMetadata metadata;
        while (!header.empty())
        {
            const auto comma = header.find(',');
            const auto pair = trim(header.substr(0, comma));
            header = comma == std::string_view::npos ? std::string_view{} : header.substr(comma + 1);
            if (pair.empty())
            {
                continue;
            }

            const auto space = pair.find(' ');
            const auto key = pair.substr(0, space);
            if (key.empty())
            {
                continue;
            }
            if (space == std::string_view::npos)
            {
                metadata[filedock::encoding::sanitize_utf8(key)] = std::string{};
                continue;
            }

            const auto decoded = filedock::encoding::decode_base64_text(trim(pair.substr(space + 1)));
            if (!decoded)
            {
                continue;
            }
            metadata[filedock::encoding::sanitize_utf8(key)] = filedock::encoding::sanitize_utf8(*decoded);
        }
        return metadata;
    }

    std::string encode_upload_metadata(const UploadMetadata &metadata)
    {
        std::string header;
        for (const auto &[key, value] : metadata)
        {
            if (!header.empty())
            {
                header.push_back(',');
            }
            header += key;
            if (!value.empty())
            {
                header.push_back(' ');
                header += filedock::encoding::encode_base64(std::string_view(value));
            }
        }
        return header;
    }

    std::string resolve_upload_name(const std::optional<std::string> &metadata_header,
                                    std::chrono::system_clock::time_point now)
    {
        if (metadata_header)
        {
            const auto metadata = parse_upload_metadata(*metadata_header);
            if (auto it = metadata.find(kFilenameKey); it != metadata.end() && !it->second.empty())
            {
                return it->second;
            }
        }
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        return "file-" + std::to_string(millis);
    }

    std::string resolve_upload_name(const std::optional<std::string> &metadata_header)
    {
        return resolve_upload_name(metadata_header, std::chrono::system_clock::now());
    }

} // namespace filedock::server
