#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace filedock::encoding
{

    // Escapes every byte except A-Z a-z 0-9 and - _ . ! ~ * ' ( ), matching encodeURIComponent.
    std::string encode_uri_component(std::string_view input);

    // RFC 5987 value-chars: escapes every byte outside attr-char, for filename* header parameters.
    std::string encode_header_parameter(std::string_view input);

    // Returns std::nullopt on a truncated or non-hex escape.
    std::optional<std::string> decode_uri_component(std::string_view input);

} // namespace filedock::encoding
