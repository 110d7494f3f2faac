#pragma once

#include <string>
#include <string_view>

namespace filedock::encoding
{

    // Replaces every maximal ill-formed subsequence with U+FFFD, the way a WHATWG UTF-8 decoder does.
    std::string sanitize_utf8(std::string_view input);

    bool is_valid_utf8(std::string_view input);

} // namespace filedock::encoding
