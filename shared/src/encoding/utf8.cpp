#include "filedock/encoding/utf8.hpp"

#include <cstddef>

namespace filedock::encoding
{

    namespace
    {

        constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

        struct LeadByte
        {
            std::size_t continuation{0};
            unsigned char lower{0x80};
            unsigned char upper{0xBF};
        };

        // Continuation count and the bounds of the first continuation byte; continuation 0 means invalid.
        LeadByte classify_lead(unsigned char c)
        {
            if (c >= 0xC2 && c <= 0xDF)
            {
                return {1, 0x80, 0xBF};
            }
            if (c == 0xE0)
            {
                return {2, 0xA0, 0xBF};
            }
            if (c == 0xED)
            {
                return {2, 0x80, 0x9F};
            }
            if (c >= 0xE1 && c <= 0xEF)
            {
                return {2, 0x80, 0xBF};
            }
            if (c == 0xF0)
            {
                return {3, 0x90, 0xBF};
            }
            if (c == 0xF4)
            {
                return {3, 0x80, 0x8F};
            }
            if (c >= 0xF1 && c <= 0xF3)
            {
                return {3, 0x80, 0xBF};
            }
            return {};
        }

        // Length of the well-formed sequence at input[pos], or the length of the ill-formed prefix negated.
        std::ptrdiff_t scan_sequence(std::string_view input, std::size_t pos)
        {
            const auto lead = static_cast<unsigned char>(input[pos]);
            if (lead < 0x80)
            {
                return 1;
            }
            const auto info = classify_lead(lead);
            if (info.continuation == 0)
            {
                return -1;
            }

            auto lower = info.lower;
            auto upper = info.upper;
            std::size_t next = pos + 1;
            for (std::size_t i = 0; i < info.continuation; ++i, ++next)
            {
                if (next >= input.size())
                {
                    return -static_cast<std::ptrdiff_t>(next - pos);
                }
                const auto c = static_cast<unsigned char>(input[next]);
                if (c < lower || c > upper)
                {
                    return -static_cast<std::ptrdiff_t>(next - pos);
                }
                lower = 0x80;
                upper = 0xBF;
            }
            return static_cast<std::ptrdiff_t>(next - pos);
        }

    } // namespace

    std::string sanitize_utf8(std::string_view input)
    {
        std::string output;
        output.reserve(input.size());
        std::size_t pos = 0;
        while (pos < input.size())
        {
            const auto length = scan_sequence(input, pos);
            if (length > 0)
            {
                output.append(input.substr(pos, static_cast<std::size_t>(length)));
                pos += static_cast<std::size_t>(length);
                continue;
            }
            output.append(kReplacement);
            pos += static_cast<std::size_t>(-length);
        }
        return output;
    }

    bool is_valid_utf8(std::string_view input)
    {
        std::size_t pos = 0;
        while (pos < input.size())
        {
            const auto length = scan_sequence(input, pos);
            if (length < 0)
            {
                return false;
            }
            pos += static_cast<std::size_t>(length);
        }
        return true;
    }

} // namespace filedock::encoding
