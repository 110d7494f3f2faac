#include "filedock/encoding/percent.hpp"

#include <cctype>

namespace filedock::encoding
{

    namespace
    {

        constexpr std::string_view kHexDigits = "0123456789ABCDEF";

        bool is_unreserved(unsigned char c)
        {
            if (std::isalnum(c))
            {
                return true;
            }
            switch (c)
            {
            case '-':
            case '_':
            case '.':
            case '!':
            case '~':
            case '*':
            case '\'':
            case '(':
            case ')':
                return true;
            default:
                return false;
            }
        }

        bool is_attr_char(unsigned char c)
        {
            constexpr std::string_view kAttrSymbols = "!#$&+-.^_`|~";
            return std::isalnum(c) || kAttrSymbols.find(static_cast<char>(c)) != std::string_view::npos;
        }

        std::string escape_bytes(std::string_view input, bool (*keep)(unsigned char))
        {
            std::string output;
            output.reserve(input.size());
            for (const char ch : input)
            {
                const auto c = static_cast<unsigned char>(ch);
                if (keep(c))
                {
                    output.push_back(ch);
                    continue;
                }
                output.push_back('%');
                output.push_back(kHexDigits[c >> 4]);
                output.push_back(kHexDigits[c & 0x0F]);
            }
            return output;
        }

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    std::string encode_uri_component(std::string_view input)
    {
        return escape_bytes(input, is_unreserved);
    }

    std::string encode_header_parameter(std::string_view input)
    {
        return escape_bytes(input, is_attr_char);
    }

    std::optional<std::string> decode_uri_component(std::string_view input)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            if (input[i] != '%')
            {
                output.push_back(input[i]);
                continue;
            }
            if (i + 2 >= input.size())
            {
                return std::nullopt;
            }
            const int high = hex_value(input[i + 1]);
            const int low = hex_value(input[i + 2]);
            if (high < 0 || low < 0)
            {
                return std::nullopt;
            }
            output.push_back(static_cast<char>((high << 4) | low));
            i += 2;
        }
        return output;
    }

} // namespace filedock::encoding
