#include "filedock/api.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace filedock::api
{

    std::string format_timestamp(std::chrono::system_clock::time_point time)
    {
        using namespace std::chrono;
        const auto millis = time_point_cast<milliseconds>(time);
        auto seconds_part = time_point_cast<seconds>(millis);
        auto fraction = millis - seconds_part;
        if (fraction.count() < 0)
        {
            seconds_part -= seconds{1};
            fraction += seconds{1};
        }

        const auto raw = system_clock::to_time_t(seconds_part);
        std::tm tm{};
        gmtime_r(&raw, &tm);

        std::ostringstream out;
        out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
            << fraction.count() << 'Z';
        return out.str();
    }

    std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text)
    {
        std::tm tm{};
        std::istringstream in{std::string(text)};
        in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (in.fail())
        {
            return std::nullopt;
        }

        int millis = 0;
        if (in.peek() == '.')
        {
            in.get();
            std::string digits;
            while (std::isdigit(in.peek()))
            {
                digits.push_back(static_cast<char>(in.get()));
            }
            if (digits.empty())
            {
                return std::nullopt;
            }
            digits.resize(3, '0');
            millis = std::stoi(digits);
        }
        if (in.get() != 'Z')
        {
            return std::nullopt;
        }

        const auto seconds_since_epoch = timegm(&tm);
        return std::chrono::system_clock::time_point{std::chrono::seconds{seconds_since_epoch}} +
               std::chrono::milliseconds{millis};
    }

    void to_json(nlohmann::json &json, const FileEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"size", entry.size},
            {"uploadedAt", format_timestamp(entry.uploaded_at)},
            {"url", entry.url},
        };
    }

    void from_json(const nlohmann::json &json, FileEntry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.size = json.value("size", 0ULL);
        const auto stamp = json.value("uploadedAt", std::string{});
        const auto parsed = parse_timestamp(stamp);
        if (!parsed)
        {
            throw std::runtime_error("Invalid uploadedAt timestamp: " + stamp);
        }
        entry.uploaded_at = *parsed;
        entry.url = json.value("url", std::string{});
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = {{"error", body.error}};
        if (body.details)
        {
            json["details"] = *body.details;
        }
    }

    void from_json(const nlohmann::json &json, ErrorBody &body)
    {
        body.error = json.at("error").get<std::string>();
        if (auto it = json.find("details"); it != json.end())
        {
            body.details = it->get<std::string>();
        }
        else
        {
            body.details.reset();
        }
    }

    void to_json(nlohmann::json &json, const DeleteResponse &response)
    {
        json = {{"message", response.message}};
        if (!response.warnings.empty())
        {
            json["warnings"] = response.warnings;
        }
    }

    void from_json(const nlohmann::json &json, DeleteResponse &response)
    {
        response.message = json.at("message").get<std::string>();
        response.warnings = json.value("warnings", std::vector<std::string>{});
    }

} // namespace filedock::api
