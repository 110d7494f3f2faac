#include <cassert>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedock/api.hpp"
#include "filedock/encoding/base64.hpp"
#include "filedock/encoding/percent.hpp"
#include "filedock/encoding/utf8.hpp"
#include "filedock/error_codes.hpp"

using namespace filedock;

void run_server_component_tests();
void run_upload_flow_tests();

namespace
{

    void test_base64()
    {
        assert(encoding::encode_base64(std::string_view("test.txt")) == "dGVzdC50eHQ=");
        assert(encoding::encode_base64(std::string_view("")) == "");
        assert(encoding::decode_base64_text("dGVzdC50eHQ=") == std::string("test.txt"));
        assert(encoding::decode_base64_text("aGVsbG8udHh0") == std::string("hello.txt"));
        assert(encoding::decode_base64_text("") == std::string(""));

        const std::vector<std::byte> binary = {std::byte{0x00}, std::byte{0xFF}, std::byte{0x10}, std::byte{0x80}};
        const auto encoded = encoding::encode_base64(binary);
        const auto decoded = encoding::decode_base64(encoded);
        assert(decoded && *decoded == binary);

        assert(!encoding::decode_base64("!!!"));
        assert(!encoding::decode_base64("dGVz*"));
        assert(!encoding::decode_base64("dGVzd"));
    }

    void test_percent_encoding()
    {
        assert(encoding::encode_uri_component("report.pdf") == "report.pdf");
        assert(encoding::encode_uri_component("my file (1).txt") == "my%20file%20(1).txt");
        assert(encoding::encode_uri_component("a/b?c=d&e") == "a%2Fb%3Fc%3Dd%26e");
        assert(encoding::encode_uri_component("\xD1\x84") == "%D1%84");

        assert(encoding::decode_uri_component("my%20file%20(1).txt") == std::string("my file (1).txt"));
        assert(encoding::decode_uri_component("%d1%84") == std::string("\xD1\x84"));
        assert(encoding::decode_uri_component("plain") == std::string("plain"));
        assert(!encoding::decode_uri_component("%zz"));
        assert(!encoding::decode_uri_component("bad%2"));
        assert(!encoding::decode_uri_component("%"));
    }

    void test_header_parameter_encoding()
    {
        assert(encoding::encode_header_parameter("report.pdf") == "report.pdf");
        assert(encoding::encode_header_parameter("it's (1).txt") == "it%27s%20%281%29.txt");
        assert(encoding::encode_header_parameter("caf\xC3\xA9") == "caf%C3%A9");
    }

    void test_utf8_repair()
    {
        const std::string replacement = "\xEF\xBF\xBD";
        assert(encoding::sanitize_utf8("plain.txt") == "plain.txt");
        assert(encoding::sanitize_utf8("caf\xC3\xA9") == "caf\xC3\xA9");
        assert(encoding::sanitize_utf8("\xF0\x9F\x93\x84") == "\xF0\x9F\x93\x84");
        assert(encoding::sanitize_utf8("\xFF"
                                       "a") == replacement + "a");
        // A truncated sequence is one replacement; the byte that broke it is decoded on its own.
        assert(encoding::sanitize_utf8("\xE2\x82") == replacement);
        assert(encoding::sanitize_utf8("\xE2"
                                       "A") == replacement + "A");
        // Encoded surrogates and overlongs are rejected byte by byte.
        assert(encoding::sanitize_utf8("\xED\xA0\x80") == replacement + replacement + replacement);
        assert(encoding::sanitize_utf8("\xC0\xAF") == replacement + replacement);

        assert(encoding::is_valid_utf8("caf\xC3\xA9"));
        assert(encoding::is_valid_utf8(""));
        assert(!encoding::is_valid_utf8("\xFF"));
        assert(encoding::is_valid_utf8(encoding::sanitize_utf8("\xC3(\xFE\xE0\x80")));
    }

    void test_timestamps()
    {
        using namespace std::chrono;
        const system_clock::time_point stamp{milliseconds{1700000000250LL}};
        assert(api::format_timestamp(stamp) == "2023-11-14T22:13:20.250Z");
        assert(api::format_timestamp(system_clock::time_point{}) == "1970-01-01T00:00:00.000Z");

        const auto parsed = api::parse_timestamp("2023-11-14T22:13:20.250Z");
        assert(parsed && *parsed == stamp);
        assert(!api::parse_timestamp("yesterday"));
        assert(!api::parse_timestamp("2023-11-14T22:13:20"));
    }

    void test_file_entry_json()
    {
        using namespace std::chrono;
        const api::FileEntry entry{
            .name = "video.mp4",
            .size = 2048,
            .uploaded_at = system_clock::time_point{milliseconds{1700000000000LL}},
            .url = "/api/files/video.mp4",
        };
        const nlohmann::json json = entry;
        assert(json.at("name") == "video.mp4");
        assert(json.at("size") == 2048);
        assert(json.at("uploadedAt") == "2023-11-14T22:13:20.000Z");
        assert(json.at("url") == "/api/files/video.mp4");

        const auto decoded = json.get<api::FileEntry>();
        assert(decoded.name == entry.name);
        assert(decoded.uploaded_at == entry.uploaded_at);
    }

    void test_error_and_delete_bodies()
    {
        const nlohmann::json plain = api::ErrorBody{.error = "File not found"};
        assert(plain == nlohmann::json({{"error", "File not found"}}));

        const nlohmann::json detailed = api::ErrorBody{.error = "Internal server error", .details = "boom"};
        assert(detailed.at("details") == "boom");

        const nlohmann::json clean = api::DeleteResponse{.message = "File deleted successfully"};
        assert(!clean.contains("warnings"));

        const nlohmann::json partial =
            api::DeleteResponse{.message = "File deleted successfully", .warnings = {"Failed to remove a.info"}};
        assert(partial.at("warnings").size() == 1);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::NotFound) == "not_found");
        assert(to_string(ErrorCode::StorageUnavailable) == "storage_unavailable");
        assert(to_string(ErrorCode::PartialCleanup) == "partial_cleanup");
        assert(error_code_from_int(to_int(ErrorCode::Conflict)) == ErrorCode::Conflict);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

} // namespace

int main()
{
    try
    {
        test_base64();
        test_percent_encoding();
        test_header_parameter_encoding();
        test_utf8_repair();
        test_timestamps();
        test_file_entry_json();
        test_error_and_delete_bodies();
        test_error_codes();
        run_server_component_tests();
        run_upload_flow_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
