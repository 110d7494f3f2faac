#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "filedock/server/artifact_classifier.hpp"
#include "filedock/server/deletion.hpp"
#include "filedock/server/file_listing.hpp"
#include "filedock/server/naming.hpp"
#include "filedock/server/upload_directory.hpp"

using namespace filedock;
using namespace filedock::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_directory(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::vector<std::string> listed_names(const UploadDirectory &directory)
    {
        std::vector<std::string> names;
        for (const auto &entry : list_files(directory))
        {
            names.push_back(entry.name);
        }
        return names;
    }

    bool contains(const std::vector<std::string> &names, const std::string &name)
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    void test_naming_resolver()
    {
        assert(resolve_upload_name(std::string("filename dGVzdC50eHQ=")) == "test.txt");
        assert(resolve_upload_name(std::string("filetype dGV4dC9wbGFpbg==,filename dGVzdC50eHQ=")) == "test.txt");

        const std::chrono::system_clock::time_point now{std::chrono::milliseconds{1700000000123LL}};
        assert(resolve_upload_name(std::nullopt, now) == "file-1700000000123");
        assert(resolve_upload_name(std::string(""), now) == "file-1700000000123");
        assert(resolve_upload_name(std::string("filetype dGV4dC9wbGFpbg=="), now) == "file-1700000000123");

        const auto generated = resolve_upload_name(std::nullopt);
        assert(generated.starts_with("file-"));
        assert(generated.size() > 5);
        assert(std::all_of(generated.begin() + 5, generated.end(), [](char c)
                           { return c >= '0' && c <= '9'; }));

        // Last occurrence wins, malformed pairs are skipped.
        assert(resolve_upload_name(std::string("filename Zmlyc3Q=,filename c2Vjb25k")) == "second");
        assert(resolve_upload_name(std::string("filename dGVzdC50eHQ=,filename !!!")) == "test.txt");
        assert(resolve_upload_name(std::string("filename !!!"), now) == "file-1700000000123");

        // The client name is taken verbatim.
        assert(resolve_upload_name(std::string("filename Li4vZXZpbA==")) == "../evil");

        // Bytes that are not UTF-8 come back as U+FFFD.
        assert(resolve_upload_name(std::string("filename /2E=")) == "\xEF\xBF\xBD"
                                                                    "a");
    }

    void test_metadata_parsing()
    {
        const auto metadata = parse_upload_metadata("filename dGVzdC50eHQ=, filetype dGV4dC9wbGFpbg==,is_confidential");
        assert(metadata.size() == 3);
        assert(metadata.at("filename") == "test.txt");
        assert(metadata.at("filetype") == "text/plain");
        assert(metadata.at("is_confidential").empty());

        assert(parse_upload_metadata("").empty());
        assert(parse_upload_metadata(" , ,").empty());

        const auto repaired = parse_upload_metadata("filename ZnQudHh0,filetype /w==");
        assert(repaired.at("filename") == "ft.txt");
        assert(repaired.at("filetype") == "\xEF\xBF\xBD");

        const UploadMetadata encoded_source{{"filename", "test.txt"}, {"flag", ""}};
        assert(encode_upload_metadata(encoded_source) == "filename dGVzdC50eHQ=,flag");
        assert(parse_upload_metadata(encode_upload_metadata(encoded_source)) == encoded_source);
    }

    void test_upload_directory_probe()
    {
        const auto root = fresh_directory("filedock_probe_test");
        UploadDirectory directory(root);
        write_file(root / "data.bin", "12345");
        std::filesystem::create_directories(root / "nested");

        const auto file = directory.probe("data.bin");
        assert(file && file->kind == EntryKind::RegularFile && file->size == 5);
        const auto folder = directory.probe("nested");
        assert(folder && folder->kind == EntryKind::Directory);
        assert(!directory.probe("absent"));

        assert(!directory.path_for(""));
        assert(!directory.path_for("."));
        assert(!directory.path_for(".."));
        assert(!directory.path_for("../data.bin"));
        assert(!directory.path_for("nested/data.bin"));
        assert(!directory.path_for("x\r\nSet-Cookie: a=b"));
        assert(!directory.path_for("tab\tname"));
        assert(!directory.path_for(std::string_view("nul\0name", 8)));
        assert(!directory.path_for("del\x7F"));
        assert(!directory.probe("x\r\ny"));
        assert(directory.path_for("caf\xC3\xA9.txt"));
        assert(directory.path_for("data.bin") == root / "data.bin");

        cleanup_path(root);
    }

    void test_classifier()
    {
        const auto root = fresh_directory("filedock_classifier_test");
        UploadDirectory directory(root);
        write_file(root / "video.mp4", "video");
        write_file(root / "video.mp4.info", "{}");
        write_file(root / "video.mp4.json", "{}");
        write_file(root / "report.json", "{\"user\":true}");
        write_file(root / "orphan.info", "{}");
        std::filesystem::create_directories(root / "folder");
        write_file(root / "folder.json", "{}");

        assert(classify(directory, "video.mp4") == ArtifactKind::LogicalFile);
        assert(classify(directory, "video.mp4.info") == ArtifactKind::ProgressArtifact);
        assert(classify(directory, "video.mp4.json") == ArtifactKind::SidecarMetadata);
        assert(classify(directory, "report.json") == ArtifactKind::LogicalFile);
        assert(classify(directory, "orphan.info") == ArtifactKind::ProgressArtifact);
        assert(classify(directory, "folder.json") == ArtifactKind::LogicalFile);
        assert(!classify(directory, "folder"));
        assert(!classify(directory, "missing"));

        const std::vector<std::string> names = {"video.mp4", "video.mp4.info", "video.mp4.json", "report.json",
                                                "orphan.info", "folder", "folder.json"};
        std::vector<std::optional<ArtifactKind>> first;
        std::vector<std::optional<ArtifactKind>> second;
        for (const auto &name : names)
        {
            first.push_back(classify(directory, name));
        }
        for (const auto &name : names)
        {
            second.push_back(classify(directory, name));
        }
        assert(first == second);

        write_file(root / "report", "primary");
        assert(classify(directory, "report.json") == ArtifactKind::SidecarMetadata);
        std::filesystem::remove(root / "report");
        assert(classify(directory, "report.json") == ArtifactKind::LogicalFile);

        cleanup_path(root);
    }

    void test_listing()
    {
        const auto root = fresh_directory("filedock_listing_test");
        UploadDirectory directory(root);
        write_file(root / "video.mp4", "0123456789");
        write_file(root / "video.mp4.info", "{}");
        write_file(root / "video.mp4.json", "{}");
        write_file(root / "report.json", "{}");
        write_file(root / "stray.info", "{}");
        write_file(root / "my file.txt", "abc");
        std::filesystem::create_directories(root / "folder");

        const auto files = list_files(directory);
        assert(files.size() == 3);
        const auto video = std::find_if(files.begin(), files.end(), [](const auto &entry)
                                        { return entry.name == "video.mp4"; });
        assert(video != files.end());
        assert(video->size == 10);
        assert(video->url == "/api/files/video.mp4");
        assert(video->uploaded_at.time_since_epoch().count() > 0);

        const auto spaced = std::find_if(files.begin(), files.end(), [](const auto &entry)
                                         { return entry.name == "my file.txt"; });
        assert(spaced != files.end() && spaced->url == "/api/files/my%20file.txt");

        auto names = listed_names(directory);
        assert(contains(names, "report.json"));
        assert(!contains(names, "stray.info"));
        assert(!contains(names, "video.mp4.info"));
        assert(!contains(names, "video.mp4.json"));
        assert(!contains(names, "folder"));

        // Unchanged state lists in the same order.
        assert(listed_names(directory) == names);

        write_file(root / "report", "primary");
        names = listed_names(directory);
        assert(contains(names, "report"));
        assert(!contains(names, "report.json"));

        cleanup_path(root);
    }

    void test_listing_unavailable()
    {
        const auto root = std::filesystem::temp_directory_path() / "filedock_listing_missing";
        cleanup_path(root);
        UploadDirectory directory(root);

        bool caught = false;
        try
        {
            (void)list_files(directory);
        }
        catch (const StorageError &error)
        {
            caught = error.code() == ErrorCode::StorageUnavailable;
        }
        assert(caught);

        directory.ensure_exists();
        assert(list_files(directory).empty());
        cleanup_path(root);
    }

    void test_delete_with_artifacts()
    {
        const auto root = fresh_directory("filedock_delete_test");
        UploadDirectory directory(root);
        write_file(root / "video.mp4", "bytes");
        write_file(root / "video.mp4.info", "{}");
        write_file(root / "video.mp4.json", "{}");

        const auto report = delete_file(directory, "video.mp4");
        assert(report.clean());
        assert(report.removed.size() == 3);
        assert(!std::filesystem::exists(root / "video.mp4"));
        assert(!std::filesystem::exists(root / "video.mp4.info"));
        assert(!std::filesystem::exists(root / "video.mp4.json"));
        assert(!contains(listed_names(directory), "video.mp4"));

        bool not_found = false;
        try
        {
            (void)delete_file(directory, "video.mp4");
        }
        catch (const StorageError &error)
        {
            not_found = error.code() == ErrorCode::NotFound;
        }
        assert(not_found);

        cleanup_path(root);
    }

    void test_delete_missing_primary_keeps_artifacts()
    {
        const auto root = fresh_directory("filedock_delete_missing_test");
        UploadDirectory directory(root);
        write_file(root / "ghost.info", "{}");
        write_file(root / "ghost.json", "{}");
        std::filesystem::create_directories(root / "folder");

        for (const auto *name : {"ghost", "folder", "../ghost.info", ""})
        {
            bool not_found = false;
            try
            {
                (void)delete_file(directory, name);
            }
            catch (const StorageError &error)
            {
                not_found = error.code() == ErrorCode::NotFound;
            }
            assert(not_found);
        }
        assert(std::filesystem::exists(root / "ghost.info"));
        assert(std::filesystem::exists(root / "ghost.json"));
        assert(std::filesystem::is_directory(root / "folder"));

        cleanup_path(root);
    }

    void test_delete_primary_only()
    {
        const auto root = fresh_directory("filedock_delete_primary_test");
        UploadDirectory directory(root);
        write_file(root / "notes.txt", "text");

        const auto report = delete_file(directory, "notes.txt");
        assert(report.clean());
        assert(report.removed == std::vector<std::string>{"notes.txt"});
        assert(!std::filesystem::exists(root / "notes.txt"));

        cleanup_path(root);
    }

    void test_delete_reports_partial_cleanup()
    {
        const auto root = fresh_directory("filedock_delete_partial_test");
        UploadDirectory directory(root);
        write_file(root / "archive.zip", "zip");
        write_file(root / "archive.zip.json", "{}");
        // A non-empty directory where the progress artifact should be cannot be removed.
        std::filesystem::create_directories(root / "archive.zip.info");
        write_file(root / "archive.zip.info" / "keep", "x");

        const auto report = delete_file(directory, "archive.zip");
        assert(!report.clean());
        assert(report.warnings.size() == 1);
        assert(report.warnings.front().find("archive.zip.info") != std::string::npos);
        assert(!std::filesystem::exists(root / "archive.zip"));
        assert(!std::filesystem::exists(root / "archive.zip.json"));

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_naming_resolver();
    test_metadata_parsing();
    test_upload_directory_probe();
    test_classifier();
    test_listing();
    test_listing_unavailable();
    test_delete_with_artifacts();
    test_delete_missing_primary_keeps_artifacts();
    test_delete_primary_only();
    test_delete_reports_partial_cleanup();
}
