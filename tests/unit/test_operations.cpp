// tests/unit/test_operations.cpp - entry point pre-flight checks, error reporting and console output
// nothing here needs a reachable SSH server; uploads go to an in-memory channel

#include "common/test_helpers.hpp"
#include "rdeploy/operations.hpp"
#include <doctest/doctest.h>

#include <string>

using rdeploy::testing::captured_console;
using rdeploy::testing::fake_channel;
using rdeploy::testing::temp_dir;

namespace
{

    [[nodiscard]] auto contains(std::string const &haystack, std::string_view needle) -> bool
    {
        return haystack.find(needle) != std::string::npos;
    }

    void populate(temp_dir const &dir, std::size_t const count)
    {
        for (std::size_t i = 0; i < count; ++i)
        {
            dir.write(fmt::format("file_{:02}.txt", i), fmt::format("payload {}\n", i));
        }
    }

} // anonymous namespace

TEST_SUITE("report_error")
{
    TEST_CASE("wording per error kind")
    {
        captured_console const console;
        auto const io = console.io();

        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::config_missing, "SSH_HOST not set"));
        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::local_path_not_found, "./dist"));
        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::authentication_failed));
        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::transport_failure, "Connection refused"));
        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::other, "disk quota exceeded"));
        rdeploy::report_error(io, rdeploy::make_error(rdeploy::error_kind::other));

        CHECK(console.err() == "Error: Missing SSH configuration (SSH_HOST not set)\n"
                               "Error: Local path not found: ./dist\n"
                               "Error: Authentication failed\n"
                               "Error: SSH connection failed - Connection refused\n"
                               "Error: disk quota exceeded\n"
                               "Error: operation failed\n");
        CHECK(console.out().empty());
    }
}

TEST_SUITE("run_remote_command")
{
    TEST_CASE("empty host, user or secret is rejected before connecting")
    {
        auto config = rdeploy::testing::offline_config();
        config.secret.clear();
        captured_console const console;

        CHECK(rdeploy::run_remote_command(config, "echo hi", console.io()) == 1);
        CHECK(contains(console.err(), "Error: Missing SSH configuration"));
        CHECK(console.out().empty());
    }

    TEST_CASE("unreachable host is a transport failure with exit code 1")
    {
        captured_console const console;
        CHECK(rdeploy::run_remote_command(rdeploy::testing::offline_config(), "echo hi", console.io()) == 1);
        CHECK(contains(console.err(), "Error: SSH connection failed - "));
    }
}

TEST_SUITE("copy_to_remote")
{
    TEST_CASE("missing configuration wins over everything else")
    {
        rdeploy::connection_config const config{};
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(config, "/definitely/not/here", "/tmp/x", console.io()) == 1);
        CHECK(contains(console.err(), "Missing SSH configuration"));
        CHECK_FALSE(contains(console.err(), "Local path not found"));
    }

    TEST_CASE("missing local path fails before connecting")
    {
        temp_dir const dir;
        captured_console const console;
        auto const missing = dir.path() / "missing.txt";

        CHECK(rdeploy::copy_to_remote(rdeploy::testing::offline_config(), missing, "/tmp/x", console.io()) == 1);
        CHECK(console.err() == fmt::format("Error: Local path not found: {}\n", missing.string()));
        CHECK_FALSE(contains(console.out(), "Connecting"));
    }

    TEST_CASE("existing file with unreachable host reports the connection failure")
    {
        temp_dir const dir;
        auto const file = dir.write("artifact.tar", "data");
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(rdeploy::testing::offline_config(), file, "/tmp/artifact.tar", console.io()) ==
              1);
        CHECK(console.out() == "Connecting to 127.0.0.1...\n");
        CHECK(contains(console.err(), "Error: SSH connection failed - "));
    }
}

TEST_SUITE("upload_images")
{
    TEST_CASE("fixed extension set")
    {
        CHECK(rdeploy::image_upload::extensions.size() == 3);
        CHECK(rdeploy::image_upload::extensions[0] == ".png");
        CHECK(rdeploy::image_upload::extensions[1] == ".jpg");
        CHECK(rdeploy::image_upload::extensions[2] == ".webp");
    }

    TEST_CASE("missing local directory fails before connecting")
    {
        temp_dir const dir;
        captured_console const console;
        auto const missing = dir.path() / "products";

        CHECK(rdeploy::upload_images(rdeploy::testing::offline_config(), missing, "/srv/img", console.io()) == 1);
        CHECK(console.err() == fmt::format("Error: Local directory not found: {}\n", missing.string()));
        CHECK(console.out().empty());
    }

    TEST_CASE("missing configuration is reported first")
    {
        temp_dir const dir;
        auto config = rdeploy::testing::offline_config();
        config.host.clear();
        captured_console const console;

        CHECK(rdeploy::upload_images(config, dir.path(), "/srv/img", console.io()) == 1);
        CHECK(contains(console.err(), "Missing SSH configuration (SSH_HOST not set)"));
    }
}

TEST_SUITE("copy_to_remote over an open channel")
{
    TEST_CASE("single file")
    {
        temp_dir const dir;
        auto const file = dir.write("app.tar", "archive");
        fake_channel channel;
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(channel, file, "/srv/app.tar", console.io()) == 0);
        CHECK(console.out() == "Uploading app.tar...\nDone! Uploaded app.tar\n");
        CHECK(console.err().empty());
        CHECK(channel.files.contains("/srv/app.tar"));
    }

    TEST_CASE("empty directory prints a notice and succeeds")
    {
        temp_dir const dir;
        fake_channel channel;
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(channel, dir.path(), "/srv/out", console.io()) == 0);
        CHECK(console.out() == "No files found to upload.\n");
        CHECK(console.err().empty());
        CHECK(channel.calls.empty());
    }

    TEST_CASE("twelve files report progress at ten and at the end")
    {
        temp_dir const dir;
        populate(dir, 12);
        fake_channel channel;
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(channel, dir.path(), "/srv/out", console.io()) == 0);
        CHECK(console.out() == "Uploading 12 files...\n"
                               "Uploaded 10/12\n"
                               "Uploaded 12/12\n"
                               "Done! Uploaded 12 files.\n");
        CHECK(console.err().empty());
        CHECK(channel.directories.contains("/srv/out"));
        CHECK(channel.files.size() == 12);
    }

    TEST_CASE("failing third write stops the batch with exit code 1")
    {
        temp_dir const dir;
        populate(dir, 5);
        fake_channel channel;
        channel.fail_write_at = 2;
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(channel, dir.path(), "/srv/out", console.io()) == 1);
        CHECK(console.out() == "Uploading 5 files...\n");
        CHECK(console.err() ==
              "Error: SSH connection failed - file_02.txt -> /srv/out/file_02.txt: connection reset\n");
        CHECK(channel.put_count() == 3);
        CHECK(channel.files.size() == 2);
    }

    TEST_CASE("unexpected mkdir failure is a warning, the upload still runs")
    {
        temp_dir const dir;
        populate(dir, 2);
        fake_channel channel;
        channel.mkdir_error = rdeploy::make_error(rdeploy::error_kind::other, "permission denied");
        captured_console const console;

        CHECK(rdeploy::copy_to_remote(channel, dir.path(), "/srv/out", console.io()) == 0);
        CHECK(contains(console.err(), "Warning: could not create /srv/out: "));
        CHECK(contains(console.err(), "permission denied"));
        CHECK(contains(console.out(), "Done! Uploaded 2 files.\n"));
    }
}

TEST_SUITE("upload_images over an open channel")
{
    TEST_CASE("only png, jpg and webp files are sent")
    {
        temp_dir const dir;
        dir.write("a.png", "png");
        dir.write("b.jpg", "jpg");
        dir.write("c.webp", "webp");
        dir.write("d.txt", "text");
        dir.write("e.PNG", "upper case");
        dir.write("f.jpeg", "jpeg");
        fake_channel channel;
        captured_console const console;

        CHECK(rdeploy::upload_images(channel, dir.path(), "/srv/img", console.io()) == 0);
        CHECK(console.out() == "Uploading 3 images...\n"
                               "Uploaded 3/3\n"
                               "Done! Uploaded 3 images.\n");
        CHECK(channel.files.size() == 3);
        CHECK(channel.files.contains("/srv/img/a.png"));
        CHECK(channel.files.contains("/srv/img/b.jpg"));
        CHECK(channel.files.contains("/srv/img/c.webp"));
    }

    TEST_CASE("no matching images prints a notice and succeeds")
    {
        temp_dir const dir;
        dir.write("readme.txt", "nothing to see");
        fake_channel channel;
        captured_console const console;

        CHECK(rdeploy::upload_images(channel, dir.path(), "/srv/img", console.io()) == 0);
        CHECK(console.out() == "No image files found to upload.\n");
        CHECK(channel.calls.empty());
    }

    TEST_CASE("failed image write is reported with exit code 1")
    {
        temp_dir const dir;
        dir.write("a.png", "1");
        dir.write("b.png", "2");
        dir.write("c.png", "3");
        fake_channel channel;
        channel.fail_write_at = 2;
        captured_console const console;

        CHECK(rdeploy::upload_images(channel, dir.path(), "/srv/img", console.io()) == 1);
        CHECK(console.out() == "Uploading 3 images...\n");
        CHECK(contains(console.err(), "Error: SSH connection failed - c.png -> /srv/img/c.png: connection reset"));
    }
}
