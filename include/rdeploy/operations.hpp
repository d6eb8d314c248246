#pragma once

// operations.hpp - the three command-line entry points as callable functions
// each one opens exactly one session, prints what happened and returns the process exit code

#include "rdeploy/config.hpp"
#include "rdeploy/transfer_channel.hpp"

#include <array>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace rdeploy
{

    // where entry points write; tests pass std::tmpfile() streams
    struct console
    {
        std::FILE *out{stdout};
        std::FILE *err{stderr};
    };

    namespace image_upload
    {
        inline constexpr std::string_view local_dir = "server/uploads/products";
        inline constexpr std::string_view remote_dir = "/root/PerfumesStore/server/uploads/products";
        inline constexpr std::array<std::string_view, 3> extensions{".png", ".jpg", ".webp"};
    }

    // "Error: ..." line for a failure, worded per error kind
    void report_error(console const &io, error const &err);

    // writes the remote stdout/stderr (ASCII-sanitized) and returns the remote exit code, or 1
    [[nodiscard]] auto run_remote_command(connection_config const &config, std::string_view command,
                                          console const &io = {}) -> int;

    // local_path may be a file (uploaded to remote_path) or a directory (flat upload into remote_path)
    [[nodiscard]] auto copy_to_remote(connection_config const &config, std::filesystem::path const &local_path,
                                      std::string_view remote_path, console const &io = {}) -> int;

    // directory upload restricted to image_upload::extensions
    [[nodiscard]] auto upload_images(connection_config const &config, std::filesystem::path const &local_dir,
                                     std::string_view remote_dir, console const &io = {}) -> int;

    // the work the two upload entry points do once the transfer channel is open
    // same console output and exit codes; local paths are not re-checked
    [[nodiscard]] auto copy_to_remote(transfer_channel &channel, std::filesystem::path const &local_path,
                                      std::string_view remote_path, console const &io = {}) -> int;

    [[nodiscard]] auto upload_images(transfer_channel &channel, std::filesystem::path const &local_dir,
                                     std::string_view remote_dir, console const &io = {}) -> int;

} // namespace rdeploy
