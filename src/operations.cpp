// operations.cpp - entry points: validate, connect, do the work, print, map to exit code

#include "rdeploy/operations.hpp"

#include "rdeploy/executor.hpp"
#include "rdeploy/ssh_session.hpp"
#include "rdeploy/transfer.hpp"

#include <fmt/format.h>

#include <utility>
#include <vector>

namespace rdeploy
{

    namespace
    {

        // the session is closed explicitly on the way out, and by its destructor if work throws
        template <typename Work>
        [[nodiscard]] auto with_session(connection_config const &config, console const &io, Work &&work) -> int
        {
            auto session = ssh::session::connect(config);
            if (!session.has_value())
            {
                report_error(io, session.error());
                return exit_codes::failure;
            }

            auto const code = std::forward<Work>(work)(*session);
            session->close();
            return code;
        }

        [[nodiscard]] auto preflight(connection_config const &config, console const &io) -> bool
        {
            if (auto valid = validate(config); !valid.has_value())
            {
                report_error(io, valid.error());
                return false;
            }
            return true;
        }

        [[nodiscard]] auto open_channel(ssh::session &session, console const &io) -> transfer_channel *
        {
            auto channel = session.open_transfer_channel();
            if (!channel.has_value())
            {
                report_error(io, channel.error());
                return nullptr;
            }
            return *channel;
        }

        void print_raw(std::FILE *stream, std::string_view bytes)
        {
            if (!bytes.empty())
            {
                fmt::print(stream, "{}", printable_output(bytes));
                std::fflush(stream);
            }
        }

        struct batch_wording
        {
            std::string_view noun;       // "files" / "images"
            std::string_view empty_line; // printed when nothing matched
        };

        [[nodiscard]] auto run_directory_upload(transfer_channel &channel, std::filesystem::path const &local_dir,
                                                std::string_view remote_dir, std::vector<std::string> extensions,
                                                batch_wording const &wording, console const &io) -> int
        {
            directory_upload_options options;
            options.extensions = std::move(extensions);
            options.on_directory_warning = [&io, remote_dir](error const &err) {
                fmt::print(io.err, "Warning: could not create {}: {}\n", remote_dir, err);
            };

            options.on_start = [&io, &wording](std::size_t total) {
                fmt::print(io.out, "Uploading {} {}...\n", total, wording.noun);
                std::fflush(io.out);
            };
            options.on_progress = [&io](transfer_progress const &progress) {
                fmt::print(io.out, "Uploaded {}/{}\n", progress.uploaded, progress.total);
                std::fflush(io.out);
            };

            auto batch = upload_directory(channel, local_dir, remote_dir, options);
            if (!batch.has_value())
            {
                report_error(io, batch.error());
                return exit_codes::failure;
            }

            if (batch->total_count == 0)
            {
                fmt::print(io.out, "{}\n", wording.empty_line);
                return exit_codes::success;
            }

            fmt::print(io.out, "Done! Uploaded {} {}.\n", batch->succeeded_count, wording.noun);
            return exit_codes::success;
        }

    } // namespace

    void report_error(console const &io, error const &err)
    {
        switch (err.kind)
        {
        case error_kind::config_missing:
            fmt::print(io.err, "Error: Missing SSH configuration ({})\n", err.cause);
            break;
        case error_kind::local_path_not_found:
            fmt::print(io.err, "Error: Local path not found: {}\n", err.cause);
            break;
        case error_kind::authentication_failed:
            fmt::print(io.err, "Error: Authentication failed\n");
            break;
        case error_kind::transport_failure:
            fmt::print(io.err, "Error: SSH connection failed - {}\n", err.cause);
            break;
        case error_kind::other:
            fmt::print(io.err, "Error: {}\n", err.cause.empty() ? err.message() : err.cause);
            break;
        }
        std::fflush(io.err);
    }

    auto run_remote_command(connection_config const &config, std::string_view command, console const &io) -> int
    {
        if (!preflight(config, io))
        {
            return exit_codes::failure;
        }

        return with_session(config, io, [&](ssh::session &session) {
            auto outcome = execute(session, command);
            if (!outcome.has_value())
            {
                report_error(io, outcome.error());
                return exit_code_for(outcome);
            }

            print_raw(io.out, outcome->stdout_output);
            print_raw(io.err, outcome->stderr_output);
            return exit_code_for(outcome);
        });
    }

    auto copy_to_remote(connection_config const &config, std::filesystem::path const &local_path,
                        std::string_view remote_path, console const &io) -> int
    {
        if (!preflight(config, io))
        {
            return exit_codes::failure;
        }

        std::error_code ec;
        if (!std::filesystem::exists(local_path, ec))
        {
            report_error(io, make_error(error_kind::local_path_not_found, local_path.string()));
            return exit_codes::failure;
        }

        fmt::print(io.out, "Connecting to {}...\n", config.host);
        std::fflush(io.out);

        return with_session(config, io, [&](ssh::session &session) {
            auto *channel = open_channel(session, io);
            if (channel == nullptr)
            {
                return exit_codes::failure;
            }
            return copy_to_remote(*channel, local_path, remote_path, io);
        });
    }

    auto copy_to_remote(transfer_channel &channel, std::filesystem::path const &local_path,
                        std::string_view remote_path, console const &io) -> int
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            return run_directory_upload(channel, local_path, remote_path, {},
                                        batch_wording{"files", "No files found to upload."}, io);
        }

        auto const name = local_path.filename().string();
        fmt::print(io.out, "Uploading {}...\n", name);
        std::fflush(io.out);

        if (auto uploaded = upload_file(channel, local_path, remote_path); !uploaded.has_value())
        {
            report_error(io, uploaded.error());
            return exit_codes::failure;
        }

        fmt::print(io.out, "Done! Uploaded {}\n", name);
        return exit_codes::success;
    }

    auto upload_images(connection_config const &config, std::filesystem::path const &local_dir,
                       std::string_view remote_dir, console const &io) -> int
    {
        if (!preflight(config, io))
        {
            return exit_codes::failure;
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(local_dir, ec))
        {
            fmt::print(io.err, "Error: Local directory not found: {}\n", local_dir.string());
            std::fflush(io.err);
            return exit_codes::failure;
        }

        fmt::print(io.out, "Connecting to {}...\n", config.host);
        std::fflush(io.out);

        return with_session(config, io, [&](ssh::session &session) {
            auto *channel = open_channel(session, io);
            if (channel == nullptr)
            {
                return exit_codes::failure;
            }
            return upload_images(*channel, local_dir, remote_dir, io);
        });
    }

    auto upload_images(transfer_channel &channel, std::filesystem::path const &local_dir, std::string_view remote_dir,
                       console const &io) -> int
    {
        std::vector<std::string> extensions(image_upload::extensions.begin(), image_upload::extensions.end());
        return run_directory_upload(channel, local_dir, remote_dir, std::move(extensions),
                                    batch_wording{"images", "No image files found to upload."}, io);
    }

} // namespace rdeploy
