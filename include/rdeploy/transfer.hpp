#pragma once

// transfer.hpp - single-file and flat-directory upload over a transfer_channel

#include "rdeploy/common.hpp"
#include "rdeploy/transfer_channel.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdeploy
{

    // ============================================================================
    // transfer model
    // ============================================================================

    enum class transfer_kind : std::uint8_t
    {
        file,
        directory,
    };

    struct transfer_item
    {
        std::filesystem::path local_path;
        std::string remote_path;
        transfer_kind kind{transfer_kind::file};

        [[nodiscard]] auto operator==(transfer_item const &) const -> bool = default;
    };

    struct item_outcome
    {
        transfer_item item;
        std::optional<error> failure; // empty on success

        [[nodiscard]] auto succeeded() const noexcept -> bool { return !failure.has_value(); }
    };

    struct transfer_batch_result
    {
        std::size_t total_count{0};
        std::size_t succeeded_count{0};
        std::vector<item_outcome> outcomes;

        [[nodiscard]] auto complete() const noexcept -> bool { return succeeded_count == total_count; }

        // the outcome that aborted the batch, if any
        [[nodiscard]] auto failure() const -> std::optional<error>
        {
            if (outcomes.empty())
            {
                return std::nullopt;
            }
            return outcomes.back().failure;
        }
    };

    struct transfer_progress
    {
        std::size_t uploaded{0};
        std::size_t total{0};
    };

    namespace transfer_defaults
    {
        inline constexpr std::size_t progress_interval = 10;
        inline constexpr int file_mode = 0644;
        inline constexpr int directory_mode = 0755;
    }

    struct directory_upload_options
    {
        // ".png" style suffixes, compared case-sensitively; empty = every regular file
        std::vector<std::string> extensions;

        // called once with the batch size, after the remote directory is ensured
        std::function<void(std::size_t)> on_start;

        std::function<void(transfer_progress const &)> on_progress;

        // remote directory creation failed for a reason other than "already exists";
        // the batch still goes ahead
        std::function<void(error const &)> on_directory_warning;
    };

    // true after every progress_interval-th file and after the last one
    [[nodiscard]] constexpr auto should_report_progress(std::size_t const uploaded, std::size_t const total) noexcept
        -> bool
    {
        return uploaded > 0 && (uploaded % transfer_defaults::progress_interval == 0 || uploaded == total);
    }

    // "<remote_dir>/<name>", without doubling a trailing slash
    [[nodiscard]] auto remote_join(std::string_view remote_dir, std::string_view name) -> std::string;

    // regular files directly inside local_dir, sorted by name, each mapped to remote_dir/<name>
    [[nodiscard]] auto collect_batch(std::filesystem::path const &local_dir, std::string_view remote_dir,
                                     std::vector<std::string> const &extensions = {})
        -> result<std::vector<transfer_item>>;

    // ============================================================================
    // upload operations
    // ============================================================================

    // local_file must be a regular file; checked before the channel is touched
    [[nodiscard]] auto upload_file(transfer_channel &channel, std::filesystem::path const &local_file,
                                   std::string_view remote_path) -> void_result;

    // uploads items in order and stops at the first failure, which is recorded as the last outcome
    [[nodiscard]] auto upload_batch(transfer_channel &channel, std::vector<transfer_item> const &items,
                                    std::function<void(transfer_progress const &)> const &on_progress = {})
        -> transfer_batch_result;

    // fail-fast: the first failing file ends the batch, earlier uploads stay in place
    [[nodiscard]] auto upload_directory(transfer_channel &channel, std::filesystem::path const &local_dir,
                                        std::string_view remote_dir, directory_upload_options const &options = {})
        -> result<transfer_batch_result>;

} // namespace rdeploy
