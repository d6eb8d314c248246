// transfer.cpp - transfer engine: file and flat-directory uploads with batch progress

#include "rdeploy/transfer.hpp"

#include <algorithm>

namespace rdeploy
{

    namespace
    {

        [[nodiscard]] auto matches_extension(std::filesystem::path const &file, std::vector<std::string> const &extensions)
            -> bool
        {
            if (extensions.empty())
            {
                return true;
            }
            auto const ext = file.extension().string();
            return std::ranges::find(extensions, ext) != extensions.end();
        }

        [[nodiscard]] auto missing_path(std::filesystem::path const &path) -> error
        {
            return make_error(error_kind::local_path_not_found, path.string());
        }

    } // namespace

    auto remote_join(std::string_view remote_dir, std::string_view name) -> std::string
    {
        if (remote_dir.empty())
        {
            return std::string(name);
        }
        if (remote_dir.back() == '/')
        {
            return fmt::format("{}{}", remote_dir, name);
        }
        return fmt::format("{}/{}", remote_dir, name);
    }

    auto collect_batch(std::filesystem::path const &local_dir, std::string_view remote_dir,
                       std::vector<std::string> const &extensions) -> result<std::vector<transfer_item>>
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(local_dir, ec))
        {
            return std::unexpected(missing_path(local_dir));
        }

        std::vector<std::filesystem::path> files;
        for (auto it = std::filesystem::directory_iterator(local_dir, ec); !ec && it != std::filesystem::directory_iterator();
             it.increment(ec))
        {
            // is_regular_file follows symlinks, same as a glob-then-is_file listing
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec) && matches_extension(it->path(), extensions))
            {
                files.push_back(it->path());
            }
        }

        if (ec)
        {
            return std::unexpected(
                make_error(error_kind::other, fmt::format("cannot list {}: {}", local_dir.string(), ec.message())));
        }

        std::ranges::sort(files, [](auto const &a, auto const &b) { return a.filename() < b.filename(); });

        std::vector<transfer_item> items;
        items.reserve(files.size());
        for (auto const &file : files)
        {
            items.push_back(transfer_item{
                .local_path = file,
                .remote_path = remote_join(remote_dir, file.filename().string()),
                .kind = transfer_kind::file,
            });
        }
        return items;
    }

    auto upload_file(transfer_channel &channel, std::filesystem::path const &local_file, std::string_view remote_path)
        -> void_result
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_file, ec))
        {
            return std::unexpected(missing_path(local_file));
        }

        return channel.write_file(local_file, remote_path, transfer_defaults::file_mode);
    }

    auto upload_batch(transfer_channel &channel, std::vector<transfer_item> const &items,
                      std::function<void(transfer_progress const &)> const &on_progress) -> transfer_batch_result
    {
        transfer_batch_result batch;
        batch.total_count = items.size();
        batch.outcomes.reserve(items.size());

        for (auto const &item : items)
        {
            auto uploaded = upload_file(channel, item.local_path, item.remote_path);
            if (!uploaded.has_value())
            {
                auto failure = uploaded.error();
                // a local_path_not_found cause is the path itself and stays that way
                if (failure.kind != error_kind::local_path_not_found)
                {
                    failure.cause =
                        fmt::format("{} -> {}: {}", item.local_path.filename().string(), item.remote_path, failure.cause);
                }
                batch.outcomes.push_back(item_outcome{item, std::move(failure)});
                return batch;
            }

            batch.outcomes.push_back(item_outcome{item, std::nullopt});
            ++batch.succeeded_count;

            if (on_progress && should_report_progress(batch.succeeded_count, batch.total_count))
            {
                on_progress(transfer_progress{batch.succeeded_count, batch.total_count});
            }
        }

        return batch;
    }

    auto upload_directory(transfer_channel &channel, std::filesystem::path const &local_dir,
                          std::string_view remote_dir, directory_upload_options const &options)
        -> result<transfer_batch_result>
    {
        auto items = collect_batch(local_dir, remote_dir, options.extensions);
        if (!items.has_value())
        {
            return std::unexpected(items.error());
        }

        // nothing to send, nothing to create
        if (items->empty())
        {
            return transfer_batch_result{};
        }

        // any mkdir failure is tolerated here; only "already exists" is expected
        if (auto created = channel.make_directory(remote_dir, transfer_defaults::directory_mode);
            !created.has_value() && options.on_directory_warning)
        {
            options.on_directory_warning(created.error());
        }

        if (options.on_start)
        {
            options.on_start(items->size());
        }

        auto batch = upload_batch(channel, *items, options.on_progress);
        if (auto failure = batch.failure(); failure.has_value())
        {
            return std::unexpected(std::move(*failure));
        }
        return batch;
    }

} // namespace rdeploy
