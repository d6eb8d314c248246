#pragma once

// transfer_channel.hpp - remote file operations the transfer engine needs
// the SFTP implementation lives inside ssh::session; tests plug in an in-memory one

#include "rdeploy/common.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace rdeploy
{

    enum class directory_status : std::uint8_t
    {
        created,
        already_exists,
    };

    class transfer_channel
    {
    public:
        virtual ~transfer_channel() = default;

        transfer_channel() = default;
        transfer_channel(transfer_channel const &) = delete;
        auto operator=(transfer_channel const &) -> transfer_channel & = delete;
        transfer_channel(transfer_channel &&) = delete;
        auto operator=(transfer_channel &&) -> transfer_channel & = delete;

        [[nodiscard]] virtual auto make_directory(std::string_view remote_dir, int mode = 0755)
            -> result<directory_status> = 0;

        // create or truncate remote_path and stream local_path into it
        [[nodiscard]] virtual auto write_file(std::filesystem::path const &local_path, std::string_view remote_path,
                                              int mode = 0644) -> void_result = 0;

        [[nodiscard]] virtual auto read_file(std::string_view remote_path) -> result<std::vector<std::uint8_t>> = 0;

        [[nodiscard]] virtual auto remove_file(std::string_view remote_path) -> void_result = 0;
    };

} // namespace rdeploy
