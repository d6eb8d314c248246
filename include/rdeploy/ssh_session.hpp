// ssh_session.hpp - one authenticated SSH connection plus its lazily opened SFTP channel
// close() runs on every exit path: explicitly, or from the destructor

#pragma once

#include "rdeploy/common.hpp"
#include "rdeploy/config.hpp"
#include "rdeploy/transfer_channel.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace rdeploy::ssh
{

    // =============================================================================
    // command result
    // =============================================================================

    // raw bytes as the remote process wrote them; decoding is up to the caller
    struct command_result
    {
        std::string stdout_output;
        std::string stderr_output;
        int exit_code{0};

        [[nodiscard]] auto success() const noexcept -> bool { return exit_code == 0; }

        [[nodiscard]] auto operator==(command_result const &) const -> bool = default;
    };

    // =============================================================================
    // SSH session
    // =============================================================================

    class session
    {
    public:
        ~session();

        // move-only type
        session(session const &) = delete;
        auto operator=(session const &) -> session & = delete;
        session(session &&) noexcept;
        auto operator=(session &&) noexcept -> session &;

        // -------------------------------------------------------------------------
        // connection management
        // -------------------------------------------------------------------------

        // validates config first, so a missing host/user/secret never reaches the network.
        // the remote host key is accepted without verification.
        [[nodiscard]] static auto connect(connection_config const &config) -> result<session>;

        // releases the SFTP channel, then the SSH session; safe to call repeatedly
        void close() noexcept;

        [[nodiscard]] auto is_connected() const noexcept -> bool;
        [[nodiscard]] auto host() const noexcept -> std::string_view;
        [[nodiscard]] auto user() const noexcept -> std::string_view;
        [[nodiscard]] auto port() const noexcept -> int;

        // -------------------------------------------------------------------------
        // command execution
        // -------------------------------------------------------------------------

        // drains stdout and stderr together until EOF, then reads the exit status
        [[nodiscard]] auto run(std::string_view command) -> result<command_result>;

        // -------------------------------------------------------------------------
        // file transfer (SFTP)
        // -------------------------------------------------------------------------

        // opened on first call; the channel is owned by this session and dies with it
        [[nodiscard]] auto open_transfer_channel() -> result<transfer_channel *>;

    private:
        class impl;
        std::unique_ptr<impl> impl_;

        explicit session(std::unique_ptr<impl> impl);
    };

} // namespace rdeploy::ssh
