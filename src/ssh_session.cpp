// ssh_session.cpp - SSH session implementation using libssh, SFTP for file transfer

#include "rdeploy/ssh_session.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <vector>

// libssh headers - order matters due to internal dependencies
#include <libssh/libssh.h>
#include <libssh/sftp.h>

// some libssh versions have issues with fcntl.h order
#include <fcntl.h>

namespace rdeploy::ssh
{

    namespace
    {

        // =============================================================================
        // RAII guards
        // =============================================================================

        struct sftp_session_guard
        {
            sftp_session session{nullptr};

            sftp_session_guard() = default;
            explicit sftp_session_guard(sftp_session s) : session(s) {}
            ~sftp_session_guard()
            {
                if (session != nullptr)
                {
                    sftp_free(session);
                }
            }

            sftp_session_guard(sftp_session_guard const &) = delete;
            auto operator=(sftp_session_guard const &) -> sftp_session_guard & = delete;
            sftp_session_guard(sftp_session_guard &&) = delete;
            auto operator=(sftp_session_guard &&) -> sftp_session_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> sftp_session { return session; }
            [[nodiscard]] explicit operator bool() const noexcept { return session != nullptr; }
        };

        struct sftp_file_guard
        {
            sftp_file file{nullptr};

            explicit sftp_file_guard(sftp_file f) : file(f) {}
            ~sftp_file_guard()
            {
                if (file != nullptr)
                {
                    sftp_close(file);
                }
            }

            sftp_file_guard(sftp_file_guard const &) = delete;
            auto operator=(sftp_file_guard const &) -> sftp_file_guard & = delete;
            sftp_file_guard(sftp_file_guard &&) = delete;
            auto operator=(sftp_file_guard &&) -> sftp_file_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> sftp_file { return file; }
            [[nodiscard]] explicit operator bool() const noexcept { return file != nullptr; }

            // close explicitly so a failed flush on close is reported
            [[nodiscard]] auto close() noexcept -> int
            {
                auto const rc = sftp_close(file);
                file = nullptr;
                return rc;
            }
        };

        struct channel_guard
        {
            ssh_channel channel{nullptr};

            explicit channel_guard(ssh_channel c) : channel(c) {}
            ~channel_guard()
            {
                if (channel != nullptr)
                {
                    ssh_channel_close(channel);
                    ssh_channel_free(channel);
                }
            }

            channel_guard(channel_guard const &) = delete;
            auto operator=(channel_guard const &) -> channel_guard & = delete;
            channel_guard(channel_guard &&) = delete;
            auto operator=(channel_guard &&) -> channel_guard & = delete;

            [[nodiscard]] auto get() const noexcept -> ssh_channel { return channel; }
            [[nodiscard]] explicit operator bool() const noexcept { return channel != nullptr; }
        };

        // SFTP chunk size - 32KB is safe for most servers
        constexpr std::size_t SFTP_CHUNK_SIZE = 32 * 1024;

        // how long one drain iteration waits for stdout before checking stderr
        constexpr int POLL_INTERVAL_MS = 50;

        [[nodiscard]] auto sftp_status_text(int code) -> std::string_view
        {
            switch (code)
            {
            case SSH_FX_OK:
                return "ok";
            case SSH_FX_EOF:
                return "end of file";
            case SSH_FX_NO_SUCH_FILE:
                return "no such file";
            case SSH_FX_PERMISSION_DENIED:
                return "permission denied";
            case SSH_FX_FAILURE:
                return "generic failure";
            case SSH_FX_BAD_MESSAGE:
                return "bad message";
            case SSH_FX_NO_CONNECTION:
                return "no connection";
            case SSH_FX_CONNECTION_LOST:
                return "connection lost";
            case SSH_FX_OP_UNSUPPORTED:
                return "operation unsupported";
            case SSH_FX_INVALID_HANDLE:
                return "invalid handle";
            case SSH_FX_NO_SUCH_PATH:
                return "no such path";
            case SSH_FX_FILE_ALREADY_EXISTS:
                return "file already exists";
            case SSH_FX_WRITE_PROTECT:
                return "write protected";
            case SSH_FX_NO_MEDIA:
                return "no media";
            default:
                return "unknown sftp status";
            }
        }

        // a dead transport is a transport failure, anything the server refused is "other"
        [[nodiscard]] auto session_failure(ssh_session ssh, std::string_view what) -> error
        {
            auto const detail = fmt::format("{}: {}", what, ssh_get_error(ssh));
            if (ssh_is_connected(ssh) == 0)
            {
                return make_error(error_kind::transport_failure, detail);
            }
            return make_error(error_kind::other, detail);
        }

        [[nodiscard]] auto sftp_failure(ssh_session ssh, sftp_session sftp, std::string_view what,
                                        std::string_view path) -> error
        {
            if (ssh_is_connected(ssh) == 0)
            {
                return make_error(error_kind::transport_failure,
                                  fmt::format("{} {}: {}", what, path, ssh_get_error(ssh)));
            }
            auto const code = sftp_get_error(sftp);
            return make_error(error_kind::other, fmt::format("{} {}: {}", what, path, sftp_status_text(code)));
        }

        // =============================================================================
        // SFTP transfer channel
        // =============================================================================

        class sftp_channel final : public transfer_channel
        {
        public:
            sftp_channel(ssh_session ssh, sftp_session sftp) : ssh_(ssh), sftp_(sftp) {}

            auto make_directory(std::string_view remote_dir, int mode) -> result<directory_status> override
            {
                auto const path = std::string(remote_dir);
                if (sftp_mkdir(sftp_.get(), path.c_str(), static_cast<mode_t>(mode)) == SSH_OK)
                {
                    return directory_status::created;
                }

                if (sftp_get_error(sftp_.get()) == SSH_FX_FILE_ALREADY_EXISTS)
                {
                    return directory_status::already_exists;
                }

                // SFTPv3 servers answer a generic failure for an existing path, so look
                auto const mkdir_error = sftp_failure(ssh_, sftp_.get(), "mkdir", remote_dir);
                if (sftp_attributes attrs = sftp_stat(sftp_.get(), path.c_str()); attrs != nullptr)
                {
                    auto const is_dir = attrs->type == SSH_FILEXFER_TYPE_DIRECTORY;
                    sftp_attributes_free(attrs);
                    if (is_dir)
                    {
                        return directory_status::already_exists;
                    }
                }

                return std::unexpected(mkdir_error);
            }

            auto write_file(std::filesystem::path const &local_path, std::string_view remote_path, int mode)
                -> void_result override
            {
                std::ifstream file(local_path, std::ios::binary);
                if (!file)
                {
                    std::error_code ec;
                    auto const kind = std::filesystem::exists(local_path, ec) ? error_kind::other
                                                                               : error_kind::local_path_not_found;
                    return std::unexpected(make_error(kind, fmt::format("cannot open {}", local_path.string())));
                }

                // open remote file for writing
                auto const remote = std::string(remote_path);
                sftp_file_guard remote_file{
                    sftp_open(sftp_.get(), remote.c_str(), O_WRONLY | O_CREAT | O_TRUNC, static_cast<mode_t>(mode))};
                if (!remote_file)
                {
                    return std::unexpected(sftp_failure(ssh_, sftp_.get(), "open", remote_path));
                }

                // stream in chunks
                std::array<char, SFTP_CHUNK_SIZE> chunk{};
                while (file)
                {
                    file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                    auto const got = static_cast<std::size_t>(file.gcount());

                    std::size_t offset = 0;
                    while (offset < got)
                    {
                        auto const written = sftp_write(remote_file.get(), chunk.data() + offset, got - offset);
                        if (written < 0)
                        {
                            return std::unexpected(sftp_failure(ssh_, sftp_.get(), "write", remote_path));
                        }
                        offset += static_cast<std::size_t>(written);
                    }
                }

                if (file.bad())
                {
                    return std::unexpected(
                        make_error(error_kind::other, fmt::format("read error on {}", local_path.string())));
                }

                if (remote_file.close() != SSH_OK)
                {
                    return std::unexpected(sftp_failure(ssh_, sftp_.get(), "close", remote_path));
                }

                return {};
            }

            auto read_file(std::string_view remote_path) -> result<std::vector<std::uint8_t>> override
            {
                auto const remote = std::string(remote_path);
                sftp_file_guard file{sftp_open(sftp_.get(), remote.c_str(), O_RDONLY, 0)};
                if (!file)
                {
                    return std::unexpected(sftp_failure(ssh_, sftp_.get(), "open", remote_path));
                }

                std::vector<std::uint8_t> buffer;
                std::array<std::uint8_t, SFTP_CHUNK_SIZE> chunk{};
                ssize_t nbytes = 0;

                while ((nbytes = sftp_read(file.get(), chunk.data(), chunk.size())) > 0)
                {
                    buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + nbytes);
                }

                if (nbytes < 0)
                {
                    return std::unexpected(sftp_failure(ssh_, sftp_.get(), "read", remote_path));
                }

                return buffer;
            }

            auto remove_file(std::string_view remote_path) -> void_result override
            {
                if (sftp_unlink(sftp_.get(), std::string(remote_path).c_str()) != SSH_OK)
                {
                    return std::unexpected(sftp_failure(ssh_, sftp_.get(), "remove", remote_path));
                }
                return {};
            }

        private:
            ssh_session ssh_;
            sftp_session_guard sftp_;
        };

    } // namespace

    // =============================================================================
    // session implementation
    // =============================================================================

    class session::impl
    {
    public:
        ssh_session ssh_{nullptr};
        std::unique_ptr<sftp_channel> sftp_;
        std::string host_;
        std::string user_;
        int port_{22};
        std::chrono::seconds command_timeout_{0};

        impl() = default;

        ~impl() { release(); }

        impl(impl const &) = delete;
        auto operator=(impl const &) -> impl & = delete;
        impl(impl &&) = delete;
        auto operator=(impl &&) -> impl & = delete;

        // child channel first, it still talks over ssh_
        void release() noexcept
        {
            sftp_.reset();
            if (ssh_ != nullptr)
            {
                if (ssh_is_connected(ssh_) != 0)
                {
                    ssh_disconnect(ssh_);
                }
                ssh_free(ssh_);
                ssh_ = nullptr;
            }
        }
    };

    session::~session() = default;

    session::session(session &&other) noexcept = default;

    auto session::operator=(session &&other) noexcept -> session & = default;

    session::session(std::unique_ptr<impl> pimpl) : impl_(std::move(pimpl)) {}

    auto session::connect(connection_config const &config) -> result<session>
    {
        if (auto valid = validate(config); !valid.has_value())
        {
            return std::unexpected(valid.error());
        }

        auto pimpl = std::make_unique<impl>();

        pimpl->ssh_ = ssh_new();
        if (pimpl->ssh_ == nullptr)
        {
            return std::unexpected(make_error(error_kind::other, "ssh_new failed"));
        }

        pimpl->host_ = config.host;
        pimpl->user_ = config.user;
        pimpl->port_ = config.port;
        pimpl->command_timeout_ = config.command_timeout;

        // set connection options
        auto const timeout_secs = static_cast<long>(config.connect_timeout.count());
        if (ssh_options_set(pimpl->ssh_, SSH_OPTIONS_HOST, config.host.c_str()) != SSH_OK ||
            ssh_options_set(pimpl->ssh_, SSH_OPTIONS_PORT, &config.port) != SSH_OK ||
            ssh_options_set(pimpl->ssh_, SSH_OPTIONS_USER, config.user.c_str()) != SSH_OK ||
            ssh_options_set(pimpl->ssh_, SSH_OPTIONS_TIMEOUT, &timeout_secs) != SSH_OK)
        {
            return std::unexpected(
                make_error(error_kind::other, fmt::format("invalid SSH options: {}", ssh_get_error(pimpl->ssh_))));
        }

        if (config.verbosity > 0)
        {
            int verbosity = SSH_LOG_PROTOCOL;
            ssh_options_set(pimpl->ssh_, SSH_OPTIONS_LOG_VERBOSITY, &verbosity);
        }

        // accept any host key, the known_hosts file is never consulted
        int strict = 0;
        ssh_options_set(pimpl->ssh_, SSH_OPTIONS_STRICTHOSTKEYCHECK, &strict);

        // connect - covers resolution, TCP, key exchange and the connect timeout
        if (ssh_connect(pimpl->ssh_) != SSH_OK)
        {
            return std::unexpected(make_error(error_kind::transport_failure, ssh_get_error(pimpl->ssh_)));
        }

        // authenticate
        switch (ssh_userauth_password(pimpl->ssh_, nullptr, config.secret.c_str()))
        {
        case SSH_AUTH_SUCCESS:
            break;
        case SSH_AUTH_DENIED:
        case SSH_AUTH_PARTIAL:
            return std::unexpected(make_error(error_kind::authentication_failed));
        case SSH_AUTH_ERROR:
            return std::unexpected(make_error(error_kind::transport_failure, ssh_get_error(pimpl->ssh_)));
        default:
            return std::unexpected(make_error(error_kind::other, ssh_get_error(pimpl->ssh_)));
        }

        return session(std::move(pimpl));
    }

    void session::close() noexcept
    {
        if (impl_)
        {
            impl_->release();
        }
    }

    auto session::is_connected() const noexcept -> bool
    {
        return impl_ && impl_->ssh_ != nullptr && ssh_is_connected(impl_->ssh_) != 0;
    }

    auto session::host() const noexcept -> std::string_view
    {
        return impl_ ? impl_->host_ : std::string_view{};
    }

    auto session::user() const noexcept -> std::string_view
    {
        return impl_ ? impl_->user_ : std::string_view{};
    }

    auto session::port() const noexcept -> int
    {
        return impl_ ? impl_->port_ : 0;
    }

    auto session::run(std::string_view command) -> result<command_result>
    {
        if (!is_connected())
        {
            return std::unexpected(make_error(error_kind::transport_failure, "session not connected"));
        }

        channel_guard channel{ssh_channel_new(impl_->ssh_)};
        if (!channel)
        {
            return std::unexpected(session_failure(impl_->ssh_, "cannot create channel"));
        }

        if (ssh_channel_open_session(channel.get()) != SSH_OK)
        {
            return std::unexpected(session_failure(impl_->ssh_, "cannot open channel"));
        }

        if (ssh_channel_request_exec(channel.get(), std::string(command).c_str()) != SSH_OK)
        {
            return std::unexpected(session_failure(impl_->ssh_, "exec request failed"));
        }

        command_result result;
        std::array<char, 4096> buffer{};

        // read whatever is buffered on one stream without blocking
        auto const drain = [&](int is_stderr, std::string &sink) -> bool {
            int nbytes = 0;
            while ((nbytes = ssh_channel_read_nonblocking(channel.get(), buffer.data(),
                                                          static_cast<std::uint32_t>(buffer.size()), is_stderr)) > 0)
            {
                sink.append(buffer.data(), static_cast<std::size_t>(nbytes));
            }
            return nbytes != SSH_ERROR;
        };

        // both streams are pumped each round so neither can stall the other
        auto const started = std::chrono::steady_clock::now();
        auto const timeout = impl_->command_timeout_;
        while (true)
        {
            if (timeout.count() > 0 && std::chrono::steady_clock::now() - started > timeout)
            {
                return std::unexpected(make_error(error_kind::transport_failure,
                                                  fmt::format("command timed out after {}s", timeout.count())));
            }

            auto const out_ready = ssh_channel_poll_timeout(channel.get(), POLL_INTERVAL_MS, 0);
            if (out_ready == SSH_ERROR || !drain(0, result.stdout_output))
            {
                return std::unexpected(session_failure(impl_->ssh_, "reading stdout failed"));
            }

            auto const err_ready = ssh_channel_poll_timeout(channel.get(), 0, 1);
            if (err_ready == SSH_ERROR || !drain(1, result.stderr_output))
            {
                return std::unexpected(session_failure(impl_->ssh_, "reading stderr failed"));
            }

            if (out_ready == SSH_EOF && err_ready == SSH_EOF)
            {
                break;
            }
        }

        ssh_channel_send_eof(channel.get());
        ssh_channel_close(channel.get());
        result.exit_code = ssh_channel_get_exit_status(channel.get());

        return result;
    }

    auto session::open_transfer_channel() -> result<transfer_channel *>
    {
        if (!is_connected())
        {
            return std::unexpected(make_error(error_kind::transport_failure, "session not connected"));
        }

        if (impl_->sftp_)
        {
            return impl_->sftp_.get();
        }

        sftp_session raw = sftp_new(impl_->ssh_);
        if (raw == nullptr)
        {
            return std::unexpected(session_failure(impl_->ssh_, "cannot create SFTP session"));
        }

        // owns raw from here, also on the failure path below
        auto channel = std::make_unique<sftp_channel>(impl_->ssh_, raw);

        if (sftp_init(raw) != SSH_OK)
        {
            return std::unexpected(session_failure(impl_->ssh_, "SFTP initialization failed"));
        }

        impl_->sftp_ = std::move(channel);
        return impl_->sftp_.get();
    }

} // namespace rdeploy::ssh
