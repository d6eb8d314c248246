#pragma once

// config.hpp - connection settings and the key=value .env loader that fills them

#include "rdeploy/common.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace rdeploy
{

    // ============================================================================
    // connection configuration - built once per invocation, passed by const ref
    // ============================================================================

    struct connection_config
    {
        std::string host;
        int port{22};
        std::string user;
        std::string secret;
        std::chrono::seconds connect_timeout{30};
        std::chrono::seconds command_timeout{0}; // 0 = wait forever
        int verbosity{0};                        // 0=quiet, 1+=libssh protocol log
    };

    // host, user and secret non-empty, port in 1..65535, connect_timeout at least one second
    [[nodiscard]] auto validate(connection_config const &config) -> void_result;

    namespace env_keys
    {
        inline constexpr std::string_view host = "SSH_HOST";
        inline constexpr std::string_view user = "SSH_USER";
        inline constexpr std::string_view password = "SSH_PASSWORD";
        inline constexpr std::string_view port = "SSH_PORT";
        inline constexpr std::string_view connect_timeout = "SSH_CONNECT_TIMEOUT";
        inline constexpr std::string_view command_timeout = "SSH_COMMAND_TIMEOUT";
    }

    using env_values = std::map<std::string, std::string, std::less<>>;

    // parse KEY=VALUE lines; '#' comments, blank lines and lines without '=' are skipped
    [[nodiscard]] auto parse_env(std::string_view text) -> env_values;

    [[nodiscard]] auto load_env_file(std::filesystem::path const &path) -> result<env_values>;

    // map SSH_* values onto a config; does not require host/user/secret (see validate)
    [[nodiscard]] auto config_from_values(env_values const &values) -> result<connection_config>;

    // load_env_file + config_from_values + validate
    [[nodiscard]] auto load_connection_config(std::filesystem::path const &path) -> result<connection_config>;

} // namespace rdeploy
