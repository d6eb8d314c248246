// config.cpp - .env parsing and connection_config validation

#include "rdeploy/config.hpp"

#include <charconv>
#include <fstream>
#include <sstream>

namespace rdeploy
{

    namespace
    {

        [[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view
        {
            constexpr std::string_view whitespace = " \t\r\n\f\v";
            auto const first = text.find_first_not_of(whitespace);
            if (first == std::string_view::npos)
            {
                return {};
            }
            auto const last = text.find_last_not_of(whitespace);
            return text.substr(first, last - first + 1);
        }

        [[nodiscard]] auto parse_int(std::string_view text, int &out) noexcept -> bool
        {
            auto const *const begin = text.data();
            auto const *const end = text.data() + text.size();
            auto const [ptr, ec] = std::from_chars(begin, end, out);
            return ec == std::errc{} && ptr == end && !text.empty();
        }

        [[nodiscard]] auto lookup(env_values const &values, std::string_view key) -> std::string_view
        {
            if (auto const it = values.find(key); it != values.end())
            {
                return it->second;
            }
            return {};
        }

        // minimum is 0 for "no limit allowed" and 1 where a bound is mandatory
        [[nodiscard]] auto read_seconds(env_values const &values, std::string_view key, std::chrono::seconds fallback,
                                        int minimum) -> result<std::chrono::seconds>
        {
            auto const raw = lookup(values, key);
            if (raw.empty())
            {
                return fallback;
            }
            int secs = 0;
            if (!parse_int(raw, secs) || secs < minimum)
            {
                return std::unexpected(make_error(
                    error_kind::config_missing,
                    fmt::format("{} must be an integer of at least {}, got '{}'", key, minimum, raw)));
            }
            return std::chrono::seconds{secs};
        }

    } // namespace

    auto validate(connection_config const &config) -> void_result
    {
        if (config.host.empty() || config.user.empty() || config.secret.empty())
        {
            std::string missing;
            auto const note = [&missing](bool absent, std::string_view key) {
                if (absent)
                {
                    missing += missing.empty() ? "" : ", ";
                    missing += key;
                }
            };
            note(config.host.empty(), env_keys::host);
            note(config.user.empty(), env_keys::user);
            note(config.secret.empty(), env_keys::password);
            return std::unexpected(make_error(error_kind::config_missing, fmt::format("{} not set", missing)));
        }

        if (config.port < 1 || config.port > 65535)
        {
            return std::unexpected(
                make_error(error_kind::config_missing, fmt::format("{} out of range: {}", env_keys::port, config.port)));
        }

        // libssh treats a zero timeout as "use the library default"
        if (config.connect_timeout.count() <= 0)
        {
            return std::unexpected(make_error(
                error_kind::config_missing,
                fmt::format("{} must be positive, got {}", env_keys::connect_timeout, config.connect_timeout.count())));
        }

        return {};
    }

    auto parse_env(std::string_view text) -> env_values
    {
        env_values values;

        while (!text.empty())
        {
            auto const eol = text.find('\n');
            auto const line = trim(text.substr(0, eol));
            text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);

            if (line.empty() || line.front() == '#')
            {
                continue;
            }

            auto const eq = line.find('=');
            if (eq == std::string_view::npos)
            {
                continue;
            }

            // later lines win, same as a dict built line by line
            values.insert_or_assign(std::string{trim(line.substr(0, eq))}, std::string{trim(line.substr(eq + 1))});
        }

        return values;
    }

    auto load_env_file(std::filesystem::path const &path) -> result<env_values>
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return std::unexpected(
                make_error(error_kind::config_missing, fmt::format(".env file not found at {}", path.string())));
        }

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            return std::unexpected(
                make_error(error_kind::config_missing, fmt::format("cannot open {}", path.string())));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse_env(contents.str());
    }

    auto config_from_values(env_values const &values) -> result<connection_config>
    {
        connection_config config;
        config.host = lookup(values, env_keys::host);
        config.user = lookup(values, env_keys::user);
        config.secret = lookup(values, env_keys::password);

        if (auto const raw_port = lookup(values, env_keys::port); !raw_port.empty())
        {
            if (!parse_int(raw_port, config.port))
            {
                return std::unexpected(make_error(error_kind::config_missing,
                                                  fmt::format("{} must be an integer, got '{}'", env_keys::port, raw_port)));
            }
        }

        auto connect_timeout = read_seconds(values, env_keys::connect_timeout, config.connect_timeout, 1);
        if (!connect_timeout.has_value())
        {
            return std::unexpected(connect_timeout.error());
        }
        config.connect_timeout = *connect_timeout;

        auto command_timeout = read_seconds(values, env_keys::command_timeout, config.command_timeout, 0);
        if (!command_timeout.has_value())
        {
            return std::unexpected(command_timeout.error());
        }
        config.command_timeout = *command_timeout;

        return config;
    }

    auto load_connection_config(std::filesystem::path const &path) -> result<connection_config>
    {
        return load_env_file(path)
            .and_then([](env_values const &values) { return config_from_values(values); })
            .and_then([](connection_config config) -> result<connection_config> {
                if (auto valid = validate(config); !valid.has_value())
                {
                    return std::unexpected(valid.error());
                }
                return config;
            });
    }

} // namespace rdeploy
