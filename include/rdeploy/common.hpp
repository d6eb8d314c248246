#pragma once

// common.hpp - error taxonomy and result type shared by every rdeploy module

#include <cstdint>
#include <expected>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace rdeploy
{

    // ============================================================================
    // error handling - one kind per failure class, no exceptions, no retries
    // ============================================================================

    enum class error_kind : std::uint8_t
    {
        config_missing = 1,
        local_path_not_found,
        authentication_failed,
        transport_failure,
        other,
    };

    struct error_kind_formatter
    {
        [[nodiscard]] static constexpr auto to_string(error_kind const kind) noexcept -> std::string_view
        {
            switch (kind)
            {
            case error_kind::config_missing:
                return "config_missing";
            case error_kind::local_path_not_found:
                return "local_path_not_found";
            case error_kind::authentication_failed:
                return "authentication_failed";
            case error_kind::transport_failure:
                return "transport_failure";
            case error_kind::other:
                return "other";
            }
            return "unknown_error";
        }
    };

    [[nodiscard]] auto make_error_code(error_kind kind) noexcept -> std::error_code;

    // error kind plus the underlying cause, as reported by libssh or the filesystem
    struct error
    {
        error_kind kind{error_kind::other};
        std::string cause;

        [[nodiscard]] auto code() const noexcept -> std::error_code { return make_error_code(kind); }

        // "<category message>: <cause>" or just the category message
        [[nodiscard]] auto message() const -> std::string;

        [[nodiscard]] auto operator==(error const &) const -> bool = default;
    };

    [[nodiscard]] inline auto make_error(error_kind const kind, std::string cause = {}) -> error
    {
        return error{kind, std::move(cause)};
    }

    template <typename T>
    using result = std::expected<T, error>;

    using void_result = std::expected<void, error>;

    namespace exit_codes
    {
        inline constexpr int success = 0;
        inline constexpr int failure = 1;
    }

    // every failure maps to the same sentinel; remote exit codes never pass through here
    [[nodiscard]] constexpr auto exit_code_for(error const & /*err*/) noexcept -> int
    {
        return exit_codes::failure;
    }

} // namespace rdeploy

// enable std::error_code integration
template <>
struct std::is_error_code_enum<rdeploy::error_kind> : std::true_type
{
};

template <>
struct fmt::formatter<rdeploy::error_kind> : fmt::formatter<std::string_view>
{
    auto format(rdeploy::error_kind const kind, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(rdeploy::error_kind_formatter::to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<rdeploy::error> : fmt::formatter<std::string_view>
{
    auto format(rdeploy::error const &err, format_context &ctx) const
    {
        return fmt::formatter<std::string_view>::format(err.message(), ctx);
    }
};
