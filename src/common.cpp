// common.cpp - error category for std::error_code integration

#include "rdeploy/common.hpp"

namespace rdeploy
{

    namespace
    {

        class rdeploy_error_category_impl : public std::error_category
        {
        public:
            [[nodiscard]] auto name() const noexcept -> char const * override { return "rdeploy"; }

            [[nodiscard]] auto message(int ev) const -> std::string override
            {
                switch (static_cast<error_kind>(ev))
                {
                case error_kind::config_missing:
                    return "missing SSH configuration";
                case error_kind::local_path_not_found:
                    return "local path not found";
                case error_kind::authentication_failed:
                    return "authentication failed";
                case error_kind::transport_failure:
                    return "SSH connection failed";
                case error_kind::other:
                    return "operation failed";
                default:
                    return fmt::format("unknown rdeploy error ({})", ev);
                }
            }
        };

        [[nodiscard]] auto rdeploy_error_category() noexcept -> std::error_category const &
        {
            static rdeploy_error_category_impl const instance;
            return instance;
        }

    } // namespace

    auto make_error_code(error_kind kind) noexcept -> std::error_code
    {
        return {static_cast<int>(kind), rdeploy_error_category()};
    }

    auto error::message() const -> std::string
    {
        auto const base = code().message();
        if (cause.empty())
        {
            return base;
        }
        return fmt::format("{}: {}", base, cause);
    }

} // namespace rdeploy
