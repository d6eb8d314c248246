// upload_images.cpp - push product images (.png, .jpg, .webp) to the fixed remote uploads directory

#include "rdeploy/config.hpp"
#include "rdeploy/operations.hpp"

#include <fmt/format.h>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wtautological-compare"
#include <fmt/ranges.h>
#pragma GCC diagnostic pop

#include <filesystem>
#include <optional>
#include <string_view>

namespace
{

    struct upload_options
    {
        std::filesystem::path env_file{".env"};
        bool verbose{false};
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options]

Uploads {}/*{{{}}} to {}

Options:
  --env-file <path>         KEY=VALUE file with SSH_HOST, SSH_USER, SSH_PASSWORD,
                            SSH_PORT (default: ./.env)
  --verbose                 libssh protocol logging

)",
                   program_name, rdeploy::image_upload::local_dir,
                   fmt::join(rdeploy::image_upload::extensions, ","), rdeploy::image_upload::remote_dir);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<upload_options>
    {
        upload_options options;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg{argv[i]};

            if (arg == "--env-file" && i + 1 < argc)
            {
                options.env_file = argv[++i];
            }
            else if (arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
        }

        return options;
    }

} // anonymous namespace

auto main(int argc, char const *argv[]) -> int
{
    auto const options = parse_args(argc, argv);
    if (!options.has_value())
    {
        print_usage(argv[0]);
        return 1;
    }

    auto config = rdeploy::load_env_file(options->env_file).and_then(rdeploy::config_from_values);
    if (!config.has_value())
    {
        rdeploy::report_error({}, config.error());
        return 1;
    }
    config->verbosity = options->verbose ? 1 : 0;

    return rdeploy::upload_images(*config, std::filesystem::path{rdeploy::image_upload::local_dir},
                                  rdeploy::image_upload::remote_dir);
}
