// remote_copy.cpp - upload a file, or the files directly inside a directory, over SFTP

#include "rdeploy/config.hpp"
#include "rdeploy/operations.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace
{

    struct copy_options
    {
        std::filesystem::path env_file{".env"};
        bool verbose{false};
        std::filesystem::path local_path;
        std::string remote_path;
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] <local_path> <remote_path>

A directory uploads its regular files (not subdirectories) into <remote_path>,
which is created when missing.

Options:
  --env-file <path>         KEY=VALUE file with SSH_HOST, SSH_USER, SSH_PASSWORD,
                            SSH_PORT (default: ./.env)
  --verbose                 libssh protocol logging

Examples:
  {} ../server/uploads/products /root/PerfumesStore/server/uploads/products
  {} ./file.txt /root/file.txt

)",
                   program_name, program_name, program_name);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<copy_options>
    {
        copy_options options;
        int positional = 0;

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
            else if (positional == 0)
            {
                options.local_path = argv[i];
                ++positional;
            }
            else if (positional == 1)
            {
                options.remote_path = argv[i];
                ++positional;
            }
            else
            {
                fmt::print(stderr, "Unknown argument: {}\n", arg);
                return std::nullopt;
            }
        }

        if (positional < 2)
        {
            return std::nullopt;
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

    return rdeploy::copy_to_remote(*config, options->local_path, options->remote_path);
}
