// remote_run.cpp - run one shell command on the configured host
// the remote exit code becomes our exit code

#include "rdeploy/config.hpp"
#include "rdeploy/executor.hpp"
#include "rdeploy/operations.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

    struct run_options
    {
        std::filesystem::path env_file{".env"};
        bool verbose{false};
        std::vector<std::string> command_parts;
    };

    auto print_usage(char const *program_name) -> void
    {
        fmt::print(stderr, R"(
Usage: {} [options] <command> [args...]

Options:
  --env-file <path>         KEY=VALUE file with SSH_HOST, SSH_USER, SSH_PASSWORD,
                            SSH_PORT (default: ./.env)
  --verbose                 libssh protocol logging
  --                        end of options, everything after is the command

Example:
  {} docker compose ps

)",
                   program_name, program_name);
    }

    [[nodiscard]] auto parse_args(int argc, char const *argv[]) -> std::optional<run_options>
    {
        run_options options;

        int i = 1;
        for (; i < argc; ++i)
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
            else if (arg == "--")
            {
                ++i;
                break;
            }
            else
            {
                break;
            }
        }

        for (; i < argc; ++i)
        {
            options.command_parts.emplace_back(argv[i]);
        }

        if (options.command_parts.empty())
        {
            fmt::print(stderr, "Error: no command given\n");
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

    return rdeploy::run_remote_command(*config, rdeploy::join_command(options->command_parts));
}
