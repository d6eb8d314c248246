// tests/unit/test_config.cpp - .env parsing and config validation

#include "common/test_helpers.hpp"
#include "rdeploy/config.hpp"
#include <doctest/doctest.h>

namespace
{

    [[nodiscard]] auto valid_config() -> rdeploy::connection_config
    {
        rdeploy::connection_config config;
        config.host = "h";
        config.user = "u";
        config.secret = "p";
        return config;
    }

} // anonymous namespace

TEST_SUITE("parse_env")
{
    TEST_CASE("reads key value pairs and trims them")
    {
        auto const values = rdeploy::parse_env("SSH_HOST = example.org \n  SSH_USER=deploy\r\nSSH_PORT=2222\n");
        CHECK(values.at("SSH_HOST") == "example.org");
        CHECK(values.at("SSH_USER") == "deploy");
        CHECK(values.at("SSH_PORT") == "2222");
    }

    TEST_CASE("skips comments, blank lines and lines without '='")
    {
        auto const values = rdeploy::parse_env("# comment\n\n   \nGARBAGE\n  # SSH_HOST=ignored\nSSH_USER=u");
        CHECK(values.size() == 1);
        CHECK(values.at("SSH_USER") == "u");
    }

    TEST_CASE("splits at the first '=' only")
    {
        auto const values = rdeploy::parse_env("SSH_PASSWORD=a=b==c");
        CHECK(values.at("SSH_PASSWORD") == "a=b==c");
    }

    TEST_CASE("later lines override earlier ones")
    {
        auto const values = rdeploy::parse_env("SSH_HOST=first\nSSH_HOST=second\n");
        CHECK(values.at("SSH_HOST") == "second");
    }

    TEST_CASE("empty input gives no values")
    {
        CHECK(rdeploy::parse_env("").empty());
    }
}

TEST_SUITE("config_from_values")
{
    TEST_CASE("maps SSH keys with defaults")
    {
        auto const config = rdeploy::config_from_values(
            rdeploy::parse_env("SSH_HOST=h\nSSH_USER=u\nSSH_PASSWORD=p\n"));
        REQUIRE(config.has_value());
        CHECK(config->host == "h");
        CHECK(config->user == "u");
        CHECK(config->secret == "p");
        CHECK(config->port == 22);
        CHECK(config->connect_timeout == std::chrono::seconds{30});
        CHECK(config->command_timeout == std::chrono::seconds{0});
    }

    TEST_CASE("explicit port and timeouts")
    {
        auto const config = rdeploy::config_from_values(rdeploy::parse_env(
            "SSH_HOST=h\nSSH_USER=u\nSSH_PASSWORD=p\nSSH_PORT=2200\nSSH_CONNECT_TIMEOUT=5\nSSH_COMMAND_TIMEOUT=120\n"));
        REQUIRE(config.has_value());
        CHECK(config->port == 2200);
        CHECK(config->connect_timeout == std::chrono::seconds{5});
        CHECK(config->command_timeout == std::chrono::seconds{120});
    }

    TEST_CASE("non-numeric port is rejected")
    {
        auto const config = rdeploy::config_from_values(rdeploy::parse_env("SSH_PORT=twenty-two"));
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().kind == rdeploy::error_kind::config_missing);
        CHECK(config.error().cause.find("SSH_PORT") != std::string::npos);
    }

    TEST_CASE("negative timeout is rejected")
    {
        auto const config = rdeploy::config_from_values(rdeploy::parse_env("SSH_CONNECT_TIMEOUT=-3"));
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().kind == rdeploy::error_kind::config_missing);
    }

    TEST_CASE("zero connect timeout is rejected, zero command timeout means no limit")
    {
        auto const zero_connect = rdeploy::config_from_values(rdeploy::parse_env("SSH_CONNECT_TIMEOUT=0"));
        REQUIRE_FALSE(zero_connect.has_value());
        CHECK(zero_connect.error().kind == rdeploy::error_kind::config_missing);
        CHECK(zero_connect.error().cause.find("SSH_CONNECT_TIMEOUT") != std::string::npos);

        auto const zero_command = rdeploy::config_from_values(rdeploy::parse_env("SSH_COMMAND_TIMEOUT=0"));
        REQUIRE(zero_command.has_value());
        CHECK(zero_command->command_timeout == std::chrono::seconds{0});
    }

    TEST_CASE("missing credentials still produce a config, validate catches them")
    {
        auto const config = rdeploy::config_from_values({});
        REQUIRE(config.has_value());
        CHECK_FALSE(rdeploy::validate(*config).has_value());
    }
}

TEST_SUITE("validate")
{
    TEST_CASE("complete config passes")
    {
        CHECK(rdeploy::validate(valid_config()).has_value());
    }

    TEST_CASE("any empty credential is config_missing")
    {
        auto no_host = valid_config();
        no_host.host.clear();
        auto no_user = valid_config();
        no_user.user.clear();
        auto no_secret = valid_config();
        no_secret.secret.clear();

        for (auto const &config : {no_host, no_user, no_secret})
        {
            auto const valid = rdeploy::validate(config);
            REQUIRE_FALSE(valid.has_value());
            CHECK(valid.error().kind == rdeploy::error_kind::config_missing);
        }
    }

    TEST_CASE("cause names every missing key")
    {
        auto const valid = rdeploy::validate(rdeploy::connection_config{});
        REQUIRE_FALSE(valid.has_value());
        CHECK(valid.error().cause == "SSH_HOST, SSH_USER, SSH_PASSWORD not set");
    }

    TEST_CASE("connect timeout must be positive")
    {
        auto config = valid_config();
        config.connect_timeout = std::chrono::seconds{0};
        auto const valid = rdeploy::validate(config);
        REQUIRE_FALSE(valid.has_value());
        CHECK(valid.error().kind == rdeploy::error_kind::config_missing);
        CHECK(valid.error().cause == "SSH_CONNECT_TIMEOUT must be positive, got 0");
    }

    TEST_CASE("port must be a TCP port")
    {
        auto config = valid_config();
        config.port = 0;
        CHECK_FALSE(rdeploy::validate(config).has_value());
        config.port = 65536;
        CHECK_FALSE(rdeploy::validate(config).has_value());
        config.port = 65535;
        CHECK(rdeploy::validate(config).has_value());
        config.port = 1;
        CHECK(rdeploy::validate(config).has_value());
    }
}

TEST_SUITE("load_connection_config")
{
    TEST_CASE("missing file is config_missing")
    {
        rdeploy::testing::temp_dir const dir;
        auto const config = rdeploy::load_connection_config(dir.path() / ".env");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().kind == rdeploy::error_kind::config_missing);
        CHECK(config.error().cause.find(".env file not found") != std::string::npos);
    }

    TEST_CASE("file with all keys loads and validates")
    {
        rdeploy::testing::temp_dir const dir;
        auto const file = dir.write(".env", "# deploy target\nSSH_HOST=h\nSSH_USER=u\nSSH_PASSWORD=p\nSSH_PORT=22\n");
        auto const config = rdeploy::load_connection_config(file);
        REQUIRE(config.has_value());
        CHECK(config->host == "h");
        CHECK(config->port == 22);
    }

    TEST_CASE("file without password fails validation")
    {
        rdeploy::testing::temp_dir const dir;
        auto const file = dir.write(".env", "SSH_HOST=h\nSSH_USER=u\n");
        auto const config = rdeploy::load_connection_config(file);
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error().kind == rdeploy::error_kind::config_missing);
        CHECK(config.error().cause.find("SSH_PASSWORD") != std::string::npos);
    }
}
