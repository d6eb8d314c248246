#pragma once

// executor.hpp - run one remote command and turn its output into printable text

#include "rdeploy/common.hpp"
#include "rdeploy/ssh_session.hpp"

#include <span>
#include <string>
#include <string_view>

namespace rdeploy
{

    // the command is handed to the remote shell as-is, no quoting is added
    [[nodiscard]] auto execute(ssh::session &session, std::string_view command) -> result<ssh::command_result>;

    // tokens joined with single spaces: {"ls", "-la", "/tmp"} -> "ls -la /tmp"
    [[nodiscard]] auto join_command(std::span<std::string const> parts) -> std::string;

    // =============================================================================
    // permissive decoding
    // =============================================================================

    // each maximal invalid UTF-8 subsequence becomes U+FFFD
    [[nodiscard]] auto decode_lossy_utf8(std::string_view bytes) -> std::string;

    // each non-ASCII code point and each invalid subsequence becomes '?'
    [[nodiscard]] auto to_ascii_lossy(std::string_view bytes) -> std::string;

    // captured stream bytes as written to the local console: decode_lossy_utf8, then to_ascii_lossy
    [[nodiscard]] auto printable_output(std::string_view bytes) -> std::string;

    // remote exit code on success, 1 on any error
    [[nodiscard]] auto exit_code_for(result<ssh::command_result> const &outcome) noexcept -> int;

} // namespace rdeploy
