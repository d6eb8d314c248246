// executor.cpp - remote command execution and output decoding

#include "rdeploy/executor.hpp"

#include <cstdint>

namespace rdeploy
{

    namespace
    {

        struct utf8_step
        {
            std::size_t length{1};
            bool valid{false};
        };

        [[nodiscard]] constexpr auto in_range(std::uint8_t const b, std::uint8_t const lo, std::uint8_t const hi) noexcept
            -> bool
        {
            return b >= lo && b <= hi;
        }

        // length of the sequence at pos; when invalid, length covers the maximal invalid subpart
        [[nodiscard]] auto next_sequence(std::string_view bytes, std::size_t pos) noexcept -> utf8_step
        {
            auto const at = [&](std::size_t i) { return static_cast<std::uint8_t>(bytes[i]); };
            auto const lead = at(pos);

            if (lead < 0x80)
            {
                return {1, true};
            }

            std::size_t needed = 0;
            std::uint8_t second_lo = 0x80;
            std::uint8_t second_hi = 0xBF;

            if (in_range(lead, 0xC2, 0xDF))
            {
                needed = 1;
            }
            else if (lead == 0xE0)
            {
                needed = 2;
                second_lo = 0xA0;
            }
            else if (lead == 0xED)
            {
                needed = 2;
                second_hi = 0x9F; // no surrogates
            }
            else if (in_range(lead, 0xE1, 0xEF))
            {
                needed = 2;
            }
            else if (lead == 0xF0)
            {
                needed = 3;
                second_lo = 0x90;
            }
            else if (lead == 0xF4)
            {
                needed = 3;
                second_hi = 0x8F; // nothing above U+10FFFF
            }
            else if (in_range(lead, 0xF1, 0xF3))
            {
                needed = 3;
            }
            else
            {
                return {1, false};
            }

            for (std::size_t i = 1; i <= needed; ++i)
            {
                if (pos + i >= bytes.size())
                {
                    return {i, false};
                }
                auto const lo = (i == 1) ? second_lo : std::uint8_t{0x80};
                auto const hi = (i == 1) ? second_hi : std::uint8_t{0xBF};
                if (!in_range(at(pos + i), lo, hi))
                {
                    return {i, false};
                }
            }

            return {needed + 1, true};
        }

        template <typename OnValid, typename OnInvalid>
        void walk_utf8(std::string_view bytes, OnValid on_valid, OnInvalid on_invalid)
        {
            std::size_t pos = 0;
            while (pos < bytes.size())
            {
                auto const step = next_sequence(bytes, pos);
                if (step.valid)
                {
                    on_valid(bytes.substr(pos, step.length));
                }
                else
                {
                    on_invalid();
                }
                pos += step.length;
            }
        }

        constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

    } // namespace

    auto execute(ssh::session &session, std::string_view command) -> result<ssh::command_result>
    {
        return session.run(command);
    }

    auto join_command(std::span<std::string const> parts) -> std::string
    {
        std::string joined;
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0)
            {
                joined += ' ';
            }
            joined += parts[i];
        }
        return joined;
    }

    auto decode_lossy_utf8(std::string_view bytes) -> std::string
    {
        std::string text;
        text.reserve(bytes.size());
        walk_utf8(
            bytes, [&text](std::string_view seq) { text.append(seq); },
            [&text] { text.append(replacement_character); });
        return text;
    }

    auto to_ascii_lossy(std::string_view bytes) -> std::string
    {
        std::string text;
        text.reserve(bytes.size());
        walk_utf8(
            bytes, [&text](std::string_view seq) { text += (seq.size() == 1) ? seq.front() : '?'; },
            [&text] { text += '?'; });
        return text;
    }

    auto printable_output(std::string_view bytes) -> std::string
    {
        return to_ascii_lossy(decode_lossy_utf8(bytes));
    }

    auto exit_code_for(result<ssh::command_result> const &outcome) noexcept -> int
    {
        if (!outcome.has_value())
        {
            return exit_code_for(outcome.error());
        }
        return outcome->exit_code;
    }

} // namespace rdeploy
