#include "robosave/protocol.hpp"

#include <algorithm>
#include <array>

namespace robosave::protocol
{

    namespace
    {

        struct BackupModeMapping
        {
            BackupMode mode;
            std::string_view label;
        };

        constexpr std::array<BackupModeMapping, 2> kBackupModeMappings{{
            {BackupMode::Program, "program"},
            {BackupMode::Full, "full"},
        }};

        void append(Bytes &target, std::string_view text)
        {
            target.insert(target.end(), text.begin(), text.end());
        }

    } // namespace

    std::string_view to_string(BackupMode mode) noexcept
    {
        for (const auto &mapping : kBackupModeMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<BackupMode> backup_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kBackupModeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        return std::nullopt;
    }

    Bytes to_bytes(std::string_view text)
    {
        return Bytes(text.begin(), text.end());
    }

    Bytes build_login(std::string_view username)
    {
        Bytes bytes;
        bytes.reserve(username.size() + kLineEnding.size());
        append(bytes, username);
        append(bytes, kLineEnding);
        return bytes;
    }

    std::string save_command_text(BackupMode mode, std::string_view sanitized_name)
    {
        std::string text = mode == BackupMode::Full ? "SAVE/Full" : "SAVE";
        text += ' ';
        text += sanitized_name;
        return text;
    }

    Bytes build_save_command(BackupMode mode, std::string_view sanitized_name)
    {
        auto bytes = to_bytes(save_command_text(mode, sanitized_name));
        append(bytes, kLineEnding);
        return bytes;
    }

    Bytes build_header_marker(std::string_view sanitized_name)
    {
        Bytes bytes;
        append(bytes, kHeaderPrefix);
        append(bytes, sanitized_name);
        bytes.push_back(static_cast<std::uint8_t>('.'));
        append(bytes, kOutputExtension);
        bytes.push_back(kHeaderTerminator);
        return bytes;
    }

    std::optional<std::size_t> find_marker(std::span<const std::uint8_t> haystack, std::string_view needle)
    {
        if (needle.empty() || haystack.size() < needle.size())
        {
            return std::nullopt;
        }
        const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                    [](std::uint8_t lhs, char rhs)
                                    { return lhs == static_cast<std::uint8_t>(rhs); });
        if (it == haystack.end())
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - haystack.begin());
    }

    std::optional<std::size_t> find_aux_ready(std::span<const std::uint8_t> haystack)
    {
        std::size_t offset = 0;
        while (offset < haystack.size())
        {
            const auto found = find_marker(haystack.subspan(offset), kAuxReadyPrefix);
            if (!found)
            {
                return std::nullopt;
            }
            const auto position = offset + *found;
            const auto digit_index = position + kAuxReadyPrefix.size();
            if (digit_index < haystack.size() && haystack[digit_index] >= '0' && haystack[digit_index] <= '9')
            {
                return position;
            }
            offset = position + 1;
        }
        return std::nullopt;
    }

} // namespace robosave::protocol
