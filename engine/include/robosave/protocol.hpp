/**
 * robosave - Wire constants and command builders for the controller's
 * telnet-style save protocol.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace robosave::protocol
{

    using Bytes = std::vector<std::uint8_t>;

    enum class BackupMode : std::uint8_t
    {
        Program,
        Full
    };

    std::string_view to_string(BackupMode mode) noexcept;
    std::optional<BackupMode> backup_mode_from_string(std::string_view value) noexcept;

    inline constexpr std::string_view kLineEnding{"\r\n"};
    inline constexpr std::string_view kLoginPrompt{"login:"};
    // "AUX" followed by a single decimal digit.
    inline constexpr std::string_view kAuxReadyPrefix{"AUX"};
    inline constexpr std::string_view kDeviceBusy{"SAVE/LOAD in progress"};
    inline constexpr std::string_view kHeaderPrefix{"\x05\x02" "B"};
    inline constexpr std::string_view kRecordStart{"\x05\x02" "D"};
    inline constexpr std::uint8_t kRecordEscape{0x17};
    inline constexpr std::string_view kEndOfTransfer{"\x05\x02" "E\x17"};
    inline constexpr std::uint8_t kAck{0x06};
    inline constexpr std::string_view kSecondaryHeader{"\x02" "B    0\x17"};
    inline constexpr std::uint8_t kHeaderTerminator{0x17};
    inline constexpr std::string_view kOutputExtension{"as"};

    Bytes to_bytes(std::string_view text);

    Bytes build_login(std::string_view username);

    // Command text without the trailing line ending, e.g. "SAVE/Full cell1".
    std::string save_command_text(BackupMode mode, std::string_view sanitized_name);

    Bytes build_save_command(BackupMode mode, std::string_view sanitized_name);

    Bytes build_header_marker(std::string_view sanitized_name);

    // Offset of the first occurrence of needle, if any.
    std::optional<std::size_t> find_marker(std::span<const std::uint8_t> haystack, std::string_view needle);

    std::optional<std::size_t> find_aux_ready(std::span<const std::uint8_t> haystack);

} // namespace robosave::protocol
