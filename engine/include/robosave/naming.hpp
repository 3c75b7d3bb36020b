/**
 * robosave - File naming for backup artifacts.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace robosave
{

    // Replaces every character outside [A-Za-z0-9_.-] with '_'.
    std::string sanitize_base_name(std::string_view base_name);

    // <dir>/<sanitized>.as; the extension does not depend on the backup mode.
    std::filesystem::path output_path_for(const std::filesystem::path &dir, std::string_view sanitized_name);

    // <dir>/debug_<sanitized>_<YYYYMMDD_HHMMSS>.log in local time.
    std::filesystem::path debug_path_for(const std::filesystem::path &dir, std::string_view sanitized_name,
                                         std::chrono::system_clock::time_point when);

    std::string format_timestamp(std::chrono::system_clock::time_point when);

} // namespace robosave
