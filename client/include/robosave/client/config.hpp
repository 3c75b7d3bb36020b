#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "robosave/session_config.hpp"

namespace robosave::client
{

    struct ClientConfig
    {
        SessionConfig session;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        bool show_help{false};
        bool show_version{false};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace robosave::client
