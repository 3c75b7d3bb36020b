#include "robosave/client/config.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace robosave::client
{

    namespace
    {

        std::string require_value(const std::vector<std::string> &args, std::size_t &index, const std::string &flag)
        {
            if (index >= args.size())
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return args[index++];
        }

        std::chrono::milliseconds parse_seconds(const std::string &value, const std::string &flag)
        {
            double seconds = 0;
            try
            {
                seconds = std::stod(value);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a number of seconds, got '" + value + "'");
            }
            if (!std::isfinite(seconds) || seconds < 0)
            {
                throw std::runtime_error(flag + " expects a non-negative number of seconds");
            }
            return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        }

        // Whole-string integer parse; the flag or field name goes into the error.
        long long parse_integer(const std::string &value, const std::string &what)
        {
            std::size_t consumed = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(what + " expects an integer, got '" + value + "'");
            }
            if (consumed != value.size())
            {
                throw std::runtime_error(what + " expects an integer, got '" + value + "'");
            }
            return parsed;
        }

        void apply_endpoint(const std::string &endpoint, SessionConfig &session)
        {
            const auto colon_pos = endpoint.rfind(':');
            if (colon_pos == std::string::npos)
            {
                session.host = endpoint;
                return;
            }
            session.host = endpoint.substr(0, colon_pos);
            const auto port = parse_integer(endpoint.substr(colon_pos + 1), "Port");
            if (port <= 0 || port > 65535)
            {
                throw std::runtime_error("Port out of range: " + endpoint.substr(colon_pos + 1));
            }
            session.port = static_cast<std::uint16_t>(port);
        }

    } // namespace

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " <host>[:port] <name> [--user <name>] [--full] [--retries <n>] [--retry-delay <seconds>]\n"
               "       [--interval <bytes>] [--connect-timeout <seconds>] [--read-timeout <seconds>]\n"
               "       [--output-dir <dir>] [--config <file.json>] [--log <file>] [--verbose] [--version]\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        const std::vector<std::string> args(argv + 1, argv + argc);
        ClientConfig config;

        // --config supplies the baseline; every other flag overrides it.
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--config")
            {
                if (i + 1 >= args.size())
                {
                    throw std::runtime_error("--config requires a file path");
                }
                config.session = load_session_config(args[i + 1]);
            }
        }

        std::vector<std::string> positional;
        std::size_t index = 0;
        while (index < args.size())
        {
            const std::string arg = args[index++];
            if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
            }
            else if (arg == "--config")
            {
                ++index;
            }
            else if (arg == "--user")
            {
                config.session.username = require_value(args, index, arg);
            }
            else if (arg == "--full")
            {
                config.session.mode = protocol::BackupMode::Full;
            }
            else if (arg == "--retries")
            {
                const auto retries = parse_integer(require_value(args, index, arg), arg);
                if (retries < 1 || retries > std::numeric_limits<int>::max())
                {
                    throw std::runtime_error("--retries must be between 1 and " +
                                             std::to_string(std::numeric_limits<int>::max()));
                }
                config.session.connect_retries = static_cast<unsigned>(retries);
            }
            else if (arg == "--retry-delay")
            {
                config.session.retry_delay = parse_seconds(require_value(args, index, arg), arg);
            }
            else if (arg == "--interval")
            {
                const auto interval = parse_integer(require_value(args, index, arg), arg);
                if (interval < 1)
                {
                    throw std::runtime_error("--interval must be a positive number of bytes");
                }
                config.session.progress_interval = static_cast<std::uint64_t>(interval);
            }
            else if (arg == "--connect-timeout")
            {
                config.session.connect_timeout = parse_seconds(require_value(args, index, arg), arg);
            }
            else if (arg == "--read-timeout")
            {
                config.session.read_timeout = parse_seconds(require_value(args, index, arg), arg);
                config.session.stream_read_timeout = config.session.read_timeout;
            }
            else if (arg == "--output-dir")
            {
                config.session.output_dir = std::filesystem::path(require_value(args, index, arg));
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(args, index, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (config.show_help || config.show_version)
        {
            return config;
        }
        if (positional.size() > 2)
        {
            throw std::runtime_error("Unexpected argument: " + positional[2]);
        }
        if (!positional.empty())
        {
            apply_endpoint(positional[0], config.session);
        }
        if (positional.size() > 1)
        {
            config.session.base_name = positional[1];
        }
        if (config.session.host.empty() || config.session.base_name.empty())
        {
            throw std::runtime_error("Expected <host>[:port] and <name>");
        }
        return config;
    }

} // namespace robosave::client
