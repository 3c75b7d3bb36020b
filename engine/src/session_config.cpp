#include "robosave/session_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

namespace robosave
{

    namespace
    {

        void read_millis(const nlohmann::json &json, const char *key, std::chrono::milliseconds &target)
        {
            if (json.contains(key))
            {
                target = std::chrono::milliseconds(json.at(key).get<std::int64_t>());
            }
        }

        template <typename T>
        void read_value(const nlohmann::json &json, const char *key, T &target)
        {
            if (json.contains(key))
            {
                target = json.at(key).get<T>();
            }
        }

        // Integer fields are read wide and range-checked; a plain get<T>() would
        // wrap out-of-range values.
        template <typename T>
        void read_bounded(const nlohmann::json &json, const char *key, T &target, std::int64_t min,
                          std::int64_t max = std::numeric_limits<std::int64_t>::max())
        {
            if (!json.contains(key))
            {
                return;
            }
            const auto &value = json.at(key);
            if (!value.is_number_integer())
            {
                throw std::invalid_argument(std::string(key) + " must be an integer");
            }
            const auto wide = value.get<std::int64_t>();
            if (value.is_number_unsigned() && value.get<std::uint64_t>() > static_cast<std::uint64_t>(max))
            {
                throw std::invalid_argument(std::string(key) + " is out of range");
            }
            if (wide < min || wide > max)
            {
                throw std::invalid_argument(std::string(key) + " must be between " + std::to_string(min) + " and " +
                                            std::to_string(max));
            }
            target = static_cast<T>(wide);
        }

    } // namespace

    void SessionConfig::validate() const
    {
        if (host.empty())
        {
            throw std::invalid_argument("host must not be empty");
        }
        if (port == 0)
        {
            throw std::invalid_argument("port must be between 1 and 65535");
        }
        if (base_name.empty())
        {
            throw std::invalid_argument("base name must not be empty");
        }
        if (connect_retries < 1)
        {
            throw std::invalid_argument("connect retries must be at least 1");
        }
        if (retry_delay.count() < 0)
        {
            throw std::invalid_argument("retry delay must not be negative");
        }
        if (progress_interval == 0)
        {
            throw std::invalid_argument("progress interval must be positive");
        }
        if (connect_timeout.count() <= 0 || read_timeout.count() <= 0 || stream_read_timeout.count() <= 0)
        {
            throw std::invalid_argument("timeouts must be positive");
        }
    }

    void to_json(nlohmann::json &json, const SessionConfig &config)
    {
        json = nlohmann::json{
            {"host", config.host},
            {"port", config.port},
            {"username", config.username},
            {"mode", protocol::to_string(config.mode)},
            {"base_name", config.base_name},
            {"output_dir", config.output_dir.generic_string()},
            {"connect_timeout_ms", config.connect_timeout.count()},
            {"read_timeout_ms", config.read_timeout.count()},
            {"stream_read_timeout_ms", config.stream_read_timeout.count()},
            {"connect_retries", config.connect_retries},
            {"retry_delay_ms", config.retry_delay.count()},
            {"progress_interval", config.progress_interval},
        };
    }

    void from_json(const nlohmann::json &json, SessionConfig &config)
    {
        read_value(json, "host", config.host);
        read_bounded(json, "port", config.port, 1, std::numeric_limits<std::uint16_t>::max());
        read_value(json, "username", config.username);
        read_value(json, "base_name", config.base_name);
        if (json.contains("mode"))
        {
            const auto label = json.at("mode").get<std::string>();
            const auto mode = protocol::backup_mode_from_string(label);
            if (!mode)
            {
                throw std::invalid_argument("unknown backup mode: " + label);
            }
            config.mode = *mode;
        }
        if (json.contains("output_dir"))
        {
            config.output_dir = std::filesystem::path(json.at("output_dir").get<std::string>());
        }
        read_millis(json, "connect_timeout_ms", config.connect_timeout);
        read_millis(json, "read_timeout_ms", config.read_timeout);
        if (json.contains("stream_read_timeout_ms"))
        {
            read_millis(json, "stream_read_timeout_ms", config.stream_read_timeout);
        }
        else if (json.contains("read_timeout_ms"))
        {
            config.stream_read_timeout = config.read_timeout;
        }
        read_bounded(json, "connect_retries", config.connect_retries, 1, std::numeric_limits<unsigned>::max());
        read_millis(json, "retry_delay_ms", config.retry_delay);
        read_bounded(json, "progress_interval", config.progress_interval, 1);
    }

    SessionConfig load_session_config(const std::filesystem::path &path)
    {
        std::ifstream input(path);
        if (!input)
        {
            throw std::runtime_error("Unable to open config file " + path.string());
        }
        const auto json = nlohmann::json::parse(input);
        return json.get<SessionConfig>();
    }

} // namespace robosave
