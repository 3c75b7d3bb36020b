#include "robosave/connection.hpp"

#include <string>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace robosave
{

    namespace
    {

        std::string format_seconds(std::chrono::milliseconds delay)
        {
            std::ostringstream oss;
            oss << std::chrono::duration<double>(delay).count();
            return oss.str();
        }

    } // namespace

    ConnectionManager::ConnectionManager(std::unique_ptr<Transport> transport, const SessionConfig &config,
                                         Notifier &notifier)
        : transport_(std::move(transport)),
          config_(config),
          notifier_(notifier)
    {
        if (!transport_)
        {
            throw std::invalid_argument("ConnectionManager requires a transport");
        }
    }

    ConnectionManager::~ConnectionManager()
    {
        release();
    }

    Status ConnectionManager::connect()
    {
        std::error_code last_error;
        for (unsigned attempt = 1; attempt <= config_.connect_retries; ++attempt)
        {
            notifier_.status("Connecting to " + config_.host + ":" + std::to_string(config_.port) + " (attempt " +
                             std::to_string(attempt) + ")...");
            last_error = transport_->connect(config_.host, config_.port, config_.connect_timeout);
            if (!last_error)
            {
                spdlog::info("Connected to {}:{} on attempt {}", config_.host, config_.port, attempt);
                return success();
            }

            spdlog::warn("Connect attempt {} to {}:{} failed: {}", attempt, config_.host, config_.port,
                         last_error.message());
            if (attempt < config_.connect_retries)
            {
                notifier_.status("Connect failed, retrying in " + format_seconds(config_.retry_delay) + "s...");
                std::this_thread::sleep_for(config_.retry_delay);
            }
        }
        return make_failure(ErrorCode::ConnectFailure,
                            "unable to connect to " + config_.host + ":" + std::to_string(config_.port) + " after " +
                                std::to_string(config_.connect_retries) + " attempt(s)",
                            last_error);
    }

    void ConnectionManager::release() noexcept
    {
        if (transport_ && transport_->is_open())
        {
            transport_->shutdown();
            spdlog::debug("Transport released");
        }
    }

} // namespace robosave
