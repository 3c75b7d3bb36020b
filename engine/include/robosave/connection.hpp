/**
 * robosave - Transport ownership and bounded-retry connection setup.
 */
#pragma once

#include <memory>

#include "robosave/events.hpp"
#include "robosave/result.hpp"
#include "robosave/session_config.hpp"
#include "robosave/transport.hpp"

namespace robosave
{

    class ConnectionManager
    {
    public:
        ConnectionManager(std::unique_ptr<Transport> transport, const SessionConfig &config, Notifier &notifier);
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        // Tries up to connect_retries times, sleeping retry_delay between
        // failed attempts. Fails with ConnectFailure carrying the last error.
        Status connect();

        Transport &transport() noexcept { return *transport_; }

        // Shuts the transport down and closes it.
        void release() noexcept;

    private:
        std::unique_ptr<Transport> transport_;
        const SessionConfig &config_;
        Notifier &notifier_;
    };

} // namespace robosave
