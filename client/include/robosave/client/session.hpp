#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "robosave/backup_engine.hpp"
#include "robosave/client/config.hpp"
#include "robosave/client/logger.hpp"
#include "robosave/events.hpp"

namespace robosave::client
{

    // Prints engine notifications for an interactive terminal.
    class ConsoleEventSink final : public EventSink
    {
    public:
        explicit ConsoleEventSink(Logger &logger);

        void on_status(const std::string &text) override;
        void on_progress(std::uint64_t bytes_written) override;
        void on_error(const Failure &failure) override;
        void on_complete(const std::filesystem::path &output_path,
                         const std::filesystem::path &debug_path) override;

    private:
        Logger &logger_;
    };

    class ClientSession
    {
    public:
        static constexpr int kExitCancelled = 130;

        ClientSession(ClientConfig config, Logger logger);

        // Runs one backup; SIGINT/SIGTERM request cancellation. Returns the
        // process exit code.
        int run();

    private:
        ClientConfig config_;
        Logger logger_;
        ConsoleEventSink sink_;
    };

} // namespace robosave::client
