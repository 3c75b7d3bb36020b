/**
 * robosave - Backup session driver: connect, handshake, stream, clean up.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

#include "robosave/cancellation.hpp"
#include "robosave/events.hpp"
#include "robosave/result.hpp"
#include "robosave/session_config.hpp"
#include "robosave/transport.hpp"

namespace robosave
{

    struct BackupArtifacts
    {
        std::filesystem::path output_path;
        std::filesystem::path debug_path;
        std::uint64_t bytes_written{};
        std::uint64_t records{};
    };

    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    // One engine drives one session at a time. Calling run() again while a run
    // is in progress, from any thread, is undefined; only cancel() may be
    // called concurrently.
    class BackupEngine
    {
    public:
        // Throws std::invalid_argument when the configuration is unusable.
        explicit BackupEngine(SessionConfig config, TransportFactory transport_factory = {});
        BackupEngine(SessionConfig config, EventSink &sink, TransportFactory transport_factory = {});

        BackupEngine(const BackupEngine &) = delete;
        BackupEngine &operator=(const BackupEngine &) = delete;

        // Reports a failure through on_error and then throws it as BackupError.
        BackupArtifacts run();

        // Same session, with the failure returned instead of thrown.
        Result<BackupArtifacts> try_run();

        void cancel() noexcept;

    private:
        Result<BackupArtifacts> execute(Notifier &notifier);
        Result<BackupArtifacts> run_session(Notifier &notifier);

        const SessionConfig config_;
        NullEventSink null_sink_;
        EventSink &sink_;
        TransportFactory transport_factory_;
        CancellationToken cancellation_;
    };

} // namespace robosave
