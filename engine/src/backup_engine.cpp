#include "robosave/backup_engine.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

#include "robosave/artifact_file.hpp"
#include "robosave/connection.hpp"
#include "robosave/handshake.hpp"
#include "robosave/naming.hpp"
#include "robosave/streaming.hpp"

namespace robosave
{

    namespace
    {

        TransportFactory default_transport_factory(TransportFactory factory)
        {
            if (factory)
            {
                return factory;
            }
            return []
            { return std::make_unique<AsioTransport>(); };
        }

    } // namespace

    BackupEngine::BackupEngine(SessionConfig config, TransportFactory transport_factory)
        : BackupEngine(std::move(config), null_sink_, std::move(transport_factory))
    {
    }

    BackupEngine::BackupEngine(SessionConfig config, EventSink &sink, TransportFactory transport_factory)
        : config_(std::move(config)),
          sink_(sink),
          transport_factory_(default_transport_factory(std::move(transport_factory)))
    {
        config_.validate();
    }

    BackupArtifacts BackupEngine::run()
    {
        auto outcome = try_run();
        if (!outcome)
        {
            throw BackupError(outcome.take_failure());
        }
        return std::move(outcome.value());
    }

    Result<BackupArtifacts> BackupEngine::try_run()
    {
        Notifier notifier(sink_);
        auto outcome = execute(notifier);
        if (!outcome)
        {
            notifier.error(outcome.failure());
        }
        return outcome;
    }

    void BackupEngine::cancel() noexcept
    {
        cancellation_.request();
    }

    Result<BackupArtifacts> BackupEngine::execute(Notifier &notifier)
    {
        try
        {
            return run_session(notifier);
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            return make_failure(ErrorCode::OutputWriteFailure, ex.what(), ex.code());
        }
        catch (const std::exception &ex)
        {
            return make_failure(ErrorCode::InternalError, ex.what());
        }
    }

    Result<BackupArtifacts> BackupEngine::run_session(Notifier &notifier)
    {
        const auto sanitized = sanitize_base_name(config_.base_name);
        BackupArtifacts artifacts{
            .output_path = output_path_for(config_.output_dir, sanitized),
            .debug_path = debug_path_for(config_.output_dir, sanitized, std::chrono::system_clock::now()),
        };
        spdlog::info("Starting {} backup of {}:{} as {}", protocol::to_string(config_.mode), config_.host, config_.port,
                     artifacts.output_path.string());

        ConnectionManager connection(transport_factory_(), config_, notifier);
        auto connected = connection.connect();
        if (!connected)
        {
            return connected.take_failure();
        }
        notifier.status("Connected. Waiting for login prompt...");

        if (!config_.output_dir.empty())
        {
            std::filesystem::create_directories(config_.output_dir);
        }
        ArtifactFile output;
        ArtifactFile capture;
        for (auto *file : {&output, &capture})
        {
            auto opened = file->open(file == &output ? artifacts.output_path : artifacts.debug_path);
            if (!opened)
            {
                return opened.take_failure();
            }
        }

        HandshakeSequencer handshake(connection.transport(), capture, notifier, config_, sanitized);
        auto handshaken = handshake.run();
        if (!handshaken)
        {
            return handshaken.take_failure();
        }

        StreamingLoop stream(connection.transport(), capture, output, notifier, cancellation_, config_);
        auto streamed = stream.run(handshake.pending());
        if (!streamed)
        {
            return streamed.take_failure();
        }
        artifacts.bytes_written = streamed.value().total_written;
        artifacts.records = streamed.value().records;

        for (auto *file : {&output, &capture})
        {
            auto closed = file->close();
            if (!closed)
            {
                return closed.take_failure();
            }
        }
        connection.release();

        notifier.status("Backup complete.");
        notifier.complete(artifacts.output_path, artifacts.debug_path);
        return artifacts;
    }

} // namespace robosave
