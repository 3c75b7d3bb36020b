/**
 * robosave - Record streaming phase that follows a confirmed handshake.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

#include "robosave/artifact_file.hpp"
#include "robosave/cancellation.hpp"
#include "robosave/events.hpp"
#include "robosave/framing.hpp"
#include "robosave/progress.hpp"
#include "robosave/result.hpp"
#include "robosave/session_config.hpp"
#include "robosave/transport.hpp"

namespace robosave
{

    struct StreamSummary
    {
        std::uint64_t total_written{};
        std::uint64_t records{};
        // Bytes still buffered when the end-of-transfer marker was seen; dropped.
        std::size_t trailing_discarded{};
    };

    class StreamingLoop
    {
    public:
        StreamingLoop(Transport &transport, ArtifactFile &capture, ArtifactFile &output, Notifier &notifier,
                      const CancellationToken &cancellation, const SessionConfig &config);

        static constexpr std::chrono::milliseconds kClosedPollSlice{100};

        // Reads and decodes until the end-of-transfer marker, a cancellation
        // request or an I/O failure. The token is checked once per read.
        // pending holds bytes that arrived together with the backup header.
        Result<StreamSummary> run(std::span<const std::uint8_t> pending = {});

    private:
        // Writes every complete record currently buffered.
        Status drain();
        // Paces polling of a closed peer to one pass per read timeout while
        // still watching the cancellation token.
        void wait_after_close(std::chrono::steady_clock::time_point deadline);

        Transport &transport_;
        ArtifactFile &capture_;
        ArtifactFile &output_;
        Notifier &notifier_;
        const CancellationToken &cancellation_;
        const SessionConfig &config_;
        protocol::RecordStream records_;
        ProgressTracker progress_;
        std::uint64_t record_count_{0};
        bool peer_closed_{false};
    };

} // namespace robosave
