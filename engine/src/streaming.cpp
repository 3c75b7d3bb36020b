#include "robosave/streaming.hpp"

#include <algorithm>
#include <thread>

#include <spdlog/spdlog.h>

#include "robosave/wire_reader.hpp"

namespace robosave
{

    StreamingLoop::StreamingLoop(Transport &transport, ArtifactFile &capture, ArtifactFile &output, Notifier &notifier,
                                 const CancellationToken &cancellation, const SessionConfig &config)
        : transport_(transport),
          capture_(capture),
          output_(output),
          notifier_(notifier),
          cancellation_(cancellation),
          config_(config),
          progress_(config.progress_interval)
    {
    }

    Result<StreamSummary> StreamingLoop::run(std::span<const std::uint8_t> pending)
    {
        notifier_.status("Receiving data records...");
        if (!pending.empty())
        {
            spdlog::debug("{} bytes arrived with the header; decoding them first", pending.size());
            records_.append(pending);
        }
        for (;;)
        {
            if (cancellation_.requested())
            {
                notifier_.status("Backup cancellation requested.");
                return make_failure(ErrorCode::CancelledByUser, "backup cancelled by user");
            }

            const auto read_started = std::chrono::steady_clock::now();
            auto chunk = read_chunk(transport_, capture_, config_.stream_read_timeout);
            if (!chunk)
            {
                return chunk.take_failure();
            }
            if (!chunk.value().bytes.empty())
            {
                records_.append(chunk.value().bytes);
            }

            auto drained = drain();
            if (!drained)
            {
                return drained.take_failure();
            }

            if (records_.end_of_transfer())
            {
                StreamSummary summary{
                    .total_written = progress_.total_written(),
                    .records = record_count_,
                    .trailing_discarded = records_.discard(),
                };
                if (summary.trailing_discarded > 0)
                {
                    spdlog::debug("Discarding {} bytes left after the end-of-transfer marker",
                                  summary.trailing_discarded);
                }
                spdlog::info("Transfer finished: {} records, {} bytes", summary.records, summary.total_written);
                return summary;
            }

            if (chunk.value().peer_closed)
            {
                wait_after_close(read_started + config_.stream_read_timeout);
            }
        }
    }

    void StreamingLoop::wait_after_close(std::chrono::steady_clock::time_point deadline)
    {
        if (!peer_closed_)
        {
            peer_closed_ = true;
            spdlog::warn("Peer closed the stream before the end-of-transfer marker; polling until cancelled");
        }
        while (!cancellation_.requested())
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                return;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kClosedPollSlice, deadline - now));
        }
    }

    Status StreamingLoop::drain()
    {
        while (auto payload = records_.next_record())
        {
            auto written = output_.write(*payload);
            if (!written)
            {
                return written;
            }
            ++record_count_;
            for (const auto boundary : progress_.advance(payload->size()))
            {
                notifier_.progress(boundary);
            }
        }
        return success();
    }

} // namespace robosave
