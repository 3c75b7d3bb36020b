#include "robosave/wire_reader.hpp"

#include <array>
#include <string>

#include <spdlog/spdlog.h>

namespace robosave
{

    MarkerMatcher literal_marker(std::string_view marker)
    {
        return [needle = std::string(marker)](std::span<const std::uint8_t> bytes) -> std::optional<MarkerMatch>
        {
            const auto found = protocol::find_marker(bytes, needle);
            if (!found)
            {
                return std::nullopt;
            }
            return MarkerMatch{.begin = *found, .end = *found + needle.size()};
        };
    }

    Result<MarkerMatch> read_until(Transport &transport, ArtifactFile &capture, protocol::Bytes &received,
                                   const MarkerMatcher &matcher, std::string_view awaited,
                                   std::chrono::milliseconds timeout)
    {
        using Clock = std::chrono::steady_clock;
        const auto deadline = Clock::now() + timeout;
        std::array<std::uint8_t, kHandshakeReadSize> chunk{};

        for (;;)
        {
            if (auto match = matcher(received))
            {
                spdlog::debug("Found {} at offset {} of {} bytes", awaited, match->begin, received.size());
                return *match;
            }

            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining.count() <= 0)
            {
                return make_failure(ErrorCode::HandshakeTimeout, "timed out waiting for " + std::string(awaited));
            }

            const auto result = transport.read_some(chunk, remaining);
            switch (result.status)
            {
            case ReadStatus::Data:
            {
                const std::span<const std::uint8_t> data(chunk.data(), result.bytes);
                auto captured = capture.write(data);
                if (!captured)
                {
                    return captured.take_failure();
                }
                received.insert(received.end(), data.begin(), data.end());
                break;
            }
            case ReadStatus::Timeout:
                return make_failure(ErrorCode::HandshakeTimeout, "timed out waiting for " + std::string(awaited));
            case ReadStatus::Closed:
                return make_failure(ErrorCode::TransportFailure,
                                    "connection closed while waiting for " + std::string(awaited));
            case ReadStatus::Failed:
                return make_failure(ErrorCode::TransportFailure, "read failed while waiting for " + std::string(awaited),
                                    result.error);
            }
        }
    }

    Result<StreamChunk> read_chunk(Transport &transport, ArtifactFile &capture, std::chrono::milliseconds timeout)
    {
        std::array<std::uint8_t, kStreamReadSize> chunk{};
        const auto result = transport.read_some(chunk, timeout);
        switch (result.status)
        {
        case ReadStatus::Data:
            break;
        case ReadStatus::Timeout:
            return StreamChunk{};
        case ReadStatus::Closed:
            return StreamChunk{.peer_closed = true};
        case ReadStatus::Failed:
            return make_failure(ErrorCode::TransportFailure, "read failed while streaming records", result.error);
        }

        const std::span<const std::uint8_t> data(chunk.data(), result.bytes);
        auto captured = capture.write(data);
        if (!captured)
        {
            return captured.take_failure();
        }
        return StreamChunk{.bytes = protocol::Bytes(data.begin(), data.end())};
    }

} // namespace robosave
