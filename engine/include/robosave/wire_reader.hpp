/**
 * robosave - The two blocking read primitives of a session.
 *
 * read_until serves the handshake: running out of time is a HandshakeTimeout.
 * read_chunk serves the record stream: a timeout or a peer close is an empty
 * chunk and the caller keeps polling. A close is flagged so the caller can
 * pace itself, since a closed socket answers every read at once.
 * Both copy every received byte into the debug capture before returning.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "robosave/artifact_file.hpp"
#include "robosave/protocol.hpp"
#include "robosave/result.hpp"
#include "robosave/transport.hpp"

namespace robosave
{

    inline constexpr std::size_t kHandshakeReadSize = 1024;
    inline constexpr std::size_t kStreamReadSize = 4096;

    // Half-open byte range of a marker inside the received bytes.
    struct MarkerMatch
    {
        std::size_t begin{};
        std::size_t end{};
    };

    using MarkerMatcher = std::function<std::optional<MarkerMatch>(std::span<const std::uint8_t>)>;

    MarkerMatcher literal_marker(std::string_view marker);

    // Appends to received until matcher finds its marker there. Bytes already
    // in received are searched before the first read.
    Result<MarkerMatch> read_until(Transport &transport, ArtifactFile &capture, protocol::Bytes &received,
                                   const MarkerMatcher &matcher, std::string_view awaited,
                                   std::chrono::milliseconds timeout);

    struct StreamChunk
    {
        protocol::Bytes bytes;
        bool peer_closed{false};
    };

    Result<StreamChunk> read_chunk(Transport &transport, ArtifactFile &capture, std::chrono::milliseconds timeout);

} // namespace robosave
