/**
 * robosave - Login and SAVE handshake.
 *
 *   Connected -> LoginSent -> AuxReady -> CommandSent -> HeaderConfirmed
 *                                                     \-> DeviceBusy
 *
 * Every wait gets the read timeout as its own absolute deadline; missing it is
 * fatal for the session.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "robosave/artifact_file.hpp"
#include "robosave/events.hpp"
#include "robosave/result.hpp"
#include "robosave/session_config.hpp"
#include "robosave/transport.hpp"
#include "robosave/wire_reader.hpp"

namespace robosave
{

    enum class HandshakeState : std::uint8_t
    {
        Connected,
        LoginSent,
        AuxReady,
        CommandSent,
        HeaderConfirmed,
        DeviceBusy
    };

    std::string_view to_string(HandshakeState state) noexcept;

    class HandshakeSequencer
    {
    public:
        static constexpr std::chrono::milliseconds kAckSettleDelay{50};

        HandshakeSequencer(Transport &transport, ArtifactFile &capture, Notifier &notifier, const SessionConfig &config,
                           std::string sanitized_name);

        // Runs the whole sequence; on success the device is about to stream records.
        Status run();

        HandshakeState state() const noexcept { return state_; }
        // Bytes received after the backup header; they belong to the record stream.
        const protocol::Bytes &pending() const noexcept { return received_; }

    private:
        Status send(std::span<const std::uint8_t> bytes, std::string_view what);
        // Waits for a marker and drops everything up to its end; later bytes
        // stay buffered for the next wait.
        Result<MarkerMatch> await(const MarkerMatcher &matcher, std::string_view awaited);
        Status login();
        Status await_aux_ready();
        Status issue_save();
        Status acknowledge_header();

        Transport &transport_;
        ArtifactFile &capture_;
        Notifier &notifier_;
        const SessionConfig &config_;
        std::string sanitized_name_;
        protocol::Bytes received_;
        HandshakeState state_{HandshakeState::Connected};
    };

} // namespace robosave
