#include "robosave/handshake.hpp"

#include <array>
#include <cstddef>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "robosave/protocol.hpp"

namespace robosave
{

    namespace
    {

        struct HandshakeStateMapping
        {
            HandshakeState state;
            std::string_view label;
        };

        constexpr std::array<HandshakeStateMapping, 6> kStateMappings{{
            {HandshakeState::Connected, "connected"},
            {HandshakeState::LoginSent, "login_sent"},
            {HandshakeState::AuxReady, "aux_ready"},
            {HandshakeState::CommandSent, "command_sent"},
            {HandshakeState::HeaderConfirmed, "header_confirmed"},
            {HandshakeState::DeviceBusy, "device_busy"},
        }};

    } // namespace

    std::string_view to_string(HandshakeState state) noexcept
    {
        for (const auto &mapping : kStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    HandshakeSequencer::HandshakeSequencer(Transport &transport, ArtifactFile &capture, Notifier &notifier,
                                           const SessionConfig &config, std::string sanitized_name)
        : transport_(transport),
          capture_(capture),
          notifier_(notifier),
          config_(config),
          sanitized_name_(std::move(sanitized_name))
    {
    }

    Status HandshakeSequencer::run()
    {
        for (auto step : {&HandshakeSequencer::login, &HandshakeSequencer::await_aux_ready,
                          &HandshakeSequencer::issue_save, &HandshakeSequencer::acknowledge_header})
        {
            auto status = (this->*step)();
            if (!status)
            {
                spdlog::debug("Handshake stopped in state {}", to_string(state_));
                return status;
            }
        }
        return success();
    }

    Status HandshakeSequencer::send(std::span<const std::uint8_t> bytes, std::string_view what)
    {
        const auto ec = transport_.write_all(bytes);
        if (ec)
        {
            return make_failure(ErrorCode::TransportFailure, "sending " + std::string(what) + " failed", ec);
        }
        return success();
    }

    Result<MarkerMatch> HandshakeSequencer::await(const MarkerMatcher &matcher, std::string_view awaited)
    {
        auto match = read_until(transport_, capture_, received_, matcher, awaited, config_.read_timeout);
        if (match)
        {
            received_.erase(received_.begin(), received_.begin() + static_cast<std::ptrdiff_t>(match.value().end));
        }
        return match;
    }

    Status HandshakeSequencer::login()
    {
        notifier_.status("Sending login credentials...");
        auto sent = send(protocol::build_login(config_.username), "login");
        if (!sent)
        {
            return sent;
        }
        state_ = HandshakeState::LoginSent;

        auto prompt = await(literal_marker(protocol::kLoginPrompt), "login prompt");
        if (!prompt)
        {
            return prompt.take_failure();
        }
        return success();
    }

    Status HandshakeSequencer::await_aux_ready()
    {
        notifier_.status("Waiting for AUX prompt...");
        auto ready = await(
            [](std::span<const std::uint8_t> bytes) -> std::optional<MarkerMatch>
            {
                const auto found = protocol::find_aux_ready(bytes);
                if (!found)
                {
                    return std::nullopt;
                }
                return MarkerMatch{.begin = *found, .end = *found + protocol::kAuxReadyPrefix.size() + 1};
            },
            "AUX prompt");
        if (!ready)
        {
            return ready.take_failure();
        }
        state_ = HandshakeState::AuxReady;
        return success();
    }

    Status HandshakeSequencer::issue_save()
    {
        notifier_.status("Issuing SAVE command: " + protocol::save_command_text(config_.mode, sanitized_name_));
        auto sent = send(protocol::build_save_command(config_.mode, sanitized_name_), "SAVE command");
        if (!sent)
        {
            return sent;
        }
        state_ = HandshakeState::CommandSent;

        notifier_.status("Waiting for header or in-progress message...");
        const auto header = protocol::build_header_marker(sanitized_name_);
        const std::string header_text(header.begin(), header.end());
        const auto busy_matcher = literal_marker(protocol::kDeviceBusy);
        const auto header_matcher = literal_marker(header_text);

        // Whichever marker starts first decides the outcome.
        bool busy_first = false;
        auto reply = await(
            [&](std::span<const std::uint8_t> bytes) -> std::optional<MarkerMatch>
            {
                const auto busy = busy_matcher(bytes);
                const auto confirmed = header_matcher(bytes);
                busy_first = busy && (!confirmed || busy->begin < confirmed->begin);
                return busy_first ? busy : confirmed;
            },
            "backup header");
        if (!reply)
        {
            return reply.take_failure();
        }

        if (busy_first)
        {
            state_ = HandshakeState::DeviceBusy;
            notifier_.status("Another backup in progress; aborting.");
            return make_failure(ErrorCode::DeviceBusy, "controller reports SAVE/LOAD in progress");
        }
        state_ = HandshakeState::HeaderConfirmed;
        return success();
    }

    Status HandshakeSequencer::acknowledge_header()
    {
        notifier_.status("Handshake: ACK + secondary header...");
        const std::array<std::uint8_t, 1> ack{protocol::kAck};
        auto acked = send(ack, "ACK");
        if (!acked)
        {
            return acked;
        }
        std::this_thread::sleep_for(kAckSettleDelay);
        return send(protocol::to_bytes(protocol::kSecondaryHeader), "secondary header");
    }

} // namespace robosave
