/**
 * robosave - Blocking, deadline-bounded byte transport used by the engine.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

namespace robosave
{

    enum class ReadStatus : std::uint8_t
    {
        Data,
        Timeout,
        Closed,
        Failed
    };

    struct ReadResult
    {
        ReadStatus status{ReadStatus::Timeout};
        std::size_t bytes{};
        std::error_code error{};
    };

    // Contract: each call blocks for at most the given timeout. A read that
    // returns Timeout waited for the whole timeout without receiving a byte;
    // Closed means the peer finished the stream.
    class Transport
    {
    public:
        virtual ~Transport() = default;

        // On success the baseline timeout becomes the deadline for write_all.
        virtual std::error_code connect(const std::string &host, std::uint16_t port,
                                        std::chrono::milliseconds baseline_timeout) = 0;

        virtual std::error_code write_all(std::span<const std::uint8_t> data) = 0;

        virtual ReadResult read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout) = 0;

        // Shuts both directions down and closes; safe to call repeatedly.
        virtual void shutdown() noexcept = 0;

        virtual bool is_open() const noexcept = 0;
    };

    class AsioTransport final : public Transport
    {
    public:
        AsioTransport();
        ~AsioTransport() override;

        AsioTransport(const AsioTransport &) = delete;
        AsioTransport &operator=(const AsioTransport &) = delete;

        std::error_code connect(const std::string &host, std::uint16_t port,
                                std::chrono::milliseconds baseline_timeout) override;
        std::error_code write_all(std::span<const std::uint8_t> data) override;
        ReadResult read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout) override;
        void shutdown() noexcept override;
        bool is_open() const noexcept override;

    private:
        // Runs queued operations until they finish or timeout elapses; returns
        // false when the operations had to be cancelled.
        bool run_for(std::chrono::milliseconds timeout);

        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        std::chrono::milliseconds baseline_timeout_{std::chrono::seconds{5}};
    };

} // namespace robosave
