#include "robosave/transport.hpp"

#include <asio/buffer.hpp>
#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/write.hpp>

#include <spdlog/spdlog.h>

namespace robosave
{

    AsioTransport::AsioTransport()
        : socket_(io_context_)
    {
    }

    AsioTransport::~AsioTransport()
    {
        shutdown();
    }

    bool AsioTransport::run_for(std::chrono::milliseconds timeout)
    {
        io_context_.restart();
        io_context_.run_for(timeout);
        if (io_context_.stopped())
        {
            return true;
        }
        std::error_code ignored;
        socket_.cancel(ignored);
        io_context_.run();
        return false;
    }

    std::error_code AsioTransport::connect(const std::string &host, std::uint16_t port,
                                           std::chrono::milliseconds baseline_timeout)
    {
        std::error_code ec;
        socket_.close(ec);

        asio::ip::tcp::resolver resolver(io_context_);
        const auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec)
        {
            return ec;
        }

        std::error_code connect_ec = asio::error::would_block;
        asio::async_connect(socket_, endpoints,
                            [&connect_ec](const std::error_code &result, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { connect_ec = result; });
        if (!run_for(baseline_timeout))
        {
            socket_.close(ec);
            return asio::error::timed_out;
        }
        if (connect_ec)
        {
            socket_.close(ec);
            return connect_ec;
        }

        baseline_timeout_ = baseline_timeout;
        socket_.set_option(asio::ip::tcp::no_delay(true), ec);
        spdlog::debug("Transport connected to {}:{}", host, port);
        return {};
    }

    std::error_code AsioTransport::write_all(std::span<const std::uint8_t> data)
    {
        std::error_code write_ec = asio::error::would_block;
        asio::async_write(socket_, asio::buffer(data.data(), data.size()),
                          [&write_ec](const std::error_code &result, std::size_t /*bytes_transferred*/)
                          { write_ec = result; });
        if (!run_for(baseline_timeout_))
        {
            return asio::error::timed_out;
        }
        return write_ec;
    }

    ReadResult AsioTransport::read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout)
    {
        std::error_code read_ec = asio::error::would_block;
        std::size_t received = 0;
        socket_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                                [&read_ec, &received](const std::error_code &result, std::size_t bytes_transferred)
                                {
                                    read_ec = result;
                                    received = bytes_transferred;
                                });
        const bool finished = run_for(timeout);
        if (received > 0)
        {
            return ReadResult{.status = ReadStatus::Data, .bytes = received};
        }
        if (!finished || read_ec == asio::error::operation_aborted)
        {
            return ReadResult{.status = ReadStatus::Timeout};
        }
        if (read_ec == asio::error::eof)
        {
            return ReadResult{.status = ReadStatus::Closed};
        }
        if (read_ec)
        {
            return ReadResult{.status = ReadStatus::Failed, .error = read_ec};
        }
        return ReadResult{.status = ReadStatus::Closed};
    }

    void AsioTransport::shutdown() noexcept
    {
        if (!socket_.is_open())
        {
            return;
        }
        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    bool AsioTransport::is_open() const noexcept
    {
        return socket_.is_open();
    }

} // namespace robosave
