#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "robosave/transport.hpp"

namespace robosave::testing
{

    // Scripted transport: connect outcomes and read events are consumed in
    // order. An exhausted read script behaves like a silent peer.
    class FakeTransport final : public Transport
    {
    public:
        struct ReadEvent
        {
            ReadStatus status{ReadStatus::Data};
            std::string bytes;
            std::error_code error{};
        };

        std::deque<std::error_code> connect_results;
        // Outcome of each write in order; writes past the script succeed.
        std::deque<std::error_code> write_results;
        std::deque<ReadEvent> reads;
        // Called before each read is served; index is the zero-based read count.
        std::function<void(std::size_t)> before_read;

        std::vector<std::string> writes;
        unsigned connect_attempts{0};
        std::size_t reads_served{0};
        bool shutdown_called{false};

        void push_data(std::string_view bytes)
        {
            reads.push_back(ReadEvent{.status = ReadStatus::Data, .bytes = std::string(bytes)});
        }

        void push_timeout()
        {
            reads.push_back(ReadEvent{.status = ReadStatus::Timeout});
        }

        void push_closed()
        {
            reads.push_back(ReadEvent{.status = ReadStatus::Closed});
        }

        void push_failed(std::error_code error)
        {
            reads.push_back(ReadEvent{.status = ReadStatus::Failed, .error = error});
        }

        std::error_code connect(const std::string & /*host*/, std::uint16_t /*port*/,
                                std::chrono::milliseconds /*baseline_timeout*/) override
        {
            ++connect_attempts;
            std::error_code result;
            if (!connect_results.empty())
            {
                result = connect_results.front();
                connect_results.pop_front();
            }
            open_ = !result;
            return result;
        }

        std::error_code write_all(std::span<const std::uint8_t> data) override
        {
            writes.emplace_back(data.begin(), data.end());
            std::error_code result;
            if (!write_results.empty())
            {
                result = write_results.front();
                write_results.pop_front();
            }
            return result;
        }

        ReadResult read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds /*timeout*/) override
        {
            if (before_read)
            {
                before_read(reads_served);
            }
            ++reads_served;
            if (reads.empty())
            {
                return ReadResult{.status = ReadStatus::Timeout};
            }
            auto &event = reads.front();
            if (event.status != ReadStatus::Data)
            {
                const ReadResult result{.status = event.status, .error = event.error};
                reads.pop_front();
                return result;
            }
            const auto count = std::min(buffer.size(), event.bytes.size());
            std::copy_n(event.bytes.begin(), count, buffer.begin());
            event.bytes.erase(0, count);
            if (event.bytes.empty())
            {
                reads.pop_front();
            }
            return ReadResult{.status = ReadStatus::Data, .bytes = count};
        }

        void shutdown() noexcept override
        {
            shutdown_called = true;
            open_ = false;
        }

        bool is_open() const noexcept override { return open_; }

    private:
        bool open_{false};
    };

    // The engine owns and destroys its transport when a run ends; this handle
    // lets a test keep inspecting the scripted transport afterwards.
    class SharedTransport final : public Transport
    {
    public:
        explicit SharedTransport(std::shared_ptr<FakeTransport> target) : target_(std::move(target)) {}

        std::error_code connect(const std::string &host, std::uint16_t port,
                                std::chrono::milliseconds baseline_timeout) override
        {
            return target_->connect(host, port, baseline_timeout);
        }

        std::error_code write_all(std::span<const std::uint8_t> data) override { return target_->write_all(data); }

        ReadResult read_some(std::span<std::uint8_t> buffer, std::chrono::milliseconds timeout) override
        {
            return target_->read_some(buffer, timeout);
        }

        void shutdown() noexcept override { target_->shutdown(); }

        bool is_open() const noexcept override { return target_->is_open(); }

    private:
        std::shared_ptr<FakeTransport> target_;
    };

} // namespace robosave::testing
