/**
 * robosave - Observer interface for backup session notifications.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "robosave/error_codes.hpp"

namespace robosave
{

    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        virtual void on_status(const std::string &text) = 0;
        virtual void on_progress(std::uint64_t bytes_written) = 0;
        virtual void on_error(const Failure &failure) = 0;
        virtual void on_complete(const std::filesystem::path &output_path,
                                 const std::filesystem::path &debug_path) = 0;
    };

    class NullEventSink final : public EventSink
    {
    public:
        void on_status(const std::string &) override {}
        void on_progress(std::uint64_t) override {}
        void on_error(const Failure &) override {}
        void on_complete(const std::filesystem::path &, const std::filesystem::path &) override {}
    };

    // Forwards to whichever callbacks are set; unset slots are ignored.
    class CallbackEventSink final : public EventSink
    {
    public:
        struct Callbacks
        {
            std::function<void(const std::string &)> status;
            std::function<void(std::uint64_t)> progress;
            std::function<void(const Failure &)> error;
            std::function<void(const std::filesystem::path &, const std::filesystem::path &)> complete;
        };

        explicit CallbackEventSink(Callbacks callbacks);

        void on_status(const std::string &text) override;
        void on_progress(std::uint64_t bytes_written) override;
        void on_error(const Failure &failure) override;
        void on_complete(const std::filesystem::path &output_path,
                         const std::filesystem::path &debug_path) override;

    private:
        Callbacks callbacks_;
    };

    // Engine-side dispatcher. Every call is best effort: an exception thrown by
    // the sink is logged and dropped so it never reaches session state.
    class Notifier
    {
    public:
        explicit Notifier(EventSink &sink);

        void status(const std::string &text) noexcept;
        void progress(std::uint64_t bytes_written) noexcept;
        void error(const Failure &failure) noexcept;
        void complete(const std::filesystem::path &output_path, const std::filesystem::path &debug_path) noexcept;

    private:
        template <typename Fn>
        void dispatch(const char *channel, Fn &&fn) noexcept;

        EventSink &sink_;
    };

} // namespace robosave
