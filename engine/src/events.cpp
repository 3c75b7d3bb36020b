#include "robosave/events.hpp"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace robosave
{

    CallbackEventSink::CallbackEventSink(Callbacks callbacks)
        : callbacks_(std::move(callbacks))
    {
    }

    void CallbackEventSink::on_status(const std::string &text)
    {
        if (callbacks_.status)
        {
            callbacks_.status(text);
        }
    }

    void CallbackEventSink::on_progress(std::uint64_t bytes_written)
    {
        if (callbacks_.progress)
        {
            callbacks_.progress(bytes_written);
        }
    }

    void CallbackEventSink::on_error(const Failure &failure)
    {
        if (callbacks_.error)
        {
            callbacks_.error(failure);
        }
    }

    void CallbackEventSink::on_complete(const std::filesystem::path &output_path,
                                        const std::filesystem::path &debug_path)
    {
        if (callbacks_.complete)
        {
            callbacks_.complete(output_path, debug_path);
        }
    }

    Notifier::Notifier(EventSink &sink)
        : sink_(sink)
    {
    }

    template <typename Fn>
    void Notifier::dispatch(const char *channel, Fn &&fn) noexcept
    {
        try
        {
            std::forward<Fn>(fn)();
        }
        catch (const std::exception &ex)
        {
            spdlog::warn("Ignoring {} handler failure: {}", channel, ex.what());
        }
        catch (...)
        {
            spdlog::warn("Ignoring {} handler failure: non-standard exception", channel);
        }
    }

    void Notifier::status(const std::string &text) noexcept
    {
        spdlog::info("{}", text);
        dispatch("status", [&]
                 { sink_.on_status(text); });
    }

    void Notifier::progress(std::uint64_t bytes_written) noexcept
    {
        spdlog::debug("progress {} bytes", bytes_written);
        dispatch("progress", [&]
                 { sink_.on_progress(bytes_written); });
    }

    void Notifier::error(const Failure &failure) noexcept
    {
        spdlog::error("Backup failed: {}", describe(failure));
        dispatch("error", [&]
                 { sink_.on_error(failure); });
    }

    void Notifier::complete(const std::filesystem::path &output_path, const std::filesystem::path &debug_path) noexcept
    {
        spdlog::info("Backup written to {} (raw capture {})", output_path.string(), debug_path.string());
        dispatch("complete", [&]
                 { sink_.on_complete(output_path, debug_path); });
    }

} // namespace robosave
