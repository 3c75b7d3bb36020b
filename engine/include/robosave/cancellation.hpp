/**
 * robosave - Cross-thread cancellation flag polled by the streaming loop.
 */
#pragma once

#include <atomic>

namespace robosave
{

    class CancellationToken
    {
    public:
        // Safe from any thread; setting it again has no further effect.
        void request() noexcept { requested_.store(true, std::memory_order_release); }

        bool requested() const noexcept { return requested_.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> requested_{false};
    };

} // namespace robosave
