/**
 * robosave - Interval-crossing progress derived from the bytes written so far.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace robosave
{

    class ProgressTracker
    {
    public:
        static constexpr std::uint64_t kDefaultInterval = 10 * 1024;

        // Throws std::invalid_argument when interval is zero.
        explicit ProgressTracker(std::uint64_t interval = kDefaultInterval);

        // Records payload_length more bytes and returns every interval multiple
        // crossed by this write, in increasing order.
        std::vector<std::uint64_t> advance(std::uint64_t payload_length);

        std::uint64_t total_written() const noexcept { return total_written_; }
        std::uint64_t last_reported() const noexcept { return last_reported_; }
        std::uint64_t interval() const noexcept { return interval_; }

    private:
        std::uint64_t interval_;
        std::uint64_t total_written_{0};
        std::uint64_t last_reported_{0};
    };

} // namespace robosave
