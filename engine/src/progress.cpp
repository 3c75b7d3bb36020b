#include "robosave/progress.hpp"

#include <stdexcept>

namespace robosave
{

    ProgressTracker::ProgressTracker(std::uint64_t interval)
        : interval_(interval)
    {
        if (interval_ == 0)
        {
            throw std::invalid_argument("progress interval must be positive");
        }
    }

    std::vector<std::uint64_t> ProgressTracker::advance(std::uint64_t payload_length)
    {
        total_written_ += payload_length;
        std::vector<std::uint64_t> crossed;
        while (total_written_ >= last_reported_ + interval_)
        {
            last_reported_ += interval_;
            crossed.push_back(last_reported_);
        }
        return crossed;
    }

} // namespace robosave
