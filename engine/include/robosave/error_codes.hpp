/**
 * robosave - Failure taxonomy shared by every phase of a backup session.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace robosave
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConnectFailure = 1,
        HandshakeTimeout = 2,
        DeviceBusy = 3,
        CancelledByUser = 4,
        TransportFailure = 5,
        OutputWriteFailure = 6,
        InternalError = 7
    };

    std::string_view to_string(ErrorCode code) noexcept;

    struct Failure
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
        // Underlying transport or filesystem error, if any.
        std::error_code cause{};
    };

    std::string describe(const Failure &failure);

    class BackupError : public std::runtime_error
    {
    public:
        explicit BackupError(Failure failure);

        ErrorCode code() const noexcept { return failure_.code; }
        const Failure &failure() const noexcept { return failure_; }

    private:
        Failure failure_;
    };

} // namespace robosave
