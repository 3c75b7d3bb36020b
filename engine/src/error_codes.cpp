#include "robosave/error_codes.hpp"

#include <array>
#include <utility>

namespace robosave
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 8> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ConnectFailure, "connect_failure"},
            {ErrorCode::HandshakeTimeout, "handshake_timeout"},
            {ErrorCode::DeviceBusy, "device_busy"},
            {ErrorCode::CancelledByUser, "cancelled_by_user"},
            {ErrorCode::TransportFailure, "transport_failure"},
            {ErrorCode::OutputWriteFailure, "output_write_failure"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::string describe(const Failure &failure)
    {
        std::string text(to_string(failure.code));
        if (!failure.message.empty())
        {
            text += ": ";
            text += failure.message;
        }
        if (failure.cause)
        {
            text += " (";
            text += failure.cause.message();
            text += ')';
        }
        return text;
    }

    BackupError::BackupError(Failure failure)
        : std::runtime_error(describe(failure)),
          failure_(std::move(failure))
    {
    }

} // namespace robosave
