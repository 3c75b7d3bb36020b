/**
 * robosave - Tagged phase outcome: a value or the Failure that ended the phase.
 */
#pragma once

#include <utility>
#include <variant>

#include "robosave/error_codes.hpp"

namespace robosave
{

    template <typename T>
    class Result
    {
    public:
        Result(T value) : state_(std::move(value)) {}
        Result(Failure failure) : state_(std::move(failure)) {}

        bool ok() const noexcept { return std::holds_alternative<T>(state_); }
        explicit operator bool() const noexcept { return ok(); }

        T &value() { return std::get<T>(state_); }
        const T &value() const { return std::get<T>(state_); }

        const Failure &failure() const { return std::get<Failure>(state_); }
        Failure take_failure() { return std::get<Failure>(std::move(state_)); }

    private:
        std::variant<T, Failure> state_;
    };

    using Status = Result<std::monostate>;

    inline Status success()
    {
        return Status(std::monostate{});
    }

    inline Failure make_failure(ErrorCode code, std::string message, std::error_code cause = {})
    {
        return Failure{.code = code, .message = std::move(message), .cause = cause};
    }

} // namespace robosave
