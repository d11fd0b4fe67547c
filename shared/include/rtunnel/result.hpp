/**
 * rtunnel - Tagged result returned by codec operations.
 *
 * A Result holds exactly one of: the value, a ProtocolError for structurally
 * invalid input, or the std::error_code reported by the underlying byte stream
 * (end of input, broken pipe, ...). Transport errors are never wrapped so
 * callers can tell "not enough data" apart from "peer sent garbage".
 */
#pragma once

#include <system_error>
#include <utility>
#include <variant>

#include "rtunnel/protocol_error.hpp"

namespace rtunnel
{

    template <typename T>
    class Result
    {
    public:
        Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}

        Result(ProtocolError error) : state_(std::in_place_index<1>, std::move(error)) {}

        Result(std::error_code error) : state_(std::in_place_index<2>, error) {}

        bool ok() const noexcept { return state_.index() == 0; }

        explicit operator bool() const noexcept { return ok(); }

        bool is_protocol_error() const noexcept { return state_.index() == 1; }

        bool is_io_error() const noexcept { return state_.index() == 2; }

        // Throws the held ProtocolError or a std::system_error if there is no value.
        const T &value() const &
        {
            throw_if_error();
            return std::get<0>(state_);
        }

        T &value() &
        {
            throw_if_error();
            return std::get<0>(state_);
        }

        T &&value() &&
        {
            throw_if_error();
            return std::get<0>(std::move(state_));
        }

        const ProtocolError *protocol_error() const noexcept { return std::get_if<1>(&state_); }

        std::error_code io_error() const noexcept
        {
            if (const auto *error = std::get_if<2>(&state_))
            {
                return *error;
            }
            return {};
        }

        void throw_if_error() const
        {
            if (const auto *error = std::get_if<1>(&state_))
            {
                throw *error;
            }
            if (const auto *error = std::get_if<2>(&state_))
            {
                throw std::system_error(*error);
            }
        }

        // Re-wraps a failed result for a caller returning a different value type.
        template <typename U>
        Result<U> forward_error() const
        {
            if (const auto *error = std::get_if<1>(&state_))
            {
                return Result<U>(*error);
            }
            return Result<U>(std::get<2>(state_));
        }

    private:
        std::variant<T, ProtocolError, std::error_code> state_;
    };

    using Status = Result<std::monostate>;

    inline Status ok_status()
    {
        return Status(std::monostate{});
    }

} // namespace rtunnel
