/**
 * rtunnel - Stable error codes shared by the codec, session and auth layers.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace rtunnel
{

    // Values are part of the protocol contract. Never renumber, only append.
    enum class ErrorCode : std::uint16_t
    {
        Unknown = 0,

        InvalidVersion = 1001,
        FrameTooLarge = 1002,
        BadFrame = 1003,
        BadPayload = 1004,

        Unauthorized = 2001,
        AuthExpired = 2002,

        StreamNotFound = 3001,
        StreamClosed = 3002
    };

    enum class ErrorCategory : std::uint8_t
    {
        Unknown,
        Framing,
        Auth,
        Stream
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::string_view to_string(ErrorCategory category) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    ErrorCategory category(ErrorCode code) noexcept;

    // Framing errors leave the byte stream desynchronized; the connection has to go.
    constexpr bool is_connection_fatal(ErrorCode code) noexcept
    {
        return code == ErrorCode::InvalidVersion || code == ErrorCode::FrameTooLarge ||
               code == ErrorCode::BadFrame || code == ErrorCode::BadPayload;
    }

} // namespace rtunnel
