#include "rtunnel/error_codes.hpp"

#include <array>

namespace rtunnel
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            ErrorCategory category;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 9> kDescriptions{{
            {ErrorCode::Unknown, ErrorCategory::Unknown, "unknown"},
            {ErrorCode::InvalidVersion, ErrorCategory::Framing, "invalid_version"},
            {ErrorCode::FrameTooLarge, ErrorCategory::Framing, "frame_too_large"},
            {ErrorCode::BadFrame, ErrorCategory::Framing, "bad_frame"},
            {ErrorCode::BadPayload, ErrorCategory::Framing, "bad_payload"},
            {ErrorCode::Unauthorized, ErrorCategory::Auth, "unauthorized"},
            {ErrorCode::AuthExpired, ErrorCategory::Auth, "auth_expired"},
            {ErrorCode::StreamNotFound, ErrorCategory::Stream, "stream_not_found"},
            {ErrorCode::StreamClosed, ErrorCategory::Stream, "stream_closed"},
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

    std::string_view to_string(ErrorCategory category) noexcept
    {
        switch (category)
        {
        case ErrorCategory::Framing:
            return "framing";
        case ErrorCategory::Auth:
            return "auth";
        case ErrorCategory::Stream:
            return "stream";
        case ErrorCategory::Unknown:
            break;
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::Unknown;
    }

    ErrorCategory category(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.category;
            }
        }
        return ErrorCategory::Unknown;
    }

} // namespace rtunnel
