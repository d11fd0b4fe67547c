/**
 * rtunnel - The single error type surfaced by the protocol layer.
 */
#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "rtunnel/error_codes.hpp"

namespace rtunnel
{

    class ProtocolError : public std::runtime_error
    {
    public:
        ProtocolError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

        const std::string &message() const noexcept { return message_; }

    private:
        ErrorCode code_;
        std::string message_;
    };

    ProtocolError make_error(ErrorCode code, std::string message);

    // Returns the ProtocolError carried by `error`, or nullopt for a null or unrelated exception.
    std::optional<ProtocolError> as_protocol_error(const std::exception_ptr &error);

    std::optional<ProtocolError> as_protocol_error(const std::exception &error);

} // namespace rtunnel
