#include "rtunnel/protocol_error.hpp"

#include <utility>

namespace rtunnel
{

    namespace
    {

        std::string describe(ErrorCode code, const std::string &message)
        {
            std::string text = "protocol error (" + std::to_string(to_int(code)) + ")";
            if (!message.empty())
            {
                text += ": " + message;
            }
            return text;
        }

    } // namespace

    ProtocolError::ProtocolError(ErrorCode code, std::string message)
        : std::runtime_error(describe(code, message)), code_(code), message_(std::move(message)) {}

    ProtocolError make_error(ErrorCode code, std::string message)
    {
        return ProtocolError(code, std::move(message));
    }

    std::optional<ProtocolError> as_protocol_error(const std::exception_ptr &error)
    {
        if (!error)
        {
            return std::nullopt;
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const ProtocolError &protocol_error)
        {
            return protocol_error;
        }
        catch (...)
        {
            // Not a ProtocolError.
        }
        return std::nullopt;
    }

    std::optional<ProtocolError> as_protocol_error(const std::exception &error)
    {
        if (const auto *protocol_error = dynamic_cast<const ProtocolError *>(&error))
        {
            return *protocol_error;
        }
        return std::nullopt;
    }

} // namespace rtunnel
