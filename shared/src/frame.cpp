#include "rtunnel/frame.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <utility>

namespace rtunnel::protocol
{

    namespace
    {

        struct FrameTypeMapping
        {
            FrameType type;
            std::string_view label;
        };

        constexpr std::array<FrameTypeMapping, 5> kFrameTypeMappings{{
            {FrameType::Auth, "AUTH"},
            {FrameType::OpenStream, "OPEN_STREAM"},
            {FrameType::Data, "DATA"},
            {FrameType::Close, "CLOSE"},
            {FrameType::Heartbeat, "HEARTBEAT"},
        }};

        struct FlagMapping
        {
            Flags flag;
            std::string_view label;
        };

        constexpr std::array<FlagMapping, 3> kFlagMappings{{
            {Flags::EndStream, "END_STREAM"},
            {Flags::Ack, "ACK"},
            {Flags::Error, "ERROR"},
        }};

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs)
        {
            if (lhs.size() != rhs.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < lhs.size(); ++i)
            {
                if (std::toupper(static_cast<unsigned char>(lhs[i])) != std::toupper(static_cast<unsigned char>(rhs[i])))
                {
                    return false;
                }
            }
            return true;
        }

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return value.substr(begin, end - begin + 1);
        }

    } // namespace

    std::string_view to_string(FrameType type) noexcept
    {
        for (const auto &mapping : kFrameTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<FrameType> frame_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kFrameTypeMappings)
        {
            if (equals_ignore_case(mapping.label, value))
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::optional<FrameType> frame_type_from_byte(std::uint8_t value) noexcept
    {
        for (const auto &mapping : kFrameTypeMappings)
        {
            if (static_cast<std::uint8_t>(mapping.type) == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    bool is_valid_frame_type(std::uint8_t value) noexcept
    {
        return frame_type_from_byte(value).has_value();
    }

    std::string format_flags(Flags flags)
    {
        if (flags == Flags::None)
        {
            return "NONE";
        }
        std::string text;
        auto remaining = static_cast<std::uint8_t>(flags);
        for (const auto &mapping : kFlagMappings)
        {
            if (has_flag(flags, mapping.flag))
            {
                if (!text.empty())
                {
                    text += '|';
                }
                text += mapping.label;
                remaining = static_cast<std::uint8_t>(remaining & ~static_cast<std::uint8_t>(mapping.flag));
            }
        }
        if (remaining != 0)
        {
            std::ostringstream extra;
            extra << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<unsigned>(remaining);
            if (!text.empty())
            {
                text += '|';
            }
            text += extra.str();
        }
        return text;
    }

    std::optional<Flags> flags_from_string(std::string_view value)
    {
        Flags flags = Flags::None;
        while (!value.empty())
        {
            const auto comma = value.find(',');
            const auto token = trim(value.substr(0, comma));
            value = comma == std::string_view::npos ? std::string_view{} : value.substr(comma + 1);

            if (token.empty() || equals_ignore_case(token, "NONE"))
            {
                continue;
            }
            bool matched = false;
            for (const auto &mapping : kFlagMappings)
            {
                if (equals_ignore_case(mapping.label, token))
                {
                    flags |= mapping.flag;
                    matched = true;
                    break;
                }
            }
            if (!matched)
            {
                return std::nullopt;
            }
        }
        return flags;
    }

    Frame::Frame(FrameType type, Flags flags, StreamId stream_id, std::vector<std::uint8_t> payload,
                 std::uint8_t version)
        : version_(version), type_(type), flags_(flags), stream_id_(stream_id), payload_(std::move(payload)) {}

    std::vector<std::uint8_t> to_bytes(std::string_view text)
    {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

} // namespace rtunnel::protocol
