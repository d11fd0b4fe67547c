/**
 * rtunnel - Frame model of the tunnel wire protocol.
 *
 * Wire layout (big endian):
 *   length(4) | magic "RT"(2) | version(1) | type(1) | flags(1) | stream_id(4) | payload
 * `length` counts every byte after itself.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rtunnel::protocol
{

    inline constexpr std::uint8_t kVersion = 1;

    inline constexpr std::array<std::uint8_t, 2> kMagic{0x52, 0x54};

    inline constexpr std::size_t kLengthFieldSize = 4;

    // magic(2) + version(1) + type(1) + flags(1) + stream_id(4)
    inline constexpr std::size_t kHeaderSize = 9;

    // Header plus payload; the length field is not counted.
    inline constexpr std::size_t kMaxFrameSize = 16 * 1024 * 1024;

    inline constexpr std::size_t kMaxPayloadSize = kMaxFrameSize - kHeaderSize;

    using StreamId = std::uint32_t;

    inline constexpr StreamId kControlStreamId = 0;

    enum class FrameType : std::uint8_t
    {
        Auth = 0x01,
        OpenStream = 0x02,
        Data = 0x03,
        Close = 0x04,
        Heartbeat = 0x05
    };

    std::string_view to_string(FrameType type) noexcept;
    std::optional<FrameType> frame_type_from_string(std::string_view value) noexcept;
    std::optional<FrameType> frame_type_from_byte(std::uint8_t value) noexcept;

    bool is_valid_frame_type(std::uint8_t value) noexcept;

    // Independent bits. Undefined bits are legal on the wire and carried through.
    enum class Flags : std::uint8_t
    {
        None = 0x0,
        EndStream = 0x1,
        Ack = 0x2,
        Error = 0x4
    };

    constexpr Flags operator|(Flags a, Flags b) noexcept
    {
        return static_cast<Flags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
    }

    constexpr Flags operator&(Flags a, Flags b) noexcept
    {
        return static_cast<Flags>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
    }

    constexpr Flags &operator|=(Flags &a, Flags b) noexcept
    {
        a = a | b;
        return a;
    }

    constexpr bool has_flag(Flags flags, Flags flag) noexcept
    {
        return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
    }

    // "END_STREAM|ACK", "NONE", unknown bits as hex.
    std::string format_flags(Flags flags);

    // Accepts a comma separated list such as "end_stream,ack". Empty or "none" is Flags::None.
    std::optional<Flags> flags_from_string(std::string_view value);

    class Frame
    {
    public:
        Frame(FrameType type, Flags flags, StreamId stream_id, std::vector<std::uint8_t> payload = {},
              std::uint8_t version = kVersion);

        std::uint8_t version() const noexcept { return version_; }
        FrameType type() const noexcept { return type_; }
        Flags flags() const noexcept { return flags_; }
        StreamId stream_id() const noexcept { return stream_id_; }
        const std::vector<std::uint8_t> &payload() const noexcept { return payload_; }

        bool is_control_frame() const noexcept { return stream_id_ == kControlStreamId; }
        bool is_data_stream() const noexcept { return stream_id_ > kControlStreamId; }

        bool has_flag(Flags flag) const noexcept { return protocol::has_flag(flags_, flag); }
        bool is_end_stream() const noexcept { return has_flag(Flags::EndStream); }
        bool is_ack() const noexcept { return has_flag(Flags::Ack); }
        bool is_error() const noexcept { return has_flag(Flags::Error); }

        // Length field plus header plus payload.
        std::size_t encoded_size() const noexcept { return kLengthFieldSize + kHeaderSize + payload_.size(); }

        bool operator==(const Frame &other) const = default;

    private:
        std::uint8_t version_;
        FrameType type_;
        Flags flags_;
        StreamId stream_id_;
        std::vector<std::uint8_t> payload_;
    };

    std::vector<std::uint8_t> to_bytes(std::string_view text);

} // namespace rtunnel::protocol
