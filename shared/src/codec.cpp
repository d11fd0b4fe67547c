#include "rtunnel/codec.hpp"

#include <algorithm>
#include <string>

namespace rtunnel::protocol
{

    namespace
    {
        constexpr std::size_t kMagicOffset = 0;
        constexpr std::size_t kVersionOffset = 2;
        constexpr std::size_t kTypeOffset = 3;
        constexpr std::size_t kFlagsOffset = 4;
        constexpr std::size_t kStreamIdOffset = 5;

        std::uint32_t read_u32_be(std::span<const std::uint8_t, 4> buffer)
        {
            return (static_cast<std::uint32_t>(buffer[0]) << 24) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        void write_u32_be(std::uint32_t value, std::span<std::uint8_t, 4> buffer)
        {
            buffer[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
            buffer[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
            buffer[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
            buffer[3] = static_cast<std::uint8_t>(value & 0xFF);
        }
    } // namespace

    Result<std::uint32_t> parse_frame_length(std::span<const std::uint8_t, kLengthFieldSize> buffer)
    {
        const auto length = read_u32_be(buffer);
        if (length < kHeaderSize)
        {
            return make_error(ErrorCode::BadFrame, "invalid frame size " + std::to_string(length));
        }
        if (length > kMaxFrameSize)
        {
            return make_error(ErrorCode::FrameTooLarge, "frame size " + std::to_string(length) + " exceeds limit");
        }
        return length;
    }

    Result<FrameHeader> parse_frame_header(std::span<const std::uint8_t, kHeaderSize> buffer)
    {
        // Desync detector; nothing else in the header is trusted until it matches.
        if (buffer[kMagicOffset] != kMagic[0] || buffer[kMagicOffset + 1] != kMagic[1])
        {
            return make_error(ErrorCode::BadFrame, "invalid magic marker");
        }
        if (buffer[kVersionOffset] != kVersion)
        {
            return make_error(ErrorCode::InvalidVersion,
                              "invalid protocol version " + std::to_string(buffer[kVersionOffset]));
        }
        const auto type = frame_type_from_byte(buffer[kTypeOffset]);
        if (!type)
        {
            return make_error(ErrorCode::BadFrame, "invalid frame type " + std::to_string(buffer[kTypeOffset]));
        }

        FrameHeader header;
        header.version = buffer[kVersionOffset];
        header.type = *type;
        header.flags = static_cast<Flags>(buffer[kFlagsOffset]);
        header.stream_id = read_u32_be(buffer.subspan<kStreamIdOffset, 4>());
        return header;
    }

    Status validate_for_encoding(const Frame &frame)
    {
        if (frame.version() != kVersion)
        {
            return make_error(ErrorCode::InvalidVersion,
                              "invalid protocol version " + std::to_string(frame.version()));
        }
        if (kHeaderSize + frame.payload().size() > kMaxFrameSize)
        {
            return make_error(ErrorCode::FrameTooLarge, "frame too large");
        }
        if (!is_valid_frame_type(static_cast<std::uint8_t>(frame.type())))
        {
            return make_error(ErrorCode::BadFrame,
                              "invalid frame type " + std::to_string(static_cast<unsigned>(frame.type())));
        }
        return ok_status();
    }

    Result<std::vector<std::uint8_t>> encode_frame(const Frame &frame)
    {
        const auto status = validate_for_encoding(frame);
        if (!status)
        {
            return status.forward_error<std::vector<std::uint8_t>>();
        }

        const auto length = static_cast<std::uint32_t>(kHeaderSize + frame.payload().size());
        std::vector<std::uint8_t> bytes(kLengthFieldSize + length);
        const auto out = std::span<std::uint8_t>(bytes);
        write_u32_be(length, out.first<kLengthFieldSize>());

        const auto header = out.subspan<kLengthFieldSize, kHeaderSize>();
        header[kMagicOffset] = kMagic[0];
        header[kMagicOffset + 1] = kMagic[1];
        header[kVersionOffset] = frame.version();
        header[kTypeOffset] = static_cast<std::uint8_t>(frame.type());
        header[kFlagsOffset] = static_cast<std::uint8_t>(frame.flags());
        write_u32_be(frame.stream_id(), header.subspan<kStreamIdOffset, 4>());

        std::copy(frame.payload().begin(), frame.payload().end(),
                  bytes.begin() + static_cast<std::ptrdiff_t>(kLengthFieldSize + kHeaderSize));
        return bytes;
    }

    Result<std::optional<DecodedFrame>> try_decode_frame(std::span<const std::uint8_t> buffer)
    {
        using Decoded = std::optional<DecodedFrame>;

        if (buffer.size() < kLengthFieldSize)
        {
            return Decoded{};
        }
        const auto length = parse_frame_length(buffer.first<kLengthFieldSize>());
        if (!length)
        {
            return length.forward_error<Decoded>();
        }

        const auto rest = buffer.subspan(kLengthFieldSize);
        if (rest.size() < kHeaderSize)
        {
            return Decoded{};
        }
        const auto header = parse_frame_header(rest.first<kHeaderSize>());
        if (!header)
        {
            return header.forward_error<Decoded>();
        }

        const std::size_t total = kLengthFieldSize + length.value();
        if (buffer.size() < total)
        {
            return Decoded{};
        }

        const auto payload = buffer.subspan(kLengthFieldSize + kHeaderSize, length.value() - kHeaderSize);
        const auto &fields = header.value();
        return Decoded{DecodedFrame{
            .frame = Frame(fields.type, fields.flags, fields.stream_id,
                           std::vector<std::uint8_t>(payload.begin(), payload.end()), fields.version),
            .bytes_consumed = total,
        }};
    }

    bool is_end_of_input(const std::error_code &error) noexcept
    {
        return error == asio::error::eof;
    }

} // namespace rtunnel::protocol
