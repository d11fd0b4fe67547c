/**
 * rtunnel - Frame encoder and decoder.
 *
 * All functions are stateless. The stream forms work with anything modelling
 * asio's SyncWriteStream / SyncReadStream (sockets, posix descriptors,
 * rtunnel::MemoryStream). End of input is reported as asio::error::eof.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <utility>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/error.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include "rtunnel/frame.hpp"
#include "rtunnel/result.hpp"

namespace rtunnel::protocol
{

    struct FrameHeader
    {
        std::uint8_t version{};
        FrameType type{};
        Flags flags{};
        StreamId stream_id{};
    };

    struct DecodedFrame
    {
        Frame frame;
        std::size_t bytes_consumed{};
    };

    // Decodes the length prefix and checks kHeaderSize <= length <= kMaxFrameSize.
    Result<std::uint32_t> parse_frame_length(std::span<const std::uint8_t, kLengthFieldSize> buffer);

    // Validates magic marker, version and frame type, in that order.
    Result<FrameHeader> parse_frame_header(std::span<const std::uint8_t, kHeaderSize> buffer);

    Status validate_for_encoding(const Frame &frame);

    // Serializes the whole frame, length prefix included, into one buffer.
    Result<std::vector<std::uint8_t>> encode_frame(const Frame &frame);

    // Buffer form of read_frame for callers that accumulate bytes themselves.
    // Yields nullopt while more bytes are needed and fails as soon as the bytes
    // present prove the frame invalid.
    Result<std::optional<DecodedFrame>> try_decode_frame(std::span<const std::uint8_t> buffer);

    bool is_end_of_input(const std::error_code &error) noexcept;

    // Nothing reaches the stream unless the frame is valid. A failing stream may
    // have accepted part of the frame; there is no rollback.
    template <typename SyncWriteStream>
    Status write_frame(SyncWriteStream &stream, const Frame &frame)
    {
        auto encoded = encode_frame(frame);
        if (!encoded)
        {
            return encoded.forward_error<std::monostate>();
        }
        std::error_code ec;
        asio::write(stream, asio::buffer(encoded.value()), ec);
        if (ec)
        {
            return ec;
        }
        return ok_status();
    }

    // Consumes exactly one frame. The fixed header is validated before the
    // payload is read, so a desynchronized peer never triggers a large read.
    template <typename SyncReadStream>
    Result<Frame> read_frame(SyncReadStream &stream)
    {
        std::error_code ec;

        std::array<std::uint8_t, kLengthFieldSize> length_buffer{};
        asio::read(stream, asio::buffer(length_buffer), ec);
        if (ec)
        {
            return ec;
        }
        const auto length = parse_frame_length(length_buffer);
        if (!length)
        {
            return length.forward_error<Frame>();
        }

        std::array<std::uint8_t, kHeaderSize> header_buffer{};
        asio::read(stream, asio::buffer(header_buffer), ec);
        if (ec)
        {
            return ec;
        }
        const auto header = parse_frame_header(header_buffer);
        if (!header)
        {
            return header.forward_error<Frame>();
        }

        std::vector<std::uint8_t> payload(length.value() - kHeaderSize);
        if (!payload.empty())
        {
            asio::read(stream, asio::buffer(payload), ec);
            if (ec)
            {
                return ec;
            }
        }

        const auto &fields = header.value();
        return Frame(fields.type, fields.flags, fields.stream_id, std::move(payload), fields.version);
    }

} // namespace rtunnel::protocol
