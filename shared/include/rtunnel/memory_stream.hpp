/**
 * rtunnel - In-memory byte stream usable wherever the codec expects a socket.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include <asio/buffer.hpp>
#include <asio/error.hpp>

namespace rtunnel
{

    // Models asio's SyncReadStream and SyncWriteStream. Reads consume from the
    // front, writes append to the back. Reading an exhausted stream reports
    // asio::error::eof; writing past the optional capacity reports
    // asio::error::broken_pipe after accepting what still fits.
    class MemoryStream
    {
    public:
        MemoryStream() = default;

        explicit MemoryStream(std::vector<std::uint8_t> contents);

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers, std::error_code &ec)
        {
            ec.clear();
            if (asio::buffer_size(buffers) == 0)
            {
                return 0;
            }
            if (available() == 0)
            {
                ec = asio::error::eof;
                return 0;
            }
            const auto copied = asio::buffer_copy(buffers, asio::buffer(data_.data() + read_offset_, available()));
            read_offset_ += copied;
            return copied;
        }

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers)
        {
            std::error_code ec;
            const auto count = read_some(buffers, ec);
            if (ec)
            {
                throw std::system_error(ec);
            }
            return count;
        }

        template <typename ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence &buffers, std::error_code &ec)
        {
            ec.clear();
            const auto requested = asio::buffer_size(buffers);
            if (requested == 0)
            {
                return 0;
            }
            const auto room = remaining_capacity();
            if (room == 0)
            {
                ec = asio::error::broken_pipe;
                return 0;
            }
            const auto count = requested < room ? requested : room;
            const auto old_size = data_.size();
            data_.resize(old_size + count);
            asio::buffer_copy(asio::buffer(data_.data() + old_size, count), buffers);
            written_ += count;
            return count;
        }

        template <typename ConstBufferSequence>
        std::size_t write_some(const ConstBufferSequence &buffers)
        {
            std::error_code ec;
            const auto count = write_some(buffers, ec);
            if (ec)
            {
                throw std::system_error(ec);
            }
            return count;
        }

        // Total bytes the stream will ever accept through writes.
        void set_write_capacity(std::size_t capacity) { write_capacity_ = capacity; }

        std::size_t available() const noexcept { return data_.size() - read_offset_; }

        // Bytes not consumed by reads yet.
        std::span<const std::uint8_t> unread() const noexcept;

        const std::vector<std::uint8_t> &data() const noexcept { return data_; }

        void clear() noexcept;

    private:
        std::size_t remaining_capacity() const noexcept;

        std::vector<std::uint8_t> data_;
        std::size_t read_offset_{0};
        std::optional<std::size_t> write_capacity_;
        std::size_t written_{0};
    };

} // namespace rtunnel
