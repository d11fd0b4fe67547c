#include "rtunnel/memory_stream.hpp"

#include <utility>

namespace rtunnel
{

    MemoryStream::MemoryStream(std::vector<std::uint8_t> contents) : data_(std::move(contents)) {}

    std::span<const std::uint8_t> MemoryStream::unread() const noexcept
    {
        return std::span<const std::uint8_t>(data_).subspan(read_offset_);
    }

    void MemoryStream::clear() noexcept
    {
        data_.clear();
        read_offset_ = 0;
        written_ = 0;
    }

    std::size_t MemoryStream::remaining_capacity() const noexcept
    {
        if (!write_capacity_)
        {
            return data_.max_size() - data_.size();
        }
        return *write_capacity_ > written_ ? *write_capacity_ - written_ : 0;
    }

} // namespace rtunnel
