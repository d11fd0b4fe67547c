#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace rtunnel::encoding
{

    std::string encode_base64(std::span<const std::uint8_t> data);

    // Canonical padded base64; whitespace is ignored. Returns nullopt on malformed input.
    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input);

} // namespace rtunnel::encoding
