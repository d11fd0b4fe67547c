/**
 * rtunnel - Payload digests built on libsodium.
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

#include "rtunnel/frame.hpp"

namespace rtunnel::crypto
{

    void ensure_sodium_init();

    // Hex encoded BLAKE2b (crypto_generichash) digest.
    std::string hash_bytes(std::span<const std::uint8_t> data);

    // Digest of the frame payload only; the header is not covered.
    std::string payload_digest(const protocol::Frame &frame);

} // namespace rtunnel::crypto
