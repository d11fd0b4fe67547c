#include "rtunnel/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace rtunnel::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    std::string hash_bytes(std::span<const std::uint8_t> data)
    {
        ensure_sodium_init();
        std::array<unsigned char, crypto_generichash_BYTES> digest{};
        if (crypto_generichash(digest.data(), digest.size(), data.data(), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string payload_digest(const protocol::Frame &frame)
    {
        return hash_bytes(frame.payload());
    }

} // namespace rtunnel::crypto
