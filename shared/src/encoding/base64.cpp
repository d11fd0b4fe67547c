#include "rtunnel/encoding/base64.hpp"

#include <array>
#include <cctype>

namespace rtunnel::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(-1);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = -2;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::uint8_t> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int bits_collected = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                const auto index = static_cast<std::size_t>((buffer >> bits_collected) & 0x3Fu);
                output.push_back(kAlphabet[index]);
            }
        }

        if (bits_collected > 0)
        {
            buffer <<= (6 - bits_collected);
            const auto index = static_cast<std::size_t>(buffer & 0x3F);
            output.push_back(kAlphabet[index]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input)
    {
        std::string compact;
        compact.reserve(input.size());
        for (const char ch : input)
        {
            if (!std::isspace(static_cast<unsigned char>(ch)))
            {
                compact.push_back(ch);
            }
        }
        if (compact.size() % 4 != 0)
        {
            return std::nullopt;
        }

        std::size_t padding = 0;
        while (padding < 3 && padding < compact.size() && compact[compact.size() - 1 - padding] == '=')
        {
            ++padding;
        }
        if (padding > 2)
        {
            return std::nullopt;
        }

        std::vector<std::uint8_t> output;
        output.reserve((compact.size() / 4) * 3);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        for (const char ch : std::string_view(compact).substr(0, compact.size() - padding))
        {
            // Padding is only legal at the very end.
            const int value = kDecodeTable[static_cast<unsigned char>(ch)];
            if (value < 0)
            {
                return std::nullopt;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::uint8_t>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        // Bits left over by a partial group must be zero.
        if ((accumulator & ((1u << bits_collected) - 1u)) != 0)
        {
            return std::nullopt;
        }

        return output;
    }

} // namespace rtunnel::encoding
