#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "rtunnel/frame.hpp"

namespace rtunnel::inspect
{

    enum class Mode : std::uint8_t
    {
        Help,
        Version,
        Decode,
        Encode
    };

    enum class OutputFormat : std::uint8_t
    {
        Text,
        Json
    };

    struct InspectConfig
    {
        Mode mode{Mode::Help};
        // Unset means stdin / stdout.
        std::optional<std::filesystem::path> input;
        std::optional<std::filesystem::path> output;
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};

        OutputFormat format{OutputFormat::Text};
        std::optional<std::size_t> max_frames;
        bool digest{false};

        std::optional<protocol::FrameType> frame_type;
        protocol::Flags flags{protocol::Flags::None};
        protocol::StreamId stream_id{protocol::kControlStreamId};
        std::optional<std::string> payload_text;
        std::optional<std::string> payload_base64;
        std::optional<std::filesystem::path> payload_file;
        std::uint8_t protocol_version{protocol::kVersion};
    };

    InspectConfig parse_arguments(int argc, char *argv[]);

    std::string usage(std::string_view program_name);

} // namespace rtunnel::inspect
