#include "rtunnel/inspect/config.hpp"

#include <charconv>
#include <limits>
#include <stdexcept>
#include <string>

namespace rtunnel::inspect
{

    namespace
    {

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            ++index;
            return argv[index];
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &option, std::uint64_t max)
        {
            std::uint64_t parsed = 0;
            const auto *begin = value.data();
            const auto *end = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(begin, end, parsed);
            if (value.empty() || ec != std::errc{} || ptr != end || parsed > max)
            {
                throw std::runtime_error("Invalid value for " + option + ": " + value);
            }
            return parsed;
        }

        std::optional<std::filesystem::path> parse_path(const std::string &value)
        {
            if (value == "-")
            {
                return std::nullopt;
            }
            return std::filesystem::path(value);
        }

        void require_mode(Mode actual, Mode expected, const std::string &option)
        {
            if (actual != expected)
            {
                throw std::runtime_error(option + " is only valid for " +
                                         (expected == Mode::Decode ? "decode" : "encode"));
            }
        }

    } // namespace

    InspectConfig parse_arguments(int argc, char *argv[])
    {
        InspectConfig config;
        if (argc < 2)
        {
            return config;
        }

        const std::string command = argv[1];
        if (command == "--help" || command == "-h")
        {
            config.mode = Mode::Help;
            return config;
        }
        if (command == "--version")
        {
            config.mode = Mode::Version;
            return config;
        }
        if (command == "decode")
        {
            config.mode = Mode::Decode;
        }
        else if (command == "encode")
        {
            config.mode = Mode::Encode;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command);
        }

        for (int i = 2; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--input")
            {
                require_mode(config.mode, Mode::Decode, arg);
                config.input = parse_path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--format")
            {
                require_mode(config.mode, Mode::Decode, arg);
                const auto value = require_value(i, argc, argv, arg);
                if (value == "text")
                {
                    config.format = OutputFormat::Text;
                }
                else if (value == "json")
                {
                    config.format = OutputFormat::Json;
                }
                else
                {
                    throw std::runtime_error("Unknown format: " + value);
                }
            }
            else if (arg == "--max-frames")
            {
                require_mode(config.mode, Mode::Decode, arg);
                config.max_frames = static_cast<std::size_t>(parse_unsigned(
                    require_value(i, argc, argv, arg), arg, std::numeric_limits<std::size_t>::max()));
            }
            else if (arg == "--digest")
            {
                require_mode(config.mode, Mode::Decode, arg);
                config.digest = true;
            }
            else if (arg == "--output")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.output = parse_path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--type")
            {
                require_mode(config.mode, Mode::Encode, arg);
                const auto value = require_value(i, argc, argv, arg);
                config.frame_type = protocol::frame_type_from_string(value);
                if (!config.frame_type)
                {
                    throw std::runtime_error("Unknown frame type: " + value);
                }
            }
            else if (arg == "--stream")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.stream_id = static_cast<protocol::StreamId>(parse_unsigned(
                    require_value(i, argc, argv, arg), arg, std::numeric_limits<protocol::StreamId>::max()));
            }
            else if (arg == "--flags")
            {
                require_mode(config.mode, Mode::Encode, arg);
                const auto value = require_value(i, argc, argv, arg);
                const auto flags = protocol::flags_from_string(value);
                if (!flags)
                {
                    throw std::runtime_error("Unknown flags: " + value);
                }
                config.flags = *flags;
            }
            else if (arg == "--payload")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.payload_text = require_value(i, argc, argv, arg);
            }
            else if (arg == "--payload-base64")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.payload_base64 = require_value(i, argc, argv, arg);
            }
            else if (arg == "--payload-file")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.payload_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--protocol-version")
            {
                require_mode(config.mode, Mode::Encode, arg);
                config.protocol_version = static_cast<std::uint8_t>(
                    parse_unsigned(require_value(i, argc, argv, arg), arg, std::numeric_limits<std::uint8_t>::max()));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.mode == Mode::Encode)
        {
            if (!config.frame_type)
            {
                throw std::runtime_error("encode requires --type");
            }
            const int payload_sources = static_cast<int>(config.payload_text.has_value()) +
                                        static_cast<int>(config.payload_base64.has_value()) +
                                        static_cast<int>(config.payload_file.has_value());
            if (payload_sources > 1)
            {
                throw std::runtime_error("--payload, --payload-base64 and --payload-file are mutually exclusive");
            }
        }

        return config;
    }

    std::string usage(std::string_view program_name)
    {
        const std::string name(program_name);
        return "Usage:\n"
               "  " + name + " decode [--input <FILE|->] [--format text|json] [--max-frames <N>] [--digest]\n"
               "  " + name + " encode --type <auth|open_stream|data|close|heartbeat> [--stream <ID>]\n"
               "      [--flags end_stream,ack,error] [--payload <TEXT> | --payload-base64 <B64> | --payload-file <FILE>]\n"
               "      [--protocol-version <N>] [--output <FILE|->]\n"
               "  " + name + " --help | --version\n"
               "Common options: [--log <FILE>] [--verbose]\n";
    }

} // namespace rtunnel::inspect
