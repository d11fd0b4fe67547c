#include "rtunnel/inspect/inspector.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <asio/buffer.hpp>
#include <asio/write.hpp>
#include <spdlog/spdlog.h>

#include "rtunnel/crypto.hpp"
#include "rtunnel/encoding/base64.hpp"

namespace rtunnel::inspect
{

    namespace
    {

        std::string_view plane(const protocol::Frame &frame)
        {
            return frame.is_control_frame() ? "control" : "data";
        }

        std::vector<std::uint8_t> read_file(const std::filesystem::path &path)
        {
            std::ifstream file(path, std::ios::binary);
            if (!file.is_open())
            {
                throw std::runtime_error("Failed to open payload file: " + path.string());
            }
            return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        }

        asio::posix::stream_descriptor open_descriptor(asio::io_context &io_context, int standard_fd,
                                                       const std::optional<std::filesystem::path> &path, int flags)
        {
            const int fd = path ? ::open(path->c_str(), flags, 0644) : ::dup(standard_fd);
            if (fd < 0)
            {
                const int error = errno;
                throw std::system_error(error, std::generic_category(),
                                        "Failed to open " + (path ? path->string() : std::string("standard stream")));
            }
            return asio::posix::stream_descriptor(io_context, fd);
        }

    } // namespace

    nlohmann::json describe_frame(const protocol::Frame &frame, std::size_t index, bool include_digest)
    {
        nlohmann::json json = {
            {"index", index},
            {"version", frame.version()},
            {"type", protocol::to_string(frame.type())},
            {"flags", protocol::format_flags(frame.flags())},
            {"stream_id", frame.stream_id()},
            {"plane", plane(frame)},
            {"payload_size", frame.payload().size()},
            {"payload_base64", encoding::encode_base64(frame.payload())},
        };
        if (include_digest)
        {
            json["payload_digest"] = crypto::payload_digest(frame);
        }
        return json;
    }

    std::string format_frame(const protocol::Frame &frame, std::size_t index, bool include_digest)
    {
        std::ostringstream line;
        line << "#" << index << " " << protocol::to_string(frame.type())
             << " flags=" << protocol::format_flags(frame.flags())
             << " stream=" << frame.stream_id() << " (" << plane(frame) << ")"
             << " payload=" << frame.payload().size() << "B";
        if (include_digest)
        {
            line << " digest=" << crypto::payload_digest(frame);
        }
        return line.str();
    }

    void print_frame(std::ostream &out, const protocol::Frame &frame, std::size_t index, const InspectConfig &config)
    {
        spdlog::debug("Decoded frame #{} {} on stream {}", index, protocol::to_string(frame.type()), frame.stream_id());
        if (config.format == OutputFormat::Json)
        {
            out << describe_frame(frame, index, config.digest).dump() << '\n';
        }
        else
        {
            out << format_frame(frame, index, config.digest) << '\n';
        }
    }

    int exit_status(const DumpReport &report) noexcept
    {
        if (report.protocol_error)
        {
            return ExitProtocolError;
        }
        if (report.io_error)
        {
            return ExitFailure;
        }
        return ExitOk;
    }

    void log_report(const DumpReport &report)
    {
        if (report.protocol_error)
        {
            const auto code = report.protocol_error->code();
            spdlog::error("Frame #{} rejected: {} ({}): {}{}", report.frames + 1, to_string(code), to_int(code),
                          report.protocol_error->message(),
                          is_connection_fatal(code) ? ", connection must be closed" : "");
        }
        else if (report.truncated)
        {
            spdlog::error("Input ended inside frame #{} after {} bytes", report.frames + 1, report.bytes);
        }
        else if (report.io_error)
        {
            spdlog::error("Read failed after {} frames: {}", report.frames, report.io_error.message());
        }
        else
        {
            spdlog::info("Decoded {} frames ({} bytes)", report.frames, report.bytes);
        }
    }

    protocol::Frame build_frame(const InspectConfig &config)
    {
        if (!config.frame_type)
        {
            throw std::runtime_error("Frame type is required");
        }

        std::vector<std::uint8_t> payload;
        if (config.payload_text)
        {
            payload = protocol::to_bytes(*config.payload_text);
        }
        else if (config.payload_base64)
        {
            auto decoded = encoding::decode_base64(*config.payload_base64);
            if (!decoded)
            {
                throw std::runtime_error("Invalid base64 payload");
            }
            payload = std::move(*decoded);
        }
        else if (config.payload_file)
        {
            payload = read_file(*config.payload_file);
        }

        return protocol::Frame(*config.frame_type, config.flags, config.stream_id, std::move(payload),
                               config.protocol_version);
    }

    int run_decode(asio::io_context &io_context, const InspectConfig &config, std::ostream &out)
    {
        auto input = open_input(io_context, config.input);
        const auto report = dump_frames(input, out, config);
        out.flush();
        log_report(report);
        return exit_status(report);
    }

    int run_encode(asio::io_context &io_context, const InspectConfig &config)
    {
        const auto frame = build_frame(config);
        // Validate before the output is opened; opening truncates an existing file.
        const auto encoded = protocol::encode_frame(frame);
        if (const auto *error = encoded.protocol_error())
        {
            spdlog::error("Refusing to encode frame: {} ({}): {}", to_string(error->code()), to_int(error->code()),
                          error->message());
            return ExitProtocolError;
        }

        auto output = open_output(io_context, config.output);
        std::error_code ec;
        asio::write(output, asio::buffer(encoded.value()), ec);
        if (ec)
        {
            spdlog::error("Write failed: {}", ec.message());
            return ExitFailure;
        }
        spdlog::info("Encoded {} frame on stream {} ({} bytes)", protocol::to_string(frame.type()), frame.stream_id(),
                     frame.encoded_size());
        return ExitOk;
    }

    asio::posix::stream_descriptor open_input(asio::io_context &io_context,
                                              const std::optional<std::filesystem::path> &path)
    {
        return open_descriptor(io_context, STDIN_FILENO, path, O_RDONLY);
    }

    asio::posix::stream_descriptor open_output(asio::io_context &io_context,
                                               const std::optional<std::filesystem::path> &path)
    {
        return open_descriptor(io_context, STDOUT_FILENO, path, O_WRONLY | O_CREAT | O_TRUNC);
    }

} // namespace rtunnel::inspect
