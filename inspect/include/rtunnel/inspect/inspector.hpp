#pragma once

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "rtunnel/codec.hpp"
#include "rtunnel/frame.hpp"
#include "rtunnel/inspect/config.hpp"
#include "rtunnel/protocol_error.hpp"

namespace rtunnel::inspect
{

    enum ExitStatus : int
    {
        ExitOk = 0,
        ExitFailure = 1,
        ExitProtocolError = 2
    };

    // Forwards reads and counts the bytes that made it through.
    template <typename SyncReadStream>
    class CountingReader
    {
    public:
        explicit CountingReader(SyncReadStream &stream) : stream_(stream) {}

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers, std::error_code &ec)
        {
            const auto count = stream_.read_some(buffers, ec);
            consumed_ += count;
            return count;
        }

        template <typename MutableBufferSequence>
        std::size_t read_some(const MutableBufferSequence &buffers)
        {
            const auto count = stream_.read_some(buffers);
            consumed_ += count;
            return count;
        }

        std::size_t consumed() const noexcept { return consumed_; }

    private:
        SyncReadStream &stream_;
        std::size_t consumed_{0};
    };

    struct DumpReport
    {
        std::size_t frames{0};
        std::size_t bytes{0};
        std::optional<ProtocolError> protocol_error;
        std::error_code io_error;
        // End of input inside a frame rather than at a frame boundary.
        bool truncated{false};
    };

    nlohmann::json describe_frame(const protocol::Frame &frame, std::size_t index, bool include_digest);

    std::string format_frame(const protocol::Frame &frame, std::size_t index, bool include_digest);

    void print_frame(std::ostream &out, const protocol::Frame &frame, std::size_t index, const InspectConfig &config);

    template <typename SyncReadStream>
    DumpReport dump_frames(SyncReadStream &input, std::ostream &out, const InspectConfig &config)
    {
        CountingReader<SyncReadStream> reader(input);
        DumpReport report;
        while (!config.max_frames || report.frames < *config.max_frames)
        {
            const auto frame_start = reader.consumed();
            auto result = protocol::read_frame(reader);
            if (!result)
            {
                if (const auto *error = result.protocol_error())
                {
                    report.protocol_error = *error;
                }
                else if (!protocol::is_end_of_input(result.io_error()) || reader.consumed() != frame_start)
                {
                    report.io_error = result.io_error();
                    report.truncated = protocol::is_end_of_input(result.io_error());
                }
                break;
            }
            ++report.frames;
            print_frame(out, result.value(), report.frames, config);
        }
        report.bytes = reader.consumed();
        return report;
    }

    int exit_status(const DumpReport &report) noexcept;

    void log_report(const DumpReport &report);

    // Throws std::runtime_error when the payload source cannot be read or decoded.
    protocol::Frame build_frame(const InspectConfig &config);

    int run_decode(asio::io_context &io_context, const InspectConfig &config, std::ostream &out);

    int run_encode(asio::io_context &io_context, const InspectConfig &config);

    asio::posix::stream_descriptor open_input(asio::io_context &io_context,
                                              const std::optional<std::filesystem::path> &path);

    asio::posix::stream_descriptor open_output(asio::io_context &io_context,
                                               const std::optional<std::filesystem::path> &path);

} // namespace rtunnel::inspect
