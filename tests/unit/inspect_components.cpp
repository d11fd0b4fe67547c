#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "rtunnel/codec.hpp"
#include "rtunnel/crypto.hpp"
#include "rtunnel/encoding/base64.hpp"
#include "rtunnel/inspect/config.hpp"
#include "rtunnel/inspect/inspector.hpp"
#include "rtunnel/memory_stream.hpp"

using namespace rtunnel;
using namespace rtunnel::inspect;

namespace
{

    InspectConfig parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "rtunnel-inspect");
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    std::vector<std::uint8_t> encode(const protocol::Frame &frame)
    {
        auto encoded = protocol::encode_frame(frame);
        assert(encoded.ok());
        return std::move(encoded).value();
    }

    std::vector<std::string> lines_of(const std::string &text)
    {
        std::vector<std::string> lines;
        std::istringstream input(text);
        std::string line;
        while (std::getline(input, line))
        {
            lines.push_back(line);
        }
        return lines;
    }

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    void test_parse_decode_arguments()
    {
        assert(parse({}).mode == Mode::Help);
        assert(parse({"--version"}).mode == Mode::Version);

        const auto config = parse({"decode", "--input", "-", "--format", "json", "--max-frames", "3", "--digest",
                                   "--log", "inspect.log", "-v"});
        assert(config.mode == Mode::Decode);
        assert(!config.input.has_value());
        assert(config.format == OutputFormat::Json);
        assert(config.max_frames == 3u);
        assert(config.digest);
        assert(config.log_file == std::filesystem::path("inspect.log"));
        assert(config.verbose);

        const auto from_file = parse({"decode", "--input", "capture.bin"});
        assert(from_file.input == std::filesystem::path("capture.bin"));
        assert(from_file.format == OutputFormat::Text);
    }

    void test_parse_encode_arguments()
    {
        const auto config = parse({"encode", "--type", "open_stream", "--stream", "7", "--flags", "end_stream,ack",
                                   "--payload", "hello", "--output", "frame.bin"});
        assert(config.mode == Mode::Encode);
        assert(config.frame_type == protocol::FrameType::OpenStream);
        assert(config.stream_id == 7u);
        assert(config.flags == (protocol::Flags::EndStream | protocol::Flags::Ack));
        assert(config.payload_text == std::string("hello"));
        assert(config.output == std::filesystem::path("frame.bin"));
        assert(config.protocol_version == protocol::kVersion);

        const auto max_stream = parse({"encode", "--type", "data", "--stream", "4294967295"});
        assert(max_stream.stream_id == 0xFFFFFFFFu);
    }

    void test_parse_rejects_bad_arguments()
    {
        assert(parse_fails({"replay"}));
        assert(parse_fails({"encode"}));
        assert(parse_fails({"encode", "--type", "ping"}));
        assert(parse_fails({"encode", "--type", "data", "--stream", "4294967296"}));
        assert(parse_fails({"encode", "--type", "data", "--stream", "-1"}));
        assert(parse_fails({"encode", "--type", "data", "--flags", "fin"}));
        assert(parse_fails({"encode", "--type", "data", "--payload", "a", "--payload-file", "b"}));
        assert(parse_fails({"encode", "--type", "data", "--input", "x"}));
        assert(parse_fails({"decode", "--type", "data"}));
        assert(parse_fails({"decode", "--format", "xml"}));
        assert(parse_fails({"decode", "--max-frames"}));
        assert(parse_fails({"encode", "--type", "data", "--protocol-version", "256"}));
    }

    void test_build_frame()
    {
        auto config = parse({"encode", "--type", "auth", "--payload-base64", "aGVsbG8="});
        const auto frame = build_frame(config);
        assert(frame.type() == protocol::FrameType::Auth);
        assert(frame.is_control_frame());
        assert(frame.payload() == protocol::to_bytes("hello"));

        for (const char *malformed : {"!!!", "QQ==junk!", "QQ==QQ==", "QQ", "===="})
        {
            config.payload_base64 = malformed;
            bool threw = false;
            try
            {
                (void)build_frame(config);
            }
            catch (const std::runtime_error &)
            {
                threw = true;
            }
            assert(threw);
        }

        config.payload_base64 = "";
        assert(build_frame(config).payload().empty());

        const auto versioned = build_frame(parse({"encode", "--type", "heartbeat", "--protocol-version", "2"}));
        assert(versioned.version() == 2);
        assert(versioned.payload().empty());
    }

    void test_base64_decoding()
    {
        assert(encoding::decode_base64("QQ==") == protocol::to_bytes("A"));
        assert(encoding::decode_base64("QUI=") == protocol::to_bytes("AB"));
        assert(encoding::decode_base64("aGVs\nbG8=") == protocol::to_bytes("hello"));

        const auto empty = encoding::decode_base64("");
        assert(empty.has_value());
        assert(empty->empty());

        assert(!encoding::decode_base64("QQ==junk").has_value());
        assert(!encoding::decode_base64("QQ=A").has_value());
        assert(!encoding::decode_base64("QUJD=").has_value());
        assert(!encoding::decode_base64("QUJDR").has_value());
        assert(!encoding::decode_base64("QR==").has_value());
        assert(!encoding::decode_base64("====").has_value());
        assert(!encoding::decode_base64("QU*=").has_value());
    }

    void test_payload_digest()
    {
        const protocol::Frame empty(protocol::FrameType::Heartbeat, protocol::Flags::None, 0);
        assert(crypto::payload_digest(empty) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        const protocol::Frame first(protocol::FrameType::Data, protocol::Flags::None, 1, protocol::to_bytes("chunk"));
        const protocol::Frame second(protocol::FrameType::Data, protocol::Flags::EndStream, 9,
                                     protocol::to_bytes("chunk"));
        assert(crypto::payload_digest(first) == crypto::payload_digest(second));
        assert(crypto::payload_digest(first) == crypto::hash_bytes(first.payload()));
        assert(crypto::payload_digest(first) != crypto::payload_digest(empty));
    }

    void test_describe_frame()
    {
        const protocol::Frame frame(protocol::FrameType::Data, protocol::Flags::EndStream, 1,
                                    protocol::to_bytes("Response body"));

        const auto json = describe_frame(frame, 1, false);
        assert(json["index"] == 1);
        assert(json["version"] == 1);
        assert(json["type"] == "DATA");
        assert(json["flags"] == "END_STREAM");
        assert(json["stream_id"] == 1);
        assert(json["plane"] == "data");
        assert(json["payload_size"] == 13);
        assert(json["payload_base64"] == "UmVzcG9uc2UgYm9keQ==");
        assert(!json.contains("payload_digest"));

        const auto with_digest = describe_frame(frame, 1, true);
        assert(with_digest["payload_digest"].get<std::string>().size() == 64);

        assert(format_frame(frame, 1, false) == "#1 DATA flags=END_STREAM stream=1 (data) payload=13B");
        const protocol::Frame heartbeat(protocol::FrameType::Heartbeat, protocol::Flags::Ack, 0);
        assert(format_frame(heartbeat, 2, false) == "#2 HEARTBEAT flags=ACK stream=0 (control) payload=0B");

        assert(encoding::decode_base64(json["payload_base64"].get<std::string>()) == frame.payload());
        assert(with_digest["payload_digest"] == crypto::payload_digest(frame));
    }

    void test_dump_clean_stream()
    {
        const protocol::Frame first(protocol::FrameType::OpenStream, protocol::Flags::None, 3, protocol::to_bytes("GET"));
        const protocol::Frame second(protocol::FrameType::Close, protocol::Flags::EndStream, 3);

        auto bytes = encode(first);
        const auto second_bytes = encode(second);
        bytes.insert(bytes.end(), second_bytes.begin(), second_bytes.end());
        const auto total = bytes.size();

        MemoryStream input(std::move(bytes));
        std::ostringstream out;
        InspectConfig config;
        config.mode = Mode::Decode;
        config.format = OutputFormat::Json;

        const auto report = dump_frames(input, out, config);
        assert(report.frames == 2);
        assert(report.bytes == total);
        assert(!report.protocol_error);
        assert(!report.io_error);
        assert(!report.truncated);
        assert(exit_status(report) == ExitOk);

        const auto lines = lines_of(out.str());
        assert(lines.size() == 2);
        const auto decoded = nlohmann::json::parse(lines[1]);
        assert(decoded["type"] == "CLOSE");
        assert(decoded["flags"] == "END_STREAM");
        assert(decoded["index"] == 2);
    }

    void test_dump_stops_at_limit()
    {
        auto bytes = encode(protocol::Frame(protocol::FrameType::Heartbeat, protocol::Flags::None, 0));
        const auto more = encode(protocol::Frame(protocol::FrameType::Heartbeat, protocol::Flags::Ack, 0));
        bytes.insert(bytes.end(), more.begin(), more.end());

        MemoryStream input(std::move(bytes));
        std::ostringstream out;
        InspectConfig config;
        config.max_frames = 1;

        const auto report = dump_frames(input, out, config);
        assert(report.frames == 1);
        assert(exit_status(report) == ExitOk);
        assert(input.available() == more.size());
    }

    void test_dump_reports_truncation()
    {
        const auto complete = encode(protocol::Frame(protocol::FrameType::Data, protocol::Flags::None, 1,
                                                     protocol::to_bytes("chunk")));
        auto bytes = complete;
        bytes.insert(bytes.end(), complete.begin(), complete.end() - 2);

        MemoryStream input(std::move(bytes));
        std::ostringstream out;
        const auto report = dump_frames(input, out, InspectConfig{});
        assert(report.frames == 1);
        assert(report.truncated);
        assert(!report.protocol_error);
        assert(exit_status(report) == ExitFailure);
        log_report(report);
    }

    void test_dump_reports_protocol_error()
    {
        const auto good = encode(protocol::Frame(protocol::FrameType::Data, protocol::Flags::None, 1,
                                                 protocol::to_bytes("chunk")));
        auto bad = good;
        bad[6] = 0x02;
        auto bytes = good;
        bytes.insert(bytes.end(), bad.begin(), bad.end());

        MemoryStream input(std::move(bytes));
        std::ostringstream out;
        const auto report = dump_frames(input, out, InspectConfig{});
        assert(report.frames == 1);
        assert(report.protocol_error.has_value());
        assert(report.protocol_error->code() == ErrorCode::InvalidVersion);
        assert(exit_status(report) == ExitProtocolError);
        assert(lines_of(out.str()).size() == 1);
        log_report(report);
    }

    void test_encode_then_decode_through_files()
    {
        const auto temp_root = std::filesystem::temp_directory_path() / "rtunnel_inspect_test";
        cleanup_path(temp_root);
        std::filesystem::create_directories(temp_root);
        const auto frame_path = temp_root / "frame.bin";

        asio::io_context io_context;
        auto config = parse({"encode", "--type", "data", "--stream", "1", "--flags", "end_stream", "--payload",
                             "Response body", "--output", frame_path.string()});
        assert(run_encode(io_context, config) == ExitOk);

        std::ifstream file(frame_path, std::ios::binary);
        const std::vector<std::uint8_t> written(std::istreambuf_iterator<char>(file), {});
        assert(written.size() == 26);
        assert(written[4] == 0x52);
        assert(written[5] == 0x54);

        const auto decode_config = parse({"decode", "--input", frame_path.string()});
        std::ostringstream out;
        assert(run_decode(io_context, decode_config, out) == ExitOk);
        assert(out.str() == "#1 DATA flags=END_STREAM stream=1 (data) payload=13B\n");

        auto rejected = parse({"encode", "--type", "data", "--protocol-version", "2", "--output",
                               frame_path.string()});
        assert(run_encode(io_context, rejected) == ExitProtocolError);
        std::ifstream kept(frame_path, std::ios::binary);
        const std::vector<std::uint8_t> after(std::istreambuf_iterator<char>(kept), {});
        assert(after == written);

        cleanup_path(temp_root);
    }

} // namespace

void run_inspect_component_tests()
{
    test_parse_decode_arguments();
    test_parse_encode_arguments();
    test_parse_rejects_bad_arguments();
    test_build_frame();
    test_base64_decoding();
    test_payload_digest();
    test_describe_frame();
    test_dump_clean_stream();
    test_dump_stops_at_limit();
    test_dump_reports_truncation();
    test_dump_reports_protocol_error();
    test_encode_then_decode_through_files();
}
