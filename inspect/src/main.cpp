#include <asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "rtunnel/inspect/config.hpp"
#include "rtunnel/inspect/inspector.hpp"
#include "rtunnel/inspect/logging.hpp"
#include "rtunnel/version.hpp"

int main(int argc, char *argv[])
{
    using namespace rtunnel::inspect;

    InspectConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << "\n"
                  << usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.mode == Mode::Help)
    {
        std::cout << "rtunnel frame inspector " << rtunnel::version() << "\n"
                  << usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (config.mode == Mode::Version)
    {
        std::cout << rtunnel::version() << std::endl;
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(config);
        spdlog::debug("rtunnel-inspect {} starting", rtunnel::version());

        asio::io_context io_context;
        if (config.mode == Mode::Decode)
        {
            return run_decode(io_context, config, std::cout);
        }
        return run_encode(io_context, config);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "rtunnel-inspect failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
