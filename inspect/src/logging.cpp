#include "rtunnel/inspect/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rtunnel::inspect
{

    void configure_logging(const InspectConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), false));
        }
        auto logger = std::make_shared<spdlog::logger>("inspect", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace rtunnel::inspect
