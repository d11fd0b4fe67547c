#pragma once

#include "rtunnel/inspect/config.hpp"

namespace rtunnel::inspect
{

    // Installs the default spdlog logger. Stdout is left to frame output.
    void configure_logging(const InspectConfig &config);

} // namespace rtunnel::inspect
