#pragma once
#include "Ingestor.h"
#include "Logging.h"
#include "ReconnectPolicy.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace SBS
{
struct Config
{
    static constexpr char const* DefaultHost = "127.0.0.1";
    static constexpr uint16_t    DefaultPort = 30003;

    std::string             host     = DefaultHost;
    uint16_t                port     = DefaultPort;
    std::filesystem::path   database = "./data/flightsdata.db";
    ReconnectPolicy::Config reconnect{};
    Ingestor::Config        ingest{};
    Log::Level              logLevel = Log::Level::Info;
    bool                    showHelp = false;
};

// Throws std::invalid_argument on unknown options or bad values
Config ParseCommandLine(int argc, char const* const* argv);

std::string Usage(std::string_view program);
}    // namespace SBS
