#include "Config.h"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace SBS
{
template <typename T> static T ParseValue(std::string_view option, std::string_view value, T minValue, T maxValue)
{
    T    result{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc{} || ptr != value.data() + value.size() || result < minValue || result > maxValue)
    {
        throw std::invalid_argument(fmt::format("Invalid value '{}' for {}", value, option));
    }
    return result;
}

std::string Usage(std::string_view program)
{
    return fmt::format(
        "Usage: {} [OPTIONS]\n"
        "Options:\n"
        "  --host HOST               Feed host (default: {})\n"
        "  --port PORT               Feed port (default: {})\n"
        "  --db PATH                 SQLite database (default: ./data/flightsdata.db)\n"
        "  --reconnect-delay SEC     Delay before reconnecting (default: 3)\n"
        "  --reconnect-max SEC       Upper bound for exponential backoff (default: 60)\n"
        "  --backoff fixed|exponential\n"
        "                            Reconnect delay policy (default: fixed)\n"
        "  --session-timeout SEC     Quiet period that ends a session (default: 1200)\n"
        "  --feed-time local|utc     Clock of the feed's generated date/time (default: local)\n"
        "  --max-clock-skew SEC      Feed times further from the receipt time are replaced by it (default: 1200)\n"
        "  --session-capacity N      Callsigns kept in the session index (default: 10000)\n"
        "  --no-sessions             Do not group records into sessions\n"
        "  --no-message-log          Do not keep decoded records in the messages table\n"
        "  --stats-interval N        Log statistics every N stored records (default: 1000, 0=disable)\n"
        "  --verbose                 Debug logging\n"
        "  --help                    Show this help message\n",
        program,
        Config::DefaultHost,
        Config::DefaultPort);
}

Config ParseCommandLine(int argc, char const* const* argv)
{
    Config config;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        auto             value = [&]() -> std::string_view {
            if (i + 1 >= argc) { throw std::invalid_argument(fmt::format("Missing value for {}", arg)); }
            return argv[++i];
        };

        if (arg == "--host") { config.host = value(); }
        else if (arg == "--port") { config.port = ParseValue<uint16_t>(arg, value(), 1, 65535); }
        else if (arg == "--db") { config.database = std::filesystem::path(value()); }
        else if (arg == "--reconnect-delay") { config.reconnect.initialDelay = std::chrono::seconds{ParseValue<int>(arg, value(), 1, 86400)}; }
        else if (arg == "--reconnect-max") { config.reconnect.maxDelay = std::chrono::seconds{ParseValue<int>(arg, value(), 1, 86400)}; }
        else if (arg == "--backoff")
        {
            auto mode = value();
            if (mode == "fixed") { config.reconnect.mode = ReconnectPolicy::Mode::Fixed; }
            else if (mode == "exponential") { config.reconnect.mode = ReconnectPolicy::Mode::Exponential; }
            else { throw std::invalid_argument(fmt::format("Invalid value '{}' for {}", mode, arg)); }
        }
        else if (arg == "--session-timeout")
        {
            config.ingest.session.timeout = std::chrono::seconds{ParseValue<int>(arg, value(), 1, 7 * 86400)};
        }
        else if (arg == "--feed-time")
        {
            auto base = value();
            if (base == "local") { config.ingest.feedTimeBase = TimeBase::Local; }
            else if (base == "utc") { config.ingest.feedTimeBase = TimeBase::Utc; }
            else { throw std::invalid_argument(fmt::format("Invalid value '{}' for {}", base, arg)); }
        }
        else if (arg == "--max-clock-skew")
        {
            config.ingest.maxClockSkew = std::chrono::seconds{ParseValue<int>(arg, value(), 1, 7 * 86400)};
        }
        else if (arg == "--session-capacity") { config.ingest.session.capacity = ParseValue<size_t>(arg, value(), 1, size_t{10000000}); }
        else if (arg == "--no-sessions") { config.ingest.enableSessions = false; }
        else if (arg == "--no-message-log") { config.ingest.enableMessageLog = false; }
        else if (arg == "--stats-interval") { config.ingest.statsInterval = ParseValue<uint64_t>(arg, value(), 0, UINT64_MAX); }
        else if (arg == "--verbose") { config.logLevel = Log::Level::Debug; }
        else if (arg == "--help") { config.showHelp = true; }
        else { throw std::invalid_argument(fmt::format("Unknown option {}", arg)); }
    }

    if (config.reconnect.maxDelay < config.reconnect.initialDelay) { config.reconnect.maxDelay = config.reconnect.initialDelay; }
    return config;
}
}    // namespace SBS
