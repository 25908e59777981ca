#pragma once
#include "FeedClient.h"
#include "FlightStore.h"
#include "LineFramer.h"
#include "SBSMessage.h"
#include "SessionTracker.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace SBS
{
// Feed bytes -> records -> decoded messages -> one store transaction per record.
// Decode and store failures drop the record; everything else is left to FeedClient.
struct Ingestor : IFeedHandler
{
    struct Config
    {
        bool                      enableSessions   = true;
        bool                      enableMessageLog = true;
        SessionTracker::Config    session{};
        size_t                    maxRecordLength = LineFramer::DefaultMaxRecordLength;
        uint64_t                  statsInterval   = 1000;    // 0 disables periodic statistics
        TimeBase                  feedTimeBase    = TimeBase::Local;
        std::chrono::milliseconds maxClockSkew    = SessionTracker::DefaultTimeout;    // feed times further off use the receipt time
    };

    enum class Outcome
    {
        Stored,
        Ignored,    // not a state update
        Skipped,    // could not be interpreted
        Dropped     // store rejected it
    };

    struct Stats
    {
        uint64_t records{0};
        uint64_t stored{0};
        uint64_t ignored{0};
        uint64_t decodeErrors{0};
        uint64_t storeErrors{0};
        uint64_t positions{0};
        uint64_t sessionsOpened{0};
        uint64_t clockSkew{0};
    };

    using Clock = std::function<time_point()>;

    static time_point SystemNow();

    Ingestor(FlightStore& storeIn, Config const& configIn, Clock clockIn = SystemNow);
    ~Ingestor() override = default;
    CLASS_DELETE_COPY_AND_MOVE(Ingestor);

    void HandleData(std::span<uint8_t const> const& data) override;
    void OnConnectionChanged(bool connected) override;

    Outcome HandleLine(std::string_view line);

    [[nodiscard]] Stats const&          GetStats() const { return _stats; }
    [[nodiscard]] SessionTracker const& Tracker() const { return _tracker; }
    void                                LogStats() const;

    private:
    Outcome    Persist(std::string_view line);
    time_point EventTimeOrNow(Message const& msg, time_point now);

    FlightStore&   _store;
    Config         _config;
    Clock          _clock;
    LineFramer     _framer;
    SessionTracker _tracker;
    Stats          _stats;
};
}    // namespace SBS
