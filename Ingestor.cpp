#include "Ingestor.h"
#include "Errors.h"
#include "Logging.h"

namespace SBS
{
time_point Ingestor::SystemNow()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

Ingestor::Ingestor(FlightStore& storeIn, Config const& configIn, Clock clockIn) :
    _store(storeIn),
    _config(configIn),
    _clock(std::move(clockIn)),
    _framer(configIn.maxRecordLength),
    _tracker(configIn.session, [this](std::string const& callsign) { return _store.LatestSession(callsign); })
{}

void Ingestor::HandleData(std::span<uint8_t const> const& data)
{
    _framer.Feed(data);
    std::string line;
    while (_framer.Pop(line)) { HandleLine(line); }
}

void Ingestor::OnConnectionChanged(bool connected)
{
    if (connected) { return; }
    if (_framer.PendingBytes() > 0) { Log::Debug("Dropping {} bytes of a partial record", _framer.PendingBytes()); }
    _framer.Reset();
    LogStats();
}

Ingestor::Outcome Ingestor::HandleLine(std::string_view line)
{
    _stats.records++;
    try
    {
        return Persist(line);
    } catch (DecodeError const& ex)
    {
        _stats.decodeErrors++;
        Log::Warn("Skipping record: {}: {}", ex.what(), line);
        return Outcome::Skipped;
    } catch (StoreError const& ex)
    {
        _stats.storeErrors++;
        Log::Error("Dropping record, store error {}: {}: {}", ex.code, ex.what(), line);
        return Outcome::Dropped;
    }
}

Ingestor::Outcome Ingestor::Persist(std::string_view line)
{
    auto msg = Decode(line);
    if (!msg.IsStateUpdate())
    {
        _stats.ignored++;
        return Outcome::Ignored;
    }

    std::string const hex(msg.Hex());
    if (!IsValidHex(hex)) { throw DecodeError(fmt::format("invalid aircraft identifier '{}'", hex)); }

    auto update    = msg.ToAircraftUpdate();
    auto now       = _clock();
    auto eventTime = EventTimeOrNow(msg, now);

    SessionTracker::Decision decision;
    if (_config.enableSessions && update.callsign) { decision = _tracker.Resolve(*update.callsign, hex, eventTime); }

    bool hasPosition = false;
    {
        FlightStore::Transaction tx(_store);
        _store.UpsertAircraft(hex, update, now);
        hasPosition = _store.AppendPosition(hex, eventTime, update);
        switch (decision.action)
        {
        case SessionTracker::Action::Open: _store.AppendSession(decision.session); break;
        case SessionTracker::Action::Extend: _store.TouchSession(decision.session.sessionId, decision.session.lastSeen); break;
        case SessionTracker::Action::None: break;
        }
        if (_config.enableMessageLog)
        {
            std::optional<std::string> sessionId;
            if (decision.action != SessionTracker::Action::None) { sessionId = decision.session.sessionId; }
            _store.AppendMessage(hex, sessionId, msg.ToJson(), now);
        }
        tx.Commit();
    }

    _tracker.Commit(decision);
    _stats.stored++;
    if (hasPosition) { _stats.positions++; }
    if (decision.action == SessionTracker::Action::Open)
    {
        _stats.sessionsOpened++;
        Log::Debug("Opened session {} for {}", decision.session.sessionId, hex);
    }
    if (_config.statsInterval != 0 && (_stats.stored % _config.statsInterval) == 0) { LogStats(); }
    return Outcome::Stored;
}

time_point Ingestor::EventTimeOrNow(Message const& msg, time_point now)
{
    auto t = msg.EventTime(_config.feedTimeBase);
    if (!t) { return now; }
    auto skew = (*t > now) ? (*t - now) : (now - *t);
    if (skew > _config.maxClockSkew)
    {
        _stats.clockSkew++;
        Log::Debug("Feed time {} is {} ms off the receipt time, using receipt time", ToEpochMs(*t), skew.count());
        return now;
    }
    return *t;
}

void Ingestor::LogStats() const
{
    Log::Info("Records: {} stored: {} ignored: {} skipped: {} dropped: {} positions: {} sessions: {} (index {}) oversize: {} clock skew: {}",
              _stats.records,
              _stats.stored,
              _stats.ignored,
              _stats.decodeErrors,
              _stats.storeErrors,
              _stats.positions,
              _stats.sessionsOpened,
              _tracker.Size(),
              _framer.OversizeRecords(),
              _stats.clockSkew);
}
}    // namespace SBS
