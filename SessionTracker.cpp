#include "SessionTracker.h"
#include "Logging.h"

#include <algorithm>

namespace SBS
{
std::string SessionTracker::MakeSessionId(std::string_view callsign, time_point firstSeen)
{
    return fmt::format("{}-{}", callsign, ToEpochMs(firstSeen));
}

SessionTracker::Decision SessionTracker::Resolve(std::string_view callsign, std::string_view hex, time_point t) const
{
    Decision decision;
    if (callsign.empty()) { return decision; }

    std::optional<Session> open;
    auto                   key = std::string(callsign);
    auto                   it  = _index.find(key);
    if (it != _index.end()) { open = Session{it->second.sessionId, key, std::string(hex), it->second.firstSeen, it->second.lastSeen}; }
    else if (lookup) { open = lookup(key); }

    if (open && (t - open->lastSeen) <= config.timeout)
    {
        decision.action           = Action::Extend;
        decision.session          = std::move(*open);
        decision.session.lastSeen = std::max(decision.session.lastSeen, t);
        return decision;
    }

    decision.action            = Action::Open;
    decision.session.sessionId = MakeSessionId(callsign, t);
    decision.session.callsign  = key;
    decision.session.hex       = std::string(hex);
    decision.session.firstSeen = t;
    decision.session.lastSeen  = t;
    return decision;
}

void SessionTracker::Commit(Decision const& decision)
{
    if (decision.action == Action::None) { return; }

    auto const& s  = decision.session;
    auto        it = _index.find(s.callsign);
    if (it == _index.end())
    {
        _lru.push_front(s.callsign);
        _index.emplace(s.callsign, Entry{s.sessionId, s.firstSeen, s.lastSeen, _lru.begin()});
    }
    else
    {
        it->second.sessionId = s.sessionId;
        it->second.firstSeen = s.firstSeen;
        it->second.lastSeen  = s.lastSeen;
        _lru.splice(_lru.begin(), _lru, it->second.lruPos);
    }
    _newest = std::max(_newest, s.lastSeen);

    Sweep(_newest);
    while (_index.size() > config.capacity && !_lru.empty())
    {
        Log::Debug("Session index full, evicting {}", _lru.back());
        _index.erase(_lru.back());
        _lru.pop_back();
    }
}

size_t SessionTracker::Sweep(time_point now)
{
    size_t removed = 0;
    while (!_lru.empty())
    {
        auto it = _index.find(_lru.back());
        if (it != _index.end() && (now - it->second.lastSeen) <= config.timeout) { break; }
        if (it != _index.end()) { _index.erase(it); }
        _lru.pop_back();
        removed++;
    }
    return removed;
}
}    // namespace SBS
