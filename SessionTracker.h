#pragma once
#include "Aircraft.h"

#include <chrono>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace SBS
{
// Groups records sharing a callsign into sessions split by a quiet period.
// A gap exactly equal to the timeout continues the open session.
struct SessionTracker
{
    static constexpr std::chrono::seconds DefaultTimeout{1200};
    static constexpr size_t               DefaultCapacity = 10000;

    struct Config
    {
        std::chrono::milliseconds timeout  = DefaultTimeout;
        size_t                    capacity = DefaultCapacity;
    };

    enum class Action
    {
        None,
        Open,
        Extend
    };

    struct Decision
    {
        Action  action{Action::None};
        Session session{};
    };

    // Consulted when a callsign is not in the index, e.g. after eviction or a restart
    using Lookup = std::function<std::optional<Session>(std::string const& callsign)>;

    SessionTracker() = default;
    explicit SessionTracker(Config const& configIn, Lookup lookupIn = {}) : config(configIn), lookup(std::move(lookupIn)) {}

    // Does not modify the index
    [[nodiscard]] Decision Resolve(std::string_view callsign, std::string_view hex, time_point t) const;

    // Records a decision once it has been persisted
    void Commit(Decision const& decision);

    // Drops entries whose last sighting is older than the timeout relative to now
    size_t Sweep(time_point now);

    [[nodiscard]] size_t Size() const { return _index.size(); }

    static std::string MakeSessionId(std::string_view callsign, time_point firstSeen);

    Config config;
    Lookup lookup;

    private:
    struct Entry
    {
        std::string                      sessionId;
        time_point                       firstSeen{};
        time_point                       lastSeen{};
        std::list<std::string>::iterator lruPos;
    };

    std::unordered_map<std::string, Entry> _index;
    std::list<std::string>                 _lru;    // most recently committed first
    time_point                             _newest{};
};
}    // namespace SBS
