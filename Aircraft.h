#pragma once
#include "CommonMacros.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace SBS
{
using time_point = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline int64_t ToEpochMs(time_point tp)
{
    return tp.time_since_epoch().count();
}

inline time_point FromEpochMs(int64_t ms)
{
    return time_point{std::chrono::milliseconds{ms}};
}

// Sparse update carried by one record. Absent members leave the stored value untouched.
struct AircraftUpdate
{
    std::optional<std::string> callsign;
    std::optional<int32_t>     altitude;
    std::optional<double>      groundSpeed;
    std::optional<double>      heading;
    std::optional<double>      lat;
    std::optional<double>      lon;
    std::optional<int32_t>     verticalRate;
    std::optional<std::string> squawk;
    std::optional<bool>        grounded;

    [[nodiscard]] bool HasPosition() const { return lat.has_value() && lon.has_value(); }
};

struct AircraftState
{
    int64_t                    id{};
    std::string                hex;
    std::optional<std::string> callsign;
    std::optional<int32_t>     altitude;
    std::optional<double>      groundSpeed;
    std::optional<double>      heading;
    std::optional<double>      lat;
    std::optional<double>      lon;
    std::optional<bool>        grounded;
    std::optional<std::string> squawk;
    std::optional<int32_t>     verticalRate;
    time_point                 createdAt{};
    time_point                 updatedAt{};
};

struct PositionSample
{
    std::string            hex;
    time_point             timestamp{};
    double                 lat{};
    double                 lon{};
    std::optional<int32_t> altitude;
    std::optional<double>  heading;
    std::optional<double>  groundSpeed;
};

struct Session
{
    std::string sessionId;
    std::string callsign;
    std::string hex;
    time_point  firstSeen{};
    time_point  lastSeen{};
};
}    // namespace SBS
