#pragma once
#include "Aircraft.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace SBS
{
// Positional fields of a BaseStation (port 30003) record
enum class Field : size_t
{
    MessageType      = 0,
    TransmissionType = 1,
    SessionId        = 2,
    AircraftId       = 3,
    Hex              = 4,
    FlightId         = 5,
    DateGenerated    = 6,
    TimeGenerated    = 7,
    DateLogged       = 8,
    TimeLogged       = 9,
    Callsign         = 10,
    Altitude         = 11,
    GroundSpeed      = 12,
    Track            = 13,
    Latitude         = 14,
    Longitude        = 15,
    VerticalRate     = 16,
    Squawk           = 17,
    Alert            = 18,
    Emergency        = 19,
    Spi              = 20,
    IsOnGround       = 21,
};

// Clock the feed writes its generated date/time in. dump1090 and BaseStation use the receiver's local time.
enum class TimeBase
{
    Local,
    Utc
};

struct Message
{
    static constexpr size_t           FieldCount      = 22;
    static constexpr std::string_view StateUpdateType = "MSG";

    [[nodiscard]] std::string const& Get(Field f) const { return fields[static_cast<size_t>(f)]; }
    [[nodiscard]] std::string_view   Type() const { return Get(Field::MessageType); }
    [[nodiscard]] std::string_view   Hex() const { return Get(Field::Hex); }
    [[nodiscard]] std::string_view   Callsign() const { return Get(Field::Callsign); }

    [[nodiscard]] bool IsStateUpdate() const { return Type() == StateUpdateType; }

    // Typed view of the non-blank fields. Values that fail to parse are left absent.
    [[nodiscard]] AircraftUpdate ToAircraftUpdate() const;

    // Generated date/time (fields 6 and 7), if both parse
    [[nodiscard]] std::optional<time_point> EventTime(TimeBase base = TimeBase::Local) const;

    // All positional fields as a JSON object keyed by field name
    [[nodiscard]] std::string ToJson() const;

    std::array<std::string, FieldCount> fields{};
};

// Never throws on malformed input: short records are padded with blanks, extra fields dropped.
Message Decode(std::string_view record);

std::string_view FieldName(Field f);

std::optional<time_point> ParseDateTime(std::string_view date, std::string_view time, TimeBase base = TimeBase::Local);

// Hex identifiers are 24 bit addresses: six hexadecimal digits, optionally prefixed by '~' for non-ICAO addresses
constexpr size_t HexDigits = 6;
bool             IsValidHex(std::string_view hex);
}    // namespace SBS
