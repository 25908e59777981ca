#include "SBSMessage.h"

SUPPRESS_WARNINGS_START
SUPPRESS_THIRD_PARTY_WARNINGS
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
SUPPRESS_WARNINGS_END

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ctime>
#include <limits>
#include <type_traits>

namespace SBS
{
static constexpr std::array<std::string_view, Message::FieldCount> FieldNames = {
    "message_type", "transmission_type", "session_id", "aircraft_id", "hex",      "flight_id",     "date_generated", "time_generated",
    "date_logged",  "time_logged",       "callsign",   "altitude",    "gspeed",   "track",         "lat",            "lon",
    "vertical_rate", "squawk",           "alert",      "emergency",   "spi",      "is_on_ground"};

static std::string_view Trim(std::string_view str)
{
    auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!str.empty() && isSpace(str.front())) { str.remove_prefix(1); }
    while (!str.empty() && isSpace(str.back())) { str.remove_suffix(1); }
    return str;
}

template <typename T> static std::optional<T> ParseNumber(std::string_view str)
{
    T value{};
    auto const* end = str.data() + str.size();
    if (!str.empty() && str.front() == '+') { str.remove_prefix(1); }
    auto [ptr, ec] = std::from_chars(str.data(), end, value);
    if (str.empty() || ec != std::errc{} || ptr != end) { return std::nullopt; }
    if constexpr (std::is_floating_point_v<T>)
    {
        if (!std::isfinite(value)) { return std::nullopt; }
    }
    return value;
}

// Some feeds write altitudes with a decimal part
static std::optional<int32_t> ParseInteger(std::string_view str)
{
    if (auto i = ParseNumber<int32_t>(str)) { return i; }
    auto d = ParseNumber<double>(str);
    if (!d || *d > std::numeric_limits<int32_t>::max() || *d < std::numeric_limits<int32_t>::min()) { return std::nullopt; }
    return static_cast<int32_t>(std::lround(*d));
}

static std::optional<bool> ParseFlag(std::string_view str)
{
    if (str == "-1" || str == "1" || str == "true" || str == "True") { return true; }
    if (str == "0" || str == "false" || str == "False") { return false; }
    return std::nullopt;
}

static std::optional<std::string> NonBlank(std::string const& str)
{
    if (str.empty()) { return std::nullopt; }
    return str;
}

std::string_view FieldName(Field f)
{
    return FieldNames.at(static_cast<size_t>(f));
}

bool IsValidHex(std::string_view hex)
{
    if (!hex.empty() && hex.front() == '~') { hex.remove_prefix(1); }
    if (hex.size() != HexDigits) { return false; }
    return std::all_of(hex.begin(), hex.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

Message Decode(std::string_view record)
{
    Message msg;
    size_t  index = 0;
    while (index < Message::FieldCount)
    {
        auto comma = record.find(',');
        auto token = Trim(record.substr(0, comma));
        msg.fields[index].assign(token.data(), token.size());
        index++;
        if (comma == std::string_view::npos) { break; }
        record.remove_prefix(comma + 1);
    }

    auto& hex = msg.fields[static_cast<size_t>(Field::Hex)];
    std::transform(hex.begin(), hex.end(), hex.begin(), [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); });
    return msg;
}

AircraftUpdate Message::ToAircraftUpdate() const
{
    AircraftUpdate update;
    update.callsign     = NonBlank(Get(Field::Callsign));
    update.altitude     = ParseInteger(Get(Field::Altitude));
    update.groundSpeed  = ParseNumber<double>(Get(Field::GroundSpeed));
    update.heading      = ParseNumber<double>(Get(Field::Track));
    update.lat          = ParseNumber<double>(Get(Field::Latitude));
    update.lon          = ParseNumber<double>(Get(Field::Longitude));
    update.verticalRate = ParseInteger(Get(Field::VerticalRate));
    update.squawk       = NonBlank(Get(Field::Squawk));
    update.grounded     = ParseFlag(Get(Field::IsOnGround));

    if (update.lat && (*update.lat < -90.0 || *update.lat > 90.0)) { update.lat.reset(); }
    if (update.lon && (*update.lon < -180.0 || *update.lon > 180.0)) { update.lon.reset(); }
    return update;
}

std::optional<time_point> Message::EventTime(TimeBase base) const
{
    return ParseDateTime(Get(Field::DateGenerated), Get(Field::TimeGenerated), base);
}

std::string Message::ToJson() const
{
    rapidjson::StringBuffer                    buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    for (size_t i = 0; i < FieldCount; i++)
    {
        writer.Key(FieldNames[i].data(), static_cast<rapidjson::SizeType>(FieldNames[i].size()));
        writer.String(fields[i].data(), static_cast<rapidjson::SizeType>(fields[i].size()));
    }
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
}

// date: YYYY/MM/DD, time: HH:MM:SS[.mmm]
std::optional<time_point> ParseDateTime(std::string_view date, std::string_view time, TimeBase base)
{
    auto next = [](std::string_view& str, char sep) {
        auto pos   = str.find(sep);
        auto token = str.substr(0, pos);
        str        = (pos == std::string_view::npos) ? std::string_view{} : str.substr(pos + 1);
        return token;
    };

    auto year  = ParseNumber<int>(next(date, '/'));
    auto month = ParseNumber<unsigned>(next(date, '/'));
    auto day   = ParseNumber<unsigned>(next(date, '/'));
    auto hour  = ParseNumber<int>(next(time, ':'));
    auto min   = ParseNumber<int>(next(time, ':'));
    auto secs  = time;
    auto dot   = secs.find('.');
    auto sec   = ParseNumber<int>(secs.substr(0, dot));
    int  ms    = 0;
    if (dot != std::string_view::npos)
    {
        auto frac = secs.substr(dot + 1, 3);
        auto val  = ParseNumber<int>(frac);
        if (!val || *val < 0) { return std::nullopt; }
        ms = *val;
        for (size_t i = frac.size(); i < 3; i++) { ms *= 10; }
    }
    if (!year || !month || !day || !hour || !min || !sec) { return std::nullopt; }
    if (*hour < 0 || *hour > 23 || *min < 0 || *min > 59 || *sec < 0 || *sec > 60) { return std::nullopt; }

    std::chrono::year_month_day ymd{std::chrono::year{*year}, std::chrono::month{*month}, std::chrono::day{*day}};
    if (!ymd.ok()) { return std::nullopt; }

    if (base == TimeBase::Utc)
    {
        auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{*hour} + std::chrono::minutes{*min} + std::chrono::seconds{*sec}
                  + std::chrono::milliseconds{ms};
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }

    // mktime applies the TZ rules in effect on that date, DST included
    std::tm tm{};
    tm.tm_year  = *year - 1900;
    tm.tm_mon   = static_cast<int>(*month) - 1;
    tm.tm_mday  = static_cast<int>(*day);
    tm.tm_hour  = *hour;
    tm.tm_min   = *min;
    tm.tm_sec   = *sec;
    tm.tm_isdst = -1;
    auto epoch  = std::mktime(&tm);
    if (epoch == static_cast<std::time_t>(-1)) { return std::nullopt; }
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::from_time_t(epoch))
           + std::chrono::milliseconds{ms};
}
}    // namespace SBS
