#include "Ingestor.h"
#include "TestUtils.h"

SUPPRESS_WARNINGS_START
SUPPRESS_THIRD_PARTY_WARNINGS
#include <sqlite3.h>
SUPPRESS_WARNINGS_END

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using SBS::Field;
using Outcome = SBS::Ingestor::Outcome;

static constexpr std::string_view FirstRecord
    = "MSG,3,1,1,A1B2C3,1,2024/01/01,00:00:00,2024/01/01,00:00:00,UAL123,35000,450,90,40.1,-75.2,,,,,,0";
static constexpr std::string_view AltitudeOnlyRecord = "MSG,5,1,1,A1B2C3,1,2024/01/01,00:00:05,2024/01/01,00:00:05,,36000,,,,,,,,,,";

// Second connection to the same database file, as an external reader would have
struct RawConnection
{
    explicit RawConnection(std::filesystem::path const& path)
    {
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(path.string().c_str(), &raw) == SQLITE_OK);
        db.reset(raw);
    }

    void Exec(char const* sql) const { REQUIRE(sqlite3_exec(db.get(), sql, nullptr, nullptr, nullptr) == SQLITE_OK); }

    [[nodiscard]] std::vector<std::string> Column(char const* sql) const
    {
        std::vector<std::string> out;
        sqlite3_stmt*            stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db.get(), sql, -1, &stmt, nullptr) == SQLITE_OK);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            auto const* text = reinterpret_cast<char const*>(sqlite3_column_text(stmt, 0));
            out.emplace_back(text == nullptr ? "NULL" : text);
        }
        sqlite3_finalize(stmt);
        return out;
    }

    struct Closer
    {
        void operator()(sqlite3* p) const { sqlite3_close(p); }
    };
    std::unique_ptr<sqlite3, Closer> db;
};

static SBS::time_point const T0 = SBS::FromEpochMs(1704067200000);    // 2024-01-01T00:00:00Z

// Record generated at t, written as UTC date/time fields
static std::string Timed(std::string_view hex, std::string_view callsign, SBS::time_point t)
{
    auto const                          days = std::chrono::floor<std::chrono::days>(t);
    std::chrono::year_month_day const   ymd{days};
    std::chrono::hh_mm_ss const         hms{t - days};
    return TestCommon::MakeRecord(
        {{Field::TransmissionType, "1"},
         {Field::Hex, hex},
         {Field::DateGenerated, fmt::format("{}/{:02}/{:02}", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()))},
         {Field::TimeGenerated, fmt::format("{:02}:{:02}:{:02}", hms.hours().count(), hms.minutes().count(), hms.seconds().count())},
         {Field::Callsign, callsign}});
}

// Receives a record generated at t without delay
static Outcome IngestAt(SBS::Ingestor& ingestor, TestCommon::ManualClock& clock, std::string_view hex, std::string_view callsign, SBS::time_point t)
{
    clock.now = t;
    return ingestor.HandleLine(Timed(hex, callsign, t));
}

TEST_CASE("IngestFirstAndPartialRecord", "[ingest]")
{
    TestCommon::ScopedTimeZone utc("UTC0");
    TestCommon::ManualClock clock;
    SBS::FlightStore        store(":memory:");
    SBS::Ingestor           ingestor(store, SBS::Ingestor::Config{}, clock.Get());

    REQUIRE(ingestor.HandleLine(FirstRecord) == Outcome::Stored);
    auto a = store.FindAircraft("A1B2C3");
    REQUIRE(a.has_value());
    REQUIRE(a->callsign == "UAL123");
    REQUIRE(a->altitude == 35000);
    REQUIRE(a->grounded == false);

    auto track = store.RecentPositions("A1B2C3");
    REQUIRE(track.size() == 1);
    REQUIRE(track[0].lat == Catch::Approx(40.1));
    REQUIRE(track[0].lon == Catch::Approx(-75.2));
    REQUIRE(track[0].timestamp == SBS::FromEpochMs(1704067200000));

    clock.now += std::chrono::seconds{5};
    REQUIRE(ingestor.HandleLine(AltitudeOnlyRecord) == Outcome::Stored);
    auto b = store.FindAircraft("A1B2C3").value();
    REQUIRE(b.altitude == 36000);
    REQUIRE(b.callsign == "UAL123");
    REQUIRE(b.lat == a->lat);
    REQUIRE(b.lon == a->lon);
    REQUIRE(b.grounded == false);
    REQUIRE(b.updatedAt == clock.now);
    REQUIRE(store.RecentPositions("A1B2C3").size() == 1);

    auto const& stats = ingestor.GetStats();
    REQUIRE(stats.records == 2);
    REQUIRE(stats.stored == 2);
    REQUIRE(stats.positions == 1);
}

TEST_CASE("IngestSplitReads", "[ingest]")
{
    SBS::FlightStore store(":memory:");
    SBS::Ingestor    ingestor(store, SBS::Ingestor::Config{});

    auto const stream = std::string(FirstRecord) + "\r\n" + std::string(AltitudeOnlyRecord) + "\n";
    auto const data   = std::span(reinterpret_cast<uint8_t const*>(stream.data()), stream.size());
    ingestor.HandleData(data.subspan(0, 20));
    ingestor.HandleData(data.subspan(20, 100));
    REQUIRE(ingestor.GetStats().records == 1);
    ingestor.HandleData(data.subspan(120));

    REQUIRE(ingestor.GetStats().stored == 2);
    REQUIRE(store.FindAircraft("A1B2C3").value().altitude == 36000);
}

TEST_CASE("IngestIgnoresNonStateRecords", "[ingest]")
{
    SBS::FlightStore store(":memory:");
    SBS::Ingestor    ingestor(store, SBS::Ingestor::Config{});

    REQUIRE(ingestor.HandleLine("STA,,5,179,400AE7,10103,2008/11/28,14:58:51.153,2008/11/28,14:58:51.153,RM") == Outcome::Ignored);
    REQUIRE(ingestor.HandleLine("CLK,,,,,,2008/11/28,14:58:51.153") == Outcome::Ignored);
    REQUIRE(ingestor.GetStats().ignored == 2);
    REQUIRE(store.CountRows("aircraft_state") == 0);
    REQUIRE(store.CountRows("messages") == 0);
}

TEST_CASE("IngestSkipsInvalidHex", "[ingest]")
{
    SBS::FlightStore store(":memory:");
    SBS::Ingestor    ingestor(store, SBS::Ingestor::Config{});

    REQUIRE(ingestor.HandleLine(TestCommon::MakeRecord({{Field::Hex, "XYZ123"}, {Field::Altitude, "1000"}})) == Outcome::Skipped);
    REQUIRE(ingestor.HandleLine(TestCommon::MakeRecord({{Field::Altitude, "1000"}})) == Outcome::Skipped);
    REQUIRE(ingestor.HandleLine(TestCommon::MakeRecord({{Field::Hex, "A"}, {Field::Altitude, "1000"}})) == Outcome::Skipped);
    REQUIRE(ingestor.HandleLine(TestCommon::MakeRecord({{Field::Hex, "A1B2C3D4E5F6A1B2C3D4E5F6A1B2C3D4E5F6A1B2"}, {Field::Altitude, "1000"}})) == Outcome::Skipped);
    REQUIRE(ingestor.HandleLine(TestCommon::MakeRecord({{Field::Hex, "~2cf0b1"}, {Field::Altitude, "1000"}})) == Outcome::Stored);

    REQUIRE(ingestor.GetStats().decodeErrors == 4);
    REQUIRE(store.CountRows("aircraft_state") == 1);
    REQUIRE(store.FindAircraft("~2CF0B1").has_value());
}

TEST_CASE("IngestGroupsSessions", "[ingest]")
{
    using namespace std::chrono_literals;
    TestCommon::ScopedTimeZone utc("UTC0");
    TestCommon::ManualClock    clock;
    SBS::FlightStore           store(":memory:");
    SBS::Ingestor              ingestor(store, SBS::Ingestor::Config{}, clock.Get());

    REQUIRE(IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0) == Outcome::Stored);
    REQUIRE(IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0 + 10min) == Outcome::Stored);
    REQUIRE(IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0 + 30min) == Outcome::Stored);    // gap of exactly 20 minutes
    REQUIRE(IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0 + 1h) == Outcome::Stored);
    REQUIRE(IngestAt(ingestor, clock, "4CA2D6", "", T0 + 1h) == Outcome::Stored);

    auto sessions = store.SessionsForCallsign("UAL123");
    REQUIRE(sessions.size() == 2);
    REQUIRE(sessions[0].sessionId == "UAL123-1704067200000");
    REQUIRE(sessions[0].firstSeen == T0);
    REQUIRE(sessions[0].lastSeen == T0 + 30min);
    REQUIRE(sessions[1].sessionId == "UAL123-1704070800000");
    REQUIRE(sessions[1].hex == "A1B2C3");
    REQUIRE(store.CountRows("sessions") == 2);
    REQUIRE(ingestor.GetStats().sessionsOpened == 2);
    REQUIRE(ingestor.GetStats().clockSkew == 0);
    REQUIRE(ingestor.Tracker().Size() == 1);
}

TEST_CASE("IngestResumesSessionAfterRestart", "[ingest]")
{
    using namespace std::chrono_literals;
    TestCommon::ScopedTimeZone utc("UTC0");
    TestCommon::ManualClock    clock;
    SBS::FlightStore           store(":memory:");
    {
        SBS::Ingestor ingestor(store, SBS::Ingestor::Config{}, clock.Get());
        IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0);
    }

    SBS::Ingestor ingestor(store, SBS::Ingestor::Config{}, clock.Get());
    REQUIRE(IngestAt(ingestor, clock, "A1B2C3", "UAL123", T0 + 5min) == Outcome::Stored);
    REQUIRE(ingestor.GetStats().sessionsOpened == 0);

    auto sessions = store.SessionsForCallsign("UAL123");
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].lastSeen == T0 + 5min);
}

TEST_CASE("IngestReadsFeedTimeAsLocalTime", "[ingest]")
{
    TestCommon::ScopedTimeZone newYork("EST5EDT,M3.2.0,M11.1.0");
    TestCommon::ManualClock    clock;
    clock.now = SBS::FromEpochMs(1704153600000);    // 2024-01-02T00:00:00Z, 19:00 the day before in New York

    auto const record = TestCommon::MakeRecord({{Field::Hex, "A1B2C3"},
                                                {Field::DateGenerated, "2024/01/01"},
                                                {Field::TimeGenerated, "19:00:00"},
                                                {Field::Callsign, "UAL123"},
                                                {Field::Latitude, "40.1"},
                                                {Field::Longitude, "-75.2"}});

    SECTION("Local")
    {
        SBS::FlightStore store(":memory:");
        SBS::Ingestor    ingestor(store, SBS::Ingestor::Config{}, clock.Get());
        REQUIRE(ingestor.HandleLine(record) == Outcome::Stored);

        REQUIRE(store.RecentPositions("A1B2C3").at(0).timestamp == clock.now);
        REQUIRE(store.FindAircraft("A1B2C3").value().updatedAt == clock.now);
        REQUIRE(store.SessionsForCallsign("UAL123").at(0).firstSeen == clock.now);
        REQUIRE(ingestor.GetStats().clockSkew == 0);
    }

    SECTION("UtcFeedIsFiveHoursOff")
    {
        SBS::FlightStore      store(":memory:");
        SBS::Ingestor::Config config;
        config.feedTimeBase = SBS::TimeBase::Utc;
        SBS::Ingestor ingestor(store, config, clock.Get());
        REQUIRE(ingestor.HandleLine(record) == Outcome::Stored);

        // Beyond the allowed skew, so the receipt time is stored instead
        REQUIRE(ingestor.GetStats().clockSkew == 1);
        REQUIRE(store.RecentPositions("A1B2C3").at(0).timestamp == clock.now);
    }
}

TEST_CASE("IngestDistrustsSkewedFeedTime", "[ingest]")
{
    using namespace std::chrono_literals;
    TestCommon::ScopedTimeZone utc("UTC0");
    TestCommon::ManualClock    clock;
    SBS::FlightStore           store(":memory:");
    SBS::Ingestor              ingestor(store, SBS::Ingestor::Config{}, clock.Get());

    for (int i = 0; i < 50; i++) { IngestAt(ingestor, clock, fmt::format("A{:05}", i), fmt::format("FLT{}", i), T0); }
    REQUIRE(ingestor.Tracker().Size() == 50);

    clock.now = T0 + 1min;
    REQUIRE(ingestor.HandleLine(Timed("B00001", "BAD1", SBS::FromEpochMs(4070908800000))) == Outcome::Stored);    // 2099-01-01
    REQUIRE(ingestor.GetStats().clockSkew == 1);

    // The record counts as received now: no session is pinned in the future and the index is intact
    auto bad = store.SessionsForCallsign("BAD1");
    REQUIRE(bad.size() == 1);
    REQUIRE(bad[0].firstSeen == T0 + 1min);
    REQUIRE(bad[0].lastSeen == T0 + 1min);
    REQUIRE(ingestor.Tracker().Size() == 51);
    REQUIRE(ingestor.Tracker().Resolve("FLT0", "A00000", T0 + 2min).action == SBS::SessionTracker::Action::Extend);

    REQUIRE(IngestAt(ingestor, clock, "B00001", "BAD1", T0 + 10h) == Outcome::Stored);
    REQUIRE(store.SessionsForCallsign("BAD1").size() == 2);
}

TEST_CASE("IngestMessageLog", "[ingest]")
{
    TestCommon::ScopedTimeZone utc("UTC0");
    TestCommon::TempDatabase db;
    TestCommon::ManualClock  clock;
    SBS::FlightStore         store(db.path);
    SBS::Ingestor            ingestor(store, SBS::Ingestor::Config{}, clock.Get());

    REQUIRE(ingestor.HandleLine(FirstRecord) == Outcome::Stored);
    REQUIRE(ingestor.HandleLine(AltitudeOnlyRecord) == Outcome::Stored);

    RawConnection reader(db.path);
    TestCommon::CheckLines(reader.Column("SELECT hex || ' ' || COALESCE(session_id, 'NULL') || ' ' || recorded_at FROM messages ORDER BY id"),
                           {"A1B2C3 UAL123-1704067200000 1704067200000", "A1B2C3 NULL 1704067200000"});

    auto fields = reader.Column("SELECT fields FROM messages ORDER BY id");
    REQUIRE(fields.size() == 2);
    REQUIRE(TestCommon::JsonStringEqual(fields[0], SBS::Decode(FirstRecord).ToJson()));
    REQUIRE(TestCommon::JsonStringEqual(fields[1], SBS::Decode(AltitudeOnlyRecord).ToJson()));
}

TEST_CASE("IngestOptionalTables", "[ingest]")
{
    SBS::FlightStore        store(":memory:");
    SBS::Ingestor::Config   config;
    config.enableSessions   = false;
    config.enableMessageLog = false;
    SBS::Ingestor ingestor(store, config);

    REQUIRE(ingestor.HandleLine(FirstRecord) == Outcome::Stored);
    REQUIRE(store.CountRows("aircraft_state") == 1);
    REQUIRE(store.CountRows("position_history") == 1);
    REQUIRE(store.CountRows("sessions") == 0);
    REQUIRE(store.CountRows("messages") == 0);
}

TEST_CASE("IngestSurvivesStoreError", "[ingest]")
{
    TestCommon::TempDatabase db;
    SBS::FlightStore         store(db.path);
    SBS::Ingestor            ingestor(store, SBS::Ingestor::Config{});
    REQUIRE(ingestor.HandleLine(FirstRecord) == Outcome::Stored);

    RawConnection other(db.path);
    other.Exec("DROP TABLE position_history");

    auto withPosition = TestCommon::MakeRecord(
        {{Field::Hex, "B00001"}, {Field::Callsign, "DROP1"}, {Field::Latitude, "10.0"}, {Field::Longitude, "20.0"}});
    REQUIRE(ingestor.HandleLine(withPosition) == Outcome::Dropped);

    // Nothing from the failed record is visible, including its session
    REQUIRE_FALSE(store.FindAircraft("B00001").has_value());
    REQUIRE(store.SessionsForCallsign("DROP1").empty());
    REQUIRE(ingestor.Tracker().Size() == 1);

    auto withoutPosition = TestCommon::MakeRecord({{Field::Hex, "B00002"}, {Field::Altitude, "5000"}});
    REQUIRE(ingestor.HandleLine(withoutPosition) == Outcome::Stored);
    REQUIRE(store.FindAircraft("B00002").value().altitude == 5000);

    auto const& stats = ingestor.GetStats();
    REQUIRE(stats.storeErrors == 1);
    REQUIRE(stats.stored == 2);
}

TEST_CASE("IngestDropsPartialRecordOnDisconnect", "[ingest]")
{
    SBS::FlightStore store(":memory:");
    SBS::Ingestor    ingestor(store, SBS::Ingestor::Config{});

    auto const head = FirstRecord.substr(0, 12);
    auto const tail = std::string(FirstRecord.substr(12)) + "\n";
    ingestor.OnConnectionChanged(true);
    ingestor.HandleData(std::span(reinterpret_cast<uint8_t const*>(head.data()), head.size()));
    ingestor.OnConnectionChanged(false);
    ingestor.OnConnectionChanged(true);
    ingestor.HandleData(std::span(reinterpret_cast<uint8_t const*>(tail.data()), tail.size()));

    REQUIRE(ingestor.GetStats().stored == 0);
    REQUIRE(store.CountRows("aircraft_state") == 0);
}
