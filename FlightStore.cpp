#include "FlightStore.h"
#include "Errors.h"
#include "Logging.h"

SUPPRESS_WARNINGS_START
SUPPRESS_THIRD_PARTY_WARNINGS
#include <sqlite3.h>
SUPPRESS_WARNINGS_END

#include <algorithm>

namespace SBS
{
static constexpr char const* SchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS aircraft_state (
    id            INTEGER PRIMARY KEY,
    hex           TEXT    NOT NULL UNIQUE,
    callsign      TEXT,
    altitude      INTEGER,
    ground_speed  REAL,
    heading       REAL,
    lat           REAL,
    lon           REAL,
    grounded      INTEGER,
    squawk        TEXT,
    vertical_rate INTEGER,
    created_at    INTEGER NOT NULL,
    updated_at    INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS position_history (
    id           INTEGER PRIMARY KEY,
    hex          TEXT    NOT NULL,
    timestamp    INTEGER NOT NULL,
    lat          REAL    NOT NULL,
    lon          REAL    NOT NULL,
    altitude     INTEGER,
    heading      REAL,
    ground_speed REAL
);
CREATE INDEX IF NOT EXISTS position_history_hex_timestamp ON position_history (hex, timestamp);
CREATE TABLE IF NOT EXISTS sessions (
    session_id TEXT    PRIMARY KEY,
    callsign   TEXT    NOT NULL,
    hex        TEXT,
    first_seen INTEGER NOT NULL,
    last_seen  INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS sessions_callsign_last_seen ON sessions (callsign, last_seen);
CREATE TABLE IF NOT EXISTS messages (
    id          INTEGER PRIMARY KEY,
    hex         TEXT    NOT NULL,
    session_id  TEXT,
    fields      TEXT    NOT NULL,
    recorded_at INTEGER NOT NULL
);
)sql";

// Indexed by FlightStore::Query
static constexpr std::array<char const*, static_cast<size_t>(FlightStore::Query::Count)> QuerySql = {
    // UpsertAircraft: absent fields are bound as NULL and keep the stored value
    R"sql(INSERT INTO aircraft_state (hex, callsign, altitude, ground_speed, heading, lat, lon, grounded, squawk, vertical_rate, created_at, updated_at)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?11)
          ON CONFLICT (hex) DO UPDATE SET
              callsign      = COALESCE(excluded.callsign, callsign),
              altitude      = COALESCE(excluded.altitude, altitude),
              ground_speed  = COALESCE(excluded.ground_speed, ground_speed),
              heading       = COALESCE(excluded.heading, heading),
              lat           = COALESCE(excluded.lat, lat),
              lon           = COALESCE(excluded.lon, lon),
              grounded      = COALESCE(excluded.grounded, grounded),
              squawk        = COALESCE(excluded.squawk, squawk),
              vertical_rate = COALESCE(excluded.vertical_rate, vertical_rate),
              updated_at    = excluded.updated_at)sql",
    // AppendPosition
    R"sql(INSERT INTO position_history (hex, timestamp, lat, lon, altitude, heading, ground_speed)
          VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7))sql",
    // AppendSession
    R"sql(INSERT INTO sessions (session_id, callsign, hex, first_seen, last_seen) VALUES (?1, ?2, ?3, ?4, ?5))sql",
    // TouchSession
    R"sql(UPDATE sessions SET last_seen = MAX(last_seen, ?2) WHERE session_id = ?1)sql",
    // AppendMessage
    R"sql(INSERT INTO messages (hex, session_id, fields, recorded_at) VALUES (?1, ?2, ?3, ?4))sql",
    // LatestSession
    R"sql(SELECT session_id, callsign, hex, first_seen, last_seen FROM sessions
          WHERE callsign = ?1 ORDER BY last_seen DESC LIMIT 1)sql",
    // ListAircraft
    R"sql(SELECT id, hex, callsign, altitude, ground_speed, heading, lat, lon, grounded, squawk, vertical_rate, created_at, updated_at
          FROM aircraft_state WHERE lat IS NOT NULL AND lon IS NOT NULL ORDER BY hex)sql",
    // FindAircraft
    R"sql(SELECT id, hex, callsign, altitude, ground_speed, heading, lat, lon, grounded, squawk, vertical_rate, created_at, updated_at
          FROM aircraft_state WHERE hex = UPPER(?1) LIMIT 1)sql",
    // RecentPositions: newest N, returned oldest first
    R"sql(SELECT hex, timestamp, lat, lon, altitude, heading, ground_speed FROM (
              SELECT id, hex, timestamp, lat, lon, altitude, heading, ground_speed FROM position_history
              WHERE hex = UPPER(?1) ORDER BY timestamp DESC, id DESC LIMIT ?2)
          ORDER BY timestamp ASC, id ASC)sql",
    // SessionsForCallsign
    R"sql(SELECT session_id, callsign, hex, first_seen, last_seen FROM sessions
          WHERE callsign = ?1 ORDER BY first_seen ASC)sql",
};

static constexpr std::array<std::string_view, 4> KnownTables = {"aircraft_state", "position_history", "sessions", "messages"};

namespace
{
// Binds parameters and reads columns of one prepared statement, resetting it on scope exit
struct Cursor
{
    Cursor(sqlite3* dbIn, sqlite3_stmt* stmtIn) : db(dbIn), stmt(stmtIn) {}
    ~Cursor()
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    CLASS_DELETE_COPY_AND_MOVE(Cursor);

    void Check(int rc, std::string_view what) const
    {
        if (rc != SQLITE_OK) { throw StoreError(fmt::format("{}: {}", what, sqlite3_errmsg(db)), rc); }
    }

    void Bind(int index, std::nullopt_t) { Check(sqlite3_bind_null(stmt, index), "bind"); }
    void Bind(int index, int64_t value) { Check(sqlite3_bind_int64(stmt, index, value), "bind"); }
    void Bind(int index, int32_t value) { Check(sqlite3_bind_int(stmt, index, value), "bind"); }
    void Bind(int index, bool value) { Check(sqlite3_bind_int(stmt, index, value ? 1 : 0), "bind"); }
    void Bind(int index, double value) { Check(sqlite3_bind_double(stmt, index, value), "bind"); }
    void Bind(int index, std::string_view value)
    {
        Check(sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), "bind");
    }
    void Bind(int index, std::string const& value) { Bind(index, std::string_view(value)); }

    template <typename T> void Bind(int index, std::optional<T> const& value)
    {
        if (value.has_value()) { Bind(index, *value); }
        else { Bind(index, std::nullopt); }
    }

    // True while a row is available
    bool Step()
    {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) { return true; }
        if (rc == SQLITE_DONE) { return false; }
        throw StoreError(fmt::format("step: {}", sqlite3_errmsg(db)), rc);
    }

    void Execute()
    {
        while (Step()) {}
    }

    [[nodiscard]] bool IsNull(int col) const { return sqlite3_column_type(stmt, col) == SQLITE_NULL; }

    [[nodiscard]] int64_t Int64(int col) const { return sqlite3_column_int64(stmt, col); }
    [[nodiscard]] double  Double(int col) const { return sqlite3_column_double(stmt, col); }
    [[nodiscard]] std::string Text(int col) const
    {
        auto const* p = reinterpret_cast<char const*>(sqlite3_column_text(stmt, col));
        return p == nullptr ? std::string{} : std::string(p, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
    }

    [[nodiscard]] std::optional<std::string> OptText(int col) const { return IsNull(col) ? std::nullopt : std::optional(Text(col)); }
    [[nodiscard]] std::optional<double>      OptDouble(int col) const { return IsNull(col) ? std::nullopt : std::optional(Double(col)); }
    [[nodiscard]] std::optional<int32_t>     OptInt32(int col) const
    {
        return IsNull(col) ? std::nullopt : std::optional(static_cast<int32_t>(Int64(col)));
    }
    [[nodiscard]] std::optional<bool> OptBool(int col) const { return IsNull(col) ? std::nullopt : std::optional(Int64(col) != 0); }

    sqlite3*      db;
    sqlite3_stmt* stmt;
};

AircraftState ReadAircraft(Cursor const& c)
{
    AircraftState a;
    a.id           = c.Int64(0);
    a.hex          = c.Text(1);
    a.callsign     = c.OptText(2);
    a.altitude     = c.OptInt32(3);
    a.groundSpeed  = c.OptDouble(4);
    a.heading      = c.OptDouble(5);
    a.lat          = c.OptDouble(6);
    a.lon          = c.OptDouble(7);
    a.grounded     = c.OptBool(8);
    a.squawk       = c.OptText(9);
    a.verticalRate = c.OptInt32(10);
    a.createdAt    = FromEpochMs(c.Int64(11));
    a.updatedAt    = FromEpochMs(c.Int64(12));
    return a;
}

Session ReadSession(Cursor const& c)
{
    return Session{c.Text(0), c.Text(1), c.Text(2), FromEpochMs(c.Int64(3)), FromEpochMs(c.Int64(4))};
}
}    // namespace

void FlightStore::StmtDeleter::operator()(sqlite3_stmt* stmt) const
{
    sqlite3_finalize(stmt);
}

void FlightStore::DbDeleter::operator()(sqlite3* db) const
{
    if (sqlite3_close(db) != SQLITE_OK) { Log::Error("Closing database: {}", sqlite3_errmsg(db)); }
}

FlightStore::FlightStore(std::filesystem::path const& path, std::chrono::milliseconds busyTimeout)
{
    auto const inMemory = path == ":memory:";
    if (!inMemory && path.has_parent_path()) { std::filesystem::create_directories(path.parent_path()); }

    sqlite3* db = nullptr;
    int      rc = sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    _db.reset(db);
    if (rc != SQLITE_OK)
    {
        auto msg = db == nullptr ? std::string(sqlite3_errstr(rc)) : std::string(sqlite3_errmsg(db));
        throw StoreError(fmt::format("Cannot open {}: {}", path.string(), msg), rc);
    }

    sqlite3_busy_timeout(_db.get(), static_cast<int>(busyTimeout.count()));
    if (!inMemory) { Exec("PRAGMA journal_mode=WAL"); }
    Exec("PRAGMA synchronous=NORMAL");
    CreateSchema();
    Log::Info("Opened flight store {}", path.string());
}

FlightStore::~FlightStore()
{
    // Statements must be finalized before the connection closes
    for (auto& stmt : _statements) { stmt.reset(); }
}

void FlightStore::Exec(char const* sql)
{
    char* err = nullptr;
    int   rc  = sqlite3_exec(_db.get(), sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::string msg = err != nullptr ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        throw StoreError(fmt::format("{}: {}", sql, msg), rc);
    }
}

void FlightStore::CreateSchema()
{
    Exec(SchemaSql);
}

sqlite3_stmt* FlightStore::Prepare(Query query)
{
    auto& slot = _statements.at(static_cast<size_t>(query));
    if (slot) { return slot.get(); }

    sqlite3_stmt* stmt = nullptr;
    int           rc   = sqlite3_prepare_v2(_db.get(), QuerySql.at(static_cast<size_t>(query)), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        sqlite3_finalize(stmt);
        throw StoreError(fmt::format("prepare: {}", sqlite3_errmsg(_db.get())), rc);
    }
    slot.reset(stmt);
    return stmt;
}

FlightStore::Transaction::Transaction(FlightStore& storeIn) : _store(storeIn)
{
    _store.Exec("BEGIN IMMEDIATE");
}

void FlightStore::Transaction::Commit()
{
    _store.Exec("COMMIT");
    _done = true;
}

FlightStore::Transaction::~Transaction()
{
    if (_done) { return; }
    // A failed COMMIT may already have ended the transaction
    if (sqlite3_get_autocommit(_store._db.get()) != 0) { return; }
    char* err = nullptr;
    if (sqlite3_exec(_store._db.get(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK)
    {
        Log::Error("Rollback failed: {}", err != nullptr ? err : "unknown error");
    }
    sqlite3_free(err);
}

void FlightStore::UpsertAircraft(std::string_view hex, AircraftUpdate const& update, time_point now)
{
    Cursor c(_db.get(), Prepare(Query::UpsertAircraft));
    c.Bind(1, hex);
    c.Bind(2, update.callsign);
    c.Bind(3, update.altitude);
    c.Bind(4, update.groundSpeed);
    c.Bind(5, update.heading);
    c.Bind(6, update.lat);
    c.Bind(7, update.lon);
    c.Bind(8, update.grounded);
    c.Bind(9, update.squawk);
    c.Bind(10, update.verticalRate);
    c.Bind(11, ToEpochMs(now));
    c.Execute();
}

bool FlightStore::AppendPosition(std::string_view hex, time_point timestamp, AircraftUpdate const& update)
{
    if (!update.HasPosition()) { return false; }
    Cursor c(_db.get(), Prepare(Query::AppendPosition));
    c.Bind(1, hex);
    c.Bind(2, ToEpochMs(timestamp));
    c.Bind(3, *update.lat);
    c.Bind(4, *update.lon);
    c.Bind(5, update.altitude);
    c.Bind(6, update.heading);
    c.Bind(7, update.groundSpeed);
    c.Execute();
    return true;
}

void FlightStore::AppendSession(Session const& session)
{
    Cursor c(_db.get(), Prepare(Query::AppendSession));
    c.Bind(1, session.sessionId);
    c.Bind(2, session.callsign);
    c.Bind(3, session.hex);
    c.Bind(4, ToEpochMs(session.firstSeen));
    c.Bind(5, ToEpochMs(session.lastSeen));
    c.Execute();
}

void FlightStore::TouchSession(std::string_view sessionId, time_point lastSeen)
{
    Cursor c(_db.get(), Prepare(Query::TouchSession));
    c.Bind(1, sessionId);
    c.Bind(2, ToEpochMs(lastSeen));
    c.Execute();
    if (sqlite3_changes(_db.get()) == 0) { throw StoreError(fmt::format("No session {} to update", sessionId), SQLITE_NOTFOUND); }
}

void FlightStore::AppendMessage(std::string_view                  hex,
                                std::optional<std::string> const& sessionId,
                                std::string_view                  fieldsJson,
                                time_point                        recordedAt)
{
    Cursor c(_db.get(), Prepare(Query::AppendMessage));
    c.Bind(1, hex);
    c.Bind(2, sessionId);
    c.Bind(3, fieldsJson);
    c.Bind(4, ToEpochMs(recordedAt));
    c.Execute();
}

std::optional<Session> FlightStore::LatestSession(std::string const& callsign)
{
    Cursor c(_db.get(), Prepare(Query::LatestSession));
    c.Bind(1, callsign);
    if (!c.Step()) { return std::nullopt; }
    return ReadSession(c);
}

std::vector<AircraftState> FlightStore::ListAircraftWithPosition()
{
    std::vector<AircraftState> out;
    Cursor                     c(_db.get(), Prepare(Query::ListAircraft));
    while (c.Step()) { out.push_back(ReadAircraft(c)); }
    return out;
}

std::optional<AircraftState> FlightStore::FindAircraft(std::string_view hex)
{
    Cursor c(_db.get(), Prepare(Query::FindAircraft));
    c.Bind(1, hex);
    if (!c.Step()) { return std::nullopt; }
    return ReadAircraft(c);
}

std::vector<PositionSample> FlightStore::RecentPositions(std::string_view hex, size_t limit)
{
    std::vector<PositionSample> out;
    Cursor                      c(_db.get(), Prepare(Query::RecentPositions));
    c.Bind(1, hex);
    c.Bind(2, static_cast<int64_t>(std::min<size_t>(limit, INT64_MAX)));
    while (c.Step())
    {
        out.push_back(PositionSample{c.Text(0), FromEpochMs(c.Int64(1)), c.Double(2), c.Double(3), c.OptInt32(4), c.OptDouble(5), c.OptDouble(6)});
    }
    return out;
}

std::vector<Session> FlightStore::SessionsForCallsign(std::string_view callsign)
{
    std::vector<Session> out;
    Cursor               c(_db.get(), Prepare(Query::SessionsForCallsign));
    c.Bind(1, callsign);
    while (c.Step()) { out.push_back(ReadSession(c)); }
    return out;
}

int64_t FlightStore::CountRows(std::string_view table)
{
    if (std::find(KnownTables.begin(), KnownTables.end(), table) == KnownTables.end())
    {
        throw std::invalid_argument(fmt::format("Unknown table {}", table));
    }
    auto          sql  = fmt::format("SELECT COUNT(*) FROM {}", table);
    sqlite3_stmt* stmt = nullptr;
    int           rc   = sqlite3_prepare_v2(_db.get(), sql.c_str(), -1, &stmt, nullptr);
    StmtPtr       owner(stmt);
    if (rc != SQLITE_OK) { throw StoreError(fmt::format("prepare: {}", sqlite3_errmsg(_db.get())), rc); }
    Cursor c(_db.get(), stmt);
    return c.Step() ? c.Int64(0) : 0;
}
}    // namespace SBS
