#pragma once
#include "Aircraft.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace SBS
{
// SQLite backed aircraft state, position history, sessions and message log.
// Opened in WAL mode so external readers never observe a partial record.
struct FlightStore
{
    static constexpr size_t                    DefaultTrackLimit = 300;
    static constexpr std::chrono::milliseconds DefaultBusyTimeout{5000};

    // ":memory:" opens a private in-memory database
    explicit FlightStore(std::filesystem::path const& path, std::chrono::milliseconds busyTimeout = DefaultBusyTimeout);
    ~FlightStore();
    CLASS_DELETE_COPY_AND_MOVE(FlightStore);

    // All writes for one record go through one of these. Rolls back unless Commit() was called.
    struct Transaction
    {
        explicit Transaction(FlightStore& storeIn);
        ~Transaction();
        CLASS_DELETE_COPY_AND_MOVE(Transaction);

        void Commit();

        private:
        FlightStore& _store;
        bool         _done{false};
    };

    void UpsertAircraft(std::string_view hex, AircraftUpdate const& update, time_point now);

    // Returns false (and writes nothing) unless both lat and lon are present
    bool AppendPosition(std::string_view hex, time_point timestamp, AircraftUpdate const& update);

    void AppendSession(Session const& session);
    void TouchSession(std::string_view sessionId, time_point lastSeen);
    void AppendMessage(std::string_view hex, std::optional<std::string> const& sessionId, std::string_view fieldsJson, time_point recordedAt);

    [[nodiscard]] std::optional<Session> LatestSession(std::string const& callsign);

    // Read side used by the query surface
    [[nodiscard]] std::vector<AircraftState>    ListAircraftWithPosition();
    [[nodiscard]] std::optional<AircraftState>  FindAircraft(std::string_view hex);
    [[nodiscard]] std::vector<PositionSample>   RecentPositions(std::string_view hex, size_t limit = DefaultTrackLimit);
    [[nodiscard]] std::vector<Session>          SessionsForCallsign(std::string_view callsign);
    [[nodiscard]] int64_t                       CountRows(std::string_view table);

    enum class Query : size_t
    {
        UpsertAircraft,
        AppendPosition,
        AppendSession,
        TouchSession,
        AppendMessage,
        LatestSession,
        ListAircraft,
        FindAircraft,
        RecentPositions,
        SessionsForCallsign,
        Count
    };

    private:
    struct StmtDeleter
    {
        void operator()(sqlite3_stmt* stmt) const;
    };
    struct DbDeleter
    {
        void operator()(sqlite3* db) const;
    };
    using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    void          Exec(char const* sql);
    sqlite3_stmt* Prepare(Query query);
    void          CreateSchema();

    std::unique_ptr<sqlite3, DbDeleter>                      _db;
    std::array<StmtPtr, static_cast<size_t>(Query::Count)> _statements;
};
}    // namespace SBS
