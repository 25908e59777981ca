#pragma once
#include "CommonMacros.h"
#include "SBSMessage.h"

SUPPRESS_WARNINGS_START
SUPPRESS_THIRD_PARTY_WARNINGS
SUPPRESS_MSVC_WARNING(4388)    // signed / unsigned mismatch (Catch2)
#include <catch2/catch_all.hpp>
#include <dtl/dtl.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rapidjson/document.h>
SUPPRESS_WARNINGS_END

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace TestCommon
{
inline void PrintLinesDiff(std::vector<std::string> const& actual, std::vector<std::string> const& expected)
{
    dtl::Diff<std::string, std::vector<std::string>> d(expected, actual);
    d.compose();
    d.composeUnifiedHunks();
    d.printUnifiedFormat();
}

// Fails the current test with a unified diff when the lines differ
inline void CheckLines(std::vector<std::string> const& actual, std::vector<std::string> const& expected)
{
    if (actual == expected) { return; }
    PrintLinesDiff(actual, expected);
    FAIL_CHECK(fmt::format("Lines differ:\n{}", fmt::join(actual, "\n")));
}

inline bool JsonStringEqual(std::string const& lhs, std::string const& rhs)
{
    rapidjson::Document doclhs, docrhs;
    doclhs.Parse(lhs.c_str());
    docrhs.Parse(rhs.c_str());
    if (doclhs.HasParseError() || docrhs.HasParseError()) { return false; }
    return doclhs == docrhs;
}

// A fresh database file under the temp directory, removed with its WAL files afterwards
struct TempDatabase
{
    TempDatabase()
    {
        static std::atomic<int> counter{0};
        auto name = fmt::format("sbsingest-test-{}-{}.db", ::getpid(), counter++);
        path      = std::filesystem::temp_directory_path() / "sbsingest-tests" / name;
        Remove();
    }

    ~TempDatabase() { Remove(); }
    CLASS_DELETE_COPY_AND_MOVE(TempDatabase);

    void Remove() const
    {
        std::error_code ec;
        for (auto const* suffix : {"", "-wal", "-shm", "-journal"}) { std::filesystem::remove(path.string() + suffix, ec); }
    }

    std::filesystem::path path;
};

// Builds a "MSG,3,..." record; unspecified positions are blank
inline std::string MakeRecord(std::initializer_list<std::pair<SBS::Field, std::string_view>> values, std::string_view type = "MSG")
{
    std::vector<std::string> fields(SBS::Message::FieldCount);
    fields[static_cast<size_t>(SBS::Field::MessageType)] = std::string(type);
    for (auto const& [field, value] : values) { fields[static_cast<size_t>(field)] = std::string(value); }
    return fmt::format("{}", fmt::join(fields, ","));
}

// Sets TZ for the scope of a test; feed times are read in local time
struct ScopedTimeZone
{
    explicit ScopedTimeZone(char const* tz)
    {
        if (auto const* current = std::getenv("TZ")) { _previous = current; }
        ::setenv("TZ", tz, 1);
        ::tzset();
    }

    ~ScopedTimeZone()
    {
        if (_previous) { ::setenv("TZ", _previous->c_str(), 1); }
        else { ::unsetenv("TZ"); }
        ::tzset();
    }
    CLASS_DELETE_COPY_AND_MOVE(ScopedTimeZone);

    private:
    std::optional<std::string> _previous;
};

struct ManualClock
{
    SBS::time_point now = SBS::FromEpochMs(1704067200000);    // 2024-01-01T00:00:00Z

    auto Get()
    {
        return [this]() { return now; };
    }
};
}    // namespace TestCommon
