#pragma once
#include "CommonMacros.h"

SUPPRESS_WARNINGS_START
SUPPRESS_THIRD_PARTY_WARNINGS
#include <fmt/chrono.h>
#include <fmt/format.h>
SUPPRESS_WARNINGS_END

#include <atomic>
#include <chrono>
#include <cstdio>
#include <iterator>
#include <string_view>

namespace SBS::Log
{
enum class Level : int
{
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

inline std::atomic<Level>& MinimumLevel()
{
    SUPPRESS_WARNINGS_START
    SUPPRESS_CLANG_WARNING("-Wexit-time-destructors")
    static std::atomic<Level> level{Level::Info};
    SUPPRESS_WARNINGS_END
    return level;
}

inline void SetLevel(Level level)
{
    MinimumLevel().store(level);
}

constexpr std::string_view LevelName(Level level)
{
    switch (level)
    {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    }
    return "?";
}

// One line per event: "2024-01-01 00:00:00.000 [INFO] message"
// A failed write to stderr (closed pipe, full disk) is dropped, logging never throws it.
template <typename... TArgs> void Write(Level level, fmt::format_string<TArgs...> format, TArgs&&... args)
{
    if (level < MinimumLevel().load()) { return; }
    auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto ms  = now.time_since_epoch().count() % 1000;

    fmt::memory_buffer line;
    fmt::format_to(std::back_inserter(line), "{:%Y-%m-%d %H:%M:%S}.{:03} [{}] ", std::chrono::time_point_cast<std::chrono::seconds>(now), ms, LevelName(level));
    fmt::format_to(std::back_inserter(line), format, std::forward<TArgs>(args)...);
    line.push_back('\n');
    if (std::fwrite(line.data(), 1, line.size(), stderr) != line.size()) { std::clearerr(stderr); }
}

template <typename... TArgs> void Debug(fmt::format_string<TArgs...> format, TArgs&&... args)
{
    Write(Level::Debug, format, std::forward<TArgs>(args)...);
}

template <typename... TArgs> void Info(fmt::format_string<TArgs...> format, TArgs&&... args)
{
    Write(Level::Info, format, std::forward<TArgs>(args)...);
}

template <typename... TArgs> void Warn(fmt::format_string<TArgs...> format, TArgs&&... args)
{
    Write(Level::Warn, format, std::forward<TArgs>(args)...);
}

template <typename... TArgs> void Error(fmt::format_string<TArgs...> format, TArgs&&... args)
{
    Write(Level::Error, format, std::forward<TArgs>(args)...);
}
}    // namespace SBS::Log
