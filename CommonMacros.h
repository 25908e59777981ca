#pragma once

#if !(defined SUPPRESS_WARNINGS_START)
#if defined(__clang__)
#define SUPPRESS_WARNINGS_START _Pragma("clang diagnostic push") _Pragma("clang diagnostic ignored \"-Weverything\"")
#define SUPPRESS_WARNINGS_END _Pragma("clang diagnostic pop")
#define SUPPRESS_CLANG_WARNING(w) _Pragma(SBS_STRINGIFY(clang diagnostic ignored w))
#define SUPPRESS_GCC_WARNING(w)
#define SUPPRESS_MSVC_WARNING(w)
#elif defined(__GNUC__)
#define SUPPRESS_WARNINGS_START _Pragma("GCC diagnostic push")
#define SUPPRESS_WARNINGS_END _Pragma("GCC diagnostic pop")
#define SUPPRESS_CLANG_WARNING(w)
#define SUPPRESS_GCC_WARNING(w) _Pragma(SBS_STRINGIFY(GCC diagnostic ignored w))
#define SUPPRESS_MSVC_WARNING(w)
#else
#define SUPPRESS_WARNINGS_START _Pragma("warning(push, 3)")
#define SUPPRESS_WARNINGS_END _Pragma("warning(pop)")
#define SUPPRESS_CLANG_WARNING(w)
#define SUPPRESS_GCC_WARNING(w)
#define SUPPRESS_MSVC_WARNING(w) _Pragma(SBS_STRINGIFY(warning(disable : w)))
#endif

#define SBS_STRINGIFY_(x) #x
#define SBS_STRINGIFY(x) SBS_STRINGIFY_(x)

// Third party headers (sqlite3, rapidjson, fmt) are pulled in between these
#define SUPPRESS_THIRD_PARTY_WARNINGS                 \
    SUPPRESS_GCC_WARNING("-Wmaybe-uninitialized")     \
    SUPPRESS_GCC_WARNING("-Wclass-memaccess")         \
    SUPPRESS_GCC_WARNING("-Wconversion")              \
    SUPPRESS_GCC_WARNING("-Wsign-conversion")         \
    SUPPRESS_MSVC_WARNING(4365) /* signed / unsigned mismatch*/
#endif

#if (!defined CLASS_DEFAULT_COPY_AND_MOVE)
#define CLASS_DEFAULT_COPY_AND_MOVE(name)   \
    name(name const&)            = default; \
    name(name&&)                 = default; \
    name& operator=(name const&) = default; \
    name& operator=(name&&)      = default

#define CLASS_DELETE_COPY_AND_MOVE(name)   \
    name(name const&)            = delete; \
    name(name&&)                 = delete; \
    name& operator=(name const&) = delete; \
    name& operator=(name&&)      = delete

#define CLASS_DELETE_COPY_DEFAULT_MOVE(name) \
    name(name const&)            = delete;   \
    name(name&&)                 = default;  \
    name& operator=(name const&) = delete;   \
    name& operator=(name&&)      = default
#endif
