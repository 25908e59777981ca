#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace SBS
{
enum class ErrorKind
{
    Transport,
    Decode,
    Store
};

constexpr std::string_view ToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Decode: return "decode";
    case ErrorKind::Store: return "store";
    }
    return "unknown";
}

struct Error : std::runtime_error
{
    Error(ErrorKind kindIn, std::string const& what) : std::runtime_error(what), kind(kindIn) {}

    ErrorKind kind;
};

// Connect failure, reset or EOF. FeedClient reconnects.
struct TransportError : Error
{
    explicit TransportError(std::string const& what) : Error(ErrorKind::Transport, what) {}
};

// A record that still cannot be interpreted after padding. The record is skipped.
struct DecodeError : Error
{
    explicit DecodeError(std::string const& what) : Error(ErrorKind::Decode, what) {}
};

// SQLite failure. The record's transaction is rolled back and the record dropped.
struct StoreError : Error
{
    StoreError(std::string const& what, int codeIn) : Error(ErrorKind::Store, what), code(codeIn) {}

    int code;
};
}    // namespace SBS
