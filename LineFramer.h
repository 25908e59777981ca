#pragma once
#include "CommonMacros.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace SBS
{
// Splits a byte stream into newline delimited records.
// A partial record is kept across Feed calls until its delimiter arrives.
struct LineFramer
{
    static constexpr size_t DefaultMaxRecordLength = size_t{64u} * 1024u;

    explicit LineFramer(size_t maxRecordLength = DefaultMaxRecordLength) : _maxRecordLength(maxRecordLength) {}

    void Feed(std::span<uint8_t const> const& data);
    void Feed(std::string_view const& data) { Feed(std::span(reinterpret_cast<uint8_t const*>(data.data()), data.size())); }

    // Next complete, non blank record with any trailing '\r' removed and invalid UTF-8 replaced
    bool Pop(std::string& out);

    // Drops the partial record. Called when the connection is lost.
    void Reset();

    [[nodiscard]] size_t PendingBytes() const { return _buffer.size() - _consumed; }
    [[nodiscard]] size_t OversizeRecords() const { return _oversizeRecords; }

    private:
    size_t      _maxRecordLength;
    std::string _buffer;
    size_t      _consumed{0};
    bool        _discarding{false};
    size_t      _oversizeRecords{0};
};

// Lossy conversion: each maximal invalid subsequence becomes U+FFFD
std::string ToValidUtf8(std::string_view bytes);
}    // namespace SBS
