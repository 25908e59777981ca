#include "LineFramer.h"
#include "Logging.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace SBS
{
static bool IsBlank(std::string_view str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

void LineFramer::Feed(std::span<uint8_t const> const& data)
{
    auto const* p = reinterpret_cast<char const*>(data.data());
    size_t      n = data.size();
    if (n == 0) { return; }

    if (_discarding)
    {
        auto const* nl = static_cast<char const*>(std::memchr(p, '\n', n));
        if (nl == nullptr) { return; }
        _discarding = false;
        n -= static_cast<size_t>(nl + 1 - p);
        p = nl + 1;
    }

    _buffer.append(p, n);

    auto   lastNl       = _buffer.rfind('\n');
    size_t partialStart = (lastNl == std::string::npos) ? _consumed : std::max(lastNl + 1, _consumed);
    if (_buffer.size() - partialStart > _maxRecordLength)
    {
        Log::Warn("Discarding record longer than {} bytes without a line break", _maxRecordLength);
        _buffer.resize(partialStart);
        _discarding = true;
        _oversizeRecords++;
    }
}

bool LineFramer::Pop(std::string& out)
{
    while (true)
    {
        auto nl = _buffer.find('\n', _consumed);
        if (nl == std::string::npos)
        {
            _buffer.erase(0, _consumed);
            _consumed = 0;
            return false;
        }

        std::string_view raw(_buffer.data() + _consumed, nl - _consumed);
        _consumed = nl + 1;
        if (!raw.empty() && raw.back() == '\r') { raw.remove_suffix(1); }
        if (IsBlank(raw)) { continue; }
        if (raw.size() > _maxRecordLength)
        {
            _oversizeRecords++;
            continue;
        }
        out = ToValidUtf8(raw);
        return true;
    }
}

void LineFramer::Reset()
{
    _buffer.clear();
    _consumed   = 0;
    _discarding = false;
}

std::string ToValidUtf8(std::string_view bytes)
{
    static constexpr std::string_view Replacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size())
    {
        auto c = static_cast<uint8_t>(bytes[i]);
        if (c < 0x80)
        {
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        size_t  length = 0;
        uint8_t lo     = 0x80;
        uint8_t hi     = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) { length = 2; }
        else if (c >= 0xE0 && c <= 0xEF)
        {
            length = 3;
            if (c == 0xE0) { lo = 0xA0; }
            if (c == 0xED) { hi = 0x9F; }
        }
        else if (c >= 0xF0 && c <= 0xF4)
        {
            length = 4;
            if (c == 0xF0) { lo = 0x90; }
            if (c == 0xF4) { hi = 0x8F; }
        }

        if (length == 0)
        {
            out.append(Replacement);
            i++;
            continue;
        }

        // Only the second byte has a restricted range, the rest are plain continuation bytes
        size_t valid = 1;
        while (valid < length && i + valid < bytes.size())
        {
            auto    b     = static_cast<uint8_t>(bytes[i + valid]);
            uint8_t minB  = (valid == 1) ? lo : uint8_t{0x80};
            uint8_t maxB  = (valid == 1) ? hi : uint8_t{0xBF};
            if (b < minB || b > maxB) { break; }
            valid++;
        }

        if (valid == length) { out.append(bytes.substr(i, length)); }
        else { out.append(Replacement); }
        i += valid;
    }
    return out;
}
}    // namespace SBS
