#pragma once
#include "CommonMacros.h"
#include "ReconnectPolicy.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>

namespace SBS
{
struct IFeedHandler
{
    IFeedHandler()          = default;
    virtual ~IFeedHandler() = default;
    CLASS_DEFAULT_COPY_AND_MOVE(IFeedHandler);

    virtual void HandleData(std::span<uint8_t const> const& data) = 0;
    virtual void OnConnectionChanged(bool connected)              = 0;
};

// TCP client for a line oriented feed. Run() keeps the connection alive until Stop().
struct FeedClient
{
    static constexpr size_t ReadBufferSize = 4096;

    struct Stats
    {
        std::atomic<uint64_t> connectionAttempts{0};
        std::atomic<uint64_t> successfulConnections{0};
        std::atomic<uint64_t> disconnections{0};
        std::atomic<uint64_t> bytesReceived{0};
        std::atomic<uint64_t> readErrors{0};
    };

    FeedClient(std::string hostIn, uint16_t portIn, ReconnectPolicy policyIn = {});
    ~FeedClient();
    CLASS_DELETE_COPY_AND_MOVE(FeedClient);

    // Blocking. Returns only after Stop() has been called.
    void Run(IFeedHandler& handler);

    // Safe to call from any thread
    void Stop();

    [[nodiscard]] bool         IsConnected() const { return _connected.load(); }
    [[nodiscard]] bool         StopRequested() const { return _stopRequested.load(); }
    [[nodiscard]] Stats const& GetStats() const { return _stats; }
    [[nodiscard]] std::string const& Host() const { return _host; }
    [[nodiscard]] uint16_t           Port() const { return _port; }

    private:
    void Connect();
    void ReadLoop(IFeedHandler& handler);
    void CloseSocket();
    void WaitBeforeRetry(std::chrono::milliseconds delay);

    std::string     _host;
    uint16_t        _port;
    ReconnectPolicy _policy;
    Stats           _stats;

    std::mutex              _mutex;
    std::condition_variable _cvStop;
    int                     _socket{-1};
    std::atomic<bool>       _connected{false};
    std::atomic<bool>       _stopRequested{false};
};
}    // namespace SBS
