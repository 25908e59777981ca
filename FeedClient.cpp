#include "FeedClient.h"
#include "Errors.h"
#include "Logging.h"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace SBS
{
static std::string ErrnoMessage(int err)
{
    return std::system_category().message(err);
}

// Keepalive detects a receiver that vanished without closing the connection
static void ConfigureSocket(int fd)
{
    int one       = 1;
    int keepidle  = 30;
    int keepintvl = 10;
    int keepcnt   = 3;
    if (::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one)) < 0) { Log::Debug("SO_KEEPALIVE: {}", ErrnoMessage(errno)); }
    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle)) < 0) { Log::Debug("TCP_KEEPIDLE: {}", ErrnoMessage(errno)); }
    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl)) < 0) { Log::Debug("TCP_KEEPINTVL: {}", ErrnoMessage(errno)); }
    if (::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt)) < 0) { Log::Debug("TCP_KEEPCNT: {}", ErrnoMessage(errno)); }
}

FeedClient::FeedClient(std::string hostIn, uint16_t portIn, ReconnectPolicy policyIn) :
    _host(std::move(hostIn)), _port(portIn), _policy(policyIn)
{}

FeedClient::~FeedClient()
{
    Stop();
    CloseSocket();
}

void FeedClient::Connect()
{
    _stats.connectionAttempts++;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res     = nullptr;
    auto const       portStr = std::to_string(_port);
    int              rc      = ::getaddrinfo(_host.c_str(), portStr.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) { throw TransportError(fmt::format("Cannot resolve {}: {}", _host, ::gai_strerror(rc))); }

    int lastError = 0;
    for (auto* p = res; p != nullptr; p = p->ai_next)
    {
        int fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (fd < 0)
        {
            lastError = errno;
            continue;
        }
        {
            std::scoped_lock lock(_mutex);
            _socket = fd;
        }
        if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0)
        {
            ConfigureSocket(fd);
            ::freeaddrinfo(res);
            return;
        }
        lastError = errno;
        CloseSocket();
        if (_stopRequested) { break; }
    }

    ::freeaddrinfo(res);
    throw TransportError(fmt::format("Cannot connect to {}:{}: {}", _host, _port, ErrnoMessage(lastError)));
}

void FeedClient::CloseSocket()
{
    std::scoped_lock lock(_mutex);
    if (_socket >= 0)
    {
        ::shutdown(_socket, SHUT_RDWR);
        ::close(_socket);
        _socket = -1;
    }
}

void FeedClient::ReadLoop(IFeedHandler& handler)
{
    int fd = -1;
    {
        std::scoped_lock lock(_mutex);
        fd = _socket;
    }

    uint8_t buffer[ReadBufferSize];
    while (!_stopRequested)
    {
        ssize_t rc = ::recv(fd, buffer, sizeof(buffer), 0);
        if (rc > 0)
        {
            _stats.bytesReceived += static_cast<uint64_t>(rc);
            handler.HandleData(std::span<uint8_t const>(buffer, static_cast<size_t>(rc)));
            continue;
        }
        if (_stopRequested) { return; }
        if (rc == 0) { throw TransportError("Connection closed by peer"); }
        if (errno == EINTR) { continue; }
        _stats.readErrors++;
        throw TransportError(fmt::format("recv failed: {}", ErrnoMessage(errno)));
    }
}

void FeedClient::WaitBeforeRetry(std::chrono::milliseconds delay)
{
    std::unique_lock lock(_mutex);
    _cvStop.wait_for(lock, delay, [this]() { return _stopRequested.load(); });
}

void FeedClient::Run(IFeedHandler& handler)
{
    while (!_stopRequested)
    {
        try
        {
            Connect();
            _policy.Reset();
            _stats.successfulConnections++;
            _connected = true;
            Log::Info("Connected to {}:{}", _host, _port);
            handler.OnConnectionChanged(true);
            ReadLoop(handler);
        } catch (TransportError const& ex)
        {
            if (!_stopRequested) { Log::Warn("Feed {}:{}: {}", _host, _port, ex.what()); }
        } catch (std::exception const& ex)
        {
            Log::Error("Feed {}:{}: unexpected error, dropping connection: {}", _host, _port, ex.what());
        }

        CloseSocket();
        if (_connected.exchange(false))
        {
            _stats.disconnections++;
            handler.OnConnectionChanged(false);
        }
        if (_stopRequested) { break; }

        auto delay = _policy.NextDelay();
        Log::Info("Reconnecting to {}:{} in {} ms (attempt {})", _host, _port, delay.count(), _policy.Attempts());
        WaitBeforeRetry(delay);
    }
    Log::Info("Feed client for {}:{} stopped", _host, _port);
}

void FeedClient::Stop()
{
    _stopRequested = true;
    std::scoped_lock lock(_mutex);
    // Unblocks recv() on the reading thread; the descriptor is closed there
    if (_socket >= 0) { ::shutdown(_socket, SHUT_RDWR); }
    _cvStop.notify_all();
}
}    // namespace SBS
