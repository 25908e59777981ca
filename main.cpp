#include "Config.h"
#include "Errors.h"
#include "FeedClient.h"
#include "FlightStore.h"
#include "Ingestor.h"
#include "Logging.h"
#include "SetThreadName.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <thread>

#include <pthread.h>

// SIGINT/SIGTERM are blocked everywhere and consumed here, so the ingestion thread
// is never interrupted in the middle of a store transaction.
struct SignalThread
{
    SignalThread(sigset_t signals, SBS::FeedClient& client) :
        _thread([this, signals, &client]() {
            SetThreadName("sbs-signals");
            int sig = 0;
            if (sigwait(&signals, &sig) != 0) { return; }
            _received = true;
            SBS::Log::Info("Received signal {}, shutting down", sig);
            client.Stop();
        })
    {}

    // Wakes the wait when the client stopped for another reason
    ~SignalThread()
    {
        if (!_received) { pthread_kill(_thread.native_handle(), SIGTERM); }
        _thread.join();
    }
    CLASS_DELETE_COPY_AND_MOVE(SignalThread);

    private:
    std::atomic<bool> _received{false};
    std::thread       _thread;
};

int main(int argc, char* argv[])
{
    SBS::Config config;
    try
    {
        config = SBS::ParseCommandLine(argc, argv);
    } catch (std::invalid_argument const& ex)
    {
        fmt::print(stderr, "{}\n\n{}", ex.what(), SBS::Usage(argv[0]));
        return EXIT_FAILURE;
    }
    if (config.showHelp)
    {
        fmt::print("{}", SBS::Usage(argv[0]));
        return EXIT_SUCCESS;
    }
    SBS::Log::SetLevel(config.logLevel);

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // A closed stderr pipe must not end the process
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        SBS::FlightStore store(config.database);
        SBS::Ingestor    ingestor(store, config.ingest);
        SBS::FeedClient  client(config.host, config.port, SBS::ReconnectPolicy(config.reconnect));
        SignalThread     signalThread(signals, client);

        SBS::Log::Info("Ingesting {}:{} into {}", config.host, config.port, config.database.string());
        client.Run(ingestor);
        ingestor.LogStats();
    } catch (SBS::StoreError const& ex)
    {
        SBS::Log::Error("Cannot open flight store: {}", ex.what());
        return EXIT_FAILURE;
    } catch (std::filesystem::filesystem_error const& ex)
    {
        SBS::Log::Error("Cannot prepare database directory: {}", ex.what());
        return EXIT_FAILURE;
    } catch (std::exception const& ex)
    {
        SBS::Log::Error("Ingestion stopped: {}", ex.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
