#include "CheckinHandler.hpp"
#include "CheckinServer.hpp"
#include "CommandQueue.hpp"
#include "Config.hpp"
#include "FileTransferManager.hpp"
#include "JobReaper.hpp"
#include "SessionRegistry.hpp"
#include "SqliteStateStore.hpp"
#include "Tracing.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <iostream>

int main() {
    std::cout << "Check-in Server Starting..." << std::endl;

    const DispatchConfig config = LoadDispatchConfig();
    Tracer::Instance().Configure(LoadTraceConfig("checkin-server"));

    SqliteStateStore store(config.dbPath);
    if (!store.IsOpen()) {
        std::cerr << "[Server] State store " << config.dbPath << " unavailable." << std::endl;
        return 1;
    }

    SessionRegistry registry(store, config.staleAfterSeconds * 1000);
    QueuePolicy policy;
    policy.maxQueuedPerClient = config.maxQueuedPerClient;
    CommandQueue queue(store, registry, policy);
    FileTransferManager transfers(store, queue, config.chunkSize);
    CheckinHandler handler(registry, queue, transfers, config.downloadDir);

    if (config.apiKey.empty()) {
        std::cerr << "[Server] DISPATCH_API_KEY not set; accepting unauthenticated check-ins." << std::endl;
    }

    CheckinServer server(handler, config);
    if (!server.Start()) {
        return 1;
    }

    JobReaper reaper(queue, config.jobTimeoutSeconds, config.reaperIntervalSeconds);
    reaper.Start();

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int signal) {
        std::cout << "[Server] Signal " << signal << " received, shutting down." << std::endl;
    });
    signalContext.run();

    reaper.Stop();
    server.Stop();
    Tracer::Instance().Shutdown();
    return 0;
}
