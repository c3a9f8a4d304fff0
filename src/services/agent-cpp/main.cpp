#include "CheckinClient.hpp"
#include "CheckinPoller.hpp"
#include "Config.hpp"
#include "StockCatalog.hpp"
#include "Tracing.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace {
std::string DetectOsName() {
#ifdef _WIN32
    return "Windows";
#elif __APPLE__
    return "macOS";
#else
    return "Linux";
#endif
}

std::string DetectHostname() {
    char hostnameBuffer[256] = {};
#ifdef _WIN32
    DWORD hostnameSize = static_cast<DWORD>(sizeof(hostnameBuffer));
    if (GetComputerNameA(hostnameBuffer, &hostnameSize) != 0) {
        return hostnameBuffer;
    }
#else
    if (gethostname(hostnameBuffer, sizeof(hostnameBuffer)) == 0) {
        return hostnameBuffer;
    }
#endif
    return "unknown-host";
}

std::string DetectUser() {
    const std::string user = GetEnvOrDefault("USER", "");
    return user.empty() ? GetEnvOrDefault("USERNAME", "unknown") : user;
}

bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds) {
    if (settings.certPath.empty() || settings.keyPath.empty() || settings.caPath.empty()) {
        return false;
    }

    for (int attempt = 0; attempt < timeoutSeconds; ++attempt) {
        if (std::filesystem::exists(settings.certPath)
            && std::filesystem::exists(settings.keyPath)
            && std::filesystem::exists(settings.caPath)) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    return false;
}

// Answers the stock commands this agent can report on without a shell. Anything
// else is reported back as unsupported.
bool AnswerFromHost(const Delivery& command, const ClientMetadata& metadata, std::string& outOutput) {
    const std::string& text = command.commandText;
    if (text == "whoami") {
        outOutput = metadata.user;
        return true;
    }
    if (text == "hostname") {
        outOutput = metadata.hostname;
        return true;
    }
    if (text == "pwd") {
        std::error_code error;
        outOutput = std::filesystem::current_path(error).string();
        return !error;
    }
    if (text == "ls") {
        std::error_code error;
        for (const auto& entry : std::filesystem::directory_iterator(".", error)) {
            outOutput += entry.path().filename().string() + "\n";
        }
        return !error;
    }

    outOutput = "unsupported command: " + text;
    return false;
}
} // namespace

int main() {
    std::cout << "Check-in Agent Starting..." << std::endl;

    Tracer::Instance().Configure(LoadTraceConfig("checkin-agent"));

    const std::string coreUrl = GetEnvOrDefault("DISPATCH_CORE_URL", "http://127.0.0.1:8443");
    TlsSettings tlsSettings;
    tlsSettings.enabled = GetEnvBool("DISPATCH_MTLS_ENABLED", false);
    if (tlsSettings.enabled) {
        tlsSettings.certPath = GetEnvOrDefault("DISPATCH_MTLS_CERT_PATH", "");
        tlsSettings.keyPath = GetEnvOrDefault("DISPATCH_MTLS_KEY_PATH", "");
        tlsSettings.caPath = GetEnvOrDefault("DISPATCH_MTLS_CA_PATH", "");
        tlsSettings.verifyPeer = GetEnvBool("DISPATCH_MTLS_VERIFY_PEER", true);
        tlsSettings.verifyHost = GetEnvBool("DISPATCH_MTLS_VERIFY_HOST", false);

        if (coreUrl.rfind("https://", 0) != 0) {
            std::cerr << "[Agent] DISPATCH_MTLS_ENABLED requires an https core URL." << std::endl;
            return 1;
        }

        if (!WaitForTlsFiles(tlsSettings, 30)) {
            std::cerr << "[Agent] mTLS enabled but certificate files are missing." << std::endl;
            return 1;
        }
    }

    ClientMetadata metadata;
    metadata.hostname = DetectHostname();
    metadata.user = DetectUser();
    metadata.os = DetectOsName();
    const std::string identity = GetEnvOrDefault("DISPATCH_AGENT_IDENTITY", metadata.hostname);
    const auto interval = std::chrono::seconds(GetEnvInt("DISPATCH_CHECKIN_INTERVAL_SECONDS", 5));

    CheckinClient client(coreUrl, tlsSettings, GetEnvOrDefault("DISPATCH_API_KEY", ""));
    CheckinPoller poller(
        [&client](const CheckinRequest& request, Delivery& outDelivery) {
            return client.Checkin(request, outDelivery);
        },
        identity,
        metadata,
        [metadata](const Delivery& command, std::string& outOutput) {
            return AnswerFromHost(command, metadata, outOutput);
        },
        interval);

    std::cout << "[Agent] Checking in to " << coreUrl << " as " << identity << " every " << interval.count()
              << "s (stock catalog v" << StockCatalog::kVersion << ")" << std::endl;
    poller.Start();

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code&, int signal) {
        std::cout << "[Agent] Signal " << signal << " received, stopping." << std::endl;
    });
    signalContext.run();

    poller.Stop();
    Tracer::Instance().Shutdown();
    return 0;
}
