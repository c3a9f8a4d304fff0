#include "CommandQueue.hpp"
#include "Config.hpp"
#include "DealerControl.hpp"
#include "FileTransferManager.hpp"
#include "SessionRegistry.hpp"
#include "SqliteStateStore.hpp"
#include "StockCatalog.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace {
void PrintHelp() {
    std::cout << "Commands:\n"
              << "  list                 show known clients, most recent first\n"
              << "  select <id>          make <id> the target of later commands\n"
              << "  stock <index>        queue a catalog command (see 'catalog')\n"
              << "  custom <text>        queue an arbitrary command\n"
              << "  push <path>          send a local file to the client\n"
              << "  pull <path>          fetch a file from the client\n"
              << "  result <jobId>       show the result of a finished job\n"
              << "  status <jobId>       show a job's state and transfer progress\n"
              << "  catalog              list stock commands\n"
              << "  help                 this text\n"
              << "  exit                 quit" << std::endl;
}

std::string FormatTime(std::int64_t millis) {
    const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm tm = {};
#ifdef _WIN32
    gmtime_s(&tm, &seconds);
#else
    gmtime_r(&seconds, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "Z";
    return out.str();
}

std::string RestOf(std::istringstream& stream) {
    std::string rest;
    std::getline(stream >> std::ws, rest);
    return rest;
}

void Report(DispatchError error) {
    std::cerr << "[Dealer] " << ToString(error) << std::endl;
}

bool RequireSelection(const DealerControl& dealer) {
    if (dealer.SelectedClient().empty()) {
        std::cerr << "[Dealer] No client selected; use 'select <id>'." << std::endl;
        return false;
    }
    return true;
}

void ListSessions(DealerControl& dealer) {
    std::vector<ClientSession> sessions;
    const DispatchError error = dealer.ListSessions(sessions);
    if (error != DispatchError::None) {
        Report(error);
        return;
    }
    if (sessions.empty()) {
        std::cout << "No clients have checked in yet." << std::endl;
        return;
    }

    for (const auto& session : sessions) {
        const bool selected = session.id == dealer.SelectedClient();
        std::cout << (selected ? "* " : "  ") << std::left << std::setw(20) << session.id
                  << std::setw(7) << ToString(session.status)
                  << session.metadata.user << "@" << session.metadata.hostname
                  << " (" << session.metadata.os << ") last seen " << FormatTime(session.lastSeen) << std::endl;
    }
}

void ShowStatus(DealerControl& dealer, const std::string& jobId) {
    QueueItem job;
    const DispatchError error = dealer.JobStatus(jobId, job);
    if (error != DispatchError::None) {
        Report(error);
        return;
    }

    std::cout << job.jobId << " for " << job.clientId << ": " << ToString(job.state);
    if (job.kind == ItemKind::FileJob) {
        TransferProgressView progress;
        if (dealer.TransferProgress(jobId, progress) == DispatchError::None) {
            std::cout << " (" << ToString(job.direction) << " " << job.path << ", "
                      << progress.received << "/" << progress.total << " chunks)";
        }
    }
    if (!job.failure.empty()) {
        std::cout << " - " << job.failure;
    }
    std::cout << std::endl;
}

void ShowResult(DealerControl& dealer, const std::string& jobId) {
    JobResult result;
    const DispatchError error = dealer.FetchResult(jobId, result);
    if (error == DispatchError::NotFound) {
        std::cout << "No result for " << jobId << " yet." << std::endl;
        return;
    }
    if (error != DispatchError::None) {
        Report(error);
        return;
    }

    std::cout << "[" << ToString(result.state) << " at " << FormatTime(result.completedAt) << "]" << std::endl;
    std::cout << result.output << std::endl;
}

void Queued(DispatchError error, const std::string& jobId) {
    if (error != DispatchError::None) {
        Report(error);
        return;
    }
    std::cout << "Queued " << jobId << std::endl;
}
} // namespace

int main() {
    const DispatchConfig config = LoadDispatchConfig();

    SqliteStateStore store(config.dbPath);
    if (!store.IsOpen()) {
        std::cerr << "[Dealer] State store " << config.dbPath << " unavailable." << std::endl;
        return 1;
    }

    SessionRegistry registry(store, config.staleAfterSeconds * 1000);
    QueuePolicy policy;
    policy.maxQueuedPerClient = config.maxQueuedPerClient;
    CommandQueue queue(store, registry, policy);
    FileTransferManager transfers(store, queue, config.chunkSize);
    DealerControl dealer(registry, queue, transfers);

    std::cout << "Dealer ready on " << config.dbPath << ". Type 'help' for commands." << std::endl;

    std::string line;
    while (true) {
        std::cout << "dealer";
        if (!dealer.SelectedClient().empty()) {
            std::cout << "[" << dealer.SelectedClient() << "]";
        }
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        std::istringstream stream(line);
        std::string verb;
        stream >> verb;
        if (verb.empty()) {
            continue;
        }

        if (verb == "exit" || verb == "quit") {
            break;
        } else if (verb == "help") {
            PrintHelp();
        } else if (verb == "list") {
            ListSessions(dealer);
        } else if (verb == "catalog") {
            const auto& entries = StockCatalog::Entries();
            std::cout << "Stock catalog v" << StockCatalog::kVersion << std::endl;
            for (size_t i = 0; i < entries.size(); ++i) {
                std::cout << "  " << i << ": " << entries[i] << std::endl;
            }
        } else if (verb == "select") {
            std::string id;
            stream >> id;
            const DispatchError error = dealer.SelectClient(id);
            if (error != DispatchError::None) {
                Report(error);
            }
        } else if (verb == "stock") {
            int index = -1;
            if (!(stream >> index)) {
                std::cerr << "[Dealer] usage: stock <index>" << std::endl;
                continue;
            }
            if (!RequireSelection(dealer)) {
                continue;
            }
            std::string jobId;
            Queued(dealer.SendStockCommand(dealer.SelectedClient(), index, jobId), jobId);
        } else if (verb == "custom") {
            if (!RequireSelection(dealer)) {
                continue;
            }
            std::string jobId;
            Queued(dealer.SendCustomCommand(dealer.SelectedClient(), RestOf(stream), jobId), jobId);
        } else if (verb == "push" || verb == "pull") {
            const std::string path = RestOf(stream);
            if (path.empty()) {
                std::cerr << "[Dealer] usage: " << verb << " <path>" << std::endl;
                continue;
            }
            if (!RequireSelection(dealer)) {
                continue;
            }
            const TransferDirection direction = verb == "push"
                ? TransferDirection::ServerToClient
                : TransferDirection::ClientToServer;
            std::string jobId;
            Queued(dealer.SendFile(dealer.SelectedClient(), direction, path, jobId), jobId);
        } else if (verb == "result") {
            std::string jobId;
            stream >> jobId;
            ShowResult(dealer, jobId);
        } else if (verb == "status") {
            std::string jobId;
            stream >> jobId;
            ShowStatus(dealer, jobId);
        } else {
            std::cerr << "[Dealer] Unknown command '" << verb << "'; type 'help'." << std::endl;
        }
    }

    return 0;
}
