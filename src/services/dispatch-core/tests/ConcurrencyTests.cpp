#include "TestSupport.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

Command Custom(const std::string& text) {
    Command command;
    command.text = text;
    return command;
}

int CountDelivered(StateStore& store, const std::string& clientId) {
    std::vector<QueueItem> pending;
    store.ListPendingItems(clientId, pending);
    int delivered = 0;
    for (const auto& item : pending) {
        if (item.state == JobState::Delivered) {
            ++delivered;
        }
    }
    return delivered;
}
} // namespace

int main() {
    constexpr int kThreads = 8;
    constexpr int kJobs = 40;

    DispatchFixture fixture;
    const std::string client = fixture.Register("A1");
    std::vector<std::string> enqueued;
    for (int i = 0; i < kJobs; ++i) {
        std::string jobId;
        fixture.queue.Enqueue(client, Custom("cmd-" + std::to_string(i)), jobId);
        enqueued.push_back(jobId);
    }

    // Duplicate concurrent check-ins: exactly one receives the head item.
    {
        std::atomic<int> handedOut{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&]() {
                Delivery delivery;
                if (fixture.queue.DrainNext(client, delivery) == DispatchError::None) {
                    ++handedOut;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        if (handedOut != 1 || CountDelivered(fixture.store, client) != 1) {
            return Fail("Concurrent drains handed out " + std::to_string(handedOut.load()) + " items.");
        }
        fixture.queue.MarkCompleted(enqueued[0], "done");
    }

    // Check-in storms that also complete what they receive: every job once, in order.
    {
        std::mutex mutex;
        std::vector<std::string> order;
        std::atomic<bool> violation{false};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&]() {
                for (int attempt = 0; attempt < kJobs * 4; ++attempt) {
                    Delivery delivery;
                    if (fixture.queue.DrainNext(client, delivery) != DispatchError::None) {
                        continue;
                    }
                    if (CountDelivered(fixture.store, client) > 1) {
                        violation = true;
                    }
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        order.push_back(delivery.jobId);
                    }
                    fixture.queue.MarkCompleted(delivery.jobId, "ok");
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        if (violation) {
            return Fail("More than one item was Delivered at once.");
        }
        // Drain whatever the storm left behind.
        Delivery delivery;
        while (fixture.queue.DrainNext(client, delivery) == DispatchError::None) {
            order.push_back(delivery.jobId);
            fixture.queue.MarkCompleted(delivery.jobId, "ok");
        }
        const std::vector<std::string> expected(enqueued.begin() + 1, enqueued.end());
        if (order != expected) {
            return Fail("Deliveries did not follow enqueue order exactly once.");
        }
    }

    // Two store handles on one file stand in for two server processes; the
    // compare-and-swap in the store is all that keeps them apart.
    {
        SqliteStateStore otherStore(fixture.dir.File("state.db"));
        SessionRegistry otherRegistry(otherStore, DispatchFixture::kStaleMillis);
        CommandQueue otherQueue(otherStore, otherRegistry);

        std::string jobId;
        fixture.queue.Enqueue(client, Custom("shared-1"), jobId);
        fixture.queue.Enqueue(client, Custom("shared-2"), jobId);

        std::atomic<int> handedOut{0};
        std::set<std::string> seen;
        std::mutex mutex;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            CommandQueue* queue = t % 2 == 0 ? &fixture.queue : &otherQueue;
            threads.emplace_back([&, queue]() {
                Delivery delivery;
                if (queue->DrainNext(client, delivery) == DispatchError::None) {
                    ++handedOut;
                    std::lock_guard<std::mutex> lock(mutex);
                    seen.insert(delivery.jobId);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        if (handedOut != 1 || seen.size() != 1) {
            return Fail("Two processes handed out " + std::to_string(handedOut.load()) + " items.");
        }
    }

    // Duplicate check-ins during an outbound transfer: every chunk goes out
    // exactly once, each racer sees increasing sequence numbers, and the job
    // completes with its last chunk.
    {
        SqliteStateStore otherStore(fixture.dir.File("state.db"));
        SessionRegistry otherRegistry(otherStore, DispatchFixture::kStaleMillis);
        CommandQueue otherQueue(otherStore, otherRegistry);

        const std::string pushClient = fixture.Register("P5");
        std::string content;
        for (int i = 0; i < 13 * 1230 + 77; ++i) {
            content.push_back(static_cast<char>('a' + i % 26));
        }
        QueueItem push;
        if (fixture.transfers.StartOutbound(pushClient, "bulk.bin", content, push) != DispatchError::None
            || push.chunkCount != 14) {
            return Fail("Expected a fourteen-chunk outbound plan.");
        }

        std::mutex mutex;
        std::map<int, std::string> received;
        std::atomic<int> duplicates{0};
        std::atomic<bool> unordered{false};
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            CommandQueue* queue = t % 2 == 0 ? &fixture.queue : &otherQueue;
            threads.emplace_back([&, queue]() {
                int lastSeen = -1;
                for (int attempt = 0; attempt < push.chunkCount * kThreads * 4; ++attempt) {
                    Delivery delivery;
                    if (queue->DrainNext(pushClient, delivery) != DispatchError::None) {
                        continue;
                    }
                    if (delivery.kind != DeliveryKind::FileChunk || delivery.sequenceNumber <= lastSeen) {
                        unordered = true;
                    }
                    lastSeen = delivery.sequenceNumber;
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!received.emplace(delivery.sequenceNumber, delivery.bytes).second) {
                        ++duplicates;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        if (duplicates != 0 || unordered) {
            return Fail("A chunk was handed out twice or out of order.");
        }
        if (static_cast<int>(received.size()) != push.chunkCount) {
            return Fail("Only " + std::to_string(received.size()) + " chunks were handed out.");
        }
        std::string reassembled;
        int expectedSequence = 0;
        for (const auto& entry : received) {
            if (entry.first != expectedSequence++) {
                return Fail("Chunk sequence numbers have a gap.");
            }
            reassembled += entry.second;
        }
        if (reassembled != content) {
            return Fail("Racing drains corrupted the outbound file.");
        }
        QueueItem finished;
        if (fixture.queue.GetJob(push.jobId, finished) != DispatchError::None
            || finished.state != JobState::Completed
            || finished.nextChunk != push.chunkCount) {
            return Fail("Outbound job should end Completed after its last chunk.");
        }
    }

    std::cout << "ConcurrencyTests passed." << std::endl;
    return 0;
}
