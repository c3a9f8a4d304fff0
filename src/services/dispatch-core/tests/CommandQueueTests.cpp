#include "TestSupport.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

Command Custom(const std::string& text) {
    Command command;
    command.kind = CommandKind::Custom;
    command.text = text;
    return command;
}

Command Stock(int index) {
    Command command;
    command.kind = CommandKind::Stock;
    command.stockIndex = index;
    return command;
}
} // namespace

int main() {
    DispatchFixture fixture;
    const std::string a = fixture.Register("A1");
    const std::string b = fixture.Register("B2");

    Delivery delivery;
    for (int i = 0; i < 3; ++i) {
        if (fixture.queue.DrainNext(a, delivery) != DispatchError::QueueEmpty || delivery.kind != DeliveryKind::Empty) {
            return Fail("Draining an empty queue should return Empty every time.");
        }
    }
    std::vector<QueueItem> pending;
    fixture.store.ListPendingItems(a, pending);
    if (!pending.empty()) {
        return Fail("Empty drains must not create state.");
    }

    std::string jobId;
    if (fixture.queue.Enqueue("c-unknown", Custom("id"), jobId) != DispatchError::UnknownClient) {
        return Fail("Enqueue for an unregistered client should be UnknownClient.");
    }
    fixture.store.ListPendingItems("c-unknown", pending);
    if (!pending.empty()) {
        return Fail("Rejected enqueue left a queue entry.");
    }

    if (fixture.queue.Enqueue(a, Custom("   "), jobId) != DispatchError::InvalidArgument) {
        return Fail("Blank custom command should be rejected.");
    }
    if (fixture.queue.Enqueue(a, Stock(99), jobId) != DispatchError::InvalidArgument) {
        return Fail("Out-of-range stock index should be rejected.");
    }

    // Interleave two clients; each must see its own enqueue order.
    std::vector<std::string> jobsA;
    std::vector<std::string> jobsB;
    for (int i = 0; i < 3; ++i) {
        fixture.queue.Enqueue(a, Custom("a-" + std::to_string(i)), jobId);
        jobsA.push_back(jobId);
        fixture.queue.Enqueue(b, Custom("b-" + std::to_string(i)), jobId);
        jobsB.push_back(jobId);
    }

    for (int i = 0; i < 3; ++i) {
        if (fixture.queue.DrainNext(b, delivery) != DispatchError::None || delivery.jobId != jobsB[static_cast<size_t>(i)]) {
            return Fail("Client B received items out of order.");
        }
        if (fixture.queue.DrainNext(a, delivery) != DispatchError::None || delivery.jobId != jobsA[static_cast<size_t>(i)]) {
            return Fail("Client A received items out of order.");
        }
        if (delivery.commandText != "a-" + std::to_string(i) || delivery.commandKind != CommandKind::Custom) {
            return Fail("Unexpected command text: " + delivery.commandText);
        }

        Delivery duplicate;
        if (fixture.queue.DrainNext(a, duplicate) != DispatchError::QueueEmpty) {
            return Fail("A second item was handed out while one is outstanding.");
        }

        if (fixture.queue.MarkCompleted(jobsA[static_cast<size_t>(i)], "ok") != DispatchError::None
            || fixture.queue.MarkCompleted(jobsB[static_cast<size_t>(i)], "ok") != DispatchError::None) {
            return Fail("Completing a delivered item should succeed.");
        }
    }

    if (fixture.queue.MarkCompleted(jobsA[0], "again") != DispatchError::InvalidTransition) {
        return Fail("Duplicate completion should be InvalidTransition.");
    }
    JobResult result;
    if (fixture.queue.FetchResult(jobsA[0], result) != DispatchError::None || result.output != "ok") {
        return Fail("The first result must not be overwritten.");
    }

    fixture.queue.Enqueue(a, Stock(0), jobId);
    if (fixture.queue.MarkFailed(jobId, "too early") != DispatchError::InvalidTransition) {
        return Fail("Completing a Queued item should be InvalidTransition.");
    }
    QueueItem stored;
    fixture.queue.GetJob(jobId, stored);
    if (stored.commandText != "" || stored.stockIndex != 0) {
        return Fail("Stock commands should be stored by index only.");
    }
    if (fixture.queue.DrainNext(a, delivery) != DispatchError::None
        || delivery.commandKind != CommandKind::Stock
        || delivery.commandText != "whoami") {
        return Fail("Stock index 0 should resolve to whoami at drain time.");
    }
    if (fixture.queue.MarkFailed(jobId, "denied") != DispatchError::None) {
        return Fail("MarkFailed on a delivered item should succeed.");
    }
    if (fixture.queue.FetchResult(jobId, result) != DispatchError::None
        || result.state != JobState::Failed
        || result.output != "denied") {
        return Fail("Failure reason should be recorded as the result.");
    }
    if (fixture.queue.FetchResult("j-missing", result) != DispatchError::NotFound) {
        return Fail("Missing result should be NotFound.");
    }

    // A stalled job is failed by the reaper sweep and frees the slot.
    std::string stalled;
    std::string behind;
    fixture.queue.Enqueue(a, Custom("sleep"), stalled);
    fixture.queue.Enqueue(a, Custom("next"), behind);
    fixture.queue.DrainNext(a, delivery);

    std::vector<std::string> expired;
    fixture.Advance(1000);
    fixture.queue.ExpireStalled(5000, expired);
    if (!expired.empty()) {
        return Fail("A job inside its timeout should not expire.");
    }
    fixture.Advance(5000);
    if (fixture.queue.ExpireStalled(5000, expired) != DispatchError::None || expired.size() != 1 || expired[0] != stalled) {
        return Fail("The stalled job should expire.");
    }
    if (fixture.queue.FetchResult(stalled, result) != DispatchError::None || result.output != "timed out") {
        return Fail("Expired job should carry a timeout result.");
    }
    if (fixture.queue.MarkCompleted(stalled, "late") != DispatchError::InvalidTransition) {
        return Fail("A late result for an expired job should be InvalidTransition.");
    }
    if (fixture.queue.DrainNext(a, delivery) != DispatchError::None || delivery.jobId != behind) {
        return Fail("The next item should drain once the stalled job expired.");
    }

    // A stock item whose index stopped resolving is failed, and the same
    // check-in moves on to the next item.
    const std::string d = fixture.Register("D4");
    QueueItem stale;
    stale.jobId = "j-stale";
    stale.clientId = d;
    stale.kind = ItemKind::Command;
    stale.commandKind = CommandKind::Stock;
    stale.stockIndex = 99;
    stale.state = JobState::Queued;
    stale.createdAt = fixture.queue.Now();
    stale.updatedAt = stale.createdAt;
    if (fixture.store.InsertQueueItem(stale, {}) != StoreStatus::Ok) {
        return Fail("Could not seed a stale stock item.");
    }
    std::string fresh;
    fixture.queue.Enqueue(d, Custom("uptime"), fresh);
    if (fixture.queue.DrainNext(d, delivery) != DispatchError::None
        || delivery.kind != DeliveryKind::Command
        || delivery.jobId != fresh
        || delivery.commandText != "uptime") {
        return Fail("A dead stock item should not cost the client its check-in.");
    }
    if (fixture.queue.FetchResult("j-stale", result) != DispatchError::None
        || result.state != JobState::Failed
        || result.output != "unknown stock command") {
        return Fail("The unresolvable stock item should be failed.");
    }

    DispatchFixture bounded(FileTransferManager::kDefaultChunkSize, QueuePolicy{2});
    const std::string c = bounded.Register("C3");
    bounded.queue.Enqueue(c, Custom("one"), jobId);
    bounded.queue.Enqueue(c, Custom("two"), jobId);
    if (bounded.queue.Enqueue(c, Custom("three"), jobId) != DispatchError::QueueFull) {
        return Fail("Queue depth policy should reject a third item.");
    }

    std::cout << "CommandQueueTests passed." << std::endl;
    return 0;
}
