#pragma once

#include "CommandQueue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

// Periodically fails Delivered jobs that stopped making progress, freeing the
// client's single delivery slot.
class JobReaper {
public:
    JobReaper(CommandQueue& queue, std::int64_t timeoutSeconds, std::int64_t intervalSeconds);
    ~JobReaper();

    void Start();
    void Stop();

    // One sweep; returns the number of jobs failed.
    size_t RunOnce();

private:
    void Run();

    CommandQueue& queue_;
    std::int64_t timeoutMillis_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;
};
