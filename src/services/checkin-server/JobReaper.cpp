#include "JobReaper.hpp"

#include <iostream>
#include <string>
#include <vector>

JobReaper::JobReaper(CommandQueue& queue, std::int64_t timeoutSeconds, std::int64_t intervalSeconds)
    : queue_(queue),
      timeoutMillis_(timeoutSeconds * 1000),
      interval_(std::chrono::seconds(intervalSeconds > 0 ? intervalSeconds : 1)) {}

JobReaper::~JobReaper() {
    Stop();
}

void JobReaper::Start() {
    if (timeoutMillis_ <= 0) {
        std::cout << "[Reaper] Job timeout disabled" << std::endl;
        return;
    }
    if (running_.exchange(true)) {
        return;
    }

    worker_ = std::thread(&JobReaper::Run, this);
}

void JobReaper::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

size_t JobReaper::RunOnce() {
    std::vector<std::string> expired;
    const DispatchError error = queue_.ExpireStalled(timeoutMillis_, expired);
    if (error != DispatchError::None) {
        std::cerr << "[Reaper] Sweep failed: " << ToString(error) << std::endl;
        return 0;
    }

    for (const auto& jobId : expired) {
        std::cout << "[Reaper] " << jobId << " timed out" << std::endl;
    }
    return expired.size();
}

void JobReaper::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (wake_.wait_for(lock, interval_, [this]() { return !running_; })) {
            break;
        }

        lock.unlock();
        RunOnce();
        lock.lock();
    }
}
