#include "ClientLockTable.hpp"

std::unique_lock<std::mutex> ClientLockTable::Lock(const std::string& key) {
    std::shared_ptr<std::mutex> entry;
    {
        std::lock_guard<std::mutex> guard(tableMutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        entry = slot;
    }
    // Entries are never erased, so the mutex outlives the returned lock.
    return std::unique_lock<std::mutex>(*entry);
}
