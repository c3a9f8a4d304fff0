#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// One mutex per key, created on first use. Guards the per-client critical
// section of the queue engine inside a single process.
class ClientLockTable {
public:
    std::unique_lock<std::mutex> Lock(const std::string& key);

private:
    std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};
