#pragma once

#include <string>
#include <vector>

// Canned commands addressed by index. Shared by dealer and server; entries are
// only ever appended so queued indices stay valid across versions.
class StockCatalog {
public:
    static constexpr int kVersion = 1;

    static const std::vector<std::string>& Entries();
    static bool Resolve(int index, std::string& outCommand);
    static bool IsValidIndex(int index);
};
