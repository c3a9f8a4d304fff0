#include "StockCatalog.hpp"

const std::vector<std::string>& StockCatalog::Entries() {
    static const std::vector<std::string> entries = {
        "whoami",
        "hostname",
        "pwd",
        "ls",
        "ipconfig",
    };
    return entries;
}

bool StockCatalog::Resolve(int index, std::string& outCommand) {
    if (!IsValidIndex(index)) {
        return false;
    }
    outCommand = Entries()[static_cast<size_t>(index)];
    return true;
}

bool StockCatalog::IsValidIndex(int index) {
    return index >= 0 && static_cast<size_t>(index) < Entries().size();
}
