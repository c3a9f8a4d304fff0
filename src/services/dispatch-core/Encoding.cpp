#include "Encoding.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

std::string EncodeBase64(const std::string& bytes) {
    if (bytes.empty()) {
        return {};
    }

    std::vector<unsigned char> out(4 * ((bytes.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        static_cast<int>(bytes.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

bool DecodeBase64(const std::string& text, std::string& outBytes) {
    outBytes.clear();
    if (text.empty()) {
        return true;
    }
    if (text.size() % 4 != 0) {
        return false;
    }

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    const int written = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (written < 0) {
        return false;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }

    outBytes.assign(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written) - padding);
    return true;
}

std::string Sha256Hex(const std::string& bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (EVP_Digest(bytes.data(), bytes.size(), digest, &digestLength, EVP_sha256(), nullptr) != 1) {
        return {};
    }

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (unsigned int i = 0; i < digestLength; ++i) {
        out << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}
