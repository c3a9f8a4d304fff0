#pragma once

#include <string>

std::string EncodeBase64(const std::string& bytes);
bool DecodeBase64(const std::string& text, std::string& outBytes);

// Lowercase hex SHA-256, used as the chunk checksum on both ends of a transfer.
std::string Sha256Hex(const std::string& bytes);

std::string RandomHex(size_t bytes);
