#pragma once

#include <string>
#include <vector>

namespace facefind_core {

// Lowercase hex SHA-256 of the input bytes.
std::string sha256_hex(const std::string& data);

std::string base64_encode(const std::vector<unsigned char>& data);

}  // namespace facefind_core
