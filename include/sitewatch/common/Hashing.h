#pragma once

#include <string>

namespace sitewatch::common {

// Lower-case hex SHA-256 digest of `data` (64 characters, no prefix).
std::string sha256Hex(const std::string& data);

// Raw 32-byte SHA-256 digest of `data`.
std::string sha256Raw(const std::string& data);

std::string base64Encode(const std::string& bytes);

// Throws std::invalid_argument when `text` is not valid base64.
std::string base64Decode(const std::string& text);

} // namespace sitewatch::common
