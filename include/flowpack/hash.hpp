#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flowpack {

// ============================================================================
// Content Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string hex_digest;  // lowercase hex
    std::string error;
};

// SHA-256 of an in-memory buffer
HashResult sha256_bytes(const std::vector<uint8_t>& data);
HashResult sha256_text(const std::string& text);

// SHA-256 of a file, streamed
HashResult sha256_file(const std::string& file_path);

// Strip a leading "<scheme>:" from a hash string ("blake3:ab12" -> "ab12").
// Strings without a scheme are returned unchanged.
std::string normalize_hash_hex(const std::string& hash);

} // namespace flowpack
