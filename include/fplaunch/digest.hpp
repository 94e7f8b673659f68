#pragma once

#include <string>

namespace fplaunch {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // lowercase hex, 64 chars
};

HashResult compute_sha256(const std::string& data);

HashResult compute_file_sha256(const std::string& file_path);

} // namespace fplaunch
