#pragma once

#include <cstdint>
#include <string>

namespace binpack {

// ============================================================================
// Input Artifact Digest
// ============================================================================
//
// The normalize report records what was unpacked so a packaging run can be
// traced back to the exact upstream release file.

struct FileDigest {
    bool ok = false;
    std::string error;
    std::string sha256;     // lowercase hex, 64 chars
    uint64_t size = 0;      // bytes hashed
};

// Stream a file through SHA-256 (OpenSSL EVP)
FileDigest digest_file(const std::string& file_path);

} // namespace binpack
