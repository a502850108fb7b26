#pragma once

#include <string>
#include <vector>

namespace capsulerun {

class HashUtils {
public:
    // SHA-256 of a string as lowercase hex (64 characters)
    static std::string sha256_string(const std::string& data);

    // Hex helper shared by the hash functions
    static std::string bytes_to_hex(const unsigned char* data, size_t len);

    // Base64 without line breaks, as embedded into generated harness source
    static std::string base64_encode(const std::string& data);
    static std::string base64_encode(const unsigned char* data, size_t len);

    // Decode base64; returns empty on malformed input
    static std::string base64_decode(const std::string& encoded);

    // Cryptographically random hex string of 2 * num_bytes characters
    static std::string random_hex(size_t num_bytes);
};

} // namespace capsulerun
