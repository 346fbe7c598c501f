#pragma once

#include "powgate/common.hpp"
#include <string>

namespace powgate::crypto {

/**
 * SHA-256 hash function wrapper (libsodium)
 *
 * The registration service recomputes the same digest, so the hex form must
 * stay lower-case with no separators.
 */
class Sha256 {
public:
    /**
     * Hash data using SHA-256
     * @param data The data to hash
     * @return 32-byte hash
     */
    static Hash256 hash(const bytes& data);
    
    /**
     * Hash the bytes of a string
     */
    static Hash256 hash(const std::string& str);
    
    /**
     * Hash the bytes of a string and return the 64-character hex digest
     */
    static std::string hex_digest(const std::string& str);
};

} // namespace powgate::crypto
