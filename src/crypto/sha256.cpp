#include "sha256.hpp"
#include <sodium.h>
#include <stdexcept>

namespace powgate::crypto {

namespace {
    // Ensure libsodium is initialized
    struct SodiumInitializer {
        SodiumInitializer() {
            if (sodium_init() < 0) {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    };
    static SodiumInitializer sodium_init_instance;
    
    static_assert(crypto_hash_sha256_BYTES == constants::SHA256_HASH_SIZE,
                  "SHA-256 digest size mismatch");
    
    Hash256 digest(const unsigned char* data, size_t len) {
        Hash256 result;
        crypto_hash_sha256(result.data(), data, len);
        return result;
    }
}

Hash256 Sha256::hash(const bytes& data) {
    return digest(data.data(), data.size());
}

Hash256 Sha256::hash(const std::string& str) {
    return digest(reinterpret_cast<const unsigned char*>(str.data()), str.size());
}

std::string Sha256::hex_digest(const std::string& str) {
    return hash_to_hex(hash(str));
}

} // namespace powgate::crypto
