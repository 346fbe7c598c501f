#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>

// powgate version
#define POWGATE_VERSION_MAJOR 0
#define POWGATE_VERSION_MINOR 1
#define POWGATE_VERSION_PATCH 0
#define POWGATE_VERSION_STRING "0.1.0"

// Utility macros
#define POWGATE_DISALLOW_COPY(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete

#define POWGATE_DISALLOW_MOVE(TypeName) \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

#define POWGATE_DISALLOW_COPY_AND_MOVE(TypeName) \
    POWGATE_DISALLOW_COPY(TypeName); \
    POWGATE_DISALLOW_MOVE(TypeName)

// Constants
namespace powgate {
namespace constants {

// Service defaults
constexpr const char* DEFAULT_SERVER_URL = "http://127.0.0.1:8000";
constexpr const char* DEFAULT_LOGIN_PATH = "/users/login";
constexpr const char* DEFAULT_PROFILE_PATH = "/users/me";
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 10000;

// Persisted session token key
constexpr const char* AUTH_TOKEN_KEY = "auth_token";

// Cryptography constants
constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SHA256_HEX_LENGTH = SHA256_HASH_SIZE * 2;

} // namespace constants
} // namespace powgate

// Core types
namespace powgate {

using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<constants::SHA256_HASH_SIZE>;

// Lower-case hex, two characters per byte
std::string hash_to_hex(const Hash256& hash);

// Percent-encoding for URL query values
std::string url_encode(const std::string& value);

} // namespace powgate
