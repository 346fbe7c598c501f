#include "powgate/common.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>

namespace powgate {

std::string hash_to_hex(const Hash256& hash) {
    // Table lookup, this sits on the PoW hot path
    static const char digits[] = "0123456789abcdef";
    std::string out(hash.size() * 2, '0');
    for (size_t i = 0; i < hash.size(); ++i) {
        out[i * 2] = digits[hash[i] >> 4];
        out[i * 2 + 1] = digits[hash[i] & 0x0f];
    }
    return out;
}

std::string url_encode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        // RFC 3986 unreserved characters pass through
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace powgate
