#include "../../include/utils/token_hash.hpp"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

namespace harvester {

std::string hashSessionToken(const std::string& token) {
    if (token.empty()) {
        return "";
    }
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), hash);
    std::ostringstream oss;
    for (unsigned char b : hash) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

std::string tokenFingerprint(const std::string& token) {
    return hashSessionToken(token).substr(0, 12);
}

} // namespace harvester
