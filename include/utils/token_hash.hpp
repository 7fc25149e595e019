#ifndef HARVESTER_TOKEN_HASH_HPP
#define HARVESTER_TOKEN_HASH_HPP

#include <string>

namespace harvester {

// Hex SHA-256 of a session token; empty for an empty token
std::string hashSessionToken(const std::string& token);

// Short prefix of the token hash, safe to write to logs
std::string tokenFingerprint(const std::string& token);

} // namespace harvester

#endif // HARVESTER_TOKEN_HASH_HPP
