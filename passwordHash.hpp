#include <string>

#ifndef PASSWORDHASH_HPP
#define PASSWORDHASH_HPP

// SHA-256 of the UTF-8 password bytes as 64 lowercase hex characters.
// Throws std::runtime_error if the digest cannot be computed.
std::string hashPassword(const std::string& password);

// Constant-time for equal-length inputs.
bool passwordHashesMatch(const std::string& expected, const std::string& supplied);

#endif // PASSWORDHASH_HPP
