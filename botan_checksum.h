#ifndef BOTAN_CHECKSUM_H
#define BOTAN_CHECKSUM_H

#include <string>

bool double_sha256(const std::string& data, std::string& digest);

// Base58Check: raw = payload || first 4 bytes of SHA-256(SHA-256(payload)).
bool base58check_verify(const std::string& raw, std::string& payload);
bool base58check_append(const std::string& payload, std::string& raw);

#endif
