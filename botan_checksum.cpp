/**
 * Botan 2.x Checksum Adapter
 *
 * Base58Check payloads carry a 4-byte checksum taken from a double SHA-256
 * of the payload. The hash comes from Botan's HashFunction registry.
 */

#include "botan_checksum.h"

#include <botan/exceptn.h>
#include <botan/hash.h>

#include <memory>

static constexpr size_t CHECKSUM_LEN = 4;

bool double_sha256(const std::string& data, std::string& digest) {
    try {
        std::unique_ptr<Botan::HashFunction> sha = Botan::HashFunction::create("SHA-256");
        if (!sha) return false;

        sha->update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Botan::secure_vector<uint8_t> first = sha->final();
        sha->update(first.data(), first.size());
        Botan::secure_vector<uint8_t> second = sha->final();

        digest.assign(reinterpret_cast<const char*>(second.data()), second.size());
        return true;
    } catch (const Botan::Exception&) {
        return false;
    }
}

bool base58check_verify(const std::string& raw, std::string& payload) {
    if (raw.size() < CHECKSUM_LEN + 1) return false;

    std::string body = raw.substr(0, raw.size() - CHECKSUM_LEN);
    std::string digest;
    if (!double_sha256(body, digest)) return false;
    if (raw.compare(raw.size() - CHECKSUM_LEN, CHECKSUM_LEN, digest, 0, CHECKSUM_LEN) != 0)
        return false;

    payload = body;
    return true;
}

bool base58check_append(const std::string& payload, std::string& raw) {
    std::string digest;
    if (!double_sha256(payload, digest)) return false;
    raw = payload + digest.substr(0, CHECKSUM_LEN);
    return true;
}
