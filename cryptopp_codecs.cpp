/**
 * Crypto++ Codec Adapter
 *
 * Wraps the Crypto++ BaseN filters (Base64, Base64URL, Base32, hex) and the
 * Crypto++ big Integer (positional Base58) behind bool-returning decoders.
 *
 * Crypto++ decoders silently skip characters they do not know, so every
 * token is validated against its alphabet here before it reaches a filter.
 * Base32 uses the RFC 4648 alphabet, installed through a decoding lookup
 * array; the Crypto++ default is the DUDE alphabet.
 */

#include "cryptopp_codecs.h"

#include <cryptopp/algparam.h>
#include <cryptopp/argnames.h>
#include <cryptopp/base32.h>
#include <cryptopp/basecode.h>
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/integer.h>

#include <map>

// ---------------------------------------------------------------------------
// Token validation & padding
// ---------------------------------------------------------------------------

// Splits `token` into data symbols and trailing '=' padding; fails on symbols
// outside `alphabet`, on '=' before the end, or on more padding than
// `max_pad`.
static bool split_padded(const std::string& token, const std::string& alphabet,
                         size_t max_pad, std::string& body) {
    size_t end = token.find_last_not_of('=');
    if (end == std::string::npos) return false;
    size_t pad = token.size() - end - 1;
    if (pad > max_pad) return false;
    body = token.substr(0, end + 1);
    for (char c : body)
        if (alphabet.find(c) == std::string::npos) return false;
    return true;
}

static std::string pad_to(const std::string& body, size_t block) {
    size_t rem = body.size() % block;
    if (rem == 0) return body;
    return body + std::string(block - rem, '=');
}

// ---------------------------------------------------------------------------
// Filter plumbing
// ---------------------------------------------------------------------------

template<typename DecoderT>
static bool run_decoder(const std::string& input, std::string& out) {
    try {
        std::string result;
        CryptoPP::StringSource ss(
            input, true,
            new DecoderT(new CryptoPP::StringSink(result))
        );
        out = result;
        return true;
    } catch (const CryptoPP::Exception&) {
        return false;
    }
}

struct Base32Lookup {
    int table[256];

    Base32Lookup() {
        CryptoPP::BaseN_Decoder::InitializeDecodingLookupArray(
            table, reinterpret_cast<const CryptoPP::byte*>(BASE32_ALPHABET), 32, false);
    }
};

static const int* base32_decoding_lookup() {
    static const Base32Lookup lookup;
    return lookup.table;
}

// ---------------------------------------------------------------------------
// Decoders
// ---------------------------------------------------------------------------

bool base64_decode(const std::string& token, std::string& out) {
    std::string body;
    if (!split_padded(token, BASE64_STD_ALPHABET, 2, body)) return false;
    if (body.size() % 4 == 1) return false;
    return run_decoder<CryptoPP::Base64Decoder>(pad_to(body, 4), out);
}

bool base64url_decode(const std::string& token, std::string& out) {
    std::string body;
    if (!split_padded(token, BASE64_URL_ALPHABET, 2, body)) return false;
    if (body.size() % 4 == 1) return false;
    return run_decoder<CryptoPP::Base64URLDecoder>(pad_to(body, 4), out);
}

bool base32_decode(const std::string& token, std::string& out) {
    std::string body;
    if (!split_padded(token, BASE32_ALPHABET, 6, body)) return false;
    size_t rem = body.size() % 8;
    if (rem == 1 || rem == 3 || rem == 6) return false;
    try {
        std::string result;
        CryptoPP::Base32Decoder decoder(new CryptoPP::StringSink(result));
        decoder.IsolatedInitialize(CryptoPP::MakeParameters(
            CryptoPP::Name::DecodingLookupArray(), base32_decoding_lookup()));
        std::string padded = pad_to(body, 8);
        decoder.Put(reinterpret_cast<const CryptoPP::byte*>(padded.data()), padded.size());
        decoder.MessageEnd();
        out = result;
        return true;
    } catch (const CryptoPP::Exception&) {
        return false;
    }
}

bool hex_decode(const std::string& token, std::string& out) {
    if (token.empty() || token.size() % 2 != 0) return false;
    for (char c : token)
        if (std::string(HEX_ALPHABET).find(c) == std::string::npos) return false;
    return run_decoder<CryptoPP::HexDecoder>(token, out);
}

// ---------------------------------------------------------------------------
// Encoders
// ---------------------------------------------------------------------------

template<typename EncoderT>
static std::string run_encoder(const std::string& data, EncoderT* encoder) {
    std::string result;
    encoder->Attach(new CryptoPP::StringSink(result));
    encoder->Put(reinterpret_cast<const CryptoPP::byte*>(data.data()), data.size());
    encoder->MessageEnd();
    return result;
}

std::string base64_encode(const std::string& data) {
    CryptoPP::Base64Encoder encoder(nullptr, false);
    return run_encoder(data, &encoder);
}

std::string base64url_encode(const std::string& data) {
    CryptoPP::Base64URLEncoder encoder(nullptr, false);
    return run_encoder(data, &encoder);
}

std::string base32_encode(const std::string& data) {
    CryptoPP::Base32Encoder encoder;
    encoder.IsolatedInitialize(CryptoPP::MakeParameters(
        CryptoPP::Name::EncodingLookupArray(),
        reinterpret_cast<const CryptoPP::byte*>(BASE32_ALPHABET)));
    return pad_to(run_encoder(data, &encoder), 8);
}

std::string hex_encode(const std::string& data) {
    CryptoPP::HexEncoder encoder(nullptr, true);
    return run_encoder(data, &encoder);
}

// ---------------------------------------------------------------------------
// Base58
// ---------------------------------------------------------------------------

static const std::map<std::string, std::string>& base58_alphabets() {
    static const std::map<std::string, std::string> m = {
        {"bitcoin", "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"},
        {"ripple",  "rpshnaf39wBUDNEGHJKLM4PQRST7VWXYZ2bcdeCg65jkm8oFqi1tuvAxyz"},
        {"flickr",  "123456789abcdefghijkmnopqrstuvwxyzABCDEFGHJKLMNPQRSTUVWXYZ"},
    };
    return m;
}

bool base58_alphabet(const std::string& name, std::string& alphabet) {
    auto it = base58_alphabets().find(name);
    if (it == base58_alphabets().end()) return false;
    alphabet = it->second;
    return true;
}

std::vector<std::string> base58_alphabet_names() {
    std::vector<std::string> names;
    for (const auto& kv : base58_alphabets())
        names.push_back(kv.first);
    return names;
}

bool base58_decode(const std::string& token, const std::string& alphabet, std::string& out) {
    if (token.empty() || alphabet.size() != 58) return false;

    const CryptoPP::Integer base(58L);
    CryptoPP::Integer num = CryptoPP::Integer::Zero();
    for (char ch : token) {
        size_t pos = alphabet.find(ch);
        if (pos == std::string::npos) return false;
        num = num * base + CryptoPP::Integer(static_cast<long>(pos));
    }

    size_t zeros = 0;
    while (zeros < token.size() && token[zeros] == alphabet[0])
        zeros++;

    std::string full(num.ByteCount(), '\0');
    if (!full.empty())
        num.Encode(reinterpret_cast<CryptoPP::byte*>(&full[0]), full.size());

    out = std::string(zeros, '\0') + full;
    return true;
}

std::string base58_encode(const std::string& data, const std::string& alphabet) {
    CryptoPP::Integer num(reinterpret_cast<const CryptoPP::byte*>(data.data()), data.size());
    std::string digits;
    while (!num.IsZero()) {
        CryptoPP::word rem = 0;
        CryptoPP::Integer quotient;
        CryptoPP::Integer::Divide(rem, quotient, num, 58);
        digits += alphabet[static_cast<size_t>(rem)];
        num = quotient;
    }
    for (size_t i = 0; i < data.size() && data[i] == '\0'; i++)
        digits += alphabet[0];
    return std::string(digits.rbegin(), digits.rend());
}
