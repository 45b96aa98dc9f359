#ifndef CRYPTOPP_CODECS_H
#define CRYPTOPP_CODECS_H

#include <string>
#include <vector>

constexpr char BASE64_STD_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr char BASE64_URL_ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr char BASE32_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
constexpr char HEX_ALPHABET[] = "0123456789abcdefABCDEF";

// Base64-family decoders. Unpadded tokens are padded to the encoding's block
// boundary first; a character outside the alphabet, padding in the middle of
// the token or an impossible data length is a decode failure.
bool base64_decode(const std::string& token, std::string& out);
bool base64url_decode(const std::string& token, std::string& out);
bool base32_decode(const std::string& token, std::string& out);
bool hex_decode(const std::string& token, std::string& out);

std::string base64_encode(const std::string& data);
std::string base64url_encode(const std::string& data);
std::string base32_encode(const std::string& data);
std::string hex_encode(const std::string& data);

// Base58 over a named alphabet (bitcoin, ripple, flickr). Leading zero-value
// symbols become leading zero bytes.
bool base58_alphabet(const std::string& name, std::string& alphabet);
std::vector<std::string> base58_alphabet_names();
bool base58_decode(const std::string& token, const std::string& alphabet, std::string& out);
std::string base58_encode(const std::string& data, const std::string& alphabet);

#endif
