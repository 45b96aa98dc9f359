/**
 * Hand-written codecs: Base45 (RFC 9285), basE91, Ascii85 and Base85
 * (RFC 1924 alphabet).
 *
 * Crypto++ and Botan cover Base64/Base32/hex/Base58; these four have no
 * library implementation in the stack, so decode and encode live here.
 * Encoders exist so every decoder can be checked by round-trip.
 */

#include "base_codecs.h"

#include <cstdint>
#include <cstring>

// ---------------------------------------------------------------------------
// Lookup tables
// ---------------------------------------------------------------------------

struct DecodeTable {
    int value[256];

    explicit DecodeTable(const char* alphabet) {
        for (int i = 0; i < 256; i++) value[i] = -1;
        for (int i = 0; alphabet[i] != '\0'; i++)
            value[static_cast<unsigned char>(alphabet[i])] = i;
    }

    int operator[](char c) const { return value[static_cast<unsigned char>(c)]; }
};

static const DecodeTable& base45_table() {
    static const DecodeTable t(BASE45_ALPHABET);
    return t;
}

static const DecodeTable& base91_table() {
    static const DecodeTable t(BASE91_ALPHABET);
    return t;
}

static const DecodeTable& base85_table() {
    static const DecodeTable t(BASE85_ALPHABET);
    return t;
}

// ---------------------------------------------------------------------------
// Base45
// ---------------------------------------------------------------------------

bool base45_decode(const std::string& token, std::string& out) {
    const DecodeTable& table = base45_table();
    std::string result;
    result.reserve(token.size() * 2 / 3 + 1);

    size_t len = token.size();
    size_t i = 0;
    while (i < len) {
        if (i + 2 < len) {
            int a = table[token[i]], b = table[token[i + 1]], c = table[token[i + 2]];
            if (a < 0 || b < 0 || c < 0) return false;
            uint32_t v = a + 45u * b + 45u * 45u * c;
            if (v > 0xFFFF) return false;
            result += static_cast<char>(v / 256);
            result += static_cast<char>(v % 256);
            i += 3;
        } else if (i + 1 < len) {
            int a = table[token[i]], b = table[token[i + 1]];
            if (a < 0 || b < 0) return false;
            uint32_t v = a + 45u * b;
            if (v > 0xFF) return false;
            result += static_cast<char>(v);
            i += 2;
        } else {
            return false;  // dangling symbol
        }
    }
    out = result;
    return true;
}

std::string base45_encode(const std::string& data) {
    std::string out;
    size_t i = 0;
    for (; i + 1 < data.size(); i += 2) {
        uint32_t n = static_cast<unsigned char>(data[i]) * 256u +
                     static_cast<unsigned char>(data[i + 1]);
        out += BASE45_ALPHABET[n % 45];
        out += BASE45_ALPHABET[(n / 45) % 45];
        out += BASE45_ALPHABET[n / 2025];
    }
    if (i < data.size()) {
        uint32_t n = static_cast<unsigned char>(data[i]);
        out += BASE45_ALPHABET[n % 45];
        out += BASE45_ALPHABET[n / 45];
    }
    return out;
}

// ---------------------------------------------------------------------------
// basE91
// ---------------------------------------------------------------------------

bool base91_decode(const std::string& token, std::string& out) {
    const DecodeTable& table = base91_table();
    std::string result;
    result.reserve(token.size());

    int v = -1;
    uint32_t queue = 0;
    int bits = 0;
    for (char ch : token) {
        int c = table[ch];
        if (c < 0) return false;
        if (v < 0) {
            v = c;
            continue;
        }
        v += c * 91;
        queue |= static_cast<uint32_t>(v) << bits;
        bits += (v & 8191) > 88 ? 13 : 14;
        do {
            result += static_cast<char>(queue & 0xFF);
            queue >>= 8;
            bits -= 8;
        } while (bits > 7);
        v = -1;
    }
    if (v != -1)
        result += static_cast<char>((queue | static_cast<uint32_t>(v) << bits) & 0xFF);

    out = result;
    return true;
}

std::string base91_encode(const std::string& data) {
    std::string out;
    uint32_t queue = 0;
    int bits = 0;
    for (unsigned char byte : data) {
        queue |= static_cast<uint32_t>(byte) << bits;
        bits += 8;
        if (bits > 13) {
            uint32_t val = queue & 8191;
            if (val > 88) {
                queue >>= 13;
                bits -= 13;
            } else {
                val = queue & 16383;
                queue >>= 14;
                bits -= 14;
            }
            out += BASE91_ALPHABET[val % 91];
            out += BASE91_ALPHABET[val / 91];
        }
    }
    if (bits > 0) {
        out += BASE91_ALPHABET[queue % 91];
        if (bits > 7 || queue > 90)
            out += BASE91_ALPHABET[queue / 91];
    }
    return out;
}

// ---------------------------------------------------------------------------
// Ascii85 / Base85 share the 5-symbol -> 32-bit group arithmetic
// ---------------------------------------------------------------------------

static bool pack_group(const int digits[5], std::string& out, size_t keep) {
    uint64_t acc = 0;
    for (int i = 0; i < 5; i++)
        acc = acc * 85 + digits[i];
    if (acc > 0xFFFFFFFFull) return false;
    char word[4] = {
        static_cast<char>((acc >> 24) & 0xFF),
        static_cast<char>((acc >> 16) & 0xFF),
        static_cast<char>((acc >> 8) & 0xFF),
        static_cast<char>(acc & 0xFF),
    };
    out.append(word, keep);
    return true;
}

static void unpack_group(const unsigned char* bytes, size_t n,
                         const char* alphabet, std::string& out) {
    uint32_t acc = 0;
    for (size_t i = 0; i < 4; i++)
        acc = (acc << 8) | (i < n ? bytes[i] : 0);
    char sym[5];
    for (int i = 4; i >= 0; i--) {
        sym[i] = alphabet[acc % 85];
        acc /= 85;
    }
    out.append(sym, n + 1);
}

bool ascii85_decode(const std::string& token, std::string& out) {
    std::string result;
    int group[5];
    int filled = 0;
    for (char ch : token) {
        if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v')
            continue;
        if (ch == 'z') {
            if (filled != 0) return false;
            result.append(4, '\0');
            continue;
        }
        if (ch < '!' || ch > 'u') return false;
        group[filled++] = ch - '!';
        if (filled == 5) {
            if (!pack_group(group, result, 4)) return false;
            filled = 0;
        }
    }
    if (filled == 1) return false;
    if (filled > 0) {
        size_t keep = filled - 1;
        for (int i = filled; i < 5; i++) group[i] = 84;  // 'u'
        if (!pack_group(group, result, keep)) return false;
    }
    out = result;
    return true;
}

std::string ascii85_encode(const std::string& data) {
    static const char* ASCII85_SYMBOLS =
        "!\"#$%&'()*+,-./0123456789:;<=>?@ABCDEFGHIJKLMNOPQRSTUVWXYZ[\\]^_`abcdefghijklmnopqrstu";
    std::string out;
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data.data());
    size_t i = 0;
    for (; i + 4 <= data.size(); i += 4) {
        if (p[i] == 0 && p[i + 1] == 0 && p[i + 2] == 0 && p[i + 3] == 0) {
            out += 'z';
            continue;
        }
        unpack_group(p + i, 4, ASCII85_SYMBOLS, out);
    }
    if (i < data.size())
        unpack_group(p + i, data.size() - i, ASCII85_SYMBOLS, out);
    return out;
}

bool base85_decode(const std::string& token, std::string& out) {
    const DecodeTable& table = base85_table();
    std::string result;
    int group[5];
    int filled = 0;
    for (char ch : token) {
        int v = table[ch];
        if (v < 0) return false;
        group[filled++] = v;
        if (filled == 5) {
            if (!pack_group(group, result, 4)) return false;
            filled = 0;
        }
    }
    if (filled == 1) return false;
    if (filled > 0) {
        size_t keep = filled - 1;
        for (int i = filled; i < 5; i++) group[i] = 84;  // '~'
        if (!pack_group(group, result, keep)) return false;
    }
    out = result;
    return true;
}

std::string base85_encode(const std::string& data) {
    std::string out;
    const unsigned char* p = reinterpret_cast<const unsigned char*>(data.data());
    for (size_t i = 0; i < data.size(); i += 4) {
        size_t n = data.size() - i < 4 ? data.size() - i : 4;
        unpack_group(p + i, n, BASE85_ALPHABET, out);
    }
    return out;
}
