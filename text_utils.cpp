/**
 * Text helpers shared by the decoders, the scorer and the salvage strategies:
 * trimming, UTF-8 handling, input canonicalisation, alphabet filtering and the
 * cooperative time budget.
 */

#include "text_utils.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

// ---------------------------------------------------------------------------
// Plain string helpers
// ---------------------------------------------------------------------------

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out)
        if (c >= 'A' && c <= 'Z') c += 32;
    return out;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, sep)) {
        std::string t = trim(token);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string format_fixed(double value, int precision) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

// ---------------------------------------------------------------------------
// UTF-8
// ---------------------------------------------------------------------------

std::vector<uint32_t> utf8_decode(const std::string& s) {
    std::vector<uint32_t> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        uint32_t cp;
        size_t len;
        uint32_t min_cp;
        if (c < 0x80)                { cp = c;        len = 1; min_cp = 0; }
        else if ((c & 0xE0) == 0xC0) { cp = c & 0x1F; len = 2; min_cp = 0x80; }
        else if ((c & 0xF0) == 0xE0) { cp = c & 0x0F; len = 3; min_cp = 0x800; }
        else if ((c & 0xF8) == 0xF0) { cp = c & 0x07; len = 4; min_cp = 0x10000; }
        else { ++i; continue; }

        if (i + len > s.size()) { ++i; continue; }
        bool ok = true;
        for (size_t j = 1; j < len; j++) {
            unsigned char cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80) { ok = false; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates and out-of-range values are invalid
        if (!ok || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

void utf8_append(std::string& r, uint32_t cp) {
    if (cp < 0x80) {
        r += static_cast<char>(cp);
    } else if (cp < 0x800) {
        r += static_cast<char>(0xC0 | (cp >> 6));
        r += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        r += static_cast<char>(0xE0 | (cp >> 12));
        r += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        r += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        r += static_cast<char>(0xF0 | (cp >> 18));
        r += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        r += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        r += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf8_lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (uint32_t cp : utf8_decode(bytes))
        utf8_append(out, cp);
    return out;
}

size_t utf8_length(const std::string& s) {
    return utf8_decode(s).size();
}

// ---------------------------------------------------------------------------
// Canonicalisation
// ---------------------------------------------------------------------------

static bool is_zero_width(uint32_t cp) {
    return cp == 0x200B || cp == 0x200C || cp == 0x200D ||
           cp == 0x2060 || cp == 0xFEFF;
}

std::string normalize_input(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (uint32_t cp : utf8_decode(s)) {
        if (is_zero_width(cp)) continue;
        if (cp >= 0xFF01 && cp <= 0xFF5E)
            cp -= 0xFEE0;                // full-width ASCII
        else if (cp == 0x3000 || cp == 0x00A0)
            cp = ' ';
        utf8_append(out, cp);
    }
    return trim(out);
}

std::string repair_lookalikes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (uint32_t cp : utf8_decode(s)) {
        switch (cp) {
            case '|':    cp = 'I'; break;
            case '!':    cp = 'I'; break;
            case '$':    cp = 'S'; break;
            case '@':    cp = 'A'; break;
            case 0x20AC: cp = 'E'; break;  // euro sign
            case 0x00A3: cp = 'L'; break;  // pound sign
            case 0x2014: cp = '-'; break;  // em dash
            case 0x2013: cp = '-'; break;  // en dash
            case 0x00B7: cp = '.'; break;  // middle dot
            default: break;
        }
        utf8_append(out, cp);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Printability
// ---------------------------------------------------------------------------

bool is_printable_char(uint32_t cp) {
    return (cp >= 0x20 && cp <= 0x7E) || (cp >= 0x09 && cp <= 0x0D);
}

double printable_fraction(const std::string& s) {
    std::vector<uint32_t> cps = utf8_decode(s);
    if (cps.empty()) return 1.0;
    size_t good = 0;
    for (uint32_t cp : cps)
        if (is_printable_char(cp)) good++;
    return static_cast<double>(good) / cps.size();
}

bool is_mostly_printable(const std::string& s, double thresh) {
    return printable_fraction(s) >= thresh;
}

bool to_plaintext(const std::string& bytes, size_t min_len, std::string& text) {
    std::string t = utf8_lossy(bytes);
    if (t.empty()) return false;
    if (utf8_length(trim(t)) < min_len) return false;
    if (!is_mostly_printable(t)) return false;
    text = t;
    return true;
}

// ---------------------------------------------------------------------------
// Alphabet filtering
// ---------------------------------------------------------------------------

std::string strip_to_allowed(const std::string& s, const std::string& alphabet) {
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        if (alphabet.find(c) != std::string::npos) out += c;
    return out;
}

bool fits_alphabet(const std::string& s, const std::string& alphabet) {
    if (s.empty()) return false;
    for (char c : s)
        if (alphabet.find(c) == std::string::npos) return false;
    return true;
}

std::string delete_periodic(const std::string& s, size_t k, size_t phase) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++)
        if (i % k != phase) out += s[i];
    return out;
}

double drop_ratio(size_t kept, size_t original) {
    return 1.0 - static_cast<double>(kept) / std::max<size_t>(1, original);
}

std::string safe_preview(const std::string& data, size_t max_len) {
    std::string out;
    size_t count = 0;
    for (uint32_t cp : utf8_decode(data)) {
        if (count++ >= max_len) break;
        if ((cp >= 0x20 && cp <= 0x7E) || cp == 0x09 || cp >= 0xA0)
            utf8_append(out, cp);
        else
            out += '.';
    }
    return out;
}

std::string quote_token(const std::string& s) {
    return "'" + s + "'";
}

// ---------------------------------------------------------------------------
// Cooperative time budget
// ---------------------------------------------------------------------------

TimeBudget::TimeBudget(double seconds)
    : start_(std::chrono::steady_clock::now()), seconds_(seconds) {}

bool TimeBudget::expired() const {
    return elapsed() >= seconds_;
}

double TimeBudget::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

double TimeBudget::remaining() const {
    return std::max(0.0, seconds_ - elapsed());
}
