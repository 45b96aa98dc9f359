/**
 * English-likelihood fitness scorer
 *
 * Ranks decoded candidates by how much they resemble natural-language or
 * identifier-style plaintext. Statistical signals (chi-square letter fit,
 * index of coincidence, character-class balance) carry most of the weight;
 * n-gram hits and wordness refine the ranking; length, control-character and
 * printability adjustments gate short or binary-looking outputs.
 *
 * Letter statistics only look at ASCII letters.
 */

#include "fitness.h"
#include "text_utils.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>
#include <vector>

// ---------------------------------------------------------------------------
// Reference data
// ---------------------------------------------------------------------------

// English unigram frequencies in percent, A..Z.
static const double ENG_FREQ[26] = {
    8.12, 1.49, 2.71, 4.32, 12.02, 2.30, 2.03, 5.92, 7.31, 0.10, 0.69, 3.98, 2.61,
    6.95, 7.68, 1.82, 0.11, 6.02, 6.28, 9.10, 2.88, 1.11, 2.09, 0.17, 2.11, 0.07,
};

static const std::set<std::string> BIGRAMS = {
    "th", "he", "in", "er", "an", "re", "on", "at", "en", "nd", "ti", "es",
    "or", "te", "of", "ed", "is", "it", "al", "ar", "st", "to", "nt", "ng",
    "se", "ha", "as", "ou", "io", "le", "ve", "co", "me", "de", "hi", "ri", "ro",
};

static const std::set<std::string> TRIGRAMS = {
    "the", "and", "ing", "her", "hat", "his", "tha", "ere", "for", "ent",
    "ion", "ter", "you", "thi", "not", "are", "all", "wit", "ver",
};

static const std::set<std::string> TETRAGRAMS = {
    "tion", "atio", "nthe", "thed", "that", "ther", "here", "ethe",
};

static const double ENGLISH_IC = 0.066;
static const char* SEPARATORS = " _-.,:;!?/|\t\n\r";

// Signal weights.
static const double W_CHI      = 3.0;
static const double W_IC       = 2.5;
static const double W_CLASS    = 1.3;
static const double W_NGRAM    = 0.9;
static const double W_SNAKE    = 0.5;
static const double WORD_BONUS = 0.25;
static const double VOWEL_BONUS = 0.3;
static const double WORDNESS_CAP = 3.0;

// Gating adjustments.
static const double CONTROL_PENALTY_EACH = 0.5;
static const double CONTROL_PENALTY_MAX  = 2.0;
static const double SHORT_PENALTY        = 1.0;
static const double TINY_PENALTY         = 2.0;
static const double TAIL_NOISE_PENALTY   = 0.6;
// Mostly-unprintable text keeps this share of its score magnitude. Applied as
// score - 0.4 * |score| rather than score * 0.6, so a negative score also moves
// down instead of toward zero.
static const double UNPRINTABLE_SCALE    = 0.6;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

static bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_separator(char c) {
    for (const char* p = SEPARATORS; *p; ++p)
        if (*p == c) return true;
    return false;
}

static void letter_counts(const std::string& text, int counts[26], int& total) {
    std::fill(counts, counts + 26, 0);
    total = 0;
    for (char c : text) {
        if (c >= 'a' && c <= 'z') c -= 32;
        if (c >= 'A' && c <= 'Z') {
            counts[c - 'A']++;
            total++;
        }
    }
}

static std::vector<std::string> split_tokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : text) {
        if (is_separator(c)) {
            if (!cur.empty()) tokens.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) tokens.push_back(cur);
    return tokens;
}

static bool all_of_alpha(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!is_ascii_alpha(c)) return false;
    return true;
}

static bool has_whitespace(const std::string& s) {
    for (char c : s)
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return true;
    return false;
}

// ---------------------------------------------------------------------------
// Signals
// ---------------------------------------------------------------------------

double chi_square_english(const std::string& text) {
    int counts[26];
    int total;
    letter_counts(text, counts, total);
    if (total == 0) return 0.0;

    double chi = 0.0;
    for (int i = 0; i < 26; i++) {
        double expected = total * (ENG_FREQ[i] / 100.0);
        double diff = counts[i] - expected;
        chi += diff * diff / expected;
    }
    return 1.0 / (1.0 + chi);
}

double index_of_coincidence_score(const std::string& text) {
    int counts[26];
    int total;
    letter_counts(text, counts, total);
    if (total < 2) return 0.0;

    double num = 0.0;
    for (int i = 0; i < 26; i++)
        num += static_cast<double>(counts[i]) * (counts[i] - 1);
    double ic = num / (static_cast<double>(total) * (total - 1));
    return std::max(0.0, 1.0 - std::fabs(ic - ENGLISH_IC) / ENGLISH_IC);
}

double ngram_hits(const std::string& text) {
    std::string t = to_lower(text);
    size_t n = t.size();
    int bi = 0, tri = 0, tetra = 0;
    for (size_t i = 0; i + 2 <= n; i++)
        if (BIGRAMS.count(t.substr(i, 2))) bi++;
    for (size_t i = 0; i + 3 <= n; i++)
        if (TRIGRAMS.count(t.substr(i, 3))) tri++;
    for (size_t i = 0; i + 4 <= n; i++)
        if (TETRAGRAMS.count(t.substr(i, 4))) tetra++;
    return bi * 0.6 + tri * 1.0 + tetra * 1.5;
}

double charclass_score(const std::string& text) {
    std::vector<uint32_t> cps = utf8_decode(text);
    if (cps.empty()) return 0.0;

    size_t letters = 0, digits = 0, others = 0;
    for (uint32_t cp : cps) {
        if (cp < 0x80 && is_ascii_alpha(static_cast<char>(cp))) letters++;
        else if (cp < 0x80 && is_ascii_digit(static_cast<char>(cp))) digits++;
        else if (cp != ' ' && cp != '_' && cp != '-') others++;
    }
    double n = static_cast<double>(cps.size());
    double score = 0.0;
    score += letters / n * 2.2;
    score -= digits / n * 0.9;
    score -= others / n * 2.2;
    // padding markers outside a decoder are a red flag
    if (text.find("==") != std::string::npos) score -= 0.8;
    return score;
}

double wordness_score(const std::string& text) {
    double score = 0.0;
    for (const std::string& tok : split_tokens(text)) {
        if (tok.size() < 3 || !all_of_alpha(tok)) continue;
        size_t vowels = 0;
        for (char c : tok) {
            char l = (c >= 'A' && c <= 'Z') ? c + 32 : c;
            if (l == 'a' || l == 'e' || l == 'i' || l == 'o' || l == 'u') vowels++;
        }
        double ratio = static_cast<double>(vowels) / tok.size();
        score += WORD_BONUS;
        score += VOWEL_BONUS * std::max(0.0, 1.0 - std::fabs(ratio - 0.45) / 0.45);
    }
    return std::min(score, WORDNESS_CAP);
}

std::string snake_from_camel(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (i > 0 && text[i - 1] >= 'a' && text[i - 1] <= 'z' && c >= 'A' && c <= 'Z')
            out += '_';
        out += c;
    }
    return to_lower(out);
}

static bool has_tail_noise(const std::string& text) {
    std::vector<std::string> tokens = split_tokens(text);
    if (tokens.size() < 2) return false;
    const std::string& last = tokens.back();
    if (last.size() < 2 || last.size() > 5) return false;
    for (char c : last)
        if (c < 'A' || c > 'Z') return false;
    return true;
}

static size_t control_count(const std::vector<uint32_t>& cps) {
    size_t n = 0;
    for (uint32_t cp : cps) {
        if (cp == '\t' || cp == '\n' || cp == '\r') continue;
        if (cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp < 0xA0)) n++;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Composite
// ---------------------------------------------------------------------------

double fitness(const std::string& text) {
    std::vector<uint32_t> cps = utf8_decode(text);
    size_t n = cps.size();
    double damp = std::min(1.0, n / 16.0);

    double score = damp * (chi_square_english(text) * W_CHI +
                           index_of_coincidence_score(text) * W_IC +
                           charclass_score(text) * W_CLASS +
                           ngram_hits(text) * W_NGRAM);
    score += wordness_score(text);

    std::string snake = snake_from_camel(text);
    if (snake != to_lower(text))
        score += damp * ngram_hits(snake) * W_SNAKE;

    score -= std::min(CONTROL_PENALTY_MAX, CONTROL_PENALTY_EACH * control_count(cps));

    if (n <= 2) score -= TINY_PENALTY;
    else if (n < 4) score -= SHORT_PENALTY;

    if (has_tail_noise(text)) score -= TAIL_NOISE_PENALTY;

    if (printable_fraction(text) < 0.9)
        score -= (1.0 - UNPRINTABLE_SCALE) * std::fabs(score);

    return score;
}

// ---------------------------------------------------------------------------
// Naming-convention hint
// ---------------------------------------------------------------------------

bool smart_hint(const std::string& text, std::string& label, std::string& value) {
    if (text.empty() || has_whitespace(text)) return false;

    std::string lower = to_lower(text);
    std::string snake = snake_from_camel(text);
    if (snake != lower) {
        label = "snake";
        value = snake;
        return true;
    }
    if (lower != text) {
        label = "lower";
        value = lower;
        return true;
    }
    return false;
}
