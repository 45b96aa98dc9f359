/**
 * Shared salvage machinery for the encoding-family strategies: provenance
 * penalty, clean-plaintext bonus, per-invocation state, span scanning and the
 * junk-token statistics that drive the removal searches.
 */

#include "salvage.h"
#include "fitness.h"

#include <algorithm>
#include <map>

static const char* ALLOWED_PRINT = " _-.,:;!?/|()[]{}'\"\\";
static const double DROP_WEIGHT = 3.0;
static const double DROP_PENALTY_MAX = 2.0;

// ---------------------------------------------------------------------------
// Scoring adjustments
// ---------------------------------------------------------------------------

static size_t count_arrows(const std::string& s) {
    size_t n = 0;
    for (size_t pos = s.find("->"); pos != std::string::npos; pos = s.find("->", pos + 2))
        n++;
    return n;
}

double provenance_penalty(const std::string& provenance, const PenaltyWeights& w) {
    size_t arrow = provenance.find("->");
    std::string edit = provenance.substr(0, arrow);

    double pen = 0.0;
    if (starts_with(edit, "keep")) {
        pen += w.keep;
    } else if (starts_with(edit, "scan")) {
        pen += w.scan;
    } else if (starts_with(edit, "rm_periodic") || starts_with(edit, "rm_dcombo") ||
               starts_with(edit, "rm_combo")) {
        pen += w.structural;
    } else if (starts_with(edit, "rm")) {
        pen += w.single_removal;
    }

    size_t arrows = count_arrows(provenance);
    if (arrows > 1) pen += w.nested_hop * (arrows - 1);

    if (provenance.find("->a85") != std::string::npos ||
        provenance.find("->b85") != std::string::npos)
        pen += w.exotic_codec;
    return pen;
}

double clean_plaintext_bonus(const std::string& text, const CleanBonus& b) {
    std::vector<uint32_t> cps = utf8_decode(text);
    if (cps.empty()) return 0.0;

    size_t letters = 0, others = 0;
    for (uint32_t cp : cps) {
        bool alpha = cp < 0x80 && ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z'));
        bool alnum = alpha || (cp >= '0' && cp <= '9');
        if (alpha) letters++;
        if (!alnum && !(cp < 0x80 && std::string(ALLOWED_PRINT).find(static_cast<char>(cp)) != std::string::npos))
            others++;
    }
    double lp = static_cast<double>(letters) / cps.size();
    double op = static_cast<double>(others) / cps.size();
    if (lp >= b.high_letters && op <= b.high_others) return b.high_bonus;
    if (lp >= b.mid_letters && op <= b.mid_others) return b.mid_bonus;
    return b.low_bonus;
}

// ---------------------------------------------------------------------------
// SalvageRun
// ---------------------------------------------------------------------------

SalvageRun::SalvageRun(const std::string& strategy, double budget_s,
                       const PenaltyWeights& weights, const CleanBonus& bonus)
    : strategy_(strategy), budget_(budget_s), weights_(weights), bonus_(bonus) {}

bool SalvageRun::first_attempt(const std::string& input) {
    return tried_.insert(input).second;
}

void SalvageRun::add(const std::string& provenance, const std::string& text, double drop) {
    double score = fitness(text)
                 + clean_plaintext_bonus(text, bonus_)
                 - std::min(DROP_PENALTY_MAX, drop * DROP_WEIGHT)
                 - provenance_penalty(provenance, weights_);
    results_.push_back({strategy_, "path=" + provenance, text, score});
}

// ---------------------------------------------------------------------------
// Token scanning
// ---------------------------------------------------------------------------

std::vector<TokenSpan> scan_runs(const std::string& s, const std::string& alphabet,
                                 size_t min_len, size_t max_pad) {
    std::vector<TokenSpan> spans;
    size_t i = 0;
    while (i < s.size()) {
        if (alphabet.find(s[i]) == std::string::npos) {
            i++;
            continue;
        }
        size_t start = i;
        while (i < s.size() && alphabet.find(s[i]) != std::string::npos)
            i++;
        size_t end = i;
        size_t pad = 0;
        while (end < s.size() && pad < max_pad && s[end] == '=') {
            end++;
            pad++;
        }
        // a run glued to more alphabet characters after its padding is not a token
        bool boundary = end >= s.size() || alphabet.find(s[end]) == std::string::npos;
        if (boundary && end - start >= min_len)
            spans.push_back({start, end, s.substr(start, end - start)});
        i = end;
    }
    return spans;
}

// ---------------------------------------------------------------------------
// Junk statistics
// ---------------------------------------------------------------------------

template<typename KeyT>
static std::vector<KeyT> most_common(const std::vector<KeyT>& seq, size_t limit) {
    std::map<KeyT, size_t> counts;
    std::vector<KeyT> order;
    for (const KeyT& k : seq) {
        if (counts[k]++ == 0) order.push_back(k);
    }
    std::stable_sort(order.begin(), order.end(), [&counts](const KeyT& a, const KeyT& b) {
        return counts[a] > counts[b];
    });
    if (order.size() > limit) order.resize(limit);
    return order;
}

std::vector<char> frequent_chars(const std::string& s, const std::string& exclude,
                                 bool digits_only, size_t limit) {
    std::vector<char> seq;
    for (char c : s) {
        if (exclude.find(c) != std::string::npos) continue;
        if (digits_only && !(c >= '0' && c <= '9')) continue;
        seq.push_back(c);
    }
    return most_common(seq, limit);
}

std::vector<std::string> frequent_mixed_kgrams(const std::string& s, size_t n, size_t topk) {
    std::vector<std::string> seq;
    if (n == 0) return seq;
    for (size_t i = 0; i + n <= s.size(); i++) {
        bool alnum = true, digit = false, alpha = false;
        for (size_t j = i; j < i + n; j++) {
            char c = s[j];
            bool is_digit = c >= '0' && c <= '9';
            bool is_alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
            if (!is_digit && !is_alpha) { alnum = false; break; }
            digit = digit || is_digit;
            alpha = alpha || is_alpha;
        }
        if (alnum && digit && alpha) seq.push_back(s.substr(i, n));
    }
    return most_common(seq, topk);
}

std::vector<std::string> combinations(const std::string& items, size_t r) {
    std::vector<std::string> out;
    size_t n = items.size();
    if (r == 0 || r > n) return out;

    std::vector<size_t> idx(r);
    for (size_t i = 0; i < r; i++) idx[i] = i;
    while (true) {
        std::string combo;
        for (size_t i : idx) combo += items[i];
        out.push_back(combo);

        size_t i = r;
        while (i > 0 && idx[i - 1] == n - r + (i - 1)) i--;
        if (i == 0) break;
        idx[i - 1]++;
        for (size_t j = i; j < r; j++) idx[j] = idx[j - 1] + 1;
    }
    return out;
}

std::string remove_all(const std::string& s, const std::string& needle) {
    if (needle.empty()) return s;
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t hit = s.find(needle, pos);
        if (hit == std::string::npos) {
            out += s.substr(pos);
            break;
        }
        out += s.substr(pos, hit - pos);
        pos = hit + needle.size();
    }
    return out;
}

std::string remove_chars(const std::string& s, const std::string& chars) {
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        if (chars.find(c) == std::string::npos) out += c;
    return out;
}

size_t count_char(const std::string& s, char c) {
    return static_cast<size_t>(std::count(s.begin(), s.end(), c));
}

std::string drop_label(double drop) {
    return "drop=" + format_fixed(drop, 2);
}
