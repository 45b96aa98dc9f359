/**
 * Base64-family salvage strategy
 *
 * Each input variant is tried against every codec of the family (hex,
 * base64, urlsafe_b64, base32, a85, b85), so one token can yield several
 * candidates. Variants come from look-alike repair, keep-only stripping,
 * digit and k-gram junk removal, periodic deletion and token scanning.
 * Outputs that are themselves shaped like a family alphabet are decoded
 * again, up to nested_passes times.
 */

#include "strategies.h"
#include "base_codecs.h"
#include "cryptopp_codecs.h"
#include "salvage.h"

#include <set>
#include <utility>

static const PenaltyWeights BASE64_PENALTY = {
    0.40,  // keep
    0.00,  // scan
    0.60,  // single removal
    1.20,  // structural removal
    0.60,  // nested hop
    0.60,  // a85 / b85
};

static const CleanBonus BASE64_BONUS = {0.75, 0.05, 1.6, 0.60, 0.10, 0.9, 0.3};

static const size_t NESTED_MIN_LEN = 8;

// ---------------------------------------------------------------------------
// Family decode
// ---------------------------------------------------------------------------

struct DecodedForm {
    std::string codec;
    std::string bytes;
};

using DecodeFn = bool (*)(const std::string&, std::string&);

static const std::vector<std::pair<std::string, DecodeFn>>& family_decoders() {
    static const std::vector<std::pair<std::string, DecodeFn>> decoders = {
        {"hex",         hex_decode},
        {"base64",      base64_decode},
        {"urlsafe_b64", base64url_decode},
        {"base32",      base32_decode},
        {"a85",         ascii85_decode},
        {"b85",         base85_decode},
    };
    return decoders;
}

static std::vector<DecodedForm> decode_once(const std::string& s) {
    std::vector<DecodedForm> outs;
    for (const auto& d : family_decoders()) {
        std::string bytes;
        if (d.second(s, bytes))
            outs.push_back({d.first, bytes});
    }
    return outs;
}

static bool fits_ascii85(const std::string& s) {
    for (char c : s)
        if (!((c >= '!' && c <= 'u') || c == 'z')) return false;
    return true;
}

// Loosely shaped like one of the family alphabets.
static bool looks_encoded(const std::string& s) {
    if (s.size() < NESTED_MIN_LEN) return false;
    return fits_alphabet(s, std::string(BASE64_STD_ALPHABET) + "=") ||
           fits_alphabet(s, std::string(BASE64_URL_ALPHABET) + "=") ||
           fits_alphabet(s, std::string(BASE32_ALPHABET) + "=") ||
           fits_alphabet(s, HEX_ALPHABET) ||
           fits_alphabet(s, BASE85_ALPHABET) ||
           fits_ascii85(s);
}

// ---------------------------------------------------------------------------
// Variants
// ---------------------------------------------------------------------------

static std::string swap_chars(const std::string& s, char a, char b, char c, char d) {
    std::string out = s;
    for (char& ch : out) {
        if (ch == a) ch = b;
        else if (ch == c) ch = d;
    }
    return out;
}

// (label, token) pairs; the label is the edit part of the provenance.
static std::vector<std::pair<std::string, std::string>> repair_variants(const std::string& tok) {
    std::string repaired = repair_lookalikes(tok);
    std::vector<std::pair<std::string, std::string>> variants = {
        {"raw",             tok},
        {"raw+repair",      repaired},
        {"raw+repair+std",  swap_chars(repaired, '-', '+', '_', '/')},
        {"raw+repair+url",  swap_chars(repaired, '+', '-', '/', '_')},
    };
    return variants;
}

// ---------------------------------------------------------------------------
// Strategy
// ---------------------------------------------------------------------------

namespace {

class Base64Search {
public:
    explicit Base64Search(const Base64Options& opts)
        : opts_(opts),
          run_("base64", opts.common.budget_s, BASE64_PENALTY, BASE64_BONUS) {}

    std::vector<Candidate> execute(const std::string& ciphertext) {
        src_ = normalize_input(resolve_ciphertext(ciphertext, opts_.common));

        whole_string();
        if (opts_.aggressive_salvage) {
            remove_digits();
            remove_digit_combos();
            periodic_deletions();
            remove_kgrams();
        }
        if (opts_.scan_substrings) scan_tokens();

        return std::move(run_.results());
    }

private:
    const Base64Options& opts_;
    SalvageRun run_;
    std::string src_;

    // Decode, then chase nested encodings of the output.
    void nest(const std::string& plain, const std::string& path, double drop) {
        std::vector<std::pair<std::string, std::string>> queue = {{plain, path}};
        for (int pass = 0; pass < opts_.nested_passes; pass++) {
            if (run_.time_up()) return;
            std::vector<std::pair<std::string, std::string>> next;
            for (const auto& item : queue) {
                std::string s2 = trim(item.first);
                if (!looks_encoded(s2)) continue;
                for (const DecodedForm& form : decode_once(s2)) {
                    std::string t2;
                    if (!to_plaintext(form.bytes, opts_.min_plain_len, t2)) continue;
                    std::string p2 = item.second + "->" + form.codec;
                    run_.add(p2, t2, drop);
                    next.push_back({t2, p2});
                }
            }
            queue = next;
        }
    }

    void try_decode(const std::string& s, const std::string& edit, double drop) {
        for (const DecodedForm& form : decode_once(s)) {
            if (run_.time_up()) return;
            std::string plain;
            if (!to_plaintext(form.bytes, opts_.min_plain_len, plain)) continue;
            std::string path = edit + "->" + form.codec;
            run_.add(path, plain, drop);
            nest(plain, path, drop);
        }
    }

    // Strip `cleaned` to the std and url alphabets and decode both.
    void try_stripped(const std::string& cleaned, const std::string& tag,
                      const std::string& detail) {
        static const std::string STD = std::string(BASE64_STD_ALPHABET) + "=";
        static const std::string URL = std::string(BASE64_URL_ALPHABET) + "=";
        const std::pair<const std::string*, std::string> alphabets[] = {
            {&STD, "_std"}, {&URL, "_url"},
        };
        for (const auto& a : alphabets) {
            std::string stripped = strip_to_allowed(cleaned, *a.first);
            if (stripped.size() < opts_.min_token_len || !run_.first_attempt(stripped))
                continue;
            double drop = drop_ratio(stripped.size(), src_.size());
            try_decode(stripped, tag + a.second + detail + "(" + drop_label(drop) + ")", drop);
        }
    }

    void whole_string() {
        for (const auto& v : repair_variants(src_)) {
            if (run_.time_up()) return;
            if (!run_.first_attempt(v.second)) continue;
            try_decode(v.second, v.first, 0.0);
        }
        if (run_.time_up()) return;
        try_stripped(src_, "keep", "");
    }

    void remove_digits() {
        for (char digit : frequent_chars(src_, "", true, 10)) {
            if (run_.time_up()) return;
            if (count_char(src_, digit) < 3) break;
            try_stripped(remove_chars(src_, std::string(1, digit)), "rm_digit",
                         "[" + quote_token(std::string(1, digit)) + "]");
        }
    }

    void remove_digit_combos() {
        if (run_.time_up()) return;
        std::vector<char> top = frequent_chars(src_, "", true, 3);
        std::string digits(top.begin(), top.end());
        size_t max_r = std::min(static_cast<size_t>(opts_.digit_combo_k), digits.size());
        for (size_t r = 2; r <= max_r; r++) {
            for (const std::string& combo : combinations(digits, r)) {
                if (run_.time_up()) return;
                try_stripped(remove_chars(src_, combo), "rm_dcombo", "[" + combo + "]");
            }
        }
    }

    void periodic_deletions() {
        int max_k = std::max(2, opts_.periodic_max_k);
        for (int k = 2; k <= max_k; k++) {
            if (run_.time_up()) return;
            for (int ph = 0; ph < k; ph++) {
                if (run_.time_up()) return;
                try_stripped(delete_periodic(src_, k, ph), "rm_periodic",
                             "[k=" + std::to_string(k) + ",ph=" + std::to_string(ph) + "]");
            }
        }
    }

    void remove_kgrams() {
        for (int n : opts_.kgram_lengths) {
            if (run_.time_up()) return;
            std::vector<std::string> grams = frequent_mixed_kgrams(
                src_, static_cast<size_t>(n), static_cast<size_t>(opts_.kgram_topk));
            for (const std::string& g : grams) {
                if (run_.time_up()) return;
                try_stripped(remove_all(src_, g), "rm_kgram", "[" + quote_token(g) + "]");
            }
        }
    }

    void scan_tokens() {
        if (run_.time_up()) return;

        struct Scanned { std::string kind; TokenSpan span; };
        std::vector<Scanned> tokens;
        for (const TokenSpan& t : scan_runs(src_, BASE64_STD_ALPHABET, opts_.min_token_len, 2))
            tokens.push_back({"b64", t});
        if (opts_.allow_urlsafe)
            for (const TokenSpan& t : scan_runs(src_, BASE64_URL_ALPHABET, opts_.min_token_len, 2))
                tokens.push_back({"b64url", t});

        std::set<std::pair<size_t, size_t>> seen;
        for (const Scanned& tok : tokens) {
            if (!seen.insert({tok.span.start, tok.span.end}).second) continue;

            std::vector<std::pair<std::string, DecodeFn>> prefer = {
                {"base64",      base64_decode},
                {"urlsafe_b64", base64url_decode},
            };
            if (tok.kind == "b64url") std::swap(prefer[0], prefer[1]);

            std::string edit = "scan[" + tok.kind + "@" + std::to_string(tok.span.start) +
                               ":" + std::to_string(tok.span.end) + "]";
            std::set<std::string> tried_variants;
            for (const auto& v : repair_variants(tok.span.token)) {
                if (!tried_variants.insert(v.second).second) continue;
                for (const auto& dec : prefer) {
                    if (run_.time_up()) return;
                    std::string bytes, plain;
                    if (!dec.second(v.second, bytes)) continue;
                    if (!to_plaintext(bytes, opts_.min_plain_len, plain)) continue;
                    std::string path = edit + "->" + dec.first;
                    run_.add(path, plain, 0.0);
                    nest(plain, path, 0.0);
                }
            }
        }
    }
};

}  // namespace

std::vector<Candidate> run_base64(const std::string& ciphertext, const Base64Options& opts) {
    Base64Search search(opts);
    return search.execute(ciphertext);
}
