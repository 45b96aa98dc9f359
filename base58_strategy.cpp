/**
 * Base58 salvage strategy
 *
 * Decodes over every configured alphabet (bitcoin, ripple, flickr). Each
 * successful decode is offered as-is and, when its trailing 4 bytes verify as
 * a Base58Check checksum, as the checksum-stripped payload. Decoded text that
 * is shaped like Base64 is decoded once more per nested pass.
 */

#include "strategies.h"
#include "botan_checksum.h"
#include "cryptopp_codecs.h"
#include "salvage.h"

#include <algorithm>
#include <utility>

static const PenaltyWeights BASE58_PENALTY = {
    0.30,  // keep
    0.00,  // scan
    1.10,  // single removal
    1.10,  // structural removal
    0.50,  // nested hop
    0.00,  // a85 / b85
};

static const CleanBonus BASE58_BONUS = {0.75, 0.05, 1.4, 0.60, 0.10, 0.7, 0.2};

// Scanned spans shorter than this are not worth a big-integer decode.
static const size_t SCAN_MIN_LEN = 8;
static const size_t NOISE_CHARS = 2;

static bool looks_base64(const std::string& s) {
    if (s.size() < 8) return false;
    std::string body = s;
    size_t pad = 0;
    while (!body.empty() && body.back() == '=' && pad < 2) {
        body.pop_back();
        pad++;
    }
    if (body.size() < 8) return false;
    return fits_alphabet(body, BASE64_STD_ALPHABET) || fits_alphabet(body, BASE64_URL_ALPHABET);
}

static bool contains(const std::vector<std::string>& v, const std::string& x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

namespace {

class Base58Search {
public:
    explicit Base58Search(const Base58Options& opts)
        : opts_(opts),
          run_("base58", opts.common.budget_s, BASE58_PENALTY, BASE58_BONUS) {
        base58_alphabet("bitcoin", std_alphabet_);
    }

    std::vector<Candidate> execute(const std::string& ciphertext) {
        src_ = normalize_input(resolve_ciphertext(ciphertext, opts_.common));

        whole_string();
        if (opts_.aggressive_salvage) {
            remove_noise();
            periodic_deletions();
        }
        if (opts_.scan_substrings) scan_tokens();

        return std::move(run_.results());
    }

private:
    const Base58Options& opts_;
    SalvageRun run_;
    std::string std_alphabet_;
    std::string src_;

    void nest(const std::string& plain, const std::string& path) {
        std::vector<std::pair<std::string, std::string>> queue = {{plain, path}};
        for (int pass = 0; pass < opts_.nested_passes; pass++) {
            if (run_.time_up()) return;
            std::vector<std::pair<std::string, std::string>> next;
            for (const auto& item : queue) {
                std::string s = trim(item.first);
                if (!looks_base64(s)) continue;

                std::string bytes, text;
                if (base64_decode(s, bytes) && to_plaintext(bytes, opts_.min_plain_len, text)) {
                    run_.add(item.second + "->base64", text, 0.0);
                    next.push_back({text, item.second + "->base64"});
                }
                if (base64url_decode(s, bytes) && to_plaintext(bytes, opts_.min_plain_len, text)) {
                    run_.add(item.second + "->urlsafe_b64", text, 0.0);
                    next.push_back({text, item.second + "->urlsafe_b64"});
                }
            }
            queue = next;
        }
    }

    void try_token(const std::string& tok, const std::string& edit, double drop) {
        for (const std::string& name : opts_.alphabets) {
            if (run_.time_up()) return;
            std::string alphabet, raw;
            if (!base58_alphabet(name, alphabet)) continue;
            if (!base58_decode(tok, alphabet, raw)) continue;

            std::string plain;
            if (contains(opts_.check_modes, "none") &&
                to_plaintext(raw, opts_.min_plain_len, plain)) {
                std::string path = edit + "->b58[" + name + "]";
                run_.add(path, plain, drop);
                nest(plain, path);
            }

            std::string payload;
            if (contains(opts_.check_modes, "b58check") &&
                base58check_verify(raw, payload) &&
                to_plaintext(payload, opts_.min_plain_len, plain)) {
                std::string path = edit + "->b58check[" + name + "]";
                run_.add(path, plain, drop);
                nest(plain, path);
            }
        }
    }

    void try_kept(const std::string& cleaned, const std::string& edit) {
        std::string keep = strip_to_allowed(cleaned, std_alphabet_);
        if (keep.size() < opts_.min_token_len || !run_.first_attempt(keep)) return;
        double drop = drop_ratio(keep.size(), src_.size());
        try_token(keep, edit + "(" + drop_label(drop) + ")", drop);
    }

    void whole_string() {
        if (run_.time_up()) return;
        if (run_.first_attempt(src_))
            try_token(src_, "raw", 0.0);
        try_kept(src_, "keep_std");
    }

    // Recurring junk outside the alphabet: the top characters singly, then
    // all of them together.
    void remove_noise() {
        if (run_.time_up()) return;
        std::vector<char> noise = frequent_chars(src_, std_alphabet_ + " \t\n\r\f\v", false, NOISE_CHARS);
        for (char ch : noise) {
            if (run_.time_up()) return;
            try_kept(remove_chars(src_, std::string(1, ch)),
                     "rm[" + quote_token(std::string(1, ch)) + "]");
        }
        if (noise.size() > 1 && !run_.time_up()) {
            std::string all(noise.begin(), noise.end());
            try_kept(remove_chars(src_, all), "rm_combo[" + quote_token(all) + "]");
        }
    }

    void periodic_deletions() {
        int max_k = std::max(2, opts_.periodic_max_k);
        for (int k = 2; k <= max_k; k++) {
            if (run_.time_up()) return;
            for (int ph = 0; ph < k; ph++) {
                if (run_.time_up()) return;
                try_kept(delete_periodic(src_, k, ph),
                         "rm_periodic[k=" + std::to_string(k) + ",ph=" + std::to_string(ph) + "]");
            }
        }
    }

    void scan_tokens() {
        for (const TokenSpan& span : scan_runs(src_, std_alphabet_, SCAN_MIN_LEN)) {
            if (run_.time_up()) return;
            try_token(span.token, "scan[" + std::to_string(span.start) + ":" +
                                  std::to_string(span.end) + "]", 0.0);
        }
    }
};

}  // namespace

std::vector<Candidate> run_base58(const std::string& ciphertext, const Base58Options& opts) {
    Base58Search search(opts);
    return search.execute(ciphertext);
}
