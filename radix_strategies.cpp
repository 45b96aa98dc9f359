/**
 * Base45 and basE91 salvage strategies
 *
 * Both codecs share one search: the raw string, the string stripped to the
 * alphabet, every periodic deletion up to periodic_max_k, and every maximal
 * run of alphabet characters. Neither codec is nested.
 */

#include "strategies.h"
#include "base_codecs.h"
#include "salvage.h"

#include <algorithm>
#include <utility>

static const PenaltyWeights RADIX_PENALTY = {
    0.30,  // keep
    0.20,  // scan
    1.00,  // single removal
    1.00,  // structural removal
    0.00,  // nested hop
    0.00,  // a85 / b85
};

static const CleanBonus BASE45_BONUS = {0.75, 0.05, 1.3, 0.60, 0.10, 0.7, 0.2};
static const CleanBonus BASE91_BONUS = {0.70, 0.08, 1.1, 0.55, 0.12, 0.6, 0.2};

struct RadixCodec {
    const char* strategy;
    const char* tag;                  // provenance suffix after "->"
    const char* alphabet;
    bool (*decode)(const std::string&, std::string&);
    const CleanBonus* bonus;
};

static const RadixCodec BASE45_CODEC = {"base45", "b45", BASE45_ALPHABET, base45_decode, &BASE45_BONUS};
static const RadixCodec BASE91_CODEC = {"base91", "b91", BASE91_ALPHABET, base91_decode, &BASE91_BONUS};

template<typename OptionsT>
static std::vector<Candidate> run_radix(const RadixCodec& codec, const std::string& ciphertext,
                                        const OptionsT& opts)
{
    SalvageRun run(codec.strategy, opts.common.budget_s, RADIX_PENALTY, *codec.bonus);
    const std::string src = normalize_input(resolve_ciphertext(ciphertext, opts.common));
    const std::string suffix = std::string("->") + codec.tag;

    auto try_decode = [&](const std::string& s, const std::string& edit, double drop) {
        if (run.time_up() || !run.first_attempt(s)) return;
        std::string bytes, plain;
        if (!codec.decode(s, bytes)) return;
        if (!to_plaintext(bytes, opts.min_plain_len, plain)) return;
        run.add(edit + suffix, plain, drop);
    };

    if (!run.time_up()) {
        try_decode(src, "raw", 0.0);
        std::string keep = strip_to_allowed(src, codec.alphabet);
        if (keep.size() >= opts.min_token_len && !run.time_up()) {
            double drop = drop_ratio(keep.size(), src.size());
            try_decode(keep, "keep_only(" + drop_label(drop) + ")", drop);
        }
    }

    // Junk inserted every k characters.
    size_t max_k = static_cast<size_t>(std::max(2, opts.periodic_max_k));
    for (size_t k = 2; k <= max_k; k++) {
        for (size_t ph = 0; ph < k; ph++) {
            if (run.time_up()) return std::move(run.results());
            std::string keep = strip_to_allowed(delete_periodic(src, k, ph), codec.alphabet);
            if (keep.size() < opts.min_token_len) continue;
            double drop = drop_ratio(keep.size(), src.size());
            try_decode(keep, "rm_periodic(k=" + std::to_string(k) + ",ph=" + std::to_string(ph) +
                             "," + drop_label(drop) + ")", drop);
        }
    }

    if (opts.scan_substrings) {
        for (const TokenSpan& span : scan_runs(src, codec.alphabet, opts.min_token_len)) {
            if (run.time_up()) break;
            try_decode(span.token, "scan[" + std::to_string(span.start) + ":" +
                                   std::to_string(span.end) + "]", 0.0);
        }
    }

    return std::move(run.results());
}

std::vector<Candidate> run_base45(const std::string& ciphertext, const Base45Options& opts) {
    return run_radix(BASE45_CODEC, ciphertext, opts);
}

std::vector<Candidate> run_base91(const std::string& ciphertext, const Base91Options& opts) {
    return run_radix(BASE91_CODEC, ciphertext, opts);
}
