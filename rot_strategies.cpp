/**
 * Letter-shift strategies
 *
 * rotN      - Caesar shift, one fixed k or all 26.
 * super_rot - progressive shift: the letter at logical position j is shifted
 *             by (k0 + j*step) mod 26, j counted from the left or the right.
 *
 * Only ASCII letters move; case is preserved and everything else is copied.
 */

#include "strategies.h"
#include "base_codecs.h"
#include "cryptopp_codecs.h"
#include "fitness.h"
#include "text_utils.h"

#include <cstdint>

static uint32_t shift_letter(uint32_t cp, int k) {
    k = ((k % 26) + 26) % 26;
    if (cp >= 'A' && cp <= 'Z') return 'A' + (cp - 'A' + k) % 26;
    if (cp >= 'a' && cp <= 'z') return 'a' + (cp - 'a' + k) % 26;
    return cp;
}

static std::string rot_decode(const std::string& s, int k) {
    std::string out;
    for (uint32_t cp : utf8_decode(s))
        utf8_append(out, shift_letter(cp, -k));
    return out;
}

// ---------------------------------------------------------------------------
// rotN
// ---------------------------------------------------------------------------

std::vector<Candidate> run_rotn(const std::string& ciphertext, const RotNOptions& opts) {
    std::string src = resolve_ciphertext(ciphertext, opts.common);
    std::vector<Candidate> results;

    if (!opts.all) {
        int k = ((opts.n % 26) + 26) % 26;
        std::string t = rot_decode(src, k);
        results.push_back({"rotN", "k=" + std::to_string(k), t, fitness(t)});
        return results;
    }

    TimeBudget budget(opts.common.budget_s);
    for (int k = 0; k < 26; k++) {
        if (budget.expired()) break;
        std::string t = rot_decode(src, k);
        results.push_back({"rotN", "k=" + std::to_string(k), t, fitness(t)});
    }
    return results;
}

// ---------------------------------------------------------------------------
// super_rot
// ---------------------------------------------------------------------------

static const double PAD_SHAPED_PENALTY = 2.0;
static const double B64_SHAPED_PENALTY = 1.2;
static const double TOKEN_SHAPED_PENALTY = 1.0;

static std::string progressive_shift(const std::vector<uint32_t>& cps, int start, int step,
                                     bool decode, bool ltr) {
    const int sign = decode ? -1 : 1;
    const long long n = static_cast<long long>(cps.size());
    std::string out;
    for (long long i = 0; i < n; i++) {
        long long j = ltr ? i : (n - 1 - i);
        int k = static_cast<int>(((start + j * step) % 26 + 26) % 26);
        utf8_append(out, shift_letter(cps[static_cast<size_t>(i)], sign * k));
    }
    return out;
}

// Alphabet run with at most two trailing '='.
static bool b64_shaped(const std::string& t) {
    size_t end = t.size();
    size_t pad = 0;
    while (end > 0 && t[end - 1] == '=' && pad < 2) {
        end--;
        pad++;
    }
    if (end == 0) return false;
    std::string body = t.substr(0, end);
    return fits_alphabet(body, BASE64_STD_ALPHABET) || fits_alphabet(body, BASE64_URL_ALPHABET);
}

static bool token_shaped(const std::string& t) {
    if (t.size() < 8) return false;
    bool letter = false, digit = false;
    for (char c : t) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return false;
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')) letter = true;
        if (c >= '0' && c <= '9') digit = true;
    }
    if (!letter || !digit) return false;

    std::string b58;
    base58_alphabet("bitcoin", b58);
    return fits_alphabet(t, b58) || fits_alphabet(t, BASE45_ALPHABET) ||
           fits_alphabet(t, BASE91_ALPHABET);
}

static double shape_penalty(const std::string& t) {
    if (b64_shaped(t))
        return ends_with(t, "==") ? PAD_SHAPED_PENALTY : B64_SHAPED_PENALTY;
    if (token_shaped(t)) return TOKEN_SHAPED_PENALTY;
    return 0.0;
}

std::vector<Candidate> run_super_rot(const std::string& ciphertext, const SuperRotOptions& opts) {
    const std::vector<uint32_t> cps = utf8_decode(resolve_ciphertext(ciphertext, opts.common));
    TimeBudget budget(opts.common.budget_s);
    std::vector<Candidate> results;

    std::vector<int> steps;
    for (int s = -opts.max_abs_step; s <= opts.max_abs_step; s++)
        if (s != 0) steps.push_back(s);

    for (int start : opts.start_keys) {
        for (int step : steps) {
            for (const std::string& order : opts.orders) {
                for (const std::string& mode : opts.modes) {
                    if (budget.expired()) return results;

                    std::string t = progressive_shift(cps, start, step, mode == "decode", order == "LTR");
                    double score = fitness(t) - shape_penalty(t);
                    std::string label = "k0=" + std::to_string(start) +
                                        ",step=" + (step > 0 ? "+" : "") + std::to_string(step) +
                                        ",order=" + order + ",mode=" + mode;
                    results.push_back({"super_rot", label, t, score});
                }
            }
        }
    }
    return results;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void register_rot_strategies(std::map<std::string, StrategyFunc>& m) {
    m["rotN"]      = bind_strategy(&StrategySettings::rotN, run_rotn);
    m["super_rot"] = bind_strategy(&StrategySettings::super_rot, run_super_rot);
}
