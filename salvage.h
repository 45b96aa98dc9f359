#ifndef SALVAGE_H
#define SALVAGE_H

#include "candidate.h"
#include "text_utils.h"

#include <set>
#include <string>
#include <vector>

// Per-strategy weights for the provenance penalty. A raw decode costs
// nothing; each edit class and each decode beyond the first adds its weight.
struct PenaltyWeights {
    double keep;            // keep-only-alphabet stripping
    double scan;            // decode of a scanned span
    double single_removal;  // one recurring junk char / token removed
    double structural;      // periodic deletion, combination removal
    double nested_hop;      // per extra decode in the chain
    double exotic_codec;    // a85 / b85 anywhere in the chain
};

// Occam bonus for decoded text that is mostly letters with little noise.
struct CleanBonus {
    double high_letters, high_others, high_bonus;
    double mid_letters, mid_others, mid_bonus;
    double low_bonus;
};

double provenance_penalty(const std::string& provenance, const PenaltyWeights& w);
double clean_plaintext_bonus(const std::string& text, const CleanBonus& b);

// State of one strategy invocation: its budget clock, the set of inputs
// already attempted and the candidates collected so far.
class SalvageRun {
public:
    SalvageRun(const std::string& strategy, double budget_s,
               const PenaltyWeights& weights, const CleanBonus& bonus);

    bool time_up() const { return budget_.expired(); }

    // True the first time `input` is seen in this invocation.
    bool first_attempt(const std::string& input);

    void add(const std::string& provenance, const std::string& text, double drop);

    std::vector<Candidate>& results() { return results_; }

private:
    std::string strategy_;
    TimeBudget budget_;
    PenaltyWeights weights_;
    CleanBonus bonus_;
    std::set<std::string> tried_;
    std::vector<Candidate> results_;
};

struct TokenSpan {
    size_t start;
    size_t end;
    std::string token;
};

// Maximal runs of `alphabet` characters, optionally followed by up to
// `max_pad` '=' characters, whose total length is at least `min_len`.
std::vector<TokenSpan> scan_runs(const std::string& s, const std::string& alphabet,
                                 size_t min_len, size_t max_pad = 0);

// Characters ordered by descending frequency, ties in first-seen order.
std::vector<char> frequent_chars(const std::string& s, const std::string& exclude,
                                 bool digits_only, size_t limit);

// Most frequent length-n alphanumeric substrings holding a letter and a digit.
std::vector<std::string> frequent_mixed_kgrams(const std::string& s, size_t n, size_t topk);

// r-element combinations of `items`, in lexicographic index order.
std::vector<std::string> combinations(const std::string& items, size_t r);

std::string remove_all(const std::string& s, const std::string& needle);
std::string remove_chars(const std::string& s, const std::string& chars);
size_t count_char(const std::string& s, char c);

std::string drop_label(double drop);

#endif
