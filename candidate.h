#ifndef CANDIDATE_H
#define CANDIDATE_H

#include <string>

// One scored plaintext hypothesis. `provenance` records every edit applied to
// the ciphertext before the successful decode; `text` is the dedupe key.
struct Candidate {
    std::string strategy_name;
    std::string provenance;
    std::string text;
    double score;
};

#endif
