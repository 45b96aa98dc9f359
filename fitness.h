#ifndef FITNESS_H
#define FITNESS_H

#include <string>

// Composite English-likelihood score. Higher is better, unbounded, never
// fails; empty and degenerate inputs score low.
double fitness(const std::string& text);

// Individual signals, exposed for the hint generator and for tests.
double chi_square_english(const std::string& text);
double index_of_coincidence_score(const std::string& text);
double ngram_hits(const std::string& text);
double charclass_score(const std::string& text);
double wordness_score(const std::string& text);

std::string snake_from_camel(const std::string& text);

// Naming-convention hint for the winning text: ("snake", ...) or
// ("lower", ...). Returns false when no hint applies.
bool smart_hint(const std::string& text, std::string& label, std::string& value);

#endif
