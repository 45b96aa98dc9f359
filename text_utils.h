#ifndef TEXT_UTILS_H
#define TEXT_UTILS_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
std::vector<std::string> split_list(const std::string& s, char sep = ',');
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);
std::string format_fixed(double value, int precision);

// UTF-8 helpers. Invalid sequences are dropped, never replaced.
std::vector<uint32_t> utf8_decode(const std::string& s);
void utf8_append(std::string& out, uint32_t cp);
std::string utf8_lossy(const std::string& bytes);
size_t utf8_length(const std::string& s);

std::string normalize_input(const std::string& s);
std::string repair_lookalikes(const std::string& s);

bool is_printable_char(uint32_t cp);
double printable_fraction(const std::string& s);
bool is_mostly_printable(const std::string& s, double thresh = 0.9);

// Decoded bytes -> text if it is long enough and mostly printable.
bool to_plaintext(const std::string& bytes, size_t min_len, std::string& text);

std::string strip_to_allowed(const std::string& s, const std::string& alphabet);
bool fits_alphabet(const std::string& s, const std::string& alphabet);
std::string delete_periodic(const std::string& s, size_t k, size_t phase);
double drop_ratio(size_t kept, size_t original);

std::string safe_preview(const std::string& data, size_t max_len = 80);
std::string quote_token(const std::string& s);

class TimeBudget {
public:
    explicit TimeBudget(double seconds);

    bool expired() const;
    double elapsed() const;
    double remaining() const;

private:
    std::chrono::steady_clock::time_point start_;
    double seconds_;
};

#endif
