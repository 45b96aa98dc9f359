#ifndef STRATEGY_CONFIG_H
#define STRATEGY_CONFIG_H

#include <cstddef>
#include <string>
#include <vector>

struct CommonOptions {
    double budget_s;
    bool has_override = false;
    std::string text_to_decipher;     // '%c' expands to the real ciphertext

    explicit CommonOptions(double budget) : budget_s(budget) {}
};

struct Base64Options {
    CommonOptions common{5.0};
    int nested_passes = 1;
    bool scan_substrings = true;
    size_t min_token_len = 12;
    bool allow_urlsafe = true;
    bool aggressive_salvage = true;
    int periodic_max_k = 6;
    int digit_combo_k = 2;
    std::vector<int> kgram_lengths = {2, 3};
    int kgram_topk = 6;
    size_t min_plain_len = 6;
};

struct Base58Options {
    CommonOptions common{5.0};
    std::vector<std::string> alphabets = {"bitcoin"};
    std::vector<std::string> check_modes = {"none", "b58check"};
    int nested_passes = 1;
    bool scan_substrings = true;
    size_t min_token_len = 10;
    bool aggressive_salvage = true;
    int periodic_max_k = 6;
    size_t min_plain_len = 6;
};

struct Base45Options {
    CommonOptions common{5.0};
    bool scan_substrings = true;
    size_t min_token_len = 6;
    int periodic_max_k = 6;
    size_t min_plain_len = 6;
};

struct Base91Options {
    CommonOptions common{5.0};
    bool scan_substrings = true;
    size_t min_token_len = 8;
    int periodic_max_k = 6;
    size_t min_plain_len = 6;
};

struct RotNOptions {
    CommonOptions common{1.0};
    bool all = false;                 // try every shift 0..25
    int n = 13;
};

struct SuperRotOptions {
    CommonOptions common{60.0};
    std::vector<int> start_keys = default_start_keys();
    int max_abs_step = 5;
    std::vector<std::string> modes = {"decode", "encode"};
    std::vector<std::string> orders = {"LTR", "RTL"};

    static std::vector<int> default_start_keys() {
        std::vector<int> keys;
        for (int k = 0; k < 26; k++) keys.push_back(k);
        return keys;
    }
};

struct StrategySettings {
    Base64Options base64;
    Base58Options base58;
    Base45Options base45;
    Base91Options base91;
    RotNOptions rotN;
    SuperRotOptions super_rot;
};

struct RunConfig {
    std::vector<std::string> active = {"base64", "base58", "base45", "base91", "rotN", "super_rot"};
    double total_budget_s = 600.0;
    size_t top_k = 10;
    size_t per_algo_cap = 5;
    bool promote_top_per_algo = true;
    std::string show_hint = "auto";
    StrategySettings strategies;
};

// Applies the text_to_decipher override, if any.
std::string resolve_ciphertext(const std::string& ciphertext, const CommonOptions& common);

// `key` is "global.<field>", "active" or "<strategy>.<field>".
bool apply_option(RunConfig& cfg, const std::string& key, const std::string& value,
                  std::string& err);
bool apply_assignment(RunConfig& cfg, const std::string& assignment, std::string& err);

// JSON config: {"active_modules": [...], "global": {...},
//               "modules": {"<strategy>": {"<field>": value, ...}}}
// Lists map to comma-separated values. Nothing is applied unless the whole
// document is valid.
bool load_config_json(const std::string& text, RunConfig& cfg, std::string& err);
bool load_config_file(const std::string& path, RunConfig& cfg, std::string& err);

bool validate_run_config(const RunConfig& cfg, const std::vector<std::string>& known_strategies,
                         std::string& err);

#endif
