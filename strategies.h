#ifndef STRATEGIES_H
#define STRATEGIES_H

#include "candidate.h"
#include "strategy_config.h"

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>

std::vector<Candidate> run_base64(const std::string& ciphertext, const Base64Options& opts);
std::vector<Candidate> run_base58(const std::string& ciphertext, const Base58Options& opts);
std::vector<Candidate> run_base45(const std::string& ciphertext, const Base45Options& opts);
std::vector<Candidate> run_base91(const std::string& ciphertext, const Base91Options& opts);
std::vector<Candidate> run_rotn(const std::string& ciphertext, const RotNOptions& opts);
std::vector<Candidate> run_super_rot(const std::string& ciphertext, const SuperRotOptions& opts);

// Uniform entry point stored in the registry. `budget_cap` is what is left of
// the global budget; the strategy runs under min(own budget_s, budget_cap).
using StrategyFunc = std::function<std::vector<Candidate>(
    const std::string& ciphertext,
    const StrategySettings& settings,
    double budget_cap
)>;

template<typename OptionsT>
StrategyFunc bind_strategy(
    OptionsT StrategySettings::*member,
    std::vector<Candidate> (*run)(const std::string&, const OptionsT&))
{
    return [member, run](const std::string& ciphertext, const StrategySettings& settings,
                         double budget_cap) {
        OptionsT opts = settings.*member;
        opts.common.budget_s = std::min(opts.common.budget_s, budget_cap);
        return run(ciphertext, opts);
    };
}

void register_codec_strategies(std::map<std::string, StrategyFunc>& m);
void register_rot_strategies(std::map<std::string, StrategyFunc>& m);

std::map<std::string, StrategyFunc> build_strategy_registry();
std::vector<std::string> registry_names(const std::map<std::string, StrategyFunc>& registry);

#endif
