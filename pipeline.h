#ifndef PIPELINE_H
#define PIPELINE_H

#include "candidate.h"
#include "strategies.h"
#include "strategy_config.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct PipelineResult {
    std::vector<Candidate> candidates;   // every candidate, unranked
    std::vector<std::string> completed;  // strategies that ran to completion
    std::vector<std::string> failed;     // strategies that threw
    double elapsed_s = 0.0;
    bool budget_exhausted = false;
};

// Runs cfg.active in order. Each strategy gets min(own budget, what is left of
// cfg.total_budget_s); once the global budget is spent no further strategy is
// launched. A strategy that throws is logged and skipped.
PipelineResult run_pipeline(const std::string& ciphertext, const RunConfig& cfg,
                            const std::map<std::string, StrategyFunc>& registry);

struct RankingOptions {
    size_t per_algo_cap = 5;
    bool promote_top_per_algo = true;
    size_t display_count = 10;
};

RankingOptions ranking_options(const RunConfig& cfg);

// Dedupe by text, sort by score, cap per strategy, optionally promote each
// strategy's best to the front, truncate to display_count.
std::vector<Candidate> rank_candidates(const std::vector<Candidate>& cands,
                                       const RankingOptions& opts);

#endif
