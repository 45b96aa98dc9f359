/**
 * Orchestrator and ranking
 *
 * run_pipeline drives the registered strategies against one ciphertext under
 * a global wall-clock budget. rank_candidates turns the raw pile into a short
 * list: one entry per distinct text, at most per_algo_cap entries per
 * strategy, and (when promotion is on) every strategy's best entry up front.
 */

#include "pipeline.h"
#include "log_util.h"
#include "text_utils.h"

#include <algorithm>
#include <exception>
#include <iterator>
#include <set>
#include <unordered_map>

// ---------------------------------------------------------------------------
// Orchestrator
// ---------------------------------------------------------------------------

PipelineResult run_pipeline(const std::string& ciphertext, const RunConfig& cfg,
                            const std::map<std::string, StrategyFunc>& registry)
{
    PipelineResult result;
    TimeBudget global(cfg.total_budget_s);

    for (const std::string& name : cfg.active) {
        auto it = registry.find(name);
        if (it == registry.end()) {
            warn("Unknown strategy '" + name + "' - skipping");
            continue;
        }

        double cap = global.remaining();
        info("Running " + name + " (budget cap " + format_fixed(cap, 2) + "s)");

        try {
            std::vector<Candidate> found = it->second(ciphertext, cfg.strategies, cap);
            info(name + " produced " + std::to_string(found.size()) + " candidates");
            result.candidates.insert(result.candidates.end(),
                                     std::make_move_iterator(found.begin()),
                                     std::make_move_iterator(found.end()));
            result.completed.push_back(name);
        } catch (const std::exception& e) {
            warn("Strategy " + name + " failed: " + e.what());
            result.failed.push_back(name);
        } catch (...) {
            warn("Strategy " + name + " failed: unknown error");
            result.failed.push_back(name);
        }

        if (global.expired()) {
            result.budget_exhausted = true;
            info("Global budget of " + format_fixed(cfg.total_budget_s, 2) +
                 "s exhausted after " + name);
            break;
        }
    }

    result.elapsed_s = global.elapsed();
    return result;
}

// ---------------------------------------------------------------------------
// Ranking
// ---------------------------------------------------------------------------

RankingOptions ranking_options(const RunConfig& cfg) {
    RankingOptions opts;
    opts.per_algo_cap = cfg.per_algo_cap;
    opts.promote_top_per_algo = cfg.promote_top_per_algo;
    opts.display_count = cfg.top_k;
    return opts;
}

// Highest score per text; the first one seen wins a tie.
static std::vector<Candidate> dedupe_by_text(const std::vector<Candidate>& cands) {
    std::vector<Candidate> out;
    std::unordered_map<std::string, size_t> slot;
    for (const Candidate& c : cands) {
        auto it = slot.find(c.text);
        if (it == slot.end()) {
            slot.emplace(c.text, out.size());
            out.push_back(c);
        } else if (c.score > out[it->second].score) {
            out[it->second] = c;
        }
    }
    return out;
}

static bool cmp_score_desc(const Candidate& a, const Candidate& b) {
    return a.score > b.score;
}

std::vector<Candidate> rank_candidates(const std::vector<Candidate>& cands,
                                       const RankingOptions& opts)
{
    std::vector<Candidate> sorted = dedupe_by_text(cands);
    std::stable_sort(sorted.begin(), sorted.end(), cmp_score_desc);

    // Candidates are referred to by their index in `sorted` from here on.
    std::vector<size_t> capped;
    std::vector<size_t> bucket_tops;
    std::unordered_map<std::string, size_t> emitted;
    for (size_t i = 0; i < sorted.size(); i++) {
        size_t& n = emitted[sorted[i].strategy_name];
        if (n == 0) bucket_tops.push_back(i);
        if (n < opts.per_algo_cap) capped.push_back(i);
        n++;
    }

    std::vector<size_t> order;
    if (opts.promote_top_per_algo) {
        // bucket_tops is already in descending score order
        std::set<size_t> placed(bucket_tops.begin(), bucket_tops.end());
        order = bucket_tops;
        for (size_t i : capped)
            if (placed.insert(i).second) order.push_back(i);
    } else {
        order = capped;
    }

    std::vector<Candidate> final_list;
    std::set<std::string> texts;
    for (size_t i : order) {
        if (final_list.size() >= opts.display_count) break;
        if (!texts.insert(sorted[i].text).second) continue;
        final_list.push_back(sorted[i]);
    }
    return final_list;
}
