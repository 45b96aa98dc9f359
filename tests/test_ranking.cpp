#include <catch2/catch.hpp>

#include "pipeline.h"

#include <map>
#include <set>
#include <string>
#include <vector>

static Candidate cand(const std::string& algo, const std::string& text, double score) {
    return {algo, "test", text, score};
}

static bool same_list(const std::vector<Candidate>& a, const std::vector<Candidate>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].strategy_name != b[i].strategy_name || a[i].text != b[i].text ||
            a[i].score != b[i].score || a[i].provenance != b[i].provenance)
            return false;
    }
    return true;
}

static std::vector<Candidate> noisy_pool() {
    std::vector<Candidate> pool;
    for (int i = 0; i < 12; i++)
        pool.push_back(cand("super_rot", "shift " + std::to_string(i), 9.0 - i * 0.1));
    pool.push_back(cand("base64", "decoded one", 3.5));
    pool.push_back(cand("base64", "decoded two", 2.5));
    pool.push_back(cand("rotN", "rotated", 1.0));
    return pool;
}

TEST_CASE("dedupe keeps the best candidate per text", "[ranking]") {
    std::vector<Candidate> pool = {
        {"base64", "first", "flag", 1.0},
        {"base58", "better", "flag", 2.0},
        {"base45", "tie", "flag", 2.0},
        {"rotN", "other", "other text", 0.5},
    };
    RankingOptions opts;
    opts.promote_top_per_algo = false;
    std::vector<Candidate> ranked = rank_candidates(pool, opts);

    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].text == "flag");
    CHECK(ranked[0].strategy_name == "base58");
    CHECK(ranked[0].provenance == "better");
    CHECK(ranked[1].text == "other text");
}

TEST_CASE("ranking is idempotent", "[ranking]") {
    RankingOptions opts;
    std::vector<Candidate> once = rank_candidates(noisy_pool(), opts);
    std::vector<Candidate> again = rank_candidates(noisy_pool(), opts);
    std::vector<Candidate> twice = rank_candidates(once, opts);

    CHECK(same_list(once, again));
    CHECK(same_list(once, twice));
}

TEST_CASE("no strategy exceeds the cap", "[ranking]") {
    RankingOptions opts;
    opts.per_algo_cap = 3;
    opts.display_count = 100;

    for (bool promote : {false, true}) {
        opts.promote_top_per_algo = promote;
        std::map<std::string, size_t> per_algo;
        for (const Candidate& c : rank_candidates(noisy_pool(), opts))
            per_algo[c.strategy_name]++;
        CHECK(per_algo["super_rot"] == 3);
        CHECK(per_algo["base64"] == 2);
        CHECK(per_algo["rotN"] == 1);
    }
}

TEST_CASE("promotion puts one candidate per strategy first", "[ranking]") {
    RankingOptions opts;
    opts.per_algo_cap = 5;
    opts.display_count = 10;
    std::vector<Candidate> ranked = rank_candidates(noisy_pool(), opts);

    REQUIRE(ranked.size() == 8);
    CHECK(ranked[0].strategy_name == "super_rot");
    CHECK(ranked[0].text == "shift 0");
    CHECK(ranked[1].strategy_name == "base64");
    CHECK(ranked[1].text == "decoded one");
    CHECK(ranked[2].strategy_name == "rotN");
    CHECK(ranked[3].text == "shift 1");

    std::set<std::string> texts;
    for (const Candidate& c : ranked)
        CHECK(texts.insert(c.text).second);

    opts.promote_top_per_algo = false;
    std::vector<Candidate> plain = rank_candidates(noisy_pool(), opts);
    CHECK(plain[1].text == "shift 1");
    CHECK(plain.back().strategy_name == "rotN");
}

TEST_CASE("display count truncates and empty input stays empty", "[ranking]") {
    RankingOptions opts;
    opts.display_count = 2;
    std::vector<Candidate> ranked = rank_candidates(noisy_pool(), opts);
    REQUIRE(ranked.size() == 2);
    CHECK(ranked[0].strategy_name == "super_rot");
    CHECK(ranked[1].strategy_name == "base64");

    CHECK(rank_candidates({}, RankingOptions()).empty());
}

TEST_CASE("ranking options mirror the run config", "[ranking]") {
    RunConfig cfg;
    cfg.top_k = 4;
    cfg.per_algo_cap = 2;
    cfg.promote_top_per_algo = false;
    RankingOptions opts = ranking_options(cfg);
    CHECK(opts.display_count == 4);
    CHECK(opts.per_algo_cap == 2);
    CHECK_FALSE(opts.promote_top_per_algo);
}
