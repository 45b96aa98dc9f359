#include <catch2/catch.hpp>

#include "log_util.h"
#include "pipeline.h"

#include <stdexcept>
#include <string>
#include <thread>
#include <chrono>

static StrategyFunc constant(const std::string& name, const std::string& text, double score) {
    return [name, text, score](const std::string&, const StrategySettings&, double) {
        return std::vector<Candidate>{{name, "fixed", text, score}};
    };
}

TEST_CASE("a throwing strategy does not abort the run", "[pipeline]") {
    set_quiet(true);
    std::map<std::string, StrategyFunc> registry;
    registry["boom"] = [](const std::string&, const StrategySettings&, double) -> std::vector<Candidate> {
        throw std::runtime_error("internal fault");
    };
    registry["ok"] = constant("ok", "survivor", 1.0);

    RunConfig cfg;
    cfg.active = {"boom", "ok"};
    PipelineResult result = run_pipeline("ciphertext", cfg, registry);

    REQUIRE(result.candidates.size() == 1);
    CHECK(result.candidates[0].text == "survivor");
    CHECK(result.failed == std::vector<std::string>{"boom"});
    CHECK(result.completed == std::vector<std::string>{"ok"});
    CHECK_FALSE(result.budget_exhausted);
}

TEST_CASE("a non-standard throw is isolated too", "[pipeline]") {
    set_quiet(true);
    std::map<std::string, StrategyFunc> registry;
    registry["odd"] = [](const std::string&, const StrategySettings&, double) -> std::vector<Candidate> {
        throw 42;
    };
    registry["ok"] = constant("ok", "survivor", 1.0);

    RunConfig cfg;
    cfg.active = {"odd", "ok"};
    PipelineResult result;
    REQUIRE_NOTHROW(result = run_pipeline("ciphertext", cfg, registry));

    REQUIRE(result.candidates.size() == 1);
    CHECK(result.failed == std::vector<std::string>{"odd"});
    CHECK(result.completed == std::vector<std::string>{"ok"});
}

TEST_CASE("strategies run in configured order with the remaining budget", "[pipeline]") {
    set_quiet(true);
    std::vector<double> caps;
    std::map<std::string, StrategyFunc> registry;
    registry["a"] = [&caps](const std::string& ct, const StrategySettings&, double cap) {
        caps.push_back(cap);
        return std::vector<Candidate>{{"a", "p", ct + "-a", 1.0}};
    };
    registry["b"] = [&caps](const std::string& ct, const StrategySettings&, double cap) {
        caps.push_back(cap);
        return std::vector<Candidate>{{"b", "p", ct + "-b", 2.0}};
    };

    RunConfig cfg;
    cfg.active = {"b", "a"};
    cfg.total_budget_s = 30.0;
    PipelineResult result = run_pipeline("x", cfg, registry);

    REQUIRE(result.candidates.size() == 2);
    CHECK(result.candidates[0].text == "x-b");
    CHECK(result.candidates[1].text == "x-a");
    REQUIRE(caps.size() == 2);
    CHECK(caps[0] <= 30.0);
    CHECK(caps[0] > 29.0);
    CHECK(caps[1] <= caps[0]);
}

TEST_CASE("no strategy is launched once the global budget is spent", "[pipeline]") {
    set_quiet(true);
    std::map<std::string, StrategyFunc> registry;
    registry["slow"] = [](const std::string&, const StrategySettings&, double) {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        return std::vector<Candidate>{{"slow", "p", "first", 1.0}};
    };
    registry["never"] = constant("never", "second", 5.0);

    RunConfig cfg;
    cfg.active = {"slow", "never"};
    cfg.total_budget_s = 0.01;
    PipelineResult result = run_pipeline("x", cfg, registry);

    REQUIRE(result.candidates.size() == 1);
    CHECK(result.candidates[0].text == "first");
    CHECK(result.budget_exhausted);
    CHECK(result.completed == std::vector<std::string>{"slow"});
}

TEST_CASE("end to end: ROT13 wins the ranked list", "[pipeline][scenario]") {
    set_quiet(true);
    auto registry = build_strategy_registry();

    RunConfig cfg;
    cfg.active = {"rotN", "base64"};
    cfg.strategies.rotN.all = true;
    cfg.strategies.base64.common.budget_s = 2.0;
    PipelineResult result = run_pipeline("Uryyb, Jbeyq!", cfg, registry);
    std::vector<Candidate> ranked = rank_candidates(result.candidates, ranking_options(cfg));

    REQUIRE_FALSE(ranked.empty());
    CHECK(ranked[0].text == "Hello, World!");
    CHECK(ranked[0].strategy_name == "rotN");

    size_t rot_count = 0;
    for (const Candidate& c : ranked)
        if (c.strategy_name == "rotN") rot_count++;
    CHECK(rot_count <= cfg.per_algo_cap);
}

TEST_CASE("end to end: embedded Base64 token", "[pipeline][scenario]") {
    set_quiet(true);
    auto registry = build_strategy_registry();

    RunConfig cfg;
    cfg.active = {"base64", "base58", "base45", "base91", "rotN"};
    cfg.total_budget_s = 30.0;
    PipelineResult result = run_pipeline("prefix SGVsbG8sIFdvcmxkIQ== suffix", cfg, registry);
    std::vector<Candidate> ranked = rank_candidates(result.candidates, ranking_options(cfg));

    bool found = false;
    for (const Candidate& c : ranked)
        if (c.text == "Hello, World!" && c.strategy_name == "base64") found = true;
    CHECK(found);
    CHECK(result.failed.empty());
}
