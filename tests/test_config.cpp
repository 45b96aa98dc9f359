#include <catch2/catch.hpp>

#include "strategies.h"
#include "strategy_config.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

static const std::vector<std::string> KNOWN = {
    "base45", "base58", "base64", "base91", "rotN", "super_rot"};

TEST_CASE("defaults match the documented values", "[config]") {
    RunConfig cfg;
    CHECK(cfg.active == std::vector<std::string>{"base64", "base58", "base45", "base91", "rotN", "super_rot"});
    CHECK(cfg.total_budget_s == 600.0);
    CHECK(cfg.top_k == 10);
    CHECK(cfg.per_algo_cap == 5);
    CHECK(cfg.promote_top_per_algo);
    CHECK(cfg.show_hint == "auto");

    const StrategySettings& s = cfg.strategies;
    CHECK(s.base64.common.budget_s == 5.0);
    CHECK(s.base64.min_token_len == 12);
    CHECK(s.base64.kgram_lengths == std::vector<int>{2, 3});
    CHECK(s.base58.alphabets == std::vector<std::string>{"bitcoin"});
    CHECK(s.base45.min_token_len == 6);
    CHECK(s.base91.min_token_len == 8);
    CHECK(s.rotN.common.budget_s == 1.0);
    CHECK(s.rotN.n == 13);
    CHECK(s.super_rot.common.budget_s == 60.0);
    CHECK(s.super_rot.start_keys.size() == 26);
    CHECK(s.super_rot.max_abs_step == 5);
    CHECK_FALSE(s.base64.common.has_override);
}

TEST_CASE("dotted assignments reach the typed options", "[config]") {
    RunConfig cfg;
    std::string err;

    CHECK(apply_assignment(cfg, "base64.nested_passes = 2", err));
    CHECK(apply_assignment(cfg, "base64.kgram_lengths=2,4", err));
    CHECK(apply_assignment(cfg, "base58.alphabets=bitcoin,flickr", err));
    CHECK(apply_assignment(cfg, "base45.scan_substrings=off", err));
    CHECK(apply_assignment(cfg, "base91.budget_s=0.5", err));
    CHECK(apply_assignment(cfg, "super_rot.orders=RTL", err));
    CHECK(apply_assignment(cfg, "global.top_k=3", err));
    CHECK(apply_assignment(cfg, "global.show_hint=Never", err));
    CHECK(apply_assignment(cfg, "active=rotN, base64", err));

    CHECK(cfg.strategies.base64.nested_passes == 2);
    CHECK(cfg.strategies.base64.kgram_lengths == std::vector<int>{2, 4});
    CHECK(cfg.strategies.base58.alphabets == std::vector<std::string>{"bitcoin", "flickr"});
    CHECK_FALSE(cfg.strategies.base45.scan_substrings);
    CHECK(cfg.strategies.base91.common.budget_s == 0.5);
    CHECK(cfg.strategies.super_rot.orders == std::vector<std::string>{"RTL"});
    CHECK(cfg.top_k == 3);
    CHECK(cfg.show_hint == "never");
    CHECK(cfg.active == std::vector<std::string>{"rotN", "base64"});
}

TEST_CASE("rotN accepts a shift or all", "[config]") {
    RunConfig cfg;
    std::string err;
    REQUIRE(apply_option(cfg, "rotN.n", "27", err));
    CHECK(cfg.strategies.rotN.n == 1);
    CHECK_FALSE(cfg.strategies.rotN.all);

    REQUIRE(apply_option(cfg, "rotN.n", "-1", err));
    CHECK(cfg.strategies.rotN.n == 25);

    REQUIRE(apply_option(cfg, "rotN.n", "all", err));
    CHECK(cfg.strategies.rotN.all);
}

TEST_CASE("text_to_decipher keeps the %c template", "[config]") {
    RunConfig cfg;
    std::string err;
    REQUIRE(apply_assignment(cfg, "rotN.text_to_decipher=[%c] and %c", err));
    const CommonOptions& common = cfg.strategies.rotN.common;
    CHECK(common.has_override);
    CHECK(resolve_ciphertext("abc", common) == "[abc] and abc");
    CHECK(resolve_ciphertext("abc", cfg.strategies.base64.common) == "abc");
}

TEST_CASE("bad options are rejected with a message", "[config]") {
    RunConfig cfg;
    std::string err;

    const std::vector<std::string> bad = {
        "base64.nested_passes=abc",
        "base64.budget_s=-1",
        "base64.no_such_field=1",
        "nosuch.budget_s=1",
        "budget_s=1",
        "global.show_hint=maybe",
        "global.total_budget_s=-5",
        "base58.alphabets=bitcoin,nope",
        "base58.check_modes=crc",
        "super_rot.start_keys=3,30",
        "super_rot.modes=",
        "super_rot.max_abs_step=0",
        "rotN.n=thirteen",
        "no equals sign",
    };
    for (const std::string& a : bad) {
        INFO(a);
        err.clear();
        CHECK_FALSE(apply_assignment(cfg, a, err));
        CHECK_FALSE(err.empty());
    }
}

TEST_CASE("run config validation", "[config]") {
    RunConfig cfg;
    std::string err;
    CHECK(validate_run_config(cfg, KNOWN, err));

    cfg.active = {};
    CHECK_FALSE(validate_run_config(cfg, KNOWN, err));

    cfg.active = {"base64", "rot47"};
    CHECK_FALSE(validate_run_config(cfg, KNOWN, err));
    CHECK(err.find("rot47") != std::string::npos);

    cfg.active = {"base64", "rotN", "base64"};
    CHECK_FALSE(validate_run_config(cfg, KNOWN, err));

    CHECK(registry_names(build_strategy_registry()) == KNOWN);
}

TEST_CASE("non-finite budgets are rejected and leave the config alone", "[config]") {
    RunConfig cfg;
    std::string err;

    for (const char* v : {"nan", "NaN", "inf", "-inf", "1e999"}) {
        INFO(v);
        CHECK_FALSE(apply_option(cfg, "base45.budget_s", v, err));
        CHECK_FALSE(apply_option(cfg, "global.total_budget_s", v, err));
    }
    CHECK(cfg.strategies.base45.common.budget_s == 5.0);
    CHECK(cfg.total_budget_s == 600.0);

    CHECK_FALSE(apply_option(cfg, "base64.periodic_max_k", "-3", err));
    CHECK(cfg.strategies.base64.periodic_max_k == 6);
    CHECK_FALSE(apply_option(cfg, "global.show_hint", "maybe", err));
    CHECK(cfg.show_hint == "auto");
}

TEST_CASE("JSON config maps onto the typed options", "[config]") {
    const std::string text = R"({
        "active_modules": ["base64", "rotN", "super_rot"],
        "global": {"top_k": 4, "total_budget_s": 12.5, "show_hint": "never"},
        "modules": {
            "base64": {"budget_s": 2, "kgram_lengths": [2, 4], "aggressive_salvage": false},
            "base58": {"alphabets": ["bitcoin", "ripple"], "check_modes": ["b58check"]},
            "rotN": {"n": "all", "text_to_decipher": null},
            "super_rot": {"start_keys": [0, 3], "orders": ["LTR"], "text_to_decipher": "%c!"}
        }
    })";
    RunConfig cfg;
    std::string err;
    REQUIRE(load_config_json(text, cfg, err));

    CHECK(cfg.active == std::vector<std::string>{"base64", "rotN", "super_rot"});
    CHECK(cfg.top_k == 4);
    CHECK(cfg.total_budget_s == 12.5);
    CHECK(cfg.show_hint == "never");
    CHECK(cfg.strategies.base64.common.budget_s == 2.0);
    CHECK(cfg.strategies.base64.kgram_lengths == std::vector<int>{2, 4});
    CHECK_FALSE(cfg.strategies.base64.aggressive_salvage);
    CHECK(cfg.strategies.base58.alphabets == std::vector<std::string>{"bitcoin", "ripple"});
    CHECK(cfg.strategies.base58.check_modes == std::vector<std::string>{"b58check"});
    CHECK(cfg.strategies.rotN.all);
    CHECK_FALSE(cfg.strategies.rotN.common.has_override);
    CHECK(cfg.strategies.super_rot.start_keys == std::vector<int>{0, 3});
    CHECK(resolve_ciphertext("abc", cfg.strategies.super_rot.common) == "abc!");
    CHECK(validate_run_config(cfg, KNOWN, err));
}

TEST_CASE("bad JSON configs are rejected whole", "[config]") {
    const std::vector<std::string> bad = {
        "{\"global\": {\"top_k\": 3,}}",
        "[\"base64\"]",
        "{\"active_modules\": \"base64\"}",
        "{\"modules\": {\"base64\": {\"budget_s\": -1}}}",
        "{\"modules\": {\"base64\": {\"budget_s\": \"nan\"}}}",
        "{\"modules\": {\"base64\": {\"kgram_lengths\": [[2]]}}}",
        "{\"modules\": {\"rot47\": {\"budget_s\": 1}}}",
        "{\"modules\": {\"rotN\": 13}}",
        "{\"global\": {\"top_k\": null}}",
        "{\"global\": {\"top_k\": 3}, \"verbose\": true}",
    };
    for (const std::string& text : bad) {
        INFO(text);
        RunConfig cfg;
        std::string err;
        CHECK_FALSE(load_config_json(text, cfg, err));
        CHECK_FALSE(err.empty());
        CHECK(cfg.top_k == 10);
    }
}

TEST_CASE("config files are read from disk", "[config]") {
    const std::string path = "decode_brute_test_config.json";
    {
        std::ofstream f(path);
        f << "{\n"
          << "  \"active_modules\": [\"base64\", \"rotN\"],\n"
          << "  \"global\": {\"total_budget_s\": 12.5},\n"
          << "  \"modules\": {\"rotN\": {\"n\": \"all\"}}\n"
          << "}\n";
    }
    RunConfig cfg;
    std::string err;
    REQUIRE(load_config_file(path, cfg, err));
    CHECK(cfg.active == std::vector<std::string>{"base64", "rotN"});
    CHECK(cfg.total_budget_s == 12.5);
    CHECK(cfg.strategies.rotN.all);

    {
        std::ofstream f(path);
        f << "active_modules = base64\n";
    }
    RunConfig broken;
    CHECK_FALSE(load_config_file(path, broken, err));
    CHECK(err.find(path) != std::string::npos);

    std::remove(path.c_str());
    CHECK_FALSE(load_config_file("does/not/exist.json", broken, err));
}
