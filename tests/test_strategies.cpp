#include <catch2/catch.hpp>

#include "fitness.h"
#include "strategies.h"
#include "text_utils.h"

#include <botan/base58.h>

#include <algorithm>
#include <string>
#include <vector>

static const Candidate* find_text(const std::vector<Candidate>& cands, const std::string& text) {
    for (const Candidate& c : cands)
        if (c.text == text) return &c;
    return nullptr;
}

static const Candidate* find_provenance(const std::vector<Candidate>& cands, const std::string& needle) {
    for (const Candidate& c : cands)
        if (c.provenance.find(needle) != std::string::npos) return &c;
    return nullptr;
}

static const Candidate& best_of(const std::vector<Candidate>& cands) {
    REQUIRE_FALSE(cands.empty());
    return *std::max_element(cands.begin(), cands.end(),
        [](const Candidate& a, const Candidate& b) { return a.score < b.score; });
}

// ---------------------------------------------------------------------------
// rotN
// ---------------------------------------------------------------------------

TEST_CASE("rotN decodes a fixed shift", "[strategies][rotN]") {
    RotNOptions opts;
    std::vector<Candidate> out = run_rotn("Uryyb, Jbeyq!", opts);
    REQUIRE(out.size() == 1);
    CHECK(out[0].strategy_name == "rotN");
    CHECK(out[0].provenance == "k=13");
    CHECK(out[0].text == "Hello, World!");
}

TEST_CASE("rotN sweep ranks ROT13 first", "[strategies][rotN]") {
    RotNOptions opts;
    opts.all = true;
    std::vector<Candidate> out = run_rotn("Uryyb, Jbeyq!", opts);
    REQUIRE(out.size() == 26);
    CHECK(best_of(out).text == "Hello, World!");
    CHECK(best_of(out).provenance == "k=13");
}

TEST_CASE("text_to_decipher redirects a strategy", "[strategies][override]") {
    RotNOptions opts;
    opts.common.has_override = true;
    opts.common.text_to_decipher = "%c, Jbeyq!";
    std::vector<Candidate> out = run_rotn("Uryyb", opts);
    REQUIRE(out.size() == 1);
    CHECK(out[0].text == "Hello, World!");
}

// ---------------------------------------------------------------------------
// super_rot
// ---------------------------------------------------------------------------

TEST_CASE("super_rot recovers a progressive shift", "[strategies][super_rot]") {
    SuperRotOptions opts;
    opts.start_keys = {3};
    opts.max_abs_step = 2;

    std::vector<Candidate> out = run_super_rot("Pjlc zt to sih bbfna igxbf fa erc", opts);
    CHECK(out.size() == 1u * 4u * 2u * 2u);

    const Candidate* hit = find_text(out, "Meet me at the usual place at ten");
    REQUIRE(hit != nullptr);
    CHECK(hit->strategy_name == "super_rot");
    CHECK(hit->provenance == "k0=3,step=+2,order=LTR,mode=decode");
    CHECK(best_of(out).text == hit->text);
}

TEST_CASE("super_rot counts positions from the right", "[strategies][super_rot]") {
    SuperRotOptions opts;
    opts.start_keys = {7};
    opts.max_abs_step = 3;
    opts.orders = {"RTL"};
    opts.modes = {"decode"};

    std::vector<Candidate> out = run_super_rot("Bwzr ql nj pgg cdirf poglq so uiu", opts);
    const Candidate* hit = find_text(out, "Meet me at the usual place at ten");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance == "k0=7,step=-3,order=RTL,mode=decode");
}

TEST_CASE("super_rot penalises encoded-looking output", "[strategies][super_rot]") {
    SuperRotOptions opts;
    opts.start_keys = {0};
    opts.max_abs_step = 1;
    opts.orders = {"LTR"};
    opts.modes = {"decode"};

    // Digits and '=' never move, so both outputs stay Base64-shaped with padding.
    std::vector<Candidate> out = run_super_rot("SGVsbG8sIFdvcmxkIQ==", opts);
    REQUIRE(out.size() == 2);
    for (const Candidate& c : out) {
        CHECK(c.text.substr(c.text.size() - 2) == "==");
        CHECK(c.score == Approx(fitness(c.text) - 2.0));
    }

    // A shifted plain sentence carries no shape penalty.
    std::vector<Candidate> prose = run_super_rot("Meet me at the usual place", opts);
    for (const Candidate& c : prose)
        CHECK(c.score == Approx(fitness(c.text)));
}

// ---------------------------------------------------------------------------
// Encoding families
// ---------------------------------------------------------------------------

TEST_CASE("base64 finds an embedded token by scanning", "[strategies][base64]") {
    Base64Options opts;
    std::vector<Candidate> out = run_base64("prefix SGVsbG8sIFdvcmxkIQ== suffix", opts);

    const Candidate* hit = find_provenance(out, "path=scan[b64@7:27]->base64");
    REQUIRE(hit != nullptr);
    CHECK(hit->strategy_name == "base64");
    CHECK(hit->text == "Hello, World!");
}

TEST_CASE("base64 repairs look-alike characters", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;
    opts.aggressive_salvage = false;

    // '$' stands in for the 'S' of "SGVsbG8s..."
    std::vector<Candidate> out = run_base64("$GVsbG8sIFdvcmxkIQ==", opts);
    const Candidate* hit = find_text(out, "Hello, World!");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance == "path=raw+repair->base64");
}

TEST_CASE("base64 follows a nested encoding", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;
    opts.aggressive_salvage = false;

    // base64("SGVsbG8sIFdvcmxkIQ==")
    std::vector<Candidate> out = run_base64("U0dWc2JHOHNJRmR2Y214a0lRPT0=", opts);
    const Candidate* hit = find_text(out, "Hello, World!");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance == "path=raw->base64->base64");

    const Candidate* outer = find_text(out, "SGVsbG8sIFdvcmxkIQ==");
    REQUIRE(outer != nullptr);
    CHECK(hit->score > outer->score);
}

TEST_CASE("base64 removes a recurring junk digit", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;

    // base64("meet me at the old mill") with '7' salted in three times
    std::vector<Candidate> out = run_base64("bWVld7CBtZSBh7dCB0aGUg7b2xkIG1pbGw=", opts);
    const Candidate* hit = find_provenance(out, "path=rm_digit_std['7'](drop=0.09)->base64");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "meet me at the old mill");

    opts.aggressive_salvage = false;
    CHECK(find_provenance(run_base64("bWVld7CBtZSBh7dCB0aGUg7b2xkIG1pbGw=", opts), "rm_digit") == nullptr);
}

TEST_CASE("base64 periodic deletion removes every k-th symbol", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;

    // 'x' after every 4 symbols of the same token
    std::vector<Candidate> out = run_base64("bWVlxdCBtxZSBhxdCB0xaGUgxb2xkxIG1pxbGw", opts);
    const Candidate* hit = find_provenance(out, "path=rm_periodic_std[k=5,ph=4]");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "meet me at the old mill");
    CHECK(ends_with(hit->provenance, "->base64"));
}

TEST_CASE("base64 removes a repeated letter-digit k-gram", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;

    std::vector<Candidate> out = run_base64("bWVlZ9dCBtZSZ9BhdCB0aGZ9Ugb2xkZ9IG1pbGw=", opts);
    const Candidate* hit = find_provenance(out, "path=rm_kgram_std['Z9'](drop=0.20)->base64");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "meet me at the old mill");
}

TEST_CASE("base64 maps url-safe punctuation onto the standard alphabet", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;
    opts.aggressive_salvage = false;

    // urlsafe_b64("??>>~~ secret??")
    std::vector<Candidate> out = run_base64("Pz8-Pn5-IHNlY3JldD8_", opts);

    // one token, two decodes
    const Candidate* url = find_provenance(out, "path=raw->urlsafe_b64");
    const Candidate* swapped = find_provenance(out, "path=raw+repair+std->base64");
    REQUIRE(url != nullptr);
    REQUIRE(swapped != nullptr);
    CHECK(url->text == "??>>~~ secret??");
    CHECK(swapped->text == "??>>~~ secret??");
    CHECK(find_provenance(out, "path=raw->base64") == nullptr);
}

TEST_CASE("base64 family covers hex, base32 and ascii85 tokens", "[strategies][base64]") {
    Base64Options opts;
    opts.scan_substrings = false;

    std::vector<Candidate> hex = run_base64("48656c6c6f2c20776f726c6421", opts);
    const Candidate* hit = find_provenance(hex, "path=raw->hex");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "Hello, world!");

    std::vector<Candidate> b32 = run_base64("MF2HIYLDNMQGC5BAMRQXO3Q", opts);
    hit = find_provenance(b32, "path=raw->base32");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "attack at dawn");

    std::vector<Candidate> a85 = run_base64("@<?U\"@r!2qF<G+&GA[", opts);
    hit = find_provenance(a85, "path=raw->a85");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "attack at dawn");
    // clean-text bonus minus the a85 penalty
    CHECK(hit->score == Approx(fitness("attack at dawn") + 1.6 - 0.6));
}

TEST_CASE("base58 decodes raw and checksummed tokens", "[strategies][base58]") {
    Base58Options opts;

    std::vector<Candidate> plain = run_base58("StV1DL6CwTryKyV", opts);
    const Candidate* hit = find_text(plain, "hello world");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance == "path=raw->b58[bitcoin]");

    const std::string payload = "checksummed message";
    std::string encoded = Botan::base58_check_encode(
        reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    std::vector<Candidate> checked = run_base58(encoded, opts);
    hit = find_provenance(checked, "path=raw->b58check[bitcoin]");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == payload);

    opts.check_modes = {"none"};
    CHECK(find_provenance(run_base58(encoded, opts), "b58check") == nullptr);
}

TEST_CASE("base58 strips recurring junk", "[strategies][base58]") {
    Base58Options opts;
    opts.scan_substrings = false;

    std::vector<Candidate> out = run_base58("StV#1DL#6Cw#Try#KyV", opts);
    const Candidate* hit = find_text(out, "hello world");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance.find("keep_std(drop=0.21)") != std::string::npos);
}

TEST_CASE("base45 periodic deletion removes inserted junk", "[strategies][base45]") {
    // Base45 of "Hello from the junk yard" with '.' after every 4 symbols.
    const std::string junked = "%69 .VD82.E .C.+3ES.44+8.DI44.2%EJ.ODNF.FYKE.";
    Base45Options opts;

    std::vector<Candidate> out = run_base45(junked, opts);
    const Candidate* hit = find_provenance(out, "rm_periodic(k=5,ph=4");
    REQUIRE(hit != nullptr);
    CHECK(hit->text == "Hello from the junk yard");
    CHECK(hit->strategy_name == "base45");

    // the periodic search is gated on the budget phase by phase
    opts.common.budget_s = 0.0;
    opts.scan_substrings = false;
    CHECK(run_base45(junked, opts).empty());
}

TEST_CASE("base91 decodes raw and scanned tokens", "[strategies][base91]") {
    Base91Options opts;

    std::vector<Candidate> raw = run_base91(">OwJh>Io0Tv!8PE", opts);
    const Candidate* hit = find_text(raw, "Hello World!");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance == "path=raw->b91");

    std::vector<Candidate> scanned = run_base91("see ' >OwJh>Io0Tv!8PE ' here", opts);
    hit = find_text(scanned, "Hello World!");
    REQUIRE(hit != nullptr);
    CHECK(hit->provenance.find("scan[") != std::string::npos);
}

// ---------------------------------------------------------------------------
// Budgets
// ---------------------------------------------------------------------------

TEST_CASE("a zero budget returns at once", "[strategies][budget]") {
    const std::string ct = "prefix SGVsbG8sIFdvcmxkIQ== suffix";

    Base64Options b64;   b64.common.budget_s = 0.0;
    Base58Options b58;   b58.common.budget_s = 0.0;
    Base45Options b45;   b45.common.budget_s = 0.0;
    Base91Options b91;   b91.common.budget_s = 0.0;
    SuperRotOptions sr;  sr.common.budget_s = 0.0;
    RotNOptions all;     all.common.budget_s = 0.0; all.all = true;
    RotNOptions fixed;   fixed.common.budget_s = 0.0;

    CHECK(run_base64(ct, b64).empty());
    CHECK(run_base58(ct, b58).empty());
    CHECK(run_base45(ct, b45).empty());
    CHECK(run_base91(ct, b91).empty());
    CHECK(run_super_rot(ct, sr).empty());
    CHECK(run_rotn(ct, all).empty());
    CHECK(run_rotn(ct, fixed).size() == 1);
}

TEST_CASE("registry binds every strategy and clamps budgets", "[strategies][registry]") {
    auto registry = build_strategy_registry();
    std::vector<std::string> names = registry_names(registry);
    CHECK(names == std::vector<std::string>{"base45", "base58", "base64", "base91", "rotN", "super_rot"});

    StrategySettings settings;
    settings.rotN.all = true;
    CHECK(registry.at("rotN")("Uryyb, Jbeyq!", settings, 0.0).empty());
    CHECK(registry.at("rotN")("Uryyb, Jbeyq!", settings, 10.0).size() == 26);
}
