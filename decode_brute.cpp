/**
 * decode_brute: brute-force decoder for noisy encoded CTF strings
 *
 * Runs every active strategy (Base64 family, Base58/Base58Check, Base45,
 * basE91, ROT-N, progressive shift) against one ciphertext under a global
 * time budget, then prints a deduplicated, per-strategy-capped ranking.
 *
 * Output: [INFO] progress lines, one block per ranked candidate, and with
 * --json a [RESULTS_JSON] block for machine consumption.
 */

#include "fitness.h"
#include "log_util.h"
#include "pipeline.h"
#include "strategies.h"
#include "strategy_config.h"
#include "text_utils.h"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// JSON escaping
// ---------------------------------------------------------------------------

static std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct Options {
    std::string ciphertext;
    bool have_ciphertext = false;
    std::string config_path;
    // Dotted-key assignments from --set and the shorthand flags, in order.
    std::vector<std::pair<std::string, std::string>> overrides;
    bool json = false;
    bool quiet = false;
    bool list_strategies = false;
};

static void usage() {
    std::cout << "Usage: decode_brute [options] <ciphertext>\n"
              << "       decode_brute --list-strategies\n"
              << "\nOptions:\n"
              << "  --config <file>          JSON config file\n"
              << "  --set <key=value>        Override one option (repeatable),\n"
              << "                           e.g. base64.nested_passes=2, global.top_k=20\n"
              << "  --strategies <a,b,c>     Active strategies, in run order\n"
              << "  --top <int>              Candidates to print (default: 10)\n"
              << "  --budget <seconds>       Global time budget (default: 600)\n"
              << "  --hint <auto|always|never>  Naming-convention hints (default: auto)\n"
              << "  --json                   Also print a [RESULTS_JSON] block\n"
              << "  --quiet                  Suppress [INFO] lines\n"
              << "  --list-strategies        List strategies and their defaults and exit\n";
}

static Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--set" && i + 1 < argc) {
            std::string kv = argv[++i];
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                error("Expected key=value after --set, got '" + kv + "'");
                std::exit(1);
            }
            opts.overrides.push_back({kv.substr(0, eq), kv.substr(eq + 1)});
        } else if (arg == "--strategies" && i + 1 < argc) {
            opts.overrides.push_back({"active", argv[++i]});
        } else if (arg == "--top" && i + 1 < argc) {
            opts.overrides.push_back({"global.top_k", argv[++i]});
        } else if (arg == "--budget" && i + 1 < argc) {
            opts.overrides.push_back({"global.total_budget_s", argv[++i]});
        } else if (arg == "--hint" && i + 1 < argc) {
            opts.overrides.push_back({"global.show_hint", argv[++i]});
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--list-strategies") {
            opts.list_strategies = true;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            std::exit(0);
        } else if (!starts_with(arg, "--") && !opts.have_ciphertext) {
            opts.ciphertext = arg;
            opts.have_ciphertext = true;
        } else {
            error("Unknown argument: " + arg);
            std::exit(1);
        }
    }
    return opts;
}

// ---------------------------------------------------------------------------
// --list-strategies
// ---------------------------------------------------------------------------

static void list_strategies_cmd(const std::vector<std::string>& names, const RunConfig& cfg) {
    std::cout << "Registered strategies:\n\n";
    char hdr[128];
    snprintf(hdr, sizeof(hdr), "%-12s%-10s%s\n", "Name", "Budget", "Active");
    std::cout << hdr;
    std::cout << std::string(32, '-') << "\n";

    const StrategySettings& s = cfg.strategies;
    for (const std::string& name : names) {
        double budget = 0.0;
        if (name == "base64")         budget = s.base64.common.budget_s;
        else if (name == "base58")    budget = s.base58.common.budget_s;
        else if (name == "base45")    budget = s.base45.common.budget_s;
        else if (name == "base91")    budget = s.base91.common.budget_s;
        else if (name == "rotN")      budget = s.rotN.common.budget_s;
        else if (name == "super_rot") budget = s.super_rot.common.budget_s;

        bool active = false;
        for (const std::string& a : cfg.active)
            if (a == name) active = true;

        char line[128];
        snprintf(line, sizeof(line), "%-12s%-10s%s\n", name.c_str(),
                 (format_fixed(budget, 1) + "s").c_str(), active ? "yes" : "no");
        std::cout << line;
    }
}

// ---------------------------------------------------------------------------
// Presentation
// ---------------------------------------------------------------------------

static void print_candidates(const std::vector<Candidate>& ranked, const std::string& hint_mode) {
    if (ranked.empty()) {
        std::cout << "No candidates produced.\n";
        return;
    }
    for (size_t i = 0; i < ranked.size(); i++) {
        const Candidate& c = ranked[i];
        char head[64];
        snprintf(head, sizeof(head), "[%zu] score=%.3f  algo=%-10s ", i + 1, c.score,
                 c.strategy_name.c_str());
        std::cout << head << c.provenance << "\n";
        std::cout << "     raw:   " << safe_preview(c.text, c.text.size()) << "\n";

        if (hint_mode == "always") {
            std::cout << "     snake: " << snake_from_camel(c.text) << "\n";
        } else if (hint_mode == "auto") {
            std::string label, value;
            if (smart_hint(c.text, label, value))
                std::cout << "     " << label << ": " << value << "\n";
        }
        std::cout << "\n";
    }
    std::cout.flush();
}

static void print_json(const std::vector<Candidate>& ranked, const PipelineResult& run) {
    std::ostringstream json;
    json << "{\n";
    json << "    \"results\": [\n";
    for (size_t i = 0; i < ranked.size(); i++) {
        const Candidate& c = ranked[i];
        json << "        {\n";
        json << "            \"score\": " << std::fixed << std::setprecision(3) << c.score << ",\n";
        json << "            \"algo\": \"" << json_escape(c.strategy_name) << "\",\n";
        json << "            \"provenance\": \"" << json_escape(c.provenance) << "\",\n";
        json << "            \"text\": \"" << json_escape(c.text) << "\"\n";
        json << "        }";
        if (i + 1 < ranked.size()) json << ",";
        json << "\n";
    }
    json << "    ],\n";
    json << "    \"total_candidates\": " << run.candidates.size() << ",\n";
    json << "    \"budget_exhausted\": " << (run.budget_exhausted ? "true" : "false") << ",\n";
    json << "    \"elapsed\": " << std::fixed << std::setprecision(2) << run.elapsed_s << "\n";
    json << "}\n";

    std::cout << "[RESULTS_JSON]\n" << json.str();
    std::cout.flush();
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);
    set_quiet(opts.quiet);

    // ── Build registry & configuration ───────────────────────────────────
    auto registry = build_strategy_registry();
    std::vector<std::string> names = registry_names(registry);

    RunConfig cfg;
    std::string err;
    if (!opts.config_path.empty()) {
        if (!load_config_file(opts.config_path, cfg, err)) {
            error(err);
            return 1;
        }
        info("Loaded config: " + opts.config_path);
    }
    for (const auto& kv : opts.overrides) {
        if (!apply_option(cfg, kv.first, kv.second, err)) {
            error(err);
            return 1;
        }
    }
    if (!validate_run_config(cfg, names, err)) {
        error(err);
        return 1;
    }

    if (opts.list_strategies) {
        list_strategies_cmd(names, cfg);
        return 0;
    }

    if (!opts.have_ciphertext) {
        usage();
        return 1;
    }

    std::string active;
    for (size_t i = 0; i < cfg.active.size(); i++) {
        if (i > 0) active += ", ";
        active += cfg.active[i];
    }
    info("Ciphertext: " + std::to_string(opts.ciphertext.size()) + " bytes, \"" +
         safe_preview(opts.ciphertext, 60) + "\"");
    info("Strategies: " + active + " (global budget " + format_fixed(cfg.total_budget_s, 1) + "s)");

    // ── Run & rank ───────────────────────────────────────────────────────
    PipelineResult run = run_pipeline(opts.ciphertext, cfg, registry);
    std::vector<Candidate> ranked = rank_candidates(run.candidates, ranking_options(cfg));

    if (run.budget_exhausted)
        warn("Global time budget exceeded; returning best-so-far");

    // ── Final output ─────────────────────────────────────────────────────
    std::cout << "[DONE] " << run.candidates.size() << " candidates, "
              << ranked.size() << " shown\n\n";
    print_candidates(ranked, cfg.show_hint);

    if (opts.json)
        print_json(ranked, run);

    info("Completed in " + format_fixed(run.elapsed_s, 2) + "s");
    return 0;
}
