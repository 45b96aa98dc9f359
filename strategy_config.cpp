/**
 * Run / strategy configuration
 *
 * A JSON config file ("active_modules", "global", "modules.<strategy>") and
 * repeated --set key=value flags both end up as dotted options, parsed
 * straight into the typed option structures. Everything is checked here,
 * once, so the strategies read plain fields with no fallback logic of their
 * own.
 */

#include "strategy_config.h"
#include "cryptopp_codecs.h"
#include "text_utils.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Value parsers
// ---------------------------------------------------------------------------

static bool parse_double(const std::string& s, double& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    // nan and inf would disable every budget check downstream
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

static bool parse_int(const std::string& s, int& out) {
    std::string t = trim(s);
    if (t.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    if (v < -1000000 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parse_size(const std::string& s, size_t& out) {
    int v;
    if (!parse_int(s, v) || v < 0) return false;
    out = static_cast<size_t>(v);
    return true;
}

static bool parse_bool(const std::string& s, bool& out) {
    std::string t = to_lower(trim(s));
    if (t == "true" || t == "1" || t == "yes" || t == "on") { out = true; return true; }
    if (t == "false" || t == "0" || t == "no" || t == "off") { out = false; return true; }
    return false;
}

static bool parse_int_list(const std::string& s, std::vector<int>& out) {
    std::vector<int> values;
    for (const std::string& item : split_list(s)) {
        int v;
        if (!parse_int(item, v)) return false;
        values.push_back(v);
    }
    out = values;
    return true;
}

static bool one_of(const std::string& v, const std::vector<std::string>& allowed) {
    return std::find(allowed.begin(), allowed.end(), v) != allowed.end();
}

static bool bad_value(const std::string& key, const std::string& value, std::string& err) {
    err = "Invalid value for '" + key + "': '" + value + "'";
    return false;
}

// ---------------------------------------------------------------------------
// Field groups shared by several strategies
// ---------------------------------------------------------------------------

enum class FieldResult { Applied, Unknown, Invalid };

static FieldResult apply_common(CommonOptions& o, const std::string& field, const std::string& value) {
    if (field == "budget_s") {
        double v;
        if (!parse_double(value, v) || v < 0.0) return FieldResult::Invalid;
        o.budget_s = v;
        return FieldResult::Applied;
    }
    if (field == "text_to_decipher") {
        o.has_override = true;
        o.text_to_decipher = value;
        return FieldResult::Applied;
    }
    return FieldResult::Unknown;
}

// scan_substrings / min_token_len / periodic_max_k / min_plain_len
template<typename OptionsT>
static FieldResult apply_salvage(OptionsT& o, const std::string& field, const std::string& value) {
    FieldResult r = apply_common(o.common, field, value);
    if (r != FieldResult::Unknown) return r;

    bool ok = true;
    if (field == "scan_substrings")     ok = parse_bool(value, o.scan_substrings);
    else if (field == "min_token_len")  ok = parse_size(value, o.min_token_len);
    else if (field == "periodic_max_k") ok = parse_int(value, o.periodic_max_k) && o.periodic_max_k >= 0;
    else if (field == "min_plain_len")  ok = parse_size(value, o.min_plain_len);
    else return FieldResult::Unknown;
    return ok ? FieldResult::Applied : FieldResult::Invalid;
}

static FieldResult apply_base64(Base64Options& o, const std::string& field, const std::string& value) {
    FieldResult r = apply_salvage(o, field, value);
    if (r != FieldResult::Unknown) return r;

    bool ok = true;
    if (field == "nested_passes")           ok = parse_int(value, o.nested_passes) && o.nested_passes >= 0;
    else if (field == "allow_urlsafe")      ok = parse_bool(value, o.allow_urlsafe);
    else if (field == "aggressive_salvage") ok = parse_bool(value, o.aggressive_salvage);
    else if (field == "digit_combo_k")      ok = parse_int(value, o.digit_combo_k) && o.digit_combo_k >= 0;
    else if (field == "kgram_topk")         ok = parse_int(value, o.kgram_topk) && o.kgram_topk >= 0;
    else if (field == "kgram_lengths") {
        ok = parse_int_list(value, o.kgram_lengths);
        for (int len : o.kgram_lengths)
            if (len < 1) ok = false;
    }
    else return FieldResult::Unknown;
    return ok ? FieldResult::Applied : FieldResult::Invalid;
}

static FieldResult apply_base58(Base58Options& o, const std::string& field, const std::string& value) {
    FieldResult r = apply_salvage(o, field, value);
    if (r != FieldResult::Unknown) return r;

    bool ok = true;
    if (field == "nested_passes")           ok = parse_int(value, o.nested_passes) && o.nested_passes >= 0;
    else if (field == "aggressive_salvage") ok = parse_bool(value, o.aggressive_salvage);
    else if (field == "alphabets") {
        o.alphabets = split_list(value);
        std::vector<std::string> known = base58_alphabet_names();
        ok = !o.alphabets.empty();
        for (const std::string& a : o.alphabets)
            if (!one_of(a, known)) ok = false;
    }
    else if (field == "check_modes") {
        o.check_modes = split_list(value);
        for (const std::string& m : o.check_modes)
            if (!one_of(m, {"none", "b58check"})) ok = false;
    }
    else return FieldResult::Unknown;
    return ok ? FieldResult::Applied : FieldResult::Invalid;
}

static FieldResult apply_rotn(RotNOptions& o, const std::string& field, const std::string& value) {
    FieldResult r = apply_common(o.common, field, value);
    if (r != FieldResult::Unknown) return r;

    if (field != "n") return FieldResult::Unknown;
    if (to_lower(trim(value)) == "all") {
        o.all = true;
        return FieldResult::Applied;
    }
    int n;
    if (!parse_int(value, n)) return FieldResult::Invalid;
    o.all = false;
    o.n = ((n % 26) + 26) % 26;
    return FieldResult::Applied;
}

static FieldResult apply_super_rot(SuperRotOptions& o, const std::string& field, const std::string& value) {
    FieldResult r = apply_common(o.common, field, value);
    if (r != FieldResult::Unknown) return r;

    bool ok = true;
    if (field == "max_abs_step") ok = parse_int(value, o.max_abs_step) && o.max_abs_step >= 1;
    else if (field == "start_keys") {
        ok = parse_int_list(value, o.start_keys) && !o.start_keys.empty();
        for (int k : o.start_keys)
            if (k < 0 || k > 25) ok = false;
    }
    else if (field == "modes") {
        o.modes = split_list(value);
        ok = !o.modes.empty();
        for (const std::string& m : o.modes)
            if (!one_of(m, {"decode", "encode"})) ok = false;
    }
    else if (field == "orders") {
        o.orders = split_list(value);
        ok = !o.orders.empty();
        for (const std::string& d : o.orders)
            if (!one_of(d, {"LTR", "RTL"})) ok = false;
    }
    else return FieldResult::Unknown;
    return ok ? FieldResult::Applied : FieldResult::Invalid;
}

static FieldResult apply_global(RunConfig& cfg, const std::string& field, const std::string& value) {
    bool ok = true;
    if (field == "total_budget_s") {
        double v;
        ok = parse_double(value, v) && v >= 0.0;
        if (ok) cfg.total_budget_s = v;
    }
    else if (field == "top_k")                ok = parse_size(value, cfg.top_k);
    else if (field == "per_algo_cap")         ok = parse_size(value, cfg.per_algo_cap);
    else if (field == "promote_top_per_algo") ok = parse_bool(value, cfg.promote_top_per_algo);
    else if (field == "show_hint") {
        cfg.show_hint = to_lower(trim(value));
        ok = one_of(cfg.show_hint, {"auto", "always", "never"});
    }
    else return FieldResult::Unknown;
    return ok ? FieldResult::Applied : FieldResult::Invalid;
}

// ---------------------------------------------------------------------------
// Public entry points
// ---------------------------------------------------------------------------

std::string resolve_ciphertext(const std::string& ciphertext, const CommonOptions& common) {
    if (!common.has_override) return ciphertext;

    std::string out;
    const std::string& tmpl = common.text_to_decipher;
    size_t pos = 0;
    while (true) {
        size_t hit = tmpl.find("%c", pos);
        if (hit == std::string::npos) {
            out += tmpl.substr(pos);
            break;
        }
        out += tmpl.substr(pos, hit - pos);
        out += ciphertext;
        pos = hit + 2;
    }
    return out;
}

bool apply_option(RunConfig& cfg, const std::string& key, const std::string& value,
                  std::string& err) {
    std::string k = trim(key);
    if (k == "active") {
        cfg.active = split_list(value);
        return true;
    }

    // a rejected value leaves cfg untouched
    RunConfig next = cfg;

    size_t dot = k.find('.');
    if (dot == std::string::npos) {
        err = "Unknown option '" + k + "'";
        return false;
    }
    std::string section = k.substr(0, dot);
    std::string field = k.substr(dot + 1);

    FieldResult r;
    StrategySettings& s = next.strategies;
    if (section == "global")         r = apply_global(next, field, value);
    else if (section == "base64")    r = apply_base64(s.base64, field, value);
    else if (section == "base58")    r = apply_base58(s.base58, field, value);
    else if (section == "base45")    r = apply_salvage(s.base45, field, value);
    else if (section == "base91")    r = apply_salvage(s.base91, field, value);
    else if (section == "rotN")      r = apply_rotn(s.rotN, field, value);
    else if (section == "super_rot") r = apply_super_rot(s.super_rot, field, value);
    else {
        err = "Unknown section '" + section + "' in option '" + k + "'";
        return false;
    }

    if (r == FieldResult::Unknown) {
        err = "Unknown option '" + k + "'";
        return false;
    }
    if (r == FieldResult::Invalid)
        return bad_value(k, value, err);
    cfg = next;
    return true;
}

bool apply_assignment(RunConfig& cfg, const std::string& assignment, std::string& err) {
    size_t eq = assignment.find('=');
    if (eq == std::string::npos) {
        err = "Expected key=value, got '" + assignment + "'";
        return false;
    }
    std::string value = assignment.substr(eq + 1);
    // text_to_decipher keeps its surrounding whitespace
    if (assignment.substr(0, eq).find("text_to_decipher") == std::string::npos)
        value = trim(value);
    return apply_option(cfg, assignment.substr(0, eq), value, err);
}

// ---------------------------------------------------------------------------
// JSON config file
// ---------------------------------------------------------------------------

// Scalars and flat lists become the text a --set assignment would carry.
static bool json_option_text(const json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_float()) {
        out = v.dump();
        return true;
    }
    if (v.is_array()) {
        std::string joined;
        for (size_t i = 0; i < v.size(); i++) {
            std::string item;
            if (v[i].is_array() || !json_option_text(v[i], item)) return false;
            if (i > 0) joined += ',';
            joined += item;
        }
        out = joined;
        return true;
    }
    return false;
}

static bool apply_json_option(RunConfig& cfg, const std::string& key, const json& v,
                              std::string& err) {
    std::string text;
    if (!json_option_text(v, text)) {
        err = "Invalid value for '" + key + "': " + v.dump();
        return false;
    }
    return apply_option(cfg, key, text, err);
}

static bool apply_json_section(RunConfig& cfg, const std::string& prefix, const json& section,
                               std::string& err) {
    if (!section.is_object()) {
        err = "'" + prefix + "' must be a JSON object";
        return false;
    }
    for (auto it = section.begin(); it != section.end(); ++it) {
        // null means "no override"
        if (it.key() == "text_to_decipher" && it.value().is_null()) continue;
        if (!apply_json_option(cfg, prefix + "." + it.key(), it.value(), err)) return false;
    }
    return true;
}

bool load_config_json(const std::string& text, RunConfig& cfg, std::string& err) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        err = std::string("Malformed config: ") + e.what();
        return false;
    }
    if (!root.is_object()) {
        err = "Config root must be a JSON object";
        return false;
    }

    RunConfig next = cfg;
    for (auto it = root.begin(); it != root.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();
        if (key == "active_modules") {
            if (!value.is_array()) {
                err = "'active_modules' must be a list of strategy names";
                return false;
            }
            if (!apply_json_option(next, "active", value, err)) return false;
        } else if (key == "global") {
            if (!apply_json_section(next, "global", value, err)) return false;
        } else if (key == "modules") {
            if (!value.is_object()) {
                err = "'modules' must be a JSON object";
                return false;
            }
            for (auto mod = value.begin(); mod != value.end(); ++mod)
                if (!apply_json_section(next, mod.key(), mod.value(), err)) return false;
        } else {
            err = "Unknown config key '" + key + "'";
            return false;
        }
    }
    cfg = next;
    return true;
}

bool load_config_file(const std::string& path, RunConfig& cfg, std::string& err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        err = "Config file not found: " + path;
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    std::string parse_err;
    if (!load_config_json(text, cfg, parse_err)) {
        err = path + ": " + parse_err;
        return false;
    }
    return true;
}

bool validate_run_config(const RunConfig& cfg, const std::vector<std::string>& known_strategies,
                         std::string& err) {
    if (cfg.active.empty()) {
        err = "No active strategies configured";
        return false;
    }
    for (const std::string& name : cfg.active) {
        if (!one_of(name, known_strategies)) {
            err = "Unknown strategy '" + name + "'";
            return false;
        }
    }
    std::vector<std::string> seen;
    for (const std::string& name : cfg.active) {
        if (one_of(name, seen)) {
            err = "Strategy '" + name + "' listed twice";
            return false;
        }
        seen.push_back(name);
    }
    return true;
}
