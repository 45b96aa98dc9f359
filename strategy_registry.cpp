/**
 * Name -> strategy dispatch table, built once at startup.
 */

#include "strategies.h"

void register_codec_strategies(std::map<std::string, StrategyFunc>& m) {
    m["base64"] = bind_strategy(&StrategySettings::base64, run_base64);
    m["base58"] = bind_strategy(&StrategySettings::base58, run_base58);
    m["base45"] = bind_strategy(&StrategySettings::base45, run_base45);
    m["base91"] = bind_strategy(&StrategySettings::base91, run_base91);
}

std::map<std::string, StrategyFunc> build_strategy_registry() {
    std::map<std::string, StrategyFunc> m;

    // ── Encoding families ──
    register_codec_strategies(m);

    // ── Letter shifts ──
    register_rot_strategies(m);

    return m;
}

std::vector<std::string> registry_names(const std::map<std::string, StrategyFunc>& registry) {
    std::vector<std::string> names;
    for (const auto& kv : registry) names.push_back(kv.first);
    return names;
}
