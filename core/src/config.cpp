#include "conjure/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>

namespace conjure {

Profile detect_profile() {
    const char* env = std::getenv("CONJURE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker processes are started.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CONJURE_WORKER_TIMEOUT_MS",            "30000", NO_OVERWRITE);
            setenv("CONJURE_GENERATOR_TIMEOUT_MS",         "120000", NO_OVERWRITE);
            setenv("CONJURE_PROMOTION_SHADOW",             "1",     NO_OVERWRITE);
            setenv("CONJURE_PROMOTION_ENFORCE",            "0",     NO_OVERWRITE);
            setenv("CONJURE_CONTINUITY_ENFORCE",           "0",     NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CONJURE_WORKER_TIMEOUT_MS",            "10000", NO_OVERWRITE);
            setenv("CONJURE_GENERATOR_TIMEOUT_MS",         "60000", NO_OVERWRITE);
            setenv("CONJURE_PROMOTION_SHADOW",             "1",     NO_OVERWRITE);
            setenv("CONJURE_PROMOTION_ENFORCE",            "1",     NO_OVERWRITE);
            setenv("CONJURE_CONTINUITY_ENFORCE",           "1",     NO_OVERWRITE);
            break;
    }
}

bool env_true(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

int env_int(const char* name, int def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    try { return std::stoi(v); } catch (const std::exception&) { return def; }
}

static double env_double(const char* name, double def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    try { return std::stod(v); } catch (const std::exception&) { return def; }
}

std::string env_str(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    return std::string(v);
}

std::vector<std::string> env_list(const char* name) {
    std::vector<std::string> out;
    const std::string raw = env_str(name);
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        std::string item = raw.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) out.push_back(item);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return out;
}

// Where conjure/program_api.h is installed; set by the build.
#ifndef CONJURE_DEFAULT_INCLUDE_DIR
#define CONJURE_DEFAULT_INCLUDE_DIR ""
#endif

static std::string default_toolstore_root() {
    if (const char* home = std::getenv("HOME")) {
        if (*home) return std::string(home) + "/.conjure";
    }
    return ".conjure";
}

RuntimeConfig RuntimeConfig::from_env() {
    RuntimeConfig c;
    c.profile = detect_profile();

    c.toolstore_root = env_str("CONJURE_TOOLSTORE_ROOT", default_toolstore_root());
    c.env_root = env_str("CONJURE_ENV_ROOT", c.toolstore_root + "/envs");
    c.log_path = env_str("CONJURE_LOG_PATH", c.toolstore_root + "/invocations.jsonl");
    c.model = env_str("CONJURE_MODEL", c.model);

    c.generator_cmd = env_str("CONJURE_GENERATOR_CMD");
    c.generator_timeout_ms = std::max(1, env_int("CONJURE_GENERATOR_TIMEOUT_MS", c.generator_timeout_ms));
    c.max_generation_attempts = std::max(1, env_int("CONJURE_MAX_GENERATION_ATTEMPTS", c.max_generation_attempts));

    c.guardrail_recovery_budget = std::max(0, env_int("CONJURE_GUARDRAIL_RECOVERY_BUDGET", c.guardrail_recovery_budget));
    c.fresh_outcome_repair_budget = std::max(0, env_int("CONJURE_OUTCOME_REPAIR_BUDGET", c.fresh_outcome_repair_budget));
    c.execution_repair_budget = std::max(0, env_int("CONJURE_EXECUTION_REPAIR_BUDGET", c.execution_repair_budget));
    c.max_repairs_before_regen = std::max(0, env_int("CONJURE_MAX_REPAIRS_BEFORE_REGEN", c.max_repairs_before_regen));
    c.max_delegation_depth = std::max(0, env_int("CONJURE_MAX_DELEGATION_DEPTH", c.max_delegation_depth));

    c.worker_bin = env_str("CONJURE_WORKER_BIN", c.worker_bin);
    c.worker_timeout_ms = std::max(1, env_int("CONJURE_WORKER_TIMEOUT_MS", c.worker_timeout_ms));
    c.max_restarts = std::max(0, env_int("CONJURE_WORKER_MAX_RESTARTS", c.max_restarts));

    c.program_cache_dir = env_str("CONJURE_PROGRAM_CACHE_DIR", c.toolstore_root + "/programs");
    c.cxx = env_str("CONJURE_CXX");
    c.include_dir = env_str("CONJURE_INCLUDE_DIR", CONJURE_DEFAULT_INCLUDE_DIR);
    c.compile_timeout_ms = std::max(1, env_int("CONJURE_COMPILE_TIMEOUT_MS", c.compile_timeout_ms));

    c.dependency_policy.allowed = env_list("CONJURE_ALLOWED_DEPS");
    c.dependency_policy.has_allowed = std::getenv("CONJURE_ALLOWED_DEPS") != nullptr;
    c.dependency_policy.blocked = env_list("CONJURE_BLOCKED_DEPS");
    c.dependency_policy.source_mode = env_str("CONJURE_SOURCE_MODE", "public");
    c.dependency_policy.internal_sources = env_list("CONJURE_INTERNAL_SOURCES");

    PromotionPolicy& p = c.promotion_policy;
    p.min_calls = std::max(1, env_int("CONJURE_PROMOTION_MIN_CALLS", p.min_calls));
    p.min_sessions = std::max(1, env_int("CONJURE_PROMOTION_MIN_SESSIONS", p.min_sessions));
    p.min_contract_pass_rate = env_double("CONJURE_PROMOTION_MIN_CONTRACT_PASS_RATE", p.min_contract_pass_rate);
    p.min_state_key_consistency_ratio =
        env_double("CONJURE_PROMOTION_MIN_STATE_KEY_CONSISTENCY", p.min_state_key_consistency_ratio);

    c.promotion_shadow_mode_enabled = env_true("CONJURE_PROMOTION_SHADOW", true);
    c.promotion_enforcement_enabled = env_true("CONJURE_PROMOTION_ENFORCE", false);
    c.continuity_enforcement_enabled = env_true("CONJURE_CONTINUITY_ENFORCE", false);

    c.debug = env_true("CONJURE_DEBUG", false);
    return c;
}

} // namespace conjure
