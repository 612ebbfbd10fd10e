#pragma once

#include "conjure/dependency_manifest.h"
#include "conjure/promotion.h"

#include <string>
#include <vector>

namespace conjure {

enum class Profile { DEV, PROD };

// Detect profile from CONJURE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (generous worker timeouts, promotion shadow only)
// PROD: strict (tight worker timeouts, promotion and continuity enforced)
void apply_profile_defaults(Profile p);

bool env_true(const char* name, bool def = false);
int env_int(const char* name, int def);
std::string env_str(const char* name, const std::string& def = "");
// Comma-separated list; blanks dropped.
std::vector<std::string> env_list(const char* name);

struct RuntimeConfig {
    Profile profile{Profile::DEV};

    std::string toolstore_root;   // artifacts/, registry.json
    std::string env_root;         // materialized dependency environments
    std::string log_path;         // invocation JSONL log ("" = disabled)
    std::string model{"default"};
    std::string prompt_version{"conjure-prompt-v1"};

    // generation
    std::string generator_cmd;
    int generator_timeout_ms{120000};
    int max_generation_attempts{2};

    // budgets
    int guardrail_recovery_budget{1};
    int fresh_outcome_repair_budget{1};
    int execution_repair_budget{1};
    int max_repairs_before_regen{3};
    int max_delegation_depth{0};  // 0 = unlimited

    // workers
    std::string worker_bin{"conjure_worker"};
    int worker_timeout_ms{30000};
    int max_restarts{2};

    // compiled programs
    std::string program_cache_dir;
    std::string cxx;
    std::string include_dir;
    int compile_timeout_ms{60000};

    DependencyPolicy dependency_policy;

    PromotionPolicy promotion_policy;
    bool promotion_shadow_mode_enabled{true};
    bool promotion_enforcement_enabled{false};
    bool continuity_enforcement_enabled{false};

    bool debug{false};

    // Reads CONJURE_* variables. Call apply_profile_defaults first.
    static RuntimeConfig from_env();
};

} // namespace conjure
