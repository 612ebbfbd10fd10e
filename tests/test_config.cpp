#include "test_common.h"
#include "conjure/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("CONJURE_PROFILE");
    auto p = conjure::detect_profile();
    expect_true(p == conjure::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("CONJURE_PROFILE", "Production", 1);
    p = conjure::detect_profile();
    expect_true(p == conjure::Profile::PROD, "should detect PROD");

    // Test 3: Apply defaults (won't override existing)
    setenv("CONJURE_WORKER_TIMEOUT_MS", "42", 1);
    unsetenv("CONJURE_PROMOTION_ENFORCE");
    conjure::apply_profile_defaults(conjure::Profile::PROD);
    std::string val = std::getenv("CONJURE_WORKER_TIMEOUT_MS") ? std::getenv("CONJURE_WORKER_TIMEOUT_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");
    val = std::getenv("CONJURE_PROMOTION_ENFORCE") ? std::getenv("CONJURE_PROMOTION_ENFORCE") : "";
    expect_true(val == "1", "PROD should enforce promotion");

    // Test 4: RuntimeConfig picks the variables up
    setenv("CONJURE_TOOLSTORE_ROOT", "/tmp/conjure_cfg", 1);
    setenv("CONJURE_WORKER_MAX_RESTARTS", "-3", 1);
    setenv("CONJURE_GUARDRAIL_RECOVERY_BUDGET", "4", 1);
    setenv("CONJURE_ALLOWED_DEPS", " json-c , ,zlib", 1);
    setenv("CONJURE_PROMOTION_MIN_CALLS", "not-a-number", 1);
    auto c = conjure::RuntimeConfig::from_env();
    expect_true(c.profile == conjure::Profile::PROD, "profile");
    expect_eq_str(c.env_root, "/tmp/conjure_cfg/envs", "env root under the toolstore");
    expect_eq_str(c.log_path, "/tmp/conjure_cfg/invocations.jsonl", "log under the toolstore");
    expect_eq_ll(c.worker_timeout_ms, 42, "worker timeout");
    expect_eq_ll(c.max_restarts, 0, "negative restarts clamp to 0");
    expect_eq_ll(c.guardrail_recovery_budget, 4, "guardrail budget");
    expect_true(c.dependency_policy.has_allowed, "allow list present");
    expect_eq_ll((long long)c.dependency_policy.allowed.size(), 2, "blank entries dropped");
    expect_eq_str(c.dependency_policy.allowed[0], "json-c", "trimmed");
    expect_eq_ll(c.promotion_policy.min_calls, 10, "malformed ints keep the default");
    expect_true(c.promotion_enforcement_enabled && c.continuity_enforcement_enabled, "PROD enforcement");

    // Test 5: Profile name
    expect_true(std::string(conjure::profile_name(conjure::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(conjure::profile_name(conjure::Profile::PROD)) == "prod", "prod name");

    // Cleanup
    for (const char* k : {"CONJURE_PROFILE", "CONJURE_WORKER_TIMEOUT_MS", "CONJURE_PROMOTION_ENFORCE",
                          "CONJURE_CONTINUITY_ENFORCE", "CONJURE_PROMOTION_SHADOW", "CONJURE_GENERATOR_TIMEOUT_MS",
                          "CONJURE_TOOLSTORE_ROOT", "CONJURE_WORKER_MAX_RESTARTS",
                          "CONJURE_GUARDRAIL_RECOVERY_BUDGET", "CONJURE_ALLOWED_DEPS",
                          "CONJURE_PROMOTION_MIN_CALLS"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
