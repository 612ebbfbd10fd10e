#include "test_common.h"

#include "conjure/artifact_store.h"
#include "conjure/fs_util.h"
#include "conjure/hash.h"

#include <filesystem>
#include <string>

using namespace conjure;
namespace fs = std::filesystem;

namespace {

ArtifactUpdate update_for(const std::string& code, bool ok, const std::string& trace) {
    ArtifactUpdate u;
    u.role = "counter";
    u.method_name = "increment";
    u.code = code;
    u.cacheable = true;
    u.cacheability_reason = "stable_behavior";
    u.prompt_version = "p1";
    u.model = "test-model";
    u.outcome = ok ? Outcome::success("1", "counter", "increment") : Outcome::failure("timeout", "slow", true);
    u.trace_id = trace;
    u.duration_ms = 12.34;
    return u;
}

ArtifactSelectOptions default_select() {
    ArtifactSelectOptions o;
    o.prompt_version = "p1";
    return o;
}

} // namespace

int main() {
    const fs::path root = fresh_test_dir("conjure_test_artifact_store");
    ArtifactStore store(root);
    PromotionSettings promo;
    promo.policy.min_calls = 3;
    promo.policy.min_sessions = 2;

    const std::string code_a = "host.memory_set(\"count\", \"1\");\nhost.ok(\"1\");";
    const std::string code_b = "host.ok(\"2\");";

    // first forge
    {
        std::string err;
        PromotionDecision d;
        expect_true(store.persist(update_for(code_a, true, "s1"), promo, &d, &err), "persist: " + err);
        expect_true(d.evaluated, "shadow decision evaluated");
        expect_eq_str(d.lifecycle_state, "probation", "first success");

        auto a = store.load("counter", "increment");
        expect_true(a.has_value(), "loads");
        expect_eq_str(a->code_checksum, hash::code_checksum(code_a), "checksum");
        expect_eq_ll(a->success_count, 1, "success counted");
        expect_eq_ll((long long)a->history.size(), 1, "history entry");
        expect_eq_str(a->history[0].trigger, "initial_forge", "initial trigger");
        expect_true(a->history[0].parent_id.empty(), "no parent");
        expect_eq_str(a->runtime_version, CONJURE_RUNTIME_VERSION, "runtime version");
        expect_true(a->cacheable.value_or(false), "cacheable");
        expect_true(fs::exists(root / "artifacts" / "counter" / "increment.json"), "one file per method");
    }

    // reuse gate
    {
        auto sel = store.select("counter", "increment", default_select());
        expect_true(sel.has_value(), "selected");
        expect_eq_str(sel->selected_checksum, hash::code_checksum(code_a), "selected checksum");

        ArtifactSelectOptions other_prompt = default_select();
        other_prompt.prompt_version = "p2";
        expect_true(!store.select("counter", "increment", other_prompt), "prompt version mismatch");

        ArtifactSelectOptions contract = default_select();
        contract.contract_fingerprint = contract_fingerprint("{\"required\":[\"body\"]}");
        expect_true(!store.select("counter", "increment", contract), "contract mismatch");
        expect_true(!store.select("counter", "missing", default_select()), "absent");
    }

    // contract fingerprints ignore key order
    {
        expect_eq_str(contract_fingerprint(""), "none", "no contract");
        expect_eq_str(contract_fingerprint("{\"a\":1,\"b\":2}"), contract_fingerprint("{ \"b\":2, \"a\":1 }"),
                      "canonical fingerprint");
        expect_true(contract_fingerprint("{\"a\":1}").rfind("sha256:", 0) == 0, "prefix");
    }

    // new code, repairs and the history cap
    {
        std::string err;
        ArtifactUpdate u = update_for(code_b, true, "s2");
        expect_true(store.persist(u, promo, nullptr, &err), err);
        auto a = store.load("counter", "increment");
        expect_eq_str(a->history[0].trigger, "regenerate:new_code", "new code");
        expect_eq_str(a->history[0].parent_id, a->history[1].id, "parent link");

        ArtifactUpdate r = update_for("host.ok(\"3\");", true, "s3");
        r.trigger = "repair:adaptive_failure";
        r.trigger_stage = "execution";
        r.trigger_error_class = "adaptive";
        expect_true(store.persist(r, promo, nullptr, &err), err);
        a = store.load("counter", "increment");
        expect_eq_ll(a->repair_count_since_regen, 1, "repair counted");
        expect_true(!a->last_repaired_at.empty(), "repair time");

        // same code again: no history entry
        expect_true(store.persist(r, promo, nullptr, &err), err);
        a = store.load("counter", "increment");
        expect_eq_ll((long long)a->history.size(), 3, "history");

        ArtifactUpdate g = update_for("host.ok(\"4\");", true, "s4");
        g.trigger = "regenerate:repair_failed";
        expect_true(store.persist(g, promo, nullptr, &err), err);
        a = store.load("counter", "increment");
        expect_eq_ll((long long)a->history.size(), ARTIFACT_HISTORY_MAX, "history capped");
        expect_eq_str(a->history[0].trigger, "regenerate:repair_failed", "newest first");
        expect_eq_ll(a->repair_count_since_regen, 0, "regeneration resets repairs");

        // returning to a known version
        expect_true(store.persist(update_for(code_a, true, "s5"), promo, nullptr, &err), err);
        a = store.load("counter", "increment");
        expect_eq_str(a->history[0].trigger, "fallback:durable", "known version");
    }

    // failure classification
    {
        std::string err;
        expect_true(store.persist(update_for(code_a, false, "s6"), promo, nullptr, &err), err);
        auto a = store.load("counter", "increment");
        expect_eq_ll(a->extrinsic_failure_count, 1, "timeout is extrinsic");
        expect_eq_str(a->last_failure_class, "extrinsic", "class");
        expect_eq_str(a->last_failure_reason, "slow", "reason");
        expect_true(a->recent_failure_rate > 0.0 && a->recent_failure_rate < 1.0, "failure rate");
    }

    // checksum gate
    {
        auto a = store.load("counter", "increment");
        Artifact tampered = *a;
        tampered.code = "host.ok(\"tampered\");";
        std::string err;
        expect_true(store.write(tampered, &err), err);
        expect_true(!store.select("counter", "increment", default_select()), "tampered code is a miss");
        expect_true(store.write(*a, &err), err);
        expect_true(store.select("counter", "increment", default_select()).has_value(), "restored");
    }

    // non-cacheable
    {
        ArtifactUpdate u = update_for(code_a, true, "s7");
        u.method_name = "ask";
        u.cacheable = false;
        u.cacheability_reason = "dynamic_dispatch_method";
        std::string err;
        expect_true(store.persist(u, promo, nullptr, &err), err);
        expect_true(store.load("counter", "ask").has_value(), "persisted anyway");
        expect_true(!store.select("counter", "ask", default_select()), "never reused");
        expect_true(is_dynamic_dispatch_method("ask") && !is_dynamic_dispatch_method("increment"), "dynamic");
    }

    // blank code is never written
    {
        ArtifactUpdate u = update_for("   \n", true, "s8");
        u.method_name = "blank";
        expect_true(store.persist(u, promo, nullptr, nullptr), "blank is a no-op");
        expect_true(!store.load("counter", "blank"), "nothing written");
    }

    // legacy degradation without a lifecycle
    {
        Artifact a;
        a.role = "legacy";
        a.method_name = "run";
        a.code = code_b;
        a.code_checksum = hash::code_checksum(code_b);
        a.cacheable = true;
        a.prompt_version = "p1";
        a.failure_count = 3;
        a.success_count = 1;
        a.recent_failure_rate = 0.75;
        expect_true(artifact_legacy_degraded(a), "degraded");
        expect_true(store.write(a, nullptr), "write");
        expect_true(!store.select("legacy", "run", default_select()), "degraded legacy record is a miss");
    }

    // enforced selection falls back to the durable version
    {
        ArtifactStore enforced(fresh_test_dir("conjure_test_artifact_enforced"));
        std::string err;
        for (const char* trace : {"e1", "e2", "e3"}) {
            expect_true(enforced.persist(update_for(code_a, true, trace), promo, nullptr, &err), err);
        }
        PromotionDecision d;
        expect_true(enforced.persist(update_for(code_b, true, "e4"), promo, &d, &err), err);
        expect_eq_str(d.lifecycle_state, "probation", "new version on probation");

        ArtifactSelectOptions opts = default_select();
        opts.enforcement = true;
        auto sel = enforced.select("counter", "increment", opts);
        expect_true(sel.has_value(), "selected under enforcement");
        expect_eq_str(sel->code, code_a, "durable code served");
        expect_eq_str(sel->selected_lifecycle_state, "durable", "durable state");

        auto shadow = enforced.select("counter", "increment", default_select());
        expect_eq_str(shadow->code, code_b, "shadow mode serves the latest code");
    }

    // corrupt files are quarantined
    {
        const fs::path p = store.path_for("counter", "increment");
        expect_true(write_atomic(p, "{not json").empty(), "write garbage");
        expect_true(!store.load("counter", "increment"), "corrupt is a miss");
        expect_true(!fs::exists(p), "moved aside");
        bool found = false;
        for (const auto& e : fs::directory_iterator(p.parent_path())) {
            if (contains(e.path().filename().string(), "increment.json.corrupt-")) found = true;
        }
        expect_true(found, "quarantine file present");
    }
    return 0;
}
