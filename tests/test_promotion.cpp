#include "test_common.h"

#include "conjure/promotion.h"

#include <map>
#include <string>

using namespace conjure;

namespace {

struct Harness {
    Lifecycle lc;
    std::map<std::string, Scorecard> scorecards;
    PromotionPolicy policy;
    int step{0};

    PromotionDecision call(const std::string& checksum, bool ok, const std::string& trace,
                           bool enforcement = false, const std::string& code = "host.ok(\"1\");") {
        CallObservation obs;
        obs.ok = ok;
        obs.error_type = ok ? "" : "execution";
        obs.error_message = ok ? "" : "boom";
        obs.code = code;
        obs.trace_id = trace;
        obs.timestamp = "2026-01-01T00:00:" + std::to_string(10 + step++) + ".000Z";
        Scorecard& sc = scorecards[checksum];
        sc.artifact_checksum = checksum;
        record_scorecard_call(sc, obs);
        return evaluate_promotion(lc, scorecards, checksum, ok, enforcement, policy, obs.timestamp, false);
    }

    std::string state(const std::string& checksum) const {
        auto it = lc.versions.find(checksum);
        return it == lc.versions.end() ? std::string() : it->second.lifecycle_state;
    }
};

} // namespace

int main() {
    // candidate -> probation -> durable, then degrade on sustained regression
    {
        Harness h;
        h.policy.min_calls = 3;
        h.policy.min_sessions = 2;

        PromotionDecision d = h.call("sha256:a", true, "t1");
        expect_true(d.evaluated, "evaluated");
        expect_eq_str(d.lifecycle_state, "probation", "first success leaves candidate");
        expect_eq_str(d.decision, "continue_probation", "decision");
        expect_eq_str(d.policy_version, "solver_promotion_v1", "policy version");

        expect_eq_str(h.call("sha256:a", true, "t2").lifecycle_state, "probation", "below min_calls");
        d = h.call("sha256:a", true, "t3");
        expect_eq_str(d.decision, "promote", "gate passes");
        expect_eq_str(h.state("sha256:a"), "durable", "durable");
        expect_eq_str(h.lc.incumbent_durable_checksum, "sha256:a", "incumbent");
        expect_true(contains(d.rationale_json, "\"gate_passed\":true"), "rationale");

        // isolated failures do not demote a durable version
        for (int i = 0; i < 4; i++) h.call("sha256:a", false, "t3");
        expect_eq_str(h.state("sha256:a"), "durable", "4 of 7 failed is not a regression");

        d = h.call("sha256:a", false, "t3");
        expect_eq_str(d.decision, "degrade", "5 of 8 failed");
        expect_eq_str(h.state("sha256:a"), "degraded", "degraded");
        expect_true(h.lc.incumbent_durable_checksum.empty(), "incumbent cleared");
        expect_eq_ll(h.lc.false_promotion_count, 1, "false promotion recorded");
        expect_true(h.lc.versions["sha256:a"].degraded_baseline.has_value(), "baseline kept");

        // re-promotion only counts calls after the degradation
        h.call("sha256:a", true, "t10");
        h.call("sha256:a", true, "t11");
        expect_eq_str(h.state("sha256:a"), "degraded", "two fresh calls are not enough");
        d = h.call("sha256:a", true, "t12");
        expect_eq_str(d.decision, "promote", "fresh window passes the gate");
        expect_eq_ll(h.lc.false_hold_count, 1, "false hold recorded");
        expect_true(!h.lc.versions["sha256:a"].degraded_baseline.has_value(), "baseline dropped");
        expect_eq_ll((long long)h.lc.evaluations.size(), 11, "one ledger entry per evaluation");
    }

    // sessions gate
    {
        Harness h;
        h.policy.min_calls = 3;
        h.policy.min_sessions = 2;
        for (int i = 0; i < 5; i++) h.call("sha256:b", true, "same-trace");
        expect_eq_str(h.state("sha256:b"), "probation", "one session never promotes");
    }

    // candidate degrades directly; enforcement degrades probation on failure
    {
        Harness h;
        h.call("sha256:c", false, "t1");
        h.call("sha256:c", false, "t2");
        expect_eq_str(h.state("sha256:c"), "candidate", "failures hold a candidate");
        expect_eq_str(h.call("sha256:c", false, "t3").decision, "degrade", "regressed candidate");

        Harness e;
        e.call("sha256:d", true, "t1", true);
        expect_eq_str(e.state("sha256:d"), "probation", "probation");
        expect_eq_str(e.call("sha256:d", false, "t2", true).lifecycle_state, "degraded", "enforced failure");
    }

    // divergent state keys drag the consistency ratio under the gate
    {
        Harness h;
        h.policy.min_calls = 3;
        h.policy.min_sessions = 1;
        h.policy.min_state_key_consistency_ratio = 0.7;
        h.call("sha256:e", true, "t1", false, "host.memory_set(\"stack\", v);");
        h.call("sha256:e", true, "t2", false, "host.memory_set(\"items\", v);");
        h.call("sha256:e", true, "t3", false, "host.memory_set(\"list\", v);");
        expect_eq_str(h.state("sha256:e"), "probation", "inconsistent keys block promotion");
    }

    // enforced selection order
    {
        Lifecycle lc;
        lc.versions["sha256:p"].lifecycle_state = "probation";
        lc.versions["sha256:d"].lifecycle_state = "durable";
        lc.versions["sha256:x"].lifecycle_state = "degraded";
        auto pick = select_lifecycle_version(lc, {"sha256:p", "sha256:d", "sha256:x"});
        expect_true(pick && pick->first == "sha256:d", "durable first");
        pick = select_lifecycle_version(lc, {"sha256:p", "sha256:x"});
        expect_true(pick && pick->second == "probation", "then probation");
        expect_true(!select_lifecycle_version(lc, {"sha256:x"}), "degraded is never selected");
    }

    // persistence
    {
        Harness h;
        h.policy.min_calls = 1;
        h.policy.min_sessions = 1;
        h.call("sha256:f", true, "t1");
        h.call("sha256:f", true, "t2");
        json_object* o = lifecycle_to_json(h.lc);
        Lifecycle back = lifecycle_from_json(o);
        json_object_put(o);
        expect_true(back.present, "present");
        expect_eq_str(back.incumbent_durable_checksum, "sha256:f", "incumbent survives");
        expect_eq_str(back.versions["sha256:f"].lifecycle_state, "durable", "state survives");
        expect_eq_ll((long long)back.evaluations.size(), 2, "ledger survives");

        json_object* s = scorecard_to_json(h.scorecards["sha256:f"]);
        Scorecard sc = scorecard_from_json(s);
        json_object_put(s);
        expect_eq_ll(sc.calls, 2, "calls");
        expect_eq_ll((long long)sc.sessions.size(), 2, "sessions");
        expect_eq_ll((long long)sc.short_window.size(), 2, "window");
    }
    std::cerr << "test_promotion: ALL PASSED" << std::endl;
    return 0;
}
