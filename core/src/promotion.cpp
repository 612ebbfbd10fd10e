#include "conjure/promotion.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <cmath>

namespace conjure {

namespace {

void push_window(std::vector<WindowEntry>& w, const WindowEntry& e, size_t cap) {
    w.push_back(e);
    if (w.size() > cap) w.erase(w.begin(), w.begin() + (long)(w.size() - cap));
}

// Share of observations that match the most common key set.
double state_key_ratio(const std::vector<std::vector<std::string>>& obs) {
    if (obs.empty()) return 1.0;
    std::map<std::string, int64_t> tally;
    for (const auto& keys : obs) {
        std::string sig = keys.empty() ? std::string() : keys.front();
        tally[sig]++;
    }
    int64_t best = 0;
    for (const auto& kv : tally) best = std::max(best, kv.second);
    return (double)best / (double)obs.size();
}

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

json_object* window_to_json(const std::vector<WindowEntry>& w) {
    json_object* arr = json_object_new_array();
    for (const auto& e : w) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "status", json_object_new_string(e.status.c_str()));
        json_object_object_add(o, "error_type",
                               e.error_type.empty() ? nullptr : json_object_new_string(e.error_type.c_str()));
        json_object_object_add(o, "at", json_object_new_string(e.at.c_str()));
        json_object_array_add(arr, o);
    }
    return arr;
}

std::vector<WindowEntry> window_from_json(json_object* o, const char* k) {
    std::vector<WindowEntry> out;
    json_object* arr = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &arr) || !json_object_is_type(arr, json_type_array)) return out;
    for (size_t i = 0; i < json_object_array_length(arr); i++) {
        json_object* it = json_object_array_get_idx(arr, i);
        WindowEntry e;
        json_get_string(it, "status", &e.status);
        json_get_string(it, "error_type", &e.error_type);
        json_get_string(it, "at", &e.at);
        out.push_back(e);
    }
    return out;
}

LifecycleEntry new_entry(const std::string& checksum, const Lifecycle& lc, const PromotionPolicy& p,
                         const std::string& ts, bool legacy_mode) {
    LifecycleEntry e;
    e.artifact_checksum = checksum;
    e.lifecycle_state = legacy_mode ? "probation" : "candidate";
    e.policy_version = p.version;
    e.incumbent_artifact_checksum = lc.incumbent_durable_checksum;
    e.compatibility_mode = legacy_mode;
    e.first_seen_at = ts;
    e.last_decision = "hold";
    e.last_decision_at = ts;
    return e;
}

json_object* metrics_to_json(const PromotionMetrics& m) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "calls", json_object_new_int64(m.calls));
    json_object_object_add(o, "successes", json_object_new_int64(m.successes));
    json_object_object_add(o, "failures", json_object_new_int64(m.failures));
    json_object_object_add(o, "failure_rate", json_object_new_double(round4(m.failure_rate)));
    json_object_object_add(o, "session_count", json_object_new_int64(m.session_count));
    json_object_object_add(o, "contract_pass_rate", json_object_new_double(round4(m.contract_pass_rate)));
    json_object_object_add(o, "guardrail_retry_exhausted", json_object_new_int64(m.guardrail_retry_exhausted));
    json_object_object_add(o, "outcome_retry_exhausted", json_object_new_int64(m.outcome_retry_exhausted));
    json_object_object_add(o, "wrong_boundary_count", json_object_new_int64(m.wrong_boundary_count));
    json_object_object_add(o, "provenance_violations", json_object_new_int64(m.provenance_violations));
    json_object_object_add(o, "state_key_consistency_ratio",
                           json_object_new_double(round4(m.state_key_consistency_ratio)));
    return o;
}

} // namespace

std::vector<std::string> state_keys_from_code(const std::string& code) {
    std::vector<std::string> keys;
    for (const char* call : {"memory_get(\"", "memory_set(\""}) {
        const std::string needle(call);
        size_t pos = 0;
        while ((pos = code.find(needle, pos)) != std::string::npos) {
            pos += needle.size();
            size_t end = code.find('"', pos);
            if (end == std::string::npos) break;
            std::string key = code.substr(pos, end - pos);
            if (!key.empty()) keys.push_back(key);
            pos = end;
        }
    }
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

void record_scorecard_call(Scorecard& sc, const CallObservation& obs) {
    sc.calls++;
    if (obs.ok) sc.successes++;
    else sc.failures++;

    if (obs.contract_applied) {
        if (obs.contract_passed) sc.contract_pass_count++;
        else sc.contract_fail_count++;
    }
    if (obs.guardrail_retry_exhausted) sc.guardrail_retry_exhausted_count++;
    if (obs.outcome_repair_retry_exhausted) sc.outcome_retry_exhausted_count++;
    if (obs.error_type == "wrong_tool_boundary") sc.wrong_boundary_count++;
    if (obs.error_type == "tool_registry_violation" && contains(obs.error_message, "provenance")) {
        sc.provenance_violation_count++;
    }

    sc.state_key_observations.push_back(state_keys_from_code(obs.code));
    if (sc.state_key_observations.size() > SCORECARD_STATE_KEY_OBSERVATIONS) {
        sc.state_key_observations.erase(sc.state_key_observations.begin());
    }
    sc.state_key_consistency_ratio = state_key_ratio(sc.state_key_observations);

    if (!obs.trace_id.empty() &&
        std::find(sc.sessions.begin(), sc.sessions.end(), obs.trace_id) == sc.sessions.end()) {
        sc.sessions.push_back(obs.trace_id);
        if (sc.sessions.size() > SCORECARD_SESSIONS_MAX) sc.sessions.erase(sc.sessions.begin());
    }

    WindowEntry w{obs.ok ? "ok" : "error", obs.ok ? std::string() : obs.error_type, obs.timestamp};
    push_window(sc.short_window, w, SCORECARD_SHORT_WINDOW);
    push_window(sc.medium_window, w, SCORECARD_MEDIUM_WINDOW);

    sc.last_outcome_status = w.status;
    sc.updated_at = obs.timestamp;
}

PromotionMetrics promotion_metrics(const Scorecard& sc, const Scorecard* baseline) {
    PromotionMetrics m;
    const Scorecard zero;
    const Scorecard& b = baseline ? *baseline : zero;

    m.calls = sc.calls - b.calls;
    m.successes = sc.successes - b.successes;
    m.failures = sc.failures - b.failures;
    m.failure_rate = m.calls > 0 ? (double)m.failures / (double)m.calls : 0.0;

    for (const auto& s : sc.sessions) {
        if (std::find(b.sessions.begin(), b.sessions.end(), s) == b.sessions.end()) m.session_count++;
    }

    const int64_t pass = sc.contract_pass_count - b.contract_pass_count;
    const int64_t fail = sc.contract_fail_count - b.contract_fail_count;
    m.contract_pass_rate = (pass + fail) > 0 ? (double)pass / (double)(pass + fail) : 1.0;

    m.guardrail_retry_exhausted = sc.guardrail_retry_exhausted_count - b.guardrail_retry_exhausted_count;
    m.outcome_retry_exhausted = sc.outcome_retry_exhausted_count - b.outcome_retry_exhausted_count;
    m.wrong_boundary_count = sc.wrong_boundary_count - b.wrong_boundary_count;
    m.provenance_violations = sc.provenance_violation_count - b.provenance_violation_count;
    m.state_key_consistency_ratio = sc.state_key_consistency_ratio;
    return m;
}

bool probation_gate_pass(const PromotionMetrics& m, const Scorecard* incumbent, const PromotionPolicy& p) {
    if (m.calls < p.min_calls) return false;
    if (m.session_count < p.min_sessions) return false;
    if (m.contract_pass_rate < p.min_contract_pass_rate) return false;
    if (m.guardrail_retry_exhausted > p.max_guardrail_retry_exhausted) return false;
    if (m.outcome_retry_exhausted > p.max_outcome_retry_exhausted) return false;
    if (m.wrong_boundary_count > p.max_wrong_boundary_count) return false;
    if (m.provenance_violations > p.max_provenance_violations) return false;
    if (m.state_key_consistency_ratio < p.min_state_key_consistency_ratio) return false;

    const double incumbent_rate = incumbent ? promotion_metrics(*incumbent).contract_pass_rate : 0.0;
    return m.contract_pass_rate >= incumbent_rate;
}

bool promotion_regressed(const PromotionMetrics& m, const PromotionPolicy& p) {
    return m.calls >= p.regression_min_calls &&
           m.failure_rate > p.regression_failure_rate &&
           m.failures > m.successes;
}

PromotionDecision evaluate_promotion(Lifecycle& lc,
                                     const std::map<std::string, Scorecard>& scorecards,
                                     const std::string& checksum,
                                     bool outcome_ok,
                                     bool enforcement,
                                     const PromotionPolicy& policy,
                                     const std::string& timestamp,
                                     bool legacy_mode) {
    PromotionDecision d;
    if (checksum.empty()) return d;

    if (!lc.present) {
        lc.present = true;
        lc.policy_version = policy.version;
        lc.legacy_compatibility_mode = legacy_mode;
        lc.created_at = timestamp;
    }

    auto it = lc.versions.find(checksum);
    if (it == lc.versions.end()) {
        it = lc.versions.emplace(checksum, new_entry(checksum, lc, policy, timestamp, legacy_mode)).first;
    }
    LifecycleEntry& entry = it->second;

    const auto sc_it = scorecards.find(checksum);
    const Scorecard empty_sc;
    const Scorecard& sc = sc_it != scorecards.end() ? sc_it->second : empty_sc;

    const Scorecard* incumbent = nullptr;
    if (!lc.incumbent_durable_checksum.empty() && lc.incumbent_durable_checksum != checksum) {
        auto inc = scorecards.find(lc.incumbent_durable_checksum);
        if (inc != scorecards.end()) incumbent = &inc->second;
    }

    // A degraded version is judged only on calls observed after it degraded.
    const Scorecard* baseline = entry.degraded_baseline ? &*entry.degraded_baseline : nullptr;
    const PromotionMetrics m = promotion_metrics(sc, baseline);
    const bool gate = probation_gate_pass(m, incumbent, policy);
    const bool regressed = promotion_regressed(m, policy);

    const std::string from = entry.lifecycle_state;
    std::string to = from;
    std::string decision = "hold";

    if (from == "candidate") {
        if (regressed) {
            to = "degraded";
            decision = "degrade";
        } else if (outcome_ok) {
            to = "probation";
            decision = "continue_probation";
        }
    } else if (from == "probation") {
        if (enforcement && !outcome_ok) {
            to = "degraded";
            decision = "degrade";
        } else if (gate) {
            to = "durable";
            decision = "promote";
        } else if (regressed) {
            to = "degraded";
            decision = "degrade";
        } else {
            decision = "continue_probation";
        }
    } else if (from == "durable") {
        if (regressed) {
            to = "degraded";
            decision = "degrade";
            lc.false_promotion_count++;
        }
    } else if (from == "degraded") {
        if (baseline && gate) {
            to = "durable";
            decision = "promote";
            lc.false_hold_count++;
        }
    }

    if (to == "degraded" && from != "degraded") {
        entry.degraded_baseline = sc;
        if (lc.incumbent_durable_checksum == checksum) lc.incumbent_durable_checksum.clear();
    }
    if (to == "durable") {
        entry.degraded_baseline.reset();
        lc.incumbent_durable_checksum = checksum;
    }

    entry.lifecycle_state = to;
    entry.last_decision = decision;
    entry.last_decision_at = timestamp;
    entry.policy_version = policy.version;
    entry.incumbent_artifact_checksum = lc.incumbent_durable_checksum;

    json_object* rationale = json_object_new_object();
    json_object_object_add(rationale, "from_state", json_object_new_string(from.c_str()));
    json_object_object_add(rationale, "to_state", json_object_new_string(to.c_str()));
    json_object_object_add(rationale, "gate_passed", json_object_new_boolean(gate));
    json_object_object_add(rationale, "regressed", json_object_new_boolean(regressed));
    json_object_object_add(rationale, "enforced", json_object_new_boolean(enforcement));
    json_object_object_add(rationale, "fresh_window", json_object_new_boolean(baseline != nullptr));
    json_object_object_add(rationale, "metrics", metrics_to_json(m));
    d.rationale_json = json_dump(rationale);
    json_object_put(rationale);

    ShadowEvaluation ev;
    ev.candidate_artifact_id = checksum;
    ev.incumbent_artifact_id = lc.incumbent_durable_checksum;
    ev.decision = decision;
    ev.policy_version = policy.version;
    ev.rationale_json = d.rationale_json;
    ev.at = timestamp;
    lc.evaluations.push_back(ev);
    if (lc.evaluations.size() > SHADOW_LEDGER_MAX) {
        lc.evaluations.erase(lc.evaluations.begin(), lc.evaluations.begin() + (long)(lc.evaluations.size() - SHADOW_LEDGER_MAX));
    }

    d.evaluated = true;
    d.lifecycle_state = to;
    d.decision = decision;
    d.policy_version = policy.version;
    return d;
}

std::optional<std::pair<std::string, std::string>>
select_lifecycle_version(const Lifecycle& lc, const std::set<std::string>& available) {
    auto state_of = [&](const std::string& checksum) -> std::string {
        auto it = lc.versions.find(checksum);
        return it == lc.versions.end() ? std::string() : it->second.lifecycle_state;
    };

    if (!lc.incumbent_durable_checksum.empty() && available.count(lc.incumbent_durable_checksum) &&
        state_of(lc.incumbent_durable_checksum) == "durable") {
        return std::make_pair(lc.incumbent_durable_checksum, std::string("durable"));
    }
    for (const char* wanted : {"durable", "probation", "candidate"}) {
        for (const auto& kv : lc.versions) {
            if (kv.second.lifecycle_state == wanted && available.count(kv.first)) {
                return std::make_pair(kv.first, kv.second.lifecycle_state);
            }
        }
    }
    return std::nullopt;
}

// --- persistence ---

json_object* scorecard_to_json(const Scorecard& sc) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "artifact_checksum", json_object_new_string(sc.artifact_checksum.c_str()));
    json_object_object_add(o, "calls", json_object_new_int64(sc.calls));
    json_object_object_add(o, "successes", json_object_new_int64(sc.successes));
    json_object_object_add(o, "failures", json_object_new_int64(sc.failures));
    json_object_object_add(o, "contract_pass_count", json_object_new_int64(sc.contract_pass_count));
    json_object_object_add(o, "contract_fail_count", json_object_new_int64(sc.contract_fail_count));
    json_object_object_add(o, "guardrail_retry_exhausted_count", json_object_new_int64(sc.guardrail_retry_exhausted_count));
    json_object_object_add(o, "outcome_retry_exhausted_count", json_object_new_int64(sc.outcome_retry_exhausted_count));
    json_object_object_add(o, "wrong_boundary_count", json_object_new_int64(sc.wrong_boundary_count));
    json_object_object_add(o, "provenance_violation_count", json_object_new_int64(sc.provenance_violation_count));

    json_object* obs = json_object_new_array();
    for (const auto& keys : sc.state_key_observations) json_object_array_add(obs, json_string_array(keys));
    json_object_object_add(o, "state_key_observations", obs);
    json_object_object_add(o, "state_key_consistency_ratio", json_object_new_double(round4(sc.state_key_consistency_ratio)));

    json_object_object_add(o, "sessions", json_string_array(sc.sessions));
    json_object_object_add(o, "short_window", window_to_json(sc.short_window));
    json_object_object_add(o, "medium_window", window_to_json(sc.medium_window));
    json_object_object_add(o, "last_outcome_status", json_object_new_string(sc.last_outcome_status.c_str()));
    json_object_object_add(o, "updated_at", json_object_new_string(sc.updated_at.c_str()));
    return o;
}

Scorecard scorecard_from_json(json_object* o) {
    Scorecard sc;
    if (!o || !json_object_is_type(o, json_type_object)) return sc;
    json_get_string(o, "artifact_checksum", &sc.artifact_checksum);
    json_get_int(o, "calls", &sc.calls);
    json_get_int(o, "successes", &sc.successes);
    json_get_int(o, "failures", &sc.failures);
    json_get_int(o, "contract_pass_count", &sc.contract_pass_count);
    json_get_int(o, "contract_fail_count", &sc.contract_fail_count);
    json_get_int(o, "guardrail_retry_exhausted_count", &sc.guardrail_retry_exhausted_count);
    json_get_int(o, "outcome_retry_exhausted_count", &sc.outcome_retry_exhausted_count);
    json_get_int(o, "wrong_boundary_count", &sc.wrong_boundary_count);
    json_get_int(o, "provenance_violation_count", &sc.provenance_violation_count);

    json_object* obs = nullptr;
    if (json_object_object_get_ex(o, "state_key_observations", &obs) && json_object_is_type(obs, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(obs); i++) {
            json_object* keys = json_object_array_get_idx(obs, i);
            std::vector<std::string> row;
            if (keys && json_object_is_type(keys, json_type_array)) {
                for (size_t j = 0; j < json_object_array_length(keys); j++) {
                    json_object* k = json_object_array_get_idx(keys, j);
                    if (k && json_object_is_type(k, json_type_string)) row.push_back(json_object_get_string(k));
                }
            }
            sc.state_key_observations.push_back(row);
        }
    }
    sc.state_key_consistency_ratio = state_key_ratio(sc.state_key_observations);

    sc.sessions = json_get_string_array(o, "sessions");
    sc.short_window = window_from_json(o, "short_window");
    sc.medium_window = window_from_json(o, "medium_window");
    json_get_string(o, "last_outcome_status", &sc.last_outcome_status);
    json_get_string(o, "updated_at", &sc.updated_at);
    return sc;
}

json_object* lifecycle_to_json(const Lifecycle& lc) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "policy_version", json_object_new_string(lc.policy_version.c_str()));
    json_object_object_add(o, "incumbent_durable_checksum",
                           lc.incumbent_durable_checksum.empty()
                               ? nullptr
                               : json_object_new_string(lc.incumbent_durable_checksum.c_str()));
    json_object_object_add(o, "legacy_compatibility_mode", json_object_new_boolean(lc.legacy_compatibility_mode));

    json_object* versions = json_object_new_object();
    for (const auto& kv : lc.versions) {
        const LifecycleEntry& e = kv.second;
        json_object* v = json_object_new_object();
        json_object_object_add(v, "artifact_checksum", json_object_new_string(e.artifact_checksum.c_str()));
        json_object_object_add(v, "lifecycle_state", json_object_new_string(e.lifecycle_state.c_str()));
        json_object_object_add(v, "policy_version", json_object_new_string(e.policy_version.c_str()));
        json_object_object_add(v, "incumbent_artifact_checksum",
                               e.incumbent_artifact_checksum.empty()
                                   ? nullptr
                                   : json_object_new_string(e.incumbent_artifact_checksum.c_str()));
        json_object_object_add(v, "compatibility_mode", json_object_new_boolean(e.compatibility_mode));
        json_object_object_add(v, "first_seen_at", json_object_new_string(e.first_seen_at.c_str()));
        json_object_object_add(v, "last_decision", json_object_new_string(e.last_decision.c_str()));
        json_object_object_add(v, "last_decision_at", json_object_new_string(e.last_decision_at.c_str()));
        if (e.degraded_baseline) {
            json_object_object_add(v, "degraded_baseline", scorecard_to_json(*e.degraded_baseline));
        }
        json_object_object_add(versions, kv.first.c_str(), v);
    }
    json_object_object_add(o, "versions", versions);

    json_object* ledger = json_object_new_object();
    json_object_object_add(ledger, "false_promotion_count", json_object_new_int64(lc.false_promotion_count));
    json_object_object_add(ledger, "false_hold_count", json_object_new_int64(lc.false_hold_count));
    json_object* evs = json_object_new_array();
    for (const auto& ev : lc.evaluations) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "decision_type", json_object_new_string("promotion_evaluation"));
        json_object_object_add(e, "candidate_artifact_id", json_object_new_string(ev.candidate_artifact_id.c_str()));
        json_object_object_add(e, "incumbent_artifact_id",
                               ev.incumbent_artifact_id.empty()
                                   ? nullptr
                                   : json_object_new_string(ev.incumbent_artifact_id.c_str()));
        json_object_object_add(e, "decision", json_object_new_string(ev.decision.c_str()));
        json_object_object_add(e, "policy_version", json_object_new_string(ev.policy_version.c_str()));
        json_object_object_add(e, "window", json_object_new_string("rolling_medium_window"));
        json_add_raw(e, "rationale", ev.rationale_json);
        json_object_object_add(e, "at", json_object_new_string(ev.at.c_str()));
        json_object_array_add(evs, e);
    }
    json_object_object_add(ledger, "evaluations", evs);
    json_object_object_add(o, "shadow_ledger", ledger);
    json_object_object_add(o, "created_at", json_object_new_string(lc.created_at.c_str()));
    return o;
}

Lifecycle lifecycle_from_json(json_object* o) {
    Lifecycle lc;
    if (!o || !json_object_is_type(o, json_type_object)) return lc;
    lc.present = true;
    json_get_string(o, "policy_version", &lc.policy_version);
    json_get_string(o, "incumbent_durable_checksum", &lc.incumbent_durable_checksum);
    json_get_bool(o, "legacy_compatibility_mode", &lc.legacy_compatibility_mode);
    json_get_string(o, "created_at", &lc.created_at);

    json_object* versions = nullptr;
    if (json_object_object_get_ex(o, "versions", &versions) && json_object_is_type(versions, json_type_object)) {
        json_object_object_foreach(versions, k, v) {
            LifecycleEntry e;
            e.artifact_checksum = k;
            json_get_string(v, "artifact_checksum", &e.artifact_checksum);
            json_get_string(v, "lifecycle_state", &e.lifecycle_state);
            json_get_string(v, "policy_version", &e.policy_version);
            json_get_string(v, "incumbent_artifact_checksum", &e.incumbent_artifact_checksum);
            json_get_bool(v, "compatibility_mode", &e.compatibility_mode);
            json_get_string(v, "first_seen_at", &e.first_seen_at);
            json_get_string(v, "last_decision", &e.last_decision);
            json_get_string(v, "last_decision_at", &e.last_decision_at);
            json_object* base = nullptr;
            if (json_object_object_get_ex(v, "degraded_baseline", &base) && base) {
                e.degraded_baseline = scorecard_from_json(base);
            }
            lc.versions[k] = e;
        }
    }

    json_object* ledger = nullptr;
    if (json_object_object_get_ex(o, "shadow_ledger", &ledger) && json_object_is_type(ledger, json_type_object)) {
        json_get_int(ledger, "false_promotion_count", &lc.false_promotion_count);
        json_get_int(ledger, "false_hold_count", &lc.false_hold_count);
        json_object* evs = nullptr;
        if (json_object_object_get_ex(ledger, "evaluations", &evs) && json_object_is_type(evs, json_type_array)) {
            for (size_t i = 0; i < json_object_array_length(evs); i++) {
                json_object* e = json_object_array_get_idx(evs, i);
                ShadowEvaluation ev;
                json_get_string(e, "candidate_artifact_id", &ev.candidate_artifact_id);
                json_get_string(e, "incumbent_artifact_id", &ev.incumbent_artifact_id);
                json_get_string(e, "decision", &ev.decision);
                json_get_string(e, "policy_version", &ev.policy_version);
                ev.rationale_json = json_get_raw(e, "rationale");
                json_get_string(e, "at", &ev.at);
                lc.evaluations.push_back(ev);
            }
        }
    }
    return lc;
}

} // namespace conjure
