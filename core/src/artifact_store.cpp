#include "conjure/artifact_store.h"
#include "conjure/errors.h"
#include "conjure/fs_util.h"
#include "conjure/hash.h"
#include "conjure/json_mini.h"
#include "conjure/log.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

namespace conjure {

namespace {

bool blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool checksum_valid(const std::string& code, const std::string& checksum) {
    if (blank(code)) return false;
    return checksum == hash::code_checksum(code);
}

double round4(double v) { return std::round(v * 10000.0) / 10000.0; }

// Trigger recorded in history; "" when the code was reused unchanged.
std::string generation_trigger(const ArtifactUpdate& u,
                               const std::string& previous,
                               const std::string& next,
                               bool known_version) {
    if (!u.trigger.empty()) return u.trigger;
    if (previous.empty()) return "initial_forge";
    if (previous != next) return known_version ? "fallback:durable" : "regenerate:new_code";
    return "";
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

void prune_versions(Artifact& a) {
    while (a.versions.size() > ARTIFACT_VERSIONS_MAX) {
        auto victim = a.versions.end();
        for (auto it = a.versions.begin(); it != a.versions.end(); ++it) {
            if (it->first == a.code_checksum) continue;
            if (it->first == a.lifecycle.incumbent_durable_checksum) continue;
            if (victim == a.versions.end() || it->second.created_at < victim->second.created_at) victim = it;
        }
        if (victim == a.versions.end()) break;
        a.versions.erase(victim);
    }
}

} // namespace

bool is_dynamic_dispatch_method(const std::string& method_name) {
    static const std::set<std::string> kDynamic = {"ask", "chat", "discuss", "host"};
    return kDynamic.count(method_name) > 0;
}

std::string contract_fingerprint(const std::string& contract_json) {
    if (contract_json.empty() || contract_json == "null") return "none";
    return "sha256:" + hash::sha256_hex(json_canonical_text(contract_json));
}

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path ArtifactStore::path_for(const std::string& role, const std::string& method_name) const {
    return root_ / "artifacts" / role / (method_name + ".json");
}

std::optional<Artifact> ArtifactStore::load(const std::string& role, const std::string& method_name) const {
    const auto path = path_for(role, method_name);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return std::nullopt;

    std::string text;
    if (!slurp_file(path, &text)) return std::nullopt;

    json_mini::Doc d = json_mini::parse(text);
    Artifact a;
    std::string err;
    if (!d.is_object() || !artifact_from_json(d.root, &a, &err)) {
        const std::string moved = quarantine_corrupt_file(path);
        debug_log("artifact " + role + "." + method_name + ": quarantined corrupt file " + moved);
        return std::nullopt;
    }
    if (a.schema_version != ARTIFACT_SCHEMA_VERSION) {
        debug_log("artifact " + role + "." + method_name + ": ignored schema=" + std::to_string(a.schema_version));
        return std::nullopt;
    }
    return a;
}

bool ArtifactStore::write(const Artifact& a, std::string* err) const {
    json_object* o = artifact_to_json(a);
    const std::string body = json_dump(o);
    json_object_put(o);
    const std::string werr = write_atomic(path_for(a.role, a.method_name), body);
    if (!werr.empty()) {
        if (err) *err = werr;
        return false;
    }
    return true;
}

std::optional<Artifact> ArtifactStore::select(const std::string& role,
                                              const std::string& method_name,
                                              const ArtifactSelectOptions& opts) const {
    std::optional<Artifact> a = load(role, method_name);
    if (!a) return std::nullopt;

    if (a->cacheable.has_value()) {
        if (!*a->cacheable) return std::nullopt;
    } else if (is_dynamic_dispatch_method(method_name)) {
        return std::nullopt;
    }

    if (!a->runtime_version.empty() && a->runtime_version != CONJURE_RUNTIME_VERSION) return std::nullopt;
    if (!opts.prompt_version.empty() && !a->prompt_version.empty() && a->prompt_version != opts.prompt_version) {
        return std::nullopt;
    }
    if (a->contract_fingerprint != opts.contract_fingerprint) return std::nullopt;
    if (!checksum_valid(a->code, a->code_checksum)) {
        debug_log("artifact " + role + "." + method_name + ": checksum mismatch, treating as miss");
        return std::nullopt;
    }

    if (opts.enforcement && a->lifecycle.present) {
        std::set<std::string> available{a->code_checksum};
        for (const auto& kv : a->versions) {
            if (checksum_valid(kv.second.code, kv.first)) available.insert(kv.first);
        }
        auto pick = select_lifecycle_version(a->lifecycle, available);
        if (!pick) {
            auto cur = a->lifecycle.versions.find(a->code_checksum);
            if (cur != a->lifecycle.versions.end() && cur->second.lifecycle_state == "degraded") return std::nullopt;
        } else {
            if (pick->first != a->code_checksum) {
                const ArtifactVersion& v = a->versions.at(pick->first);
                a->code = v.code;
                a->dependencies = v.dependencies;
                a->code_checksum = pick->first;
            }
            a->selected_lifecycle_state = pick->second;
        }
        if (a->selected_lifecycle_state == "degraded") return std::nullopt;
    } else {
        if (artifact_legacy_degraded(*a)) return std::nullopt;
        auto cur = a->lifecycle.versions.find(a->code_checksum);
        if (cur != a->lifecycle.versions.end()) a->selected_lifecycle_state = cur->second.lifecycle_state;
    }

    a->selected_checksum = a->code_checksum;
    return a;
}

bool ArtifactStore::persist(const ArtifactUpdate& u,
                            const PromotionSettings& promotion,
                            PromotionDecision* decision,
                            std::string* err) const {
    if (blank(u.code)) return true;

    const std::string ts = iso_now_ms();
    Artifact a;
    if (auto existing = load(u.role, u.method_name)) {
        a = std::move(*existing);
    } else {
        a.role = u.role;
        a.method_name = u.method_name;
    }
    const std::string previous_checksum = a.code_checksum;
    const std::string new_checksum = hash::code_checksum(u.code);
    const bool legacy_mode = !a.lifecycle.present && (a.success_count + a.failure_count) > 0;

    // payload
    a.schema_version = ARTIFACT_SCHEMA_VERSION;
    a.role = u.role;
    a.method_name = u.method_name;
    a.contract_fingerprint = u.contract_fingerprint;
    a.prompt_version = u.prompt_version;
    a.runtime_version = CONJURE_RUNTIME_VERSION;
    a.model = u.model;
    a.cacheable = u.cacheable;
    a.cacheability_reason = u.cacheability_reason;
    a.input_sensitive = u.input_sensitive;
    a.code_checksum = new_checksum;
    a.code = u.code;
    a.dependencies = u.dependencies;
    if (a.created_at.empty()) a.created_at = ts;

    const bool known_version = a.versions.count(new_checksum) > 0;
    ArtifactVersion& ver = a.versions[new_checksum];
    ver.code = u.code;
    ver.dependencies = u.dependencies;
    if (ver.created_at.empty()) ver.created_at = ts;

    // counters
    if (u.outcome.ok) {
        a.success_count++;
    } else {
        a.failure_count++;
        FailureClass fc = failure_class_for(u.outcome.error_type);
        if (fc == FailureClass::NONE) fc = FailureClass::INTRINSIC;
        switch (fc) {
        case FailureClass::EXTRINSIC: a.extrinsic_failure_count++; break;
        case FailureClass::ADAPTIVE: a.adaptive_failure_count++; break;
        default: a.intrinsic_failure_count++; break;
        }
        a.last_failure_class = failure_class_name(fc);
        a.last_failure_reason = u.outcome.error_message.empty() ? "unknown failure" : u.outcome.error_message;
    }
    const int64_t total = a.success_count + a.failure_count;
    a.recent_failure_rate = total == 0 ? 0.0 : round4((double)a.failure_count / (double)total);

    // version scorecard
    Scorecard& sc = a.scorecards[new_checksum];
    sc.artifact_checksum = new_checksum;
    CallObservation obs;
    obs.ok = u.outcome.ok;
    obs.error_type = u.outcome.error_type;
    obs.error_message = u.outcome.error_message;
    obs.contract_applied = u.contract_applied;
    obs.contract_passed = u.contract_passed;
    obs.guardrail_retry_exhausted = u.guardrail_retry_exhausted;
    obs.outcome_repair_retry_exhausted = u.outcome_repair_retry_exhausted;
    obs.code = u.code;
    obs.trace_id = u.trace_id;
    obs.timestamp = ts;
    record_scorecard_call(sc, obs);

    if (promotion.shadow_mode || promotion.enforcement) {
        PromotionDecision d = evaluate_promotion(a.lifecycle, a.scorecards, new_checksum, u.outcome.ok,
                                                 promotion.enforcement, promotion.policy, ts, legacy_mode);
        if (decision) *decision = d;
    }

    // history
    const std::string trigger = generation_trigger(u, previous_checksum, new_checksum, known_version);
    if (starts_with(trigger, "repair:")) {
        a.repair_count_since_regen++;
        a.last_repaired_at = ts;
    } else if (starts_with(trigger, "regenerate:") || trigger == "initial_forge") {
        a.repair_count_since_regen = 0;
    }
    if (previous_checksum != new_checksum) {
        HistoryEntry h;
        h.id = "gen-" + hash::random_hex(6);
        h.parent_id = a.history.empty() ? std::string() : a.history.front().id;
        h.trigger = trigger;
        h.created_at = ts;
        h.code_checksum = new_checksum;
        h.prompt_version = u.prompt_version;
        h.runtime_version = CONJURE_RUNTIME_VERSION;
        h.model = u.model;
        h.trigger_stage = u.trigger_stage;
        h.trigger_error_class = u.trigger_error_class;
        h.trigger_error_message = u.trigger_error_message;
        h.trigger_attempt_id = u.trigger_attempt_id;
        a.history.insert(a.history.begin(), h);
        if (a.history.size() > ARTIFACT_HISTORY_MAX) a.history.resize(ARTIFACT_HISTORY_MAX);
    }

    prune_versions(a);
    a.last_used_at = ts;
    a.last_duration_ms = std::round(u.duration_ms * 10.0) / 10.0;

    if (!write(a, err)) return false;
    return true;
}

} // namespace conjure
