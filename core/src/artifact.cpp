#include "conjure/artifact.h"
#include "conjure/serialization.h"

namespace conjure {

namespace {

json_object* str_or_null(const std::string& s) {
    return s.empty() ? nullptr : json_object_new_string_len(s.c_str(), (int)s.size());
}

json_object* deps_to_json(const std::vector<Dependency>& deps) {
    json_object* arr = json_object_new_array();
    for (const auto& d : deps) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "name", json_object_new_string(d.name.c_str()));
        json_object_object_add(e, "version", json_object_new_string(d.version.c_str()));
        json_object_array_add(arr, e);
    }
    return arr;
}

std::vector<Dependency> deps_from_json(json_object* o, const char* k) {
    std::vector<Dependency> out;
    json_object* arr = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &arr) || !json_object_is_type(arr, json_type_array)) return out;
    for (size_t i = 0; i < json_object_array_length(arr); i++) {
        json_object* e = json_object_array_get_idx(arr, i);
        Dependency d;
        if (!json_get_string(e, "name", &d.name)) continue;
        if (!json_get_string(e, "version", &d.version)) d.version = ">= 0";
        out.push_back(d);
    }
    return out;
}

json_object* history_to_json(const HistoryEntry& h) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "id", json_object_new_string(h.id.c_str()));
    json_object_object_add(o, "parent_id", str_or_null(h.parent_id));
    json_object_object_add(o, "trigger", json_object_new_string(h.trigger.c_str()));
    json_object_object_add(o, "created_at", json_object_new_string(h.created_at.c_str()));
    json_object_object_add(o, "code_checksum", json_object_new_string(h.code_checksum.c_str()));
    json_object_object_add(o, "prompt_version", json_object_new_string(h.prompt_version.c_str()));
    json_object_object_add(o, "runtime_version", json_object_new_string(h.runtime_version.c_str()));
    json_object_object_add(o, "model", json_object_new_string(h.model.c_str()));
    if (!h.trigger_stage.empty()) {
        json_object_object_add(o, "trigger_stage", json_object_new_string(h.trigger_stage.c_str()));
        json_object_object_add(o, "trigger_error_class", str_or_null(h.trigger_error_class));
        json_object_object_add(o, "trigger_error_message", str_or_null(h.trigger_error_message));
        json_object_object_add(o, "trigger_attempt_id", json_object_new_int64(h.trigger_attempt_id));
    }
    return o;
}

HistoryEntry history_from_json(json_object* o) {
    HistoryEntry h;
    json_get_string(o, "id", &h.id);
    json_get_string(o, "parent_id", &h.parent_id);
    json_get_string(o, "trigger", &h.trigger);
    json_get_string(o, "created_at", &h.created_at);
    json_get_string(o, "code_checksum", &h.code_checksum);
    json_get_string(o, "prompt_version", &h.prompt_version);
    json_get_string(o, "runtime_version", &h.runtime_version);
    json_get_string(o, "model", &h.model);
    json_get_string(o, "trigger_stage", &h.trigger_stage);
    json_get_string(o, "trigger_error_class", &h.trigger_error_class);
    json_get_string(o, "trigger_error_message", &h.trigger_error_message);
    json_get_int(o, "trigger_attempt_id", &h.trigger_attempt_id);
    return h;
}

} // namespace

json_object* artifact_to_json(const Artifact& a) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "schema_version", json_object_new_int(a.schema_version));
    json_object_object_add(o, "role", json_object_new_string(a.role.c_str()));
    json_object_object_add(o, "method_name", json_object_new_string(a.method_name.c_str()));
    json_object_object_add(o, "contract_fingerprint", json_object_new_string(a.contract_fingerprint.c_str()));
    json_object_object_add(o, "prompt_version", json_object_new_string(a.prompt_version.c_str()));
    json_object_object_add(o, "runtime_version", json_object_new_string(a.runtime_version.c_str()));
    json_object_object_add(o, "model", json_object_new_string(a.model.c_str()));
    json_object_object_add(o, "cacheable", a.cacheable ? json_object_new_boolean(*a.cacheable) : nullptr);
    json_object_object_add(o, "cacheability_reason", json_object_new_string(a.cacheability_reason.c_str()));
    json_object_object_add(o, "input_sensitive", json_object_new_boolean(a.input_sensitive));
    json_object_object_add(o, "code_checksum", str_or_null(a.code_checksum));
    json_object_object_add(o, "code", json_object_new_string_len(a.code.c_str(), (int)a.code.size()));
    json_object_object_add(o, "dependencies", deps_to_json(a.dependencies));

    json_object_object_add(o, "success_count", json_object_new_int64(a.success_count));
    json_object_object_add(o, "failure_count", json_object_new_int64(a.failure_count));
    json_object_object_add(o, "intrinsic_failure_count", json_object_new_int64(a.intrinsic_failure_count));
    json_object_object_add(o, "adaptive_failure_count", json_object_new_int64(a.adaptive_failure_count));
    json_object_object_add(o, "extrinsic_failure_count", json_object_new_int64(a.extrinsic_failure_count));
    json_object_object_add(o, "recent_failure_rate", json_object_new_double(a.recent_failure_rate));
    json_object_object_add(o, "last_failure_reason", str_or_null(a.last_failure_reason));
    json_object_object_add(o, "last_failure_class", str_or_null(a.last_failure_class));
    json_object_object_add(o, "repair_count_since_regen", json_object_new_int64(a.repair_count_since_regen));

    json_object_object_add(o, "created_at", str_or_null(a.created_at));
    json_object_object_add(o, "last_used_at", str_or_null(a.last_used_at));
    json_object_object_add(o, "last_repaired_at", str_or_null(a.last_repaired_at));
    json_object_object_add(o, "last_duration_ms", json_object_new_double(a.last_duration_ms));

    json_object* hist = json_object_new_array();
    for (const auto& h : a.history) json_object_array_add(hist, history_to_json(h));
    json_object_object_add(o, "history", hist);

    json_object* scs = json_object_new_object();
    for (const auto& kv : a.scorecards) json_object_object_add(scs, kv.first.c_str(), scorecard_to_json(kv.second));
    json_object_object_add(o, "scorecards", scs);

    json_object* vers = json_object_new_object();
    for (const auto& kv : a.versions) {
        json_object* v = json_object_new_object();
        json_object_object_add(v, "code", json_object_new_string_len(kv.second.code.c_str(), (int)kv.second.code.size()));
        json_object_object_add(v, "dependencies", deps_to_json(kv.second.dependencies));
        json_object_object_add(v, "created_at", json_object_new_string(kv.second.created_at.c_str()));
        json_object_object_add(vers, kv.first.c_str(), v);
    }
    json_object_object_add(o, "versions", vers);

    if (a.lifecycle.present) json_object_object_add(o, "lifecycle", lifecycle_to_json(a.lifecycle));
    return o;
}

bool artifact_from_json(json_object* o, Artifact* out, std::string* err) {
    if (!out) return false;
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "artifact is not a JSON object";
        return false;
    }
    Artifact a;
    int64_t schema = ARTIFACT_SCHEMA_VERSION;
    json_get_int(o, "schema_version", &schema);
    a.schema_version = (int)schema;
    json_get_string(o, "role", &a.role);
    json_get_string(o, "method_name", &a.method_name);
    json_get_string(o, "contract_fingerprint", &a.contract_fingerprint);
    json_get_string(o, "prompt_version", &a.prompt_version);
    json_get_string(o, "runtime_version", &a.runtime_version);
    json_get_string(o, "model", &a.model);
    bool cacheable = false;
    if (json_get_bool(o, "cacheable", &cacheable)) a.cacheable = cacheable;
    json_get_string(o, "cacheability_reason", &a.cacheability_reason);
    json_get_bool(o, "input_sensitive", &a.input_sensitive);
    json_get_string(o, "code_checksum", &a.code_checksum);
    json_get_string(o, "code", &a.code);
    a.dependencies = deps_from_json(o, "dependencies");

    json_get_int(o, "success_count", &a.success_count);
    json_get_int(o, "failure_count", &a.failure_count);
    json_get_int(o, "intrinsic_failure_count", &a.intrinsic_failure_count);
    json_get_int(o, "adaptive_failure_count", &a.adaptive_failure_count);
    json_get_int(o, "extrinsic_failure_count", &a.extrinsic_failure_count);
    json_get_double(o, "recent_failure_rate", &a.recent_failure_rate);
    json_get_string(o, "last_failure_reason", &a.last_failure_reason);
    json_get_string(o, "last_failure_class", &a.last_failure_class);
    json_get_int(o, "repair_count_since_regen", &a.repair_count_since_regen);

    json_get_string(o, "created_at", &a.created_at);
    json_get_string(o, "last_used_at", &a.last_used_at);
    json_get_string(o, "last_repaired_at", &a.last_repaired_at);
    json_get_double(o, "last_duration_ms", &a.last_duration_ms);

    json_object* hist = nullptr;
    if (json_object_object_get_ex(o, "history", &hist) && json_object_is_type(hist, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(hist); i++) {
            a.history.push_back(history_from_json(json_object_array_get_idx(hist, i)));
        }
    }

    json_object* scs = nullptr;
    if (json_object_object_get_ex(o, "scorecards", &scs) && json_object_is_type(scs, json_type_object)) {
        json_object_object_foreach(scs, k, v) {
            a.scorecards[k] = scorecard_from_json(v);
        }
    }

    json_object* vers = nullptr;
    if (json_object_object_get_ex(o, "versions", &vers) && json_object_is_type(vers, json_type_object)) {
        json_object_object_foreach(vers, k, v) {
            ArtifactVersion av;
            json_get_string(v, "code", &av.code);
            av.dependencies = deps_from_json(v, "dependencies");
            json_get_string(v, "created_at", &av.created_at);
            a.versions[k] = av;
        }
    }

    json_object* lc = nullptr;
    if (json_object_object_get_ex(o, "lifecycle", &lc) && lc) a.lifecycle = lifecycle_from_json(lc);

    *out = std::move(a);
    return true;
}

bool artifact_legacy_degraded(const Artifact& a) {
    return a.failure_count >= 3 && a.recent_failure_rate > 0.6 && a.failure_count > a.success_count;
}

} // namespace conjure
