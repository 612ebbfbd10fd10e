#include "conjure/outcome.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"

#include <set>

namespace conjure {

const char* const OUTCOME_ENVELOPE_KEY = "__conjure_outcome__";

Outcome Outcome::success(const std::string& value_json, const std::string& role, const std::string& method_name) {
    Outcome o;
    o.ok = true;
    o.value_json = value_json.empty() ? "null" : value_json;
    o.role = role;
    o.method_name = method_name;
    return o;
}

Outcome Outcome::failure(const std::string& error_type,
                         const std::string& error_message,
                         bool retriable,
                         const std::string& role,
                         const std::string& method_name,
                         const std::string& metadata_json) {
    Outcome o;
    o.ok = false;
    o.value_json = "null";
    o.error_type = error_type;
    o.error_message = error_message;
    o.retriable = retriable;
    o.role = role;
    o.method_name = method_name;
    o.metadata_json = metadata_json.empty() ? "{}" : metadata_json;
    return o;
}

Outcome Outcome::from_error(const Error& e, const std::string& role, const std::string& method_name) {
    return failure(e.type(), e.what(), e.retriable(), role, method_name, e.metadata_json());
}

static std::string envelope_wrap(json_object* inner) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, OUTCOME_ENVELOPE_KEY, inner);
    std::string out = json_dump(root);
    json_object_put(root);
    return out;
}

std::string outcome_envelope_ok(const std::string& value_json) {
    json_object* inner = json_object_new_object();
    json_object_object_add(inner, "status", json_object_new_string("ok"));
    json_add_raw(inner, "value", value_json);
    return envelope_wrap(inner);
}

std::string outcome_envelope_error(const std::string& error_type,
                                   const std::string& error_message,
                                   bool retriable) {
    json_object* inner = json_object_new_object();
    json_object_object_add(inner, "status", json_object_new_string("error"));
    json_object_object_add(inner, "error_type", json_object_new_string(error_type.c_str()));
    json_object_object_add(inner, "error_message", json_object_new_string(error_message.c_str()));
    json_object_object_add(inner, "retriable", json_object_new_boolean(retriable ? 1 : 0));
    return envelope_wrap(inner);
}

std::string outcome_envelope(const Outcome& o) {
    return envelope_wrap(outcome_to_json(o));
}

static Outcome from_error_mapping(json_object* m, const std::string& role, const std::string& method_name) {
    std::string type, message;
    bool retriable = false;
    if (!json_get_string(m, "error_type", &type) || type.empty()) type = "execution";
    if (!json_get_string(m, "error_message", &message)) {
        (void)json_get_string(m, "message", &message);
    }
    (void)json_get_bool(m, "retriable", &retriable);
    std::string metadata = "{}";
    json_object* md = nullptr;
    if (json_object_object_get_ex(m, "metadata", &md) && md && json_object_is_type(md, json_type_object)) {
        metadata = json_dump(md);
    }
    return Outcome::failure(type, message, retriable, role, method_name, metadata);
}

Outcome coerce_outcome(const std::string& raw_json,
                       const std::string& role,
                       const std::string& method_name) {
    if (!json_mini::is_valid(raw_json)) {
        // Not JSON at all: keep the text as a string value.
        return coerce_low_utility(Outcome::success(json_quote(raw_json), role, method_name));
    }

    json_mini::Doc d = json_mini::parse(raw_json);
    if (!d.is_object()) {
        return Outcome::success(raw_json, role, method_name);
    }

    json_object* env = nullptr;
    if (json_object_object_get_ex(d.root, OUTCOME_ENVELOPE_KEY, &env) && env &&
        json_object_is_type(env, json_type_object)) {
        std::string status;
        (void)json_get_string(env, "status", &status);
        if (status == "error") return from_error_mapping(env, role, method_name);
        return coerce_low_utility(Outcome::success(json_get_raw(env, "value"), role, method_name));
    }

    std::string status, type, message;
    const bool has_status = json_get_string(d.root, "status", &status);
    const bool error_shaped = json_get_string(d.root, "error_type", &type) &&
                              json_get_string(d.root, "error_message", &message);
    if ((has_status && status == "error") || error_shaped) {
        return from_error_mapping(d.root, role, method_name);
    }

    return coerce_low_utility(Outcome::success(raw_json, role, method_name));
}

Outcome coerce_low_utility(const Outcome& o) {
    static const std::set<std::string> low_utility_statuses = {
        "success_no_parse", "success_but_unusable", "partial_success_unusable",
        "empty_result", "no_useful_result", "low_utility",
    };
    if (!o.ok) return o;

    json_mini::Doc d = json_mini::parse(o.value_json);
    if (!d.is_object()) return o;
    std::string status;
    if (!json_get_string(d.root, "status", &status)) return o;
    if (!low_utility_statuses.count(status)) return o;

    std::string message;
    if (!json_get_string(d.root, "message", &message) || message.empty()) {
        message = "result marked " + status + " by the program";
    }
    json_object* md = json_object_new_object();
    json_object_object_add(md, "coerced_from_status", json_object_new_string(status.c_str()));
    std::string metadata = json_dump(md);
    json_object_put(md);
    return Outcome::failure("low_utility", message, false, o.role, o.method_name, metadata);
}

json_object* outcome_to_json(const Outcome& o) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "status", json_object_new_string(o.status()));
    if (o.ok) {
        json_add_raw(root, "value", o.value_json);
    } else {
        json_object_object_add(root, "error_type", json_object_new_string(o.error_type.c_str()));
        json_object_object_add(root, "error_message", json_object_new_string(o.error_message.c_str()));
        json_object_object_add(root, "retriable", json_object_new_boolean(o.retriable ? 1 : 0));
    }
    json_object_object_add(root, "role", json_object_new_string(o.role.c_str()));
    json_object_object_add(root, "method_name", json_object_new_string(o.method_name.c_str()));
    json_add_raw(root, "metadata", o.metadata_json);
    return root;
}

std::string outcome_to_json_text(const Outcome& o) {
    json_object* j = outcome_to_json(o);
    std::string out = json_dump(j);
    json_object_put(j);
    return out;
}

bool outcome_from_json(json_object* o, Outcome* out, std::string* err) {
    if (!out) return false;
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "outcome must be a JSON object";
        return false;
    }
    std::string status;
    if (!json_get_string(o, "status", &status) || (status != "ok" && status != "error")) {
        if (err) *err = "outcome status must be ok or error";
        return false;
    }
    Outcome r;
    r.ok = (status == "ok");
    (void)json_get_string(o, "role", &r.role);
    (void)json_get_string(o, "method_name", &r.method_name);
    if (r.ok) {
        r.value_json = json_get_raw(o, "value");
    } else {
        (void)json_get_string(o, "error_type", &r.error_type);
        (void)json_get_string(o, "error_message", &r.error_message);
        (void)json_get_bool(o, "retriable", &r.retriable);
    }
    json_object* md = nullptr;
    if (json_object_object_get_ex(o, "metadata", &md) && md && json_object_is_type(md, json_type_object)) {
        r.metadata_json = json_dump(md);
    }
    *out = std::move(r);
    return true;
}

} // namespace conjure
