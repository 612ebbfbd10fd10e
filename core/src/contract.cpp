#include "conjure/contract.h"
#include "conjure/json_mini.h"
#include "conjure/promotion.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <cctype>

namespace conjure {

namespace {

std::string lower_trim(std::string s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

json_object* member(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    if (!json_object_object_get_ex(o, k, &v)) return nullptr;
    return v;
}

std::string string_member(json_object* o, const char* k) {
    json_object* v = member(o, k);
    if (!v || !json_object_is_type(v, json_type_string)) return "";
    return lower_trim(json_object_get_string(v));
}

// Non-negative integer (or integer string); -1 when absent or malformed.
int64_t min_items_of(json_object* o) {
    json_object* v = member(o, "min_items");
    if (!v) return -1;
    if (json_object_is_type(v, json_type_int)) {
        int64_t n = json_object_get_int64(v);
        return n < 0 ? -1 : n;
    }
    if (json_object_is_type(v, json_type_string)) {
        const std::string s = json_object_get_string(v);
        if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) return -1;
        try {
            return std::stoll(s);
        } catch (const std::exception&) {
            return -1;
        }
    }
    return -1;
}

std::string shape_of(json_object* v) {
    if (!v) return "null";
    switch (json_object_get_type(v)) {
    case json_type_object: return "object";
    case json_type_array: return "array";
    case json_type_string: return "string";
    case json_type_int: return "integer";
    case json_type_double: return "number";
    case json_type_boolean: return "boolean";
    default: return "null";
    }
}

bool shape_matches(const std::string& expected, json_object* v) {
    const std::string actual = shape_of(v);
    if (expected == actual) return true;
    return expected == "number" && actual == "integer";
}

json_object* tolerant_get(json_object* obj, const std::string& key) {
    json_object* v = nullptr;
    if (json_object_object_get_ex(obj, key.c_str(), &v)) return v;
    if (json_object_object_get_ex(obj, (":" + key).c_str(), &v)) return v;
    return nullptr;
}

// ":body" and "body" name the same member.
std::string plain_key(const std::string& key) {
    return key.size() > 1 && key[0] == ':' ? key.substr(1) : key;
}

bool tolerant_has(json_object* obj, const std::string& key) {
    return json_object_object_get_ex(obj, key.c_str(), nullptr) ||
           json_object_object_get_ex(obj, (":" + key).c_str(), nullptr);
}

std::vector<std::string> key_list(json_object* v) {
    std::vector<std::string> out;
    if (!v || !json_object_is_type(v, json_type_object)) return out;
    json_object_object_foreach(v, k, val) {
        (void)val;
        out.emplace_back(k);
    }
    return out;
}

size_t array_len(json_object* v) {
    return v && json_object_is_type(v, json_type_array) ? json_object_array_length(v) : 0;
}

bool empty_container(json_object* v) {
    if (!v) return false;
    if (json_object_is_type(v, json_type_array)) return json_object_array_length(v) == 0;
    if (json_object_is_type(v, json_type_object)) return json_object_object_length(v) == 0;
    return false;
}

ContractValidation invalid(const std::string& mismatch,
                           const std::string& expected_shape,
                           const std::string& actual_shape,
                           std::vector<std::string> expected_keys,
                           std::vector<std::string> actual_keys,
                           json_object* details = nullptr) {
    ContractValidation v;
    v.applied = true;
    v.valid = false;
    v.mismatch = mismatch;
    v.expected_shape = expected_shape;
    v.actual_shape = actual_shape;
    v.expected_keys = std::move(expected_keys);
    v.actual_keys = std::move(actual_keys);
    if (details) {
        v.details_json = json_dump(details);
        json_object_put(details);
    }
    return v;
}

ContractValidation valid(const std::string& normalized) {
    ContractValidation v;
    v.applied = true;
    v.normalized_value_json = normalized;
    return v;
}

json_object* min_items_details(const std::string& path, int64_t expected, json_object* actual) {
    json_object* d = json_object_new_object();
    json_object_object_add(d, "constraint_path", json_object_new_string(path.c_str()));
    json_object_object_add(d, "expected_min_items", json_object_new_int64(expected));
    json_object_object_add(d, "actual_items",
                           actual && json_object_is_type(actual, json_type_array)
                               ? json_object_new_int64((int64_t)json_object_array_length(actual))
                               : nullptr);
    return d;
}

ContractValidation validate_object(json_object* deliverable, json_object* value, const std::string& value_json) {
    std::vector<std::string> required;
    for (const auto& raw : json_get_string_array(deliverable, "required")) {
        const std::string k = plain_key(raw);
        if (!k.empty() && std::find(required.begin(), required.end(), k) == required.end()) required.push_back(k);
    }

    if (!value || !json_object_is_type(value, json_type_object)) {
        return invalid("type_mismatch", "object", shape_of(value), required, key_list(value));
    }
    for (const auto& k : required) {
        if (!tolerant_has(value, k)) {
            return invalid("missing_required_key", "object", "object", required, key_list(value));
        }
    }

    json_object* properties = member(member(deliverable, "constraints"), "properties");
    if (properties && json_object_is_type(properties, json_type_object)) {
        json_object_object_foreach(properties, pkey, pc) {
            const std::string key = plain_key(pkey);
            if (!tolerant_has(value, key)) continue;
            json_object* pv = tolerant_get(value, key);

            const std::string expected_type = string_member(pc, "type");
            if (!expected_type.empty() && !shape_matches(expected_type, pv)) {
                json_object* d = json_object_new_object();
                std::string path = "deliverable.constraints.properties." + key + ".type";
                json_object_object_add(d, "constraint_path", json_object_new_string(path.c_str()));
                return invalid("type_mismatch", expected_type, shape_of(pv), {key}, {}, d);
            }
            const int64_t min_items = min_items_of(pc);
            if (min_items >= 0) {
                const bool ok = pv && json_object_is_type(pv, json_type_array) &&
                                (int64_t)json_object_array_length(pv) >= min_items;
                if (!ok) {
                    return invalid("min_items_violation", "array", shape_of(pv), {key}, {},
                                   min_items_details("deliverable.constraints.properties." + key + ".min_items",
                                                     min_items, pv));
                }
            }
        }
    }

    // Plain-spelling aliases for ":key" members.
    json_mini::Doc normalized = json_mini::parse(value_json);
    bool changed = false;
    if (normalized.is_object()) {
        std::vector<std::pair<std::string, std::string>> aliases;
        json_object_object_foreach(normalized.root, k, v) {
            if (k[0] == ':' && k[1] != '\0' && !json_object_object_get_ex(normalized.root, k + 1, nullptr)) {
                aliases.emplace_back(k + 1, json_dump(v));
            }
        }
        for (const auto& a : aliases) {
            json_add_raw(normalized.root, a.first.c_str(), a.second);
            changed = true;
        }
    }
    return valid(changed ? json_dump(normalized.root) : value_json);
}

ContractValidation validate_array(json_object* deliverable, json_object* value, const std::string& value_json) {
    if (!value || !json_object_is_type(value, json_type_array)) {
        return invalid("type_mismatch", "array", shape_of(value), {}, key_list(value));
    }
    int64_t min_items = min_items_of(deliverable);
    std::string path = "deliverable.min_items";
    if (min_items < 0) {
        min_items = min_items_of(member(deliverable, "constraints"));
        path = "deliverable.constraints.min_items";
    }
    if (min_items >= 0 && (int64_t)json_object_array_length(value) < min_items) {
        return invalid("min_items_violation", "array", "array", {}, {}, min_items_details(path, min_items, value));
    }
    return valid(value_json);
}

} // namespace

std::string ContractValidation::metadata_json() const {
    json_mini::Doc d = json_mini::parse(details_json);
    json_object* o = d.is_object() ? d.release() : json_object_new_object();
    json_object_object_add(o, "expected_shape", json_object_new_string(expected_shape.c_str()));
    json_object_object_add(o, "actual_shape", json_object_new_string(actual_shape.c_str()));
    json_object_object_add(o, "expected_keys", json_string_array(expected_keys));
    json_object_object_add(o, "actual_keys", json_string_array(actual_keys));
    json_object_object_add(o, "mismatch", json_object_new_string(mismatch.c_str()));
    std::string s = json_dump(o);
    json_object_put(o);
    return s;
}

ContractValidation validate_contract(const std::string& contract_json,
                                     const std::string& value_json,
                                     const std::string& args_json,
                                     const std::string& kwargs_json) {
    json_mini::Doc contract = json_mini::parse(contract_json);
    if (!contract.is_object()) return ContractValidation{};

    json_object* deliverable = member(contract.root, "deliverable");
    if (!deliverable || !json_object_is_type(deliverable, json_type_object)) deliverable = contract.root;
    if (json_object_object_length(deliverable) == 0) return ContractValidation{};

    json_mini::Doc value = json_mini::parse(value_json);

    // A nil first argument answered with an empty "success".
    json_mini::Doc args = json_mini::parse(args_json);
    json_mini::Doc kwargs = json_mini::parse(kwargs_json);
    const bool nil_first_arg = array_len(args.root) > 0 &&
                               json_object_array_get_idx(args.root, 0) == nullptr;
    const bool no_kwargs = !kwargs.is_object() || json_object_object_length(kwargs.root) == 0;
    if (nil_first_arg && no_kwargs && empty_container(value.root)) {
        return invalid("nil_required_input", "non_nil_input", "nil", {}, {});
    }

    std::string type = string_member(deliverable, "type");
    if (type.empty()) {
        if (array_len(member(deliverable, "required")) > 0 ||
            member(member(deliverable, "constraints"), "properties")) {
            type = "object";
        } else if (min_items_of(deliverable) >= 0) {
            type = "array";
        }
    }

    if (type == "object") return validate_object(deliverable, value.root, value_json);
    if (type == "array") return validate_array(deliverable, value.root, value_json);
    return valid(value_json);
}

Outcome apply_deliverable_contract(const Outcome& o,
                                   const std::string& contract_json,
                                   const std::string& args_json,
                                   const std::string& kwargs_json,
                                   ContractValidation* validation) {
    ContractValidation v;
    if (o.ok) v = validate_contract(contract_json, o.value_json, args_json, kwargs_json);
    if (validation) *validation = v;
    if (!v.applied) return o;

    if (!v.valid) {
        return Outcome::failure("contract_violation",
                                "Delegated outcome does not satisfy deliverable contract (" + v.mismatch + ")",
                                false, o.role, o.method_name, v.metadata_json());
    }
    Outcome out = o;
    out.value_json = v.normalized_value_json;
    return coerce_low_utility(out);
}

std::string ContinuityReport::to_json() const {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "evaluated", json_object_new_boolean(evaluated));
    json_object_object_add(o, "passed", json_object_new_boolean(passed));
    json_object_object_add(o, "observed_keys", json_string_array(observed_keys));
    json_object_object_add(o, "reason", reason.empty() ? nullptr : json_object_new_string(reason.c_str()));
    json_object_object_add(o, "correction_hint",
                           correction_hint.empty() ? nullptr : json_object_new_string(correction_hint.c_str()));
    std::string s = json_dump(o);
    json_object_put(o);
    return s;
}

ContinuityReport evaluate_continuity(const ContinuityConstraint& c,
                                     const std::string& method_name,
                                     const std::string& code) {
    ContinuityReport r;
    if (c.canonical_key.empty()) return r;
    if (!c.methods.empty() && std::find(c.methods.begin(), c.methods.end(), method_name) == c.methods.end()) {
        return r;
    }
    r.evaluated = true;
    r.observed_keys = state_keys_from_code(code);
    if (r.observed_keys.empty()) return r;
    if (std::find(r.observed_keys.begin(), r.observed_keys.end(), c.canonical_key) != r.observed_keys.end()) {
        return r;
    }
    r.passed = false;
    r.reason = "state key family diverged from expected value '" + c.canonical_key + "'";
    r.correction_hint = "Read and write role state under memory key \"" + c.canonical_key +
                        "\" like the role's other methods.";
    return r;
}

} // namespace conjure
