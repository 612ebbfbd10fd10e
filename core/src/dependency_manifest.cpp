#include "conjure/dependency_manifest.h"
#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace conjure {

namespace {

const char* DEFAULT_VERSION = ">= 0";

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool valid_name(const std::string& n) {
    if (n.empty()) return false;
    for (char c : n) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-')) return false;
    }
    return true;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

[[noreturn]] void invalid(const std::string& msg) {
    throw Error("invalid_dependency_manifest", msg);
}

} // namespace

const Dependency* DependencyManifest::find(const std::string& name) const {
    for (const auto& d : deps_) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

json_object* DependencyManifest::to_json() const {
    json_object* arr = json_object_new_array();
    for (const auto& d : deps_) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "name", json_object_new_string(d.name.c_str()));
        json_object_object_add(e, "version", json_object_new_string(d.version.c_str()));
        json_object_array_add(arr, e);
    }
    return arr;
}

std::string DependencyManifest::to_json_text() const {
    json_object* j = to_json();
    std::string out = json_dump(j);
    json_object_put(j);
    return out;
}

std::string DependencyManifest::canonical() const {
    json_object* j = to_json();
    std::string out = json_canonical(j);
    json_object_put(j);
    return out;
}

DependencyManifest DependencyManifest::normalize(const std::vector<Dependency>& raw) {
    std::map<std::string, std::string> by_name;
    for (size_t i = 0; i < raw.size(); i++) {
        const std::string prefix = "dependencies[" + std::to_string(i) + "]";
        std::string name = trim(raw[i].name);
        if (name.empty()) invalid(prefix + ".name must be a non-empty string");
        if (!valid_name(name)) invalid(prefix + ".name has invalid characters: " + name);
        name = lower(name);

        std::string version = trim(raw[i].version);
        if (version.empty()) version = DEFAULT_VERSION;

        auto it = by_name.find(name);
        if (it != by_name.end()) {
            if (it->second != version) {
                invalid("dependency " + name + " declared with conflicting versions: " +
                        it->second + " vs " + version);
            }
            continue;
        }
        by_name[name] = version;
    }

    DependencyManifest m;
    for (const auto& kv : by_name) m.deps_.push_back({kv.first, kv.second});
    return m;
}

DependencyManifest DependencyManifest::normalize_json(json_object* deps) {
    if (!deps) return DependencyManifest{};
    if (!json_object_is_type(deps, json_type_array)) invalid("dependencies must be an array");

    std::vector<Dependency> raw;
    const size_t n = json_object_array_length(deps);
    for (size_t i = 0; i < n; i++) {
        const std::string prefix = "dependencies[" + std::to_string(i) + "]";
        json_object* e = json_object_array_get_idx(deps, i);
        if (!e || !json_object_is_type(e, json_type_object)) invalid(prefix + " must be an object");
        Dependency d;
        if (!json_get_string(e, "name", &d.name)) invalid(prefix + ".name must be a non-empty string");
        json_object* v = nullptr;
        if (json_object_object_get_ex(e, "version", &v) && v) {
            if (!json_object_is_type(v, json_type_string)) invalid(prefix + ".version must be a string");
            d.version = json_object_get_string(v);
        }
        raw.push_back(std::move(d));
    }
    return normalize(raw);
}

DependencyManifest DependencyManifest::normalize_json_text(const std::string& deps_json) {
    if (deps_json.empty() || deps_json == "null") return DependencyManifest{};
    json_mini::Doc d = json_mini::parse(deps_json);
    if (!d.root) invalid("dependencies must be an array");
    return normalize_json(d.root);
}

DependencyManifest resolve_additive_manifest(const DependencyManifest& current,
                                             const DependencyManifest& incoming) {
    if (incoming.empty()) return current;
    for (const auto& dep : current.entries()) {
        const Dependency* in = incoming.find(dep.name);
        if (!in || in->version != dep.version) {
            throw Error("dependency_manifest_incompatible",
                        "dependencies are incompatible with prior manifest "
                        "(existing entries must remain with identical versions): " + dep.name);
        }
    }
    return incoming;
}

void enforce_dependency_policy(const DependencyManifest& m, const DependencyPolicy& policy) {
    if (policy.source_mode == "internal_only") {
        if (policy.internal_sources.empty()) {
            throw Error("dependency_policy_violation",
                        "source_mode internal_only requires at least one internal source");
        }
    } else if (policy.source_mode != "public") {
        throw Error("dependency_policy_violation", "unknown source_mode: " + policy.source_mode);
    }

    for (const auto& d : m.entries()) {
        if (policy.has_allowed &&
            std::find(policy.allowed.begin(), policy.allowed.end(), d.name) == policy.allowed.end()) {
            throw Error("dependency_policy_violation",
                        "dependency policy violation for " + d.name + ": not in allowed list");
        }
        if (std::find(policy.blocked.begin(), policy.blocked.end(), d.name) != policy.blocked.end()) {
            throw Error("dependency_policy_violation",
                        "dependency policy violation for " + d.name + ": blocked");
        }
    }
}

} // namespace conjure
