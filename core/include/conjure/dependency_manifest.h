#pragma once

#include <json-c/json.h>

#include <string>
#include <vector>

namespace conjure {

struct Dependency {
    std::string name;     // lowercased, [a-z0-9_-]+
    std::string version;  // trimmed, ">= 0" when omitted
};

inline bool operator==(const Dependency& a, const Dependency& b) {
    return a.name == b.name && a.version == b.version;
}

// Ordered (by name), de-duplicated dependency list. Frozen once computed.
class DependencyManifest {
public:
    DependencyManifest() = default;

    const std::vector<Dependency>& entries() const { return deps_; }
    bool empty() const { return deps_.empty(); }
    size_t size() const { return deps_.size(); }

    const Dependency* find(const std::string& name) const;

    json_object* to_json() const;
    std::string to_json_text() const;
    // Canonical JSON text; the input of the environment id.
    std::string canonical() const;

    // Validates and normalizes raw entries. Throws Error
    // (invalid_dependency_manifest) on malformed or conflicting entries.
    static DependencyManifest normalize(const std::vector<Dependency>& raw);
    // Same, from the generator's JSON (array, or null for none).
    static DependencyManifest normalize_json(json_object* deps);
    static DependencyManifest normalize_json_text(const std::string& deps_json);

private:
    std::vector<Dependency> deps_;
};

// Additive rule within one role: every dependency of `current` must appear in
// `incoming` with an identical version. An empty incoming manifest keeps
// `current`. Throws Error (dependency_manifest_incompatible) otherwise.
DependencyManifest resolve_additive_manifest(const DependencyManifest& current,
                                             const DependencyManifest& incoming);

struct DependencyPolicy {
    bool has_allowed{false};
    std::vector<std::string> allowed;
    std::vector<std::string> blocked;
    std::string source_mode{"public"};          // public | internal_only
    std::vector<std::string> internal_sources;  // e.g. PKG_CONFIG_PATH entries
};

// Checked before materialization. Throws Error (dependency_policy_violation).
void enforce_dependency_policy(const DependencyManifest& m, const DependencyPolicy& policy);

} // namespace conjure
