#pragma once

#include "conjure/dependency_manifest.h"
#include "conjure/promotion.h"

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conjure {

inline constexpr int ARTIFACT_SCHEMA_VERSION = 1;
inline constexpr size_t ARTIFACT_HISTORY_MAX = 3;
inline constexpr const char* CONJURE_RUNTIME_VERSION = "0.4.0";

struct HistoryEntry {
    std::string id;          // gen-<hex>
    std::string parent_id;
    std::string trigger;     // initial_forge | repair:<class>_failure | regenerate:<reason>
    std::string created_at;
    std::string code_checksum;
    std::string prompt_version;
    std::string runtime_version;
    std::string model;
    std::string trigger_stage;
    std::string trigger_error_class;
    std::string trigger_error_message;
    int64_t trigger_attempt_id{0};
};

// Code of one earlier version, kept so enforced selection can fall back to it.
struct ArtifactVersion {
    std::string code;
    std::vector<Dependency> dependencies;
    std::string created_at;
};

// Persisted program + metadata for one (role, method).
struct Artifact {
    int schema_version{ARTIFACT_SCHEMA_VERSION};
    std::string role;
    std::string method_name;
    std::string contract_fingerprint{"none"};
    std::string prompt_version;
    std::string runtime_version;
    std::string model;

    // Legacy files may not carry the flag at all.
    std::optional<bool> cacheable;
    std::string cacheability_reason{"unknown"};
    bool input_sensitive{false};

    std::string code_checksum;
    std::string code;
    std::vector<Dependency> dependencies;

    int64_t success_count{0};
    int64_t failure_count{0};
    int64_t intrinsic_failure_count{0};
    int64_t adaptive_failure_count{0};
    int64_t extrinsic_failure_count{0};
    double recent_failure_rate{0.0};
    std::string last_failure_reason;
    std::string last_failure_class;
    int64_t repair_count_since_regen{0};

    std::string created_at;
    std::string last_used_at;
    std::string last_repaired_at;
    double last_duration_ms{0.0};

    std::vector<HistoryEntry> history;  // newest first

    std::map<std::string, Scorecard> scorecards;       // by checksum
    std::map<std::string, ArtifactVersion> versions;   // by checksum
    Lifecycle lifecycle;

    // Selection results (not persisted).
    std::string selected_checksum;
    std::string selected_lifecycle_state;
};

json_object* artifact_to_json(const Artifact& a);
// False when the object is not an artifact record.
bool artifact_from_json(json_object* o, Artifact* out, std::string* err);

// failures >= 3, failure rate > 0.6, failures > successes.
bool artifact_legacy_degraded(const Artifact& a);

} // namespace conjure
