#pragma once

#include "conjure/artifact.h"
#include "conjure/outcome.h"
#include "conjure/promotion.h"

#include <filesystem>
#include <optional>
#include <string>

namespace conjure {

// Free-text methods whose behavior legitimately depends on the input.
bool is_dynamic_dispatch_method(const std::string& method_name);

// "none", or "sha256:<hex>" of the canonical contract JSON.
std::string contract_fingerprint(const std::string& contract_json);

struct ArtifactSelectOptions {
    std::string contract_fingerprint{"none"};
    std::string prompt_version;
    bool enforcement{false};
};

// Everything one finished invocation contributes to its artifact.
struct ArtifactUpdate {
    std::string role;
    std::string method_name;
    std::string code;
    std::vector<Dependency> dependencies;
    bool cacheable{false};
    std::string cacheability_reason{"unknown"};
    bool input_sensitive{false};
    std::string contract_fingerprint{"none"};
    std::string prompt_version;
    std::string model;

    Outcome outcome;

    // Explicit history trigger (repair:<class>_failure, regenerate:<reason>,
    // fallback:durable). Derived from the checksums when empty.
    std::string trigger;
    std::string trigger_stage;
    std::string trigger_error_class;
    std::string trigger_error_message;
    int64_t trigger_attempt_id{0};

    bool contract_applied{false};
    bool contract_passed{false};
    bool guardrail_retry_exhausted{false};
    bool outcome_repair_retry_exhausted{false};
    std::string trace_id;
    double duration_ms{0.0};
};

struct PromotionSettings {
    PromotionPolicy policy;
    bool shadow_mode{true};
    bool enforcement{false};
};

// One JSON file per (role, method) under <root>/artifacts/<role>/<method>.json.
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    std::filesystem::path path_for(const std::string& role, const std::string& method_name) const;

    // nullopt when missing, corrupt (quarantined) or of an unsupported schema.
    std::optional<Artifact> load(const std::string& role, const std::string& method_name) const;
    bool write(const Artifact& a, std::string* err) const;

    // Reuse gate: cacheable, version- and contract-compatible, checksum-valid
    // and not degraded. Under enforcement the lifecycle picks the version.
    std::optional<Artifact> select(const std::string& role,
                                   const std::string& method_name,
                                   const ArtifactSelectOptions& opts) const;

    // Load-or-create, fold the invocation in, write atomically.
    // Blank code is skipped (returns true, decision not evaluated).
    bool persist(const ArtifactUpdate& u,
                 const PromotionSettings& promotion,
                 PromotionDecision* decision,
                 std::string* err) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

inline constexpr size_t ARTIFACT_VERSIONS_MAX = 8;

} // namespace conjure
