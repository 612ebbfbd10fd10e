#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace conjure {

// Thresholds of the promotion gate. Tunable through RuntimeConfig.
struct PromotionPolicy {
    std::string version{"solver_promotion_v1"};
    int min_calls{10};
    int min_sessions{2};
    double min_contract_pass_rate{0.95};
    int max_guardrail_retry_exhausted{0};
    int max_outcome_retry_exhausted{0};
    int max_wrong_boundary_count{0};
    int max_provenance_violations{0};
    double min_state_key_consistency_ratio{0.5};

    int regression_min_calls{3};
    double regression_failure_rate{0.6};
};

struct WindowEntry {
    std::string status;
    std::string error_type;
    std::string at;
};

// Rolling per-version reliability record (keyed by code checksum).
struct Scorecard {
    std::string artifact_checksum;
    int64_t calls{0};
    int64_t successes{0};
    int64_t failures{0};
    int64_t contract_pass_count{0};
    int64_t contract_fail_count{0};
    int64_t guardrail_retry_exhausted_count{0};
    int64_t outcome_retry_exhausted_count{0};
    int64_t wrong_boundary_count{0};
    int64_t provenance_violation_count{0};

    std::vector<std::vector<std::string>> state_key_observations;
    double state_key_consistency_ratio{1.0};

    std::vector<std::string> sessions;       // unique trace ids
    std::vector<WindowEntry> short_window;
    std::vector<WindowEntry> medium_window;

    std::string last_outcome_status;
    std::string updated_at;
};

inline constexpr size_t SCORECARD_SESSIONS_MAX = 200;
inline constexpr size_t SCORECARD_SHORT_WINDOW = 20;
inline constexpr size_t SCORECARD_MEDIUM_WINDOW = 200;
inline constexpr size_t SCORECARD_STATE_KEY_OBSERVATIONS = 200;
inline constexpr size_t SHADOW_LEDGER_MAX = 200;

// What one finished invocation contributes to a scorecard.
struct CallObservation {
    bool ok{false};
    std::string error_type;
    std::string error_message;
    bool contract_applied{false};
    bool contract_passed{false};
    bool guardrail_retry_exhausted{false};
    bool outcome_repair_retry_exhausted{false};
    std::string code;
    std::string trace_id;
    std::string timestamp;
};

void record_scorecard_call(Scorecard& sc, const CallObservation& obs);

// Shared-state keys a program touches: memory_get("k") / memory_set("k", ...).
std::vector<std::string> state_keys_from_code(const std::string& code);

struct PromotionMetrics {
    int64_t calls{0};
    int64_t successes{0};
    int64_t failures{0};
    double failure_rate{0.0};
    int64_t session_count{0};
    double contract_pass_rate{1.0};
    int64_t guardrail_retry_exhausted{0};
    int64_t outcome_retry_exhausted{0};
    int64_t wrong_boundary_count{0};
    int64_t provenance_violations{0};
    double state_key_consistency_ratio{1.0};
};

// Metrics of sc, counted from `baseline` onward when one is given.
PromotionMetrics promotion_metrics(const Scorecard& sc, const Scorecard* baseline = nullptr);
bool probation_gate_pass(const PromotionMetrics& m, const Scorecard* incumbent, const PromotionPolicy& p);
bool promotion_regressed(const PromotionMetrics& m, const PromotionPolicy& p);

struct LifecycleEntry {
    std::string artifact_checksum;
    std::string lifecycle_state{"candidate"};  // candidate|probation|durable|degraded
    std::string policy_version;
    std::string incumbent_artifact_checksum;
    bool compatibility_mode{false};
    std::string first_seen_at;
    std::string last_decision{"hold"};
    std::string last_decision_at;
    // Scorecard at the moment of degradation; re-promotion is measured from here.
    std::optional<Scorecard> degraded_baseline;
};

struct ShadowEvaluation {
    std::string candidate_artifact_id;
    std::string incumbent_artifact_id;
    std::string decision;
    std::string policy_version;
    std::string rationale_json{"{}"};
    std::string at;
};

struct Lifecycle {
    bool present{false};
    std::string policy_version;
    std::string incumbent_durable_checksum;
    bool legacy_compatibility_mode{false};
    std::map<std::string, LifecycleEntry> versions;
    int64_t false_promotion_count{0};
    int64_t false_hold_count{0};
    std::vector<ShadowEvaluation> evaluations;
    std::string created_at;
};

struct PromotionDecision {
    bool evaluated{false};
    std::string lifecycle_state;
    std::string decision;
    std::string rationale_json{"{}"};
    std::string policy_version;
};

// Runs one lifecycle transition for `checksum` after a finished call.
PromotionDecision evaluate_promotion(Lifecycle& lc,
                                     const std::map<std::string, Scorecard>& scorecards,
                                     const std::string& checksum,
                                     bool outcome_ok,
                                     bool enforcement,
                                     const PromotionPolicy& policy,
                                     const std::string& timestamp,
                                     bool legacy_mode);

// Enforced selection: incumbent durable > any durable > probation > candidate.
// Only checksums in `available` are considered. Returns {checksum, state}.
std::optional<std::pair<std::string, std::string>>
select_lifecycle_version(const Lifecycle& lc, const std::set<std::string>& available);

json_object* scorecard_to_json(const Scorecard& sc);
Scorecard scorecard_from_json(json_object* o);
json_object* lifecycle_to_json(const Lifecycle& lc);
Lifecycle lifecycle_from_json(json_object* o);

} // namespace conjure
