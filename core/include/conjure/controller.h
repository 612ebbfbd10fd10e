#pragma once

#include "conjure/artifact_store.h"
#include "conjure/attempt.h"
#include "conjure/config.h"
#include "conjure/contract.h"
#include "conjure/environment.h"
#include "conjure/generator.h"
#include "conjure/guardrail.h"
#include "conjure/log.h"
#include "conjure/outcome.h"
#include "conjure/program.h"
#include "conjure/tool_registry.h"
#include "conjure/worker_supervisor.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace conjure {

// One logical call to an operation.
struct Invocation {
    std::string role;
    std::string method_name;
    std::string args_json{"[]"};
    std::string kwargs_json{"{}"};
    int depth{0};
    std::string trace_id;        // "" = new trace
    std::string parent_call_id;
    std::string contract_json;   // deliverable contract, "" = none
};

using Handler = std::function<Outcome(const Invocation&)>;

// Hand-registered implementations keyed by (role, method). Pairs without a
// handler go to the dynamic path.
class DispatchTable {
public:
    void register_handler(const std::string& role, const std::string& method_name, Handler h);
    const Handler* find(const std::string& role, const std::string& method_name) const;
    size_t size() const { return handlers_.size(); }

private:
    std::map<std::pair<std::string, std::string>, Handler> handlers_;
};

// Engine services. Stores and log are owned by the caller; null log disables
// logging, null environments/workers make dependency-bearing programs fail
// with dependency_activation_failed.
struct ControllerServices {
    ICodeGenerator* generator{nullptr};
    IProgramEvaluator* evaluator{nullptr};
    IEnvironmentManager* environments{nullptr};
    WorkerSupervisor* workers{nullptr};
    ArtifactStore* artifacts{nullptr};
    ToolRegistry* registry{nullptr};
    InvocationLog* log{nullptr};
};

// Drives one invocation to exactly one Outcome. Not thread-safe; nested
// invocations run synchronously inside the parent's attempt.
class AttemptLifecycleController {
public:
    AttemptLifecycleController(RuntimeConfig cfg,
                               ControllerServices services,
                               GuardrailPolicy policy = GuardrailPolicy::with_default_checks());

    // Never throws.
    Outcome invoke(const Invocation& inv);

    DispatchTable& dispatch() { return dispatch_; }

    void set_continuity_constraint(const std::string& role, ContinuityConstraint c);

    // Shared role state (survives across invocations of the role).
    JsonMap& role_memory(const std::string& role) { return memories_[role]; }
    // Manifest currently bound to the role's environment.
    const DependencyManifest* role_manifest(const std::string& role) const;

    const RuntimeConfig& config() const { return cfg_; }
    int64_t invocation_count() const { return step_; }

private:
    struct CallState;

    Outcome run_dynamic(const Invocation& inv, CallState& st);
    std::optional<Outcome> run_persisted(const Invocation& inv, CallState& st);
    std::optional<Outcome> repair_persisted(const Invocation& inv,
                                            const Artifact& artifact,
                                            const std::string& failure_class,
                                            const std::string& error_type,
                                            const std::string& error_message,
                                            CallState& st);
    Outcome run_fresh(const Invocation& inv, CallState& st);

    // Guardrails, routing, coercion, contract and continuity for one program.
    // Throws GuardrailFailure or Error.
    Outcome execute_attempt(const Invocation& inv, const Program& program, CallState& st);
    std::string run_in_worker(const Invocation& inv, const Program& program, JsonMap& memory, CallState& st);

    Program generate_program(const std::string& system_prompt,
                             const std::string& user_prompt,
                             ProgramOrigin origin,
                             CallState& st);
    PromptContext prompt_context(const Invocation& inv) const;

    // Nested invocation on behalf of a running program; returns the envelope.
    std::string delegate(const Invocation& parent, const CallState& st,
                         const std::string& role, const std::string& method, const std::string& args_json);

    void finish(const Invocation& inv, CallState& st, Outcome& out);
    std::string log_payload(const Invocation& inv, const CallState& st, const Outcome& out) const;

    RuntimeConfig cfg_;
    ControllerServices svc_;
    GuardrailPolicy policy_;
    DispatchTable dispatch_;

    std::map<std::string, JsonMap> memories_;
    std::map<std::string, DependencyManifest> manifests_;
    std::map<std::string, ContinuityConstraint> continuity_;
    int64_t step_{0};
};

// Depth-0 rewrite of guardrail_retry_exhausted into a generic message; the
// raw message and violation details move into metadata.
Outcome normalize_top_level_guardrail_exhaustion(const Outcome& o, int depth);

inline constexpr const char* GUARDRAIL_EXHAUSTED_USER_MESSAGE =
    "This request couldn't be completed after multiple attempts.";
inline constexpr const char* GUARDRAIL_NORMALIZATION_POLICY = "guardrail_exhaustion_boundary_v1";

} // namespace conjure
