#include "conjure/controller.h"
#include "conjure/errors.h"
#include "conjure/hash.h"
#include "conjure/json_mini.h"
#include "conjure/promotion.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace conjure {

namespace {

// Raised inside an attempt when a guardrail check fails; never leaves the
// controller.
class GuardrailFailure : public std::runtime_error {
public:
    explicit GuardrailFailure(GuardrailViolation v) : std::runtime_error(v.message), violation(std::move(v)) {}
    GuardrailViolation violation;
};

// Worker fault after the restart budget is spent: not worth another attempt.
class TerminalWorkerFault : public Error {
public:
    TerminalWorkerFault(const std::string& type, const std::string& message) : Error(type, message) {}
};

bool is_execution_fault(const std::string& type) {
    return type == "execution" || type == "worker_crash" || type == "timeout" ||
           type == "non_serializable_result" || type == "invalid_code";
}

std::string metadata_of(std::initializer_list<std::pair<const char*, std::string>> raw_members) {
    json_object* o = json_object_new_object();
    for (const auto& kv : raw_members) json_add_raw(o, kv.first, kv.second);
    std::string s = json_dump(o);
    json_object_put(o);
    return s;
}

std::string cacheability_reason(const std::string& method_name, bool input_sensitive) {
    if (is_dynamic_dispatch_method(method_name)) return "dynamic_dispatch_method";
    if (input_sensitive) return "input_sensitive";
    return "stable_method";
}

} // namespace

struct AttemptLifecycleController::CallState {
    std::string call_id;
    std::string trace_id;
    int64_t started_ms{0};

    AttemptTelemetry telemetry;
    int64_t attempt_id{0};
    int generation_attempts{0};
    int guardrail_recovery_attempts{0};
    int execution_repair_attempts{0};
    int outcome_repair_attempts{0};
    bool guardrail_retry_exhausted{false};
    bool outcome_repair_retry_exhausted{false};

    std::string program_source{"none"};  // handler | persisted | repaired | generated
    Program program;
    bool has_program{false};
    bool program_executed{false};

    bool artifact_hit{false};
    std::string artifact_checksum;
    std::string lifecycle_state;
    bool repair_attempted{false};
    std::string failure_class;

    std::string trigger;
    std::string trigger_stage;
    std::string trigger_error_class;
    std::string trigger_error_message;
    int64_t trigger_attempt_id{0};

    ContractValidation contract;
    ContinuityReport continuity;

    std::string env_id;
    std::optional<DependencyManifest> pending_manifest;  // bound to the role in finish()
    int worker_restart_count{0};
    int64_t worker_pid{0};
    std::vector<std::string> delegated;

    PromotionDecision promotion;
};

// ---- DispatchTable ----

void DispatchTable::register_handler(const std::string& role, const std::string& method_name, Handler h) {
    handlers_[{role, method_name}] = std::move(h);
}

const Handler* DispatchTable::find(const std::string& role, const std::string& method_name) const {
    auto it = handlers_.find({role, method_name});
    return it == handlers_.end() ? nullptr : &it->second;
}

// ---- boundary normalization ----

Outcome normalize_top_level_guardrail_exhaustion(const Outcome& o, int depth) {
    if (o.ok || o.error_type != "guardrail_retry_exhausted" || depth != 0) return o;

    json_mini::Doc meta = json_mini::parse(o.metadata_json);
    json_object* m = meta.is_object() ? meta.release() : json_object_new_object();

    json_object_object_add(m, "normalized", json_object_new_boolean(1));
    json_object_object_add(m, "normalization_policy", json_object_new_string(GUARDRAIL_NORMALIZATION_POLICY));
    std::string klass;
    if (!json_get_string(m, "guardrail_class", &klass) || klass.empty()) {
        json_object_object_add(m, "guardrail_class", json_object_new_string(GUARDRAIL_RECOVERABLE));
    }
    std::string subtype;
    if (!json_get_string(m, "last_violation_subtype", &subtype) || subtype.empty()) {
        subtype = "unknown_guardrail_violation";
    }
    json_object_object_add(m, "guardrail_subtype", json_object_new_string(subtype.c_str()));
    std::string raw;
    if (!json_get_string(m, "raw_error_message", &raw) || raw.empty()) {
        json_object_object_add(m, "raw_error_message", json_object_new_string(o.error_message.c_str()));
    }

    Outcome out = o;
    out.error_message = GUARDRAIL_EXHAUSTED_USER_MESSAGE;
    out.metadata_json = json_dump(m);
    json_object_put(m);
    return out;
}

// ---- controller ----

AttemptLifecycleController::AttemptLifecycleController(RuntimeConfig cfg,
                                                       ControllerServices services,
                                                       GuardrailPolicy policy)
    : cfg_(std::move(cfg)), svc_(services), policy_(std::move(policy)) {}

void AttemptLifecycleController::set_continuity_constraint(const std::string& role, ContinuityConstraint c) {
    continuity_[role] = std::move(c);
}

const DependencyManifest* AttemptLifecycleController::role_manifest(const std::string& role) const {
    auto it = manifests_.find(role);
    return it == manifests_.end() ? nullptr : &it->second;
}

Outcome AttemptLifecycleController::invoke(const Invocation& inv) {
    CallState st;
    st.call_id = hash::random_hex(8);
    st.trace_id = inv.trace_id.empty() ? hash::random_hex(8) : inv.trace_id;
    st.started_ms = now_ms();

    Outcome out;
    try {
        if (cfg_.max_delegation_depth > 0 && inv.depth > cfg_.max_delegation_depth) {
            out = Outcome::failure("budget_exceeded",
                                   "delegation depth " + std::to_string(inv.depth) + " exceeds limit " +
                                       std::to_string(cfg_.max_delegation_depth),
                                   false, inv.role, inv.method_name);
        } else if (const Handler* h = dispatch_.find(inv.role, inv.method_name)) {
            st.program_source = "handler";
            out = (*h)(inv);
        } else {
            out = run_dynamic(inv, st);
        }
    } catch (const Error& e) {
        out = Outcome::from_error(e, inv.role, inv.method_name);
    } catch (const std::exception& e) {
        out = Outcome::failure("execution", e.what(), false, inv.role, inv.method_name);
    }

    if (out.role.empty()) out.role = inv.role;
    if (out.method_name.empty()) out.method_name = inv.method_name;
    out = normalize_top_level_guardrail_exhaustion(out, inv.depth);

    finish(inv, st, out);
    return out;
}

Outcome AttemptLifecycleController::run_dynamic(const Invocation& inv, CallState& st) {
    if (auto persisted = run_persisted(inv, st)) return *persisted;
    return run_fresh(inv, st);
}

PromptContext AttemptLifecycleController::prompt_context(const Invocation& inv) const {
    PromptContext ctx;
    ctx.role = inv.role;
    ctx.method_name = inv.method_name;
    ctx.args_json = inv.args_json;
    ctx.kwargs_json = inv.kwargs_json;
    ctx.depth = inv.depth;
    ctx.contract_json = inv.contract_json;
    if (svc_.registry) ctx.tools_json = svc_.registry->tools_json();
    auto mem = memories_.find(inv.role);
    if (mem != memories_.end()) {
        for (const auto& kv : mem->second) {
            if (kv.first != TOOLS_MEMORY_KEY) ctx.memory_keys.push_back(kv.first);
        }
    }
    return ctx;
}

Program AttemptLifecycleController::generate_program(const std::string& system_prompt,
                                                     const std::string& user_prompt,
                                                     ProgramOrigin origin,
                                                     CallState& st) {
    if (!svc_.generator) throw Error("provider", "no code generator configured");

    const int max_attempts = std::max(1, cfg_.max_generation_attempts);
    for (int n = 1;; n++) {
        st.generation_attempts++;
        try {
            GenerationRequest req;
            req.model = cfg_.model;
            req.system_prompt = system_prompt;
            req.user_prompt = user_prompt;
            req.schema_json = program_payload_schema();
            req.timeout_ms = cfg_.generator_timeout_ms;
            GeneratedPayload payload = svc_.generator->generate(req);

            Program p;
            p.code = payload.code;
            p.dependencies = DependencyManifest::normalize_json_text(payload.dependencies_json);
            p.origin = origin;
            p.input_sensitive = payload.input_sensitive;
            return p;
        } catch (const Error& e) {
            if (e.type() == "invalid_code") {
                st.telemetry.record(st.attempt_id, "validation", e.type(), e.what(), st.call_id);
            }
            if (!e.retriable() || n >= max_attempts) throw;
            debug_log("generation attempt " + std::to_string(n) + " failed: " + e.type() + ": " + e.what());
        }
    }
}

std::string AttemptLifecycleController::delegate(const Invocation& parent,
                                                 const CallState& st,
                                                 const std::string& role,
                                                 const std::string& method,
                                                 const std::string& args_json) {
    Invocation child;
    child.role = role;
    child.method_name = method;
    child.args_json = args_json;
    child.depth = parent.depth + 1;
    child.trace_id = st.trace_id;
    child.parent_call_id = st.call_id;
    return outcome_envelope(invoke(child));
}

std::string AttemptLifecycleController::run_in_worker(const Invocation& inv,
                                                      const Program& program,
                                                      JsonMap& memory,
                                                      CallState& st) {
    if (!svc_.environments || !svc_.workers) {
        throw Error("dependency_activation_failed", "no worker runtime configured for dependency-bearing programs");
    }
    enforce_dependency_policy(program.dependencies, cfg_.dependency_policy);

    auto bound = manifests_.find(inv.role);
    const DependencyManifest effective = bound == manifests_.end()
                                             ? program.dependencies
                                             : resolve_additive_manifest(bound->second, program.dependencies);
    EnvironmentHandle env = svc_.environments->ensure(effective);
    st.env_id = env.env_id;

    WorkerRequest req;
    req.call_id = st.call_id;
    req.role = inv.role;
    req.method_name = inv.method_name;
    req.code = program.code;
    req.args_json = inv.args_json;
    req.kwargs_json = inv.kwargs_json;
    req.context_snapshot_json = json_map_to_text(memory);
    req.tools_json = svc_.registry ? svc_.registry->tools_json() : "{}";
    req.env_dir = env.dir;

    WorkerResponse resp = svc_.workers->execute(env.env_id, env.dir, req, cfg_.worker_timeout_ms);
    st.worker_restart_count = resp.worker_restart_count;
    st.worker_pid = resp.worker_pid;

    if (resp.status != "ok") {
        const std::string type = resp.error_type.empty() ? "worker_crash" : resp.error_type;
        if (resp.terminal) throw TerminalWorkerFault(type, resp.error_message);
        throw Error(type, resp.error_message);
    }

    JsonMap snapshot;
    if (!json_map_from_text(resp.context_snapshot_json, &snapshot)) {
        throw Error("non_serializable_result", "worker returned a context snapshot that is not a JSON object");
    }
    memory = std::move(snapshot);
    st.pending_manifest = effective;
    return resp.value_json;
}

Outcome AttemptLifecycleController::execute_attempt(const Invocation& inv, const Program& program, CallState& st) {
    st.pending_manifest.reset();
    if (auto v = policy_.check_code(program.code)) throw GuardrailFailure(*v);

    JsonMap& memory = memories_[inv.role];
    if (svc_.registry) memory[TOOLS_MEMORY_KEY] = svc_.registry->tools_json();
    const JsonMap before = memory;

    std::string raw;
    if (!program.dependencies.empty()) {
        raw = run_in_worker(inv, program, memory, st);
    } else {
        if (!svc_.evaluator) throw Error("execution", "no program evaluator configured");
        SandboxInputs in;
        in.role = inv.role;
        in.method_name = inv.method_name;
        in.args_json = inv.args_json;
        in.kwargs_json = inv.kwargs_json;
        in.tools_json = svc_.registry ? svc_.registry->tools_json() : "{}";
        in.delegate = [this, &inv, &st](const std::string& role, const std::string& method,
                                        const std::string& args_json) {
            return delegate(inv, st, role, method, args_json);
        };
        SandboxRun run = run_in_sandbox(*svc_.evaluator, program.code, {}, in, memory);
        st.delegated = run.delegated_methods;
        if (!run.serializable) throw Error("non_serializable_result", "program result is not valid JSON");
        raw = run.raw_result;
    }
    st.program_executed = true;

    if (auto v = check_registry_integrity(before, memory, inv.role, inv.method_name)) throw GuardrailFailure(*v);

    Outcome out = coerce_outcome(raw, inv.role, inv.method_name);
    if (!inv.contract_json.empty()) {
        out = apply_deliverable_contract(out, inv.contract_json, inv.args_json, inv.kwargs_json, &st.contract);
    }
    if (!out.ok) return out;

    if (auto v = policy_.check_outcome(program.code, out)) throw GuardrailFailure(*v);

    auto c = continuity_.find(inv.role);
    if (c != continuity_.end()) {
        st.continuity = evaluate_continuity(c->second, inv.method_name, program.code);
        if (!st.continuity.passed) {
            debug_log("continuity " + inv.role + "." + inv.method_name + ": " + st.continuity.reason);
            if (cfg_.continuity_enforcement_enabled) {
                throw GuardrailFailure(make_violation("role_profile_continuity_violation", st.continuity.reason));
            }
        }
    }
    return out;
}

std::optional<Outcome> AttemptLifecycleController::run_persisted(const Invocation& inv, CallState& st) {
    if (!svc_.artifacts) return std::nullopt;

    ArtifactSelectOptions opts;
    opts.contract_fingerprint = contract_fingerprint(inv.contract_json);
    opts.prompt_version = cfg_.prompt_version;
    opts.enforcement = cfg_.promotion_enforcement_enabled;
    std::optional<Artifact> a = svc_.artifacts->select(inv.role, inv.method_name, opts);
    if (!a) return std::nullopt;

    st.artifact_hit = true;
    st.artifact_checksum = a->selected_checksum;
    st.lifecycle_state = a->selected_lifecycle_state;

    Program p;
    p.code = a->code;
    p.origin = ProgramOrigin::PERSISTED;
    p.input_sensitive = a->input_sensitive;
    try {
        p.dependencies = DependencyManifest::normalize(a->dependencies);
    } catch (const Error& e) {
        debug_log("artifact " + inv.role + "." + inv.method_name + ": " + e.what());
        st.trigger = "regenerate:invalid_persisted_manifest";
        return std::nullopt;
    }
    st.program = p;
    st.has_program = true;
    st.program_source = "persisted";

    const JsonMap snapshot = memories_[inv.role];
    std::string stage;
    std::string error_type;
    std::string error_message;
    FailureClass fc = FailureClass::NONE;
    try {
        Outcome out = execute_attempt(inv, p, st);
        if (out.ok) return out;
        fc = failure_class_for(out.error_type);
        st.failure_class = failure_class_name(fc);
        // Declared capability limits and upstream faults are the answer.
        if (fc != FailureClass::ADAPTIVE) return out;
        stage = "outcome_policy";
        error_type = out.error_type;
        error_message = out.error_message;
    } catch (const GuardrailFailure& g) {
        memories_[inv.role] = snapshot;
        st.trigger = "regenerate:guardrail_violation";
        st.trigger_stage = "guardrail";
        st.trigger_error_class = g.violation.violation_type;
        st.trigger_error_message = truncate_failure_message(g.violation.message);
        st.has_program = false;
        st.program_executed = false;
        return std::nullopt;
    } catch (const TerminalWorkerFault& e) {
        st.failure_class = failure_class_name(failure_class_for(e.type()));
        return Outcome::failure(e.type(), e.what(), false, inv.role, inv.method_name,
                                metadata_of({{"terminal", "true"},
                                             {"worker_restart_count", std::to_string(st.worker_restart_count)}}));
    } catch (const Error& e) {
        fc = failure_class_for(e.type());
        st.failure_class = failure_class_name(fc);
        if (fc == FailureClass::EXTRINSIC) return Outcome::from_error(e, inv.role, inv.method_name);
        stage = "execution";
        error_type = e.type();
        error_message = e.what();
    }

    memories_[inv.role] = snapshot;
    st.trigger_stage = stage;
    st.trigger_error_class = error_type;
    st.trigger_error_message = truncate_failure_message(error_message);

    if (a->repair_count_since_regen < cfg_.max_repairs_before_regen) {
        if (auto repaired = repair_persisted(inv, *a, failure_class_name(fc), error_type, error_message, st)) {
            return repaired;
        }
        memories_[inv.role] = snapshot;
        st.trigger = "regenerate:repair_failed";
    } else {
        st.trigger = "regenerate:repair_budget_exhausted";
    }
    st.program_source = "none";
    st.has_program = false;
    st.program_executed = false;
    return std::nullopt;
}

std::optional<Outcome> AttemptLifecycleController::repair_persisted(const Invocation& inv,
                                                                    const Artifact& artifact,
                                                                    const std::string& failure_class,
                                                                    const std::string& error_type,
                                                                    const std::string& error_message,
                                                                    CallState& st) {
    st.repair_attempted = true;
    try {
        const PromptContext ctx = prompt_context(inv);
        Program p = generate_program(build_system_prompt(ctx),
                                     repair_user_prompt(build_user_prompt(ctx), artifact.code, error_type, error_message),
                                     ProgramOrigin::REPAIRED, st);
        st.program = p;
        st.has_program = true;
        st.program_executed = false;
        st.program_source = "repaired";

        Outcome out = execute_attempt(inv, p, st);
        if (!out.ok) {
            debug_log("repair " + inv.role + "." + inv.method_name + " failed: " + out.error_type);
            return std::nullopt;
        }
        st.trigger = "repair:" + failure_class + "_failure";
        return out;
    } catch (const GuardrailFailure& g) {
        debug_log("repair " + inv.role + "." + inv.method_name + " violated guardrail: " + g.violation.message);
    } catch (const Error& e) {
        debug_log("repair " + inv.role + "." + inv.method_name + " failed: " + e.type() + ": " + e.what());
    }
    return std::nullopt;
}

Outcome AttemptLifecycleController::run_fresh(const Invocation& inv, CallState& st) {
    const PromptContext ctx = prompt_context(inv);
    const std::string system_prompt = build_system_prompt(ctx);
    const std::string base_prompt = build_user_prompt(ctx);

    std::optional<GuardrailFeedback> guardrail_fb;
    std::optional<FailureFeedback> execution_fb;
    std::optional<FailureFeedback> outcome_fb;

    while (true) {
        st.attempt_id = st.guardrail_recovery_attempts + st.execution_repair_attempts + st.outcome_repair_attempts + 1;
        st.has_program = false;
        st.program_executed = false;

        Program program;
        try {
            program = generate_program(system_prompt, retry_user_prompt(base_prompt, guardrail_fb, execution_fb, outcome_fb),
                                       ProgramOrigin::FRESH, st);
        } catch (const Error& e) {
            return Outcome::from_error(e, inv.role, inv.method_name);
        }
        st.program = program;
        st.has_program = true;
        st.program_source = "generated";

        const JsonMap snapshot = memories_[inv.role];
        try {
            Outcome out = execute_attempt(inv, program, st);
            if (out.ok || !out.retriable || failure_class_for(out.error_type) == FailureClass::EXTRINSIC) return out;

            memories_[inv.role] = snapshot;
            st.telemetry.record(st.attempt_id, "outcome_policy", out.error_type, out.error_message, st.call_id);
            if (st.outcome_repair_attempts >= cfg_.fresh_outcome_repair_budget) {
                st.outcome_repair_retry_exhausted = true;
                return Outcome::failure(
                    "outcome_repair_retry_exhausted",
                    "Retriable outcome-error repairs exhausted for " + inv.role + "." + inv.method_name, false,
                    inv.role, inv.method_name,
                    metadata_of({{"outcome_repair_attempts", std::to_string(st.outcome_repair_attempts)},
                                 {"last_error_type", json_quote(out.error_type)},
                                 {"last_error_message", json_quote(out.error_message)}}));
            }
            st.outcome_repair_attempts++;
            guardrail_fb.reset();
            execution_fb.reset();
            outcome_fb = outcome_feedback(out.error_type, out.error_message, st.attempt_id + 1,
                                          cfg_.fresh_outcome_repair_budget - st.outcome_repair_attempts);
        } catch (const GuardrailFailure& g) {
            memories_[inv.role] = snapshot;
            const GuardrailViolation& v = g.violation;
            st.telemetry.record(st.attempt_id, "guardrail", v.violation_type, v.message, st.call_id);
            if (v.terminal()) {
                return Outcome::failure(v.violation_type, v.message, false, inv.role, inv.method_name, v.to_json());
            }
            st.guardrail_recovery_attempts++;
            const int remaining = cfg_.guardrail_recovery_budget - st.guardrail_recovery_attempts;
            if (remaining < 0) {
                st.guardrail_retry_exhausted = true;
                return Outcome::failure(
                    "guardrail_retry_exhausted",
                    "Recoverable guardrail retries exhausted for " + inv.role + "." + inv.method_name, false,
                    inv.role, inv.method_name,
                    metadata_of({{"guardrail_recovery_attempts", std::to_string(st.guardrail_recovery_attempts)},
                                 {"guardrail_class", json_quote(v.guardrail_class)},
                                 {"last_violation_type", json_quote(v.violation_type)},
                                 {"last_violation_subtype", json_quote(v.violation_subtype)},
                                 {"last_violation_message", json_quote(v.message)}}));
            }
            GuardrailFeedback fb;
            fb.violation = v;
            fb.attempt_number = st.attempt_id + 1;
            fb.remaining_budget = remaining;
            guardrail_fb = fb;
            execution_fb.reset();
            outcome_fb.reset();
        } catch (const TerminalWorkerFault& e) {
            memories_[inv.role] = snapshot;
            st.telemetry.record(st.attempt_id, "execution", e.type(), e.what(), st.call_id);
            return Outcome::failure(e.type(), e.what(), false, inv.role, inv.method_name,
                                    metadata_of({{"terminal", "true"},
                                                 {"worker_restart_count", std::to_string(st.worker_restart_count)}}));
        } catch (const Error& e) {
            if (!is_execution_fault(e.type())) return Outcome::from_error(e, inv.role, inv.method_name);

            memories_[inv.role] = snapshot;
            st.telemetry.record(st.attempt_id, "execution", e.type(), e.what(), st.call_id);
            if (st.execution_repair_attempts >= cfg_.execution_repair_budget) {
                return Outcome::failure(e.type(), e.what(), false, inv.role, inv.method_name, e.metadata_json());
            }
            st.execution_repair_attempts++;
            guardrail_fb.reset();
            outcome_fb.reset();
            execution_fb = execution_feedback(e.type(), e.what(), st.attempt_id + 1,
                                              cfg_.execution_repair_budget - st.execution_repair_attempts);
        }
    }
}

void AttemptLifecycleController::finish(const Invocation& inv, CallState& st, Outcome& out) {
    step_++;

    if (st.program_executed && st.pending_manifest) manifests_[inv.role] = *st.pending_manifest;

    if (svc_.artifacts && st.has_program && st.program_executed) {
        const bool input_sensitive = st.program.input_sensitive;
        ArtifactUpdate u;
        u.role = inv.role;
        u.method_name = inv.method_name;
        u.code = st.program.code;
        u.dependencies = st.program.dependencies.entries();
        u.cacheable = !is_dynamic_dispatch_method(inv.method_name) && !input_sensitive;
        u.cacheability_reason = cacheability_reason(inv.method_name, input_sensitive);
        u.input_sensitive = input_sensitive;
        u.contract_fingerprint = contract_fingerprint(inv.contract_json);
        u.prompt_version = cfg_.prompt_version;
        u.model = cfg_.model;
        u.outcome = out;

        u.trigger = st.trigger;
        u.trigger_stage = st.trigger_stage;
        u.trigger_error_class = st.trigger_error_class;
        u.trigger_error_message = st.trigger_error_message;
        u.trigger_attempt_id = st.trigger_attempt_id;
        if (st.program_source == "generated" && !st.telemetry.empty()) {
            u.trigger_stage = st.telemetry.latest_stage();
            u.trigger_error_class = st.telemetry.latest_class();
            u.trigger_error_message = st.telemetry.latest_message();
            u.trigger_attempt_id = st.telemetry.failures().back().attempt_id;
        }

        u.contract_applied = st.contract.applied;
        u.contract_passed = st.contract.applied && st.contract.valid;
        u.guardrail_retry_exhausted = st.guardrail_retry_exhausted;
        u.outcome_repair_retry_exhausted = st.outcome_repair_retry_exhausted;
        u.trace_id = st.trace_id;
        u.duration_ms = (double)(now_ms() - st.started_ms);

        PromotionSettings promotion;
        promotion.policy = cfg_.promotion_policy;
        promotion.shadow_mode = cfg_.promotion_shadow_mode_enabled;
        promotion.enforcement = cfg_.promotion_enforcement_enabled;

        std::string err;
        if (!svc_.artifacts->persist(u, promotion, &st.promotion, &err)) {
            debug_log("artifact " + inv.role + "." + inv.method_name + ": persist failed: " + err);
        }
    }

    if (svc_.registry) {
        svc_.registry->touch_usage(inv.role, inv.method_name, out.ok);
        std::string err;
        if (!svc_.registry->flush(&err)) debug_log("registry flush failed: " + err);
    }

    if (svc_.log) svc_.log->event(step_, "invocation", log_payload(inv, st, out));
}

std::string AttemptLifecycleController::log_payload(const Invocation& inv,
                                                    const CallState& st,
                                                    const Outcome& out) const {
    json_mini::Doc telemetry = json_mini::parse(st.telemetry.to_json());
    json_object* root = telemetry.is_object() ? telemetry.release() : json_object_new_object();

    auto str = [&](const char* k, const std::string& v) {
        json_object_object_add(root, k, json_object_new_string(v.c_str()));
    };
    auto opt_str = [&](const char* k, const std::string& v) {
        json_object_object_add(root, k, v.empty() ? nullptr : json_object_new_string(v.c_str()));
    };

    str("role", inv.role);
    str("method", inv.method_name);
    str("call_id", st.call_id);
    str("trace_id", st.trace_id);
    opt_str("parent_call_id", inv.parent_call_id);
    json_object_object_add(root, "depth", json_object_new_int(inv.depth));
    json_add_raw(root, "args", inv.args_json);
    json_add_raw(root, "kwargs", inv.kwargs_json);
    json_object_object_add(root, "duration_ms", json_object_new_int64(now_ms() - st.started_ms));

    json_object_object_add(root, "outcome", outcome_to_json(out));
    str("outcome_status", out.status());

    str("program_source", st.program_source);
    opt_str("code", st.has_program ? st.program.code : std::string());
    json_object_object_add(root, "dependencies",
                           st.has_program ? st.program.dependencies.to_json() : json_object_new_array());
    opt_str("env_id", st.env_id);
    json_object_object_add(root, "worker_restart_count", json_object_new_int(st.worker_restart_count));
    if (st.worker_pid) json_object_object_add(root, "worker_pid", json_object_new_int64(st.worker_pid));
    json_object_object_add(root, "delegated_methods", json_string_array(st.delegated));

    json_object_object_add(root, "attempt_id", json_object_new_int64(st.attempt_id));
    json_object_object_add(root, "generation_attempts", json_object_new_int(st.generation_attempts));
    json_object_object_add(root, "guardrail_recovery_attempts", json_object_new_int(st.guardrail_recovery_attempts));
    json_object_object_add(root, "execution_repair_attempts", json_object_new_int(st.execution_repair_attempts));
    json_object_object_add(root, "outcome_repair_attempts", json_object_new_int(st.outcome_repair_attempts));
    json_object_object_add(root, "guardrail_retry_exhausted", json_object_new_boolean(st.guardrail_retry_exhausted));
    json_object_object_add(root, "outcome_repair_retry_exhausted",
                           json_object_new_boolean(st.outcome_repair_retry_exhausted));

    json_object_object_add(root, "artifact_hit", json_object_new_boolean(st.artifact_hit));
    opt_str("artifact_checksum", st.artifact_checksum);
    opt_str("artifact_lifecycle_state", st.lifecycle_state);
    json_object_object_add(root, "repair_attempted", json_object_new_boolean(st.repair_attempted));
    opt_str("failure_class", st.failure_class);
    opt_str("history_trigger", st.trigger);

    if (st.contract.applied) json_add_raw(root, "contract", st.contract.metadata_json());
    if (st.continuity.evaluated) json_add_raw(root, "continuity", st.continuity.to_json());

    if (st.promotion.evaluated) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "lifecycle_state", json_object_new_string(st.promotion.lifecycle_state.c_str()));
        json_object_object_add(p, "decision", json_object_new_string(st.promotion.decision.c_str()));
        json_object_object_add(p, "policy_version", json_object_new_string(st.promotion.policy_version.c_str()));
        json_add_raw(p, "rationale", st.promotion.rationale_json);
        json_object_object_add(p, "enforced", json_object_new_boolean(cfg_.promotion_enforcement_enabled));
        json_object_object_add(root, "promotion", p);
    }

    std::string s = json_dump(root);
    json_object_put(root);
    return s;
}

} // namespace conjure
